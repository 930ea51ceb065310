// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "linux/fs.hpp"

#include <errno.h>

#include <sys/sysmacros.h> // For makedev().

#include <algorithm>

#include <stout/adaptor.hpp>
#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/numify.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

#include <stout/os/read.hpp>

using std::string;
using std::vector;

namespace unchroot {
namespace internal {
namespace fs {

// Strips trailing slashes, leaving "/" alone.
static string normalize(const string& path)
{
  string result = path;
  while (result.size() > 1 && result.back() == '/') {
    result.pop_back();
  }

  return result.empty() ? "/" : result;
}


static size_t depth(const string& path)
{
  return std::count(path.begin(), path.end(), '/');
}


string unescape(const string& s)
{
  string result;
  result.reserve(s.size());

  for (size_t i = 0; i < s.size(); i++) {
    if (s[i] == '\\' &&
        i + 3 < s.size() &&
        s[i + 1] >= '0' && s[i + 1] <= '3' &&
        s[i + 2] >= '0' && s[i + 2] <= '7' &&
        s[i + 3] >= '0' && s[i + 3] <= '7') {
      result.push_back(static_cast<char>(
          ((s[i + 1] - '0') << 6) |
          ((s[i + 2] - '0') << 3) |
          (s[i + 3] - '0')));
      i += 3;
    } else {
      result.push_back(s[i]);
    }
  }

  return result;
}


bool contains(const string& _root, const string& _path)
{
  const string root = normalize(_root);
  const string path = normalize(_path);

  if (root == "/") {
    return strings::startsWith(path, "/");
  }

  // NOTE: We have to use `path::join(root, "")` here to make sure
  // '/chroots/foo' does not contain '/chroots/foobar'.
  return path == root || strings::startsWith(path, path::join(root, ""));
}


Try<MountInfoTable> MountInfoTable::parse(const string& lines)
{
  MountInfoTable table;

  foreach (const string& line, strings::tokenize(lines, "\n")) {
    Try<Entry> parse = MountInfoTable::Entry::parse(line);
    if (parse.isError()) {
      return Error("Failed to parse entry '" + line + "': " + parse.error());
    }

    table.entries.push_back(parse.get());
  }

  return table;
}


Try<MountInfoTable> MountInfoTable::read(const string& path)
{
  Try<string> lines = os::read(path);
  if (lines.isError()) {
    return Error(
        "Failed to read mountinfo file '" + path + "': " + lines.error());
  }

  return MountInfoTable::parse(lines.get());
}


vector<string> MountInfoTable::targets(
    const string& _path,
    bool excludeRoot) const
{
  const string path = normalize(_path);

  vector<string> result;

  // Walk the table backwards so that, among targets of the same
  // depth, the most recent mount is listed (and unmounted) first.
  foreach (const Entry& entry, adaptor::reverse(entries)) {
    if (!contains(path, entry.target)) {
      continue;
    }

    if (excludeRoot && normalize(entry.target) == path) {
      continue;
    }

    result.push_back(entry.target);
  }

  std::stable_sort(
      result.begin(),
      result.end(),
      [](const string& left, const string& right) {
        return depth(normalize(left)) > depth(normalize(right));
      });

  return result;
}


bool MountInfoTable::mounted(const string& target) const
{
  const string path = normalize(target);

  foreach (const Entry& entry, entries) {
    if (normalize(entry.target) == path) {
      return true;
    }
  }

  return false;
}


Option<MountInfoTable::Entry> MountInfoTable::find(const string& target) const
{
  const string path = normalize(target);

  foreach (const Entry& entry, adaptor::reverse(entries)) {
    if (normalize(entry.target) == path) {
      return entry;
    }
  }

  return None();
}


Try<MountInfoTable::Entry> MountInfoTable::Entry::parse(const string& s)
{
  MountInfoTable::Entry entry;

  const string separator = " - ";
  size_t pos = s.find(separator);
  if (pos == string::npos) {
    return Error("Could not find separator ' - '");
  }

  // First group of fields (before the separator): 6 required fields
  // then zero or more optional fields
  vector<string> tokens = strings::tokenize(s.substr(0, pos), " ");
  if (tokens.size() < 6) {
    return Error("Failed to parse entry");
  }

  Try<int> id = numify<int>(tokens[0]);
  if (id.isError()) {
    return Error("Mount ID is not a number");
  }
  entry.id = id.get();

  Try<int> parent = numify<int>(tokens[1]);
  if (parent.isError()) {
    return Error("Parent ID is not a number");
  }
  entry.parent = parent.get();

  // Parse out the major:minor device number.
  vector<string> device = strings::split(tokens[2], ":");
  if (device.size() != 2) {
    return Error("Invalid major:minor device number");
  }

  Try<int> major = numify<int>(device[0]);
  if (major.isError()) {
    return Error("Device major is not a number");
  }

  Try<int> minor = numify<int>(device[1]);
  if (minor.isError()) {
    return Error("Device minor is not a number");
  }

  entry.devno = makedev(major.get(), minor.get());

  entry.root = unescape(tokens[3]);
  entry.target = unescape(tokens[4]);

  entry.vfsOptions = tokens[5];

  // The "proc" manpage states there can be zero or more optional
  // fields. The kernel source (fs/proc_namespace.c) has the optional
  // fields ("tagged fields") separated by " " when printing the table
  // (see show_mountinfo()).
  if (tokens.size() > 6) {
    tokens.erase(tokens.begin(), tokens.begin() + 6);
    entry.optionalFields = strings::join(" ", tokens);
  }

  // Second set of fields: 3 required fields.
  tokens = strings::tokenize(s.substr(pos + separator.size() - 1), " ");
  if (tokens.size() != 3) {
    return Error("Failed to parse type, source or options");
  }

  entry.type = tokens[0];
  entry.source = unescape(tokens[1]);
  entry.fsOptions = tokens[2];

  return entry;
}


unsigned long MountInfoTable::Entry::flags() const
{
  unsigned long flags = 0;

  foreach (const string& option, strings::tokenize(vfsOptions, ",")) {
    if (option == "ro") {
      flags |= MS_RDONLY;
    } else if (option == "nosuid") {
      flags |= MS_NOSUID;
    } else if (option == "nodev") {
      flags |= MS_NODEV;
    } else if (option == "noexec") {
      flags |= MS_NOEXEC;
    } else if (option == "noatime") {
      flags |= MS_NOATIME;
    } else if (option == "nodiratime") {
      flags |= MS_NODIRATIME;
    } else if (option == "relatime") {
      flags |= MS_RELATIME;
    } else if (option == "strictatime") {
      flags |= MS_STRICTATIME;
    } else if (option == "nosymfollow") {
      flags |= MS_NOSYMFOLLOW;
    }
  }

  return flags;
}


Try<Nothing> mount(const Option<string>& _source,
                   const string& target,
                   const Option<string>& _type,
                   unsigned long flags,
                   const void* data)
{
  const char * source = _source.isSome() ? _source->c_str() : nullptr;
  const char * type = _type.isSome() ? _type->c_str() : nullptr;

  // The prototype of function 'mount' on Linux is as follows:
  // int mount(const char *source,
  //           const char *target,
  //           const char *filesystemtype,
  //           unsigned long mountflags,
  //           const void *data);
  if (::mount(source, target.c_str(), type, flags, data) < 0) {
    return ErrnoError("Failed to mount '" + target + "'");
  }

  return Nothing();
}


Try<Nothing> unmount(const string& target, int flags)
{
  // The prototype of function 'umount2' on Linux is as follows:
  // int umount2(const char *target, int flags);
  if (::umount2(target.c_str(), flags) < 0) {
    return ErrnoError("Failed to unmount '" + target + "'");
  }

  return Nothing();
}

} // namespace fs {
} // namespace internal {
} // namespace unchroot {
