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

#include <limits.h>
#include <unistd.h>

#include <list>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/numify.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include <stout/os/ls.hpp>
#include <stout/os/read.hpp>
#include <stout/os/realpath.hpp>

#include "linux/proc.hpp"

using std::list;
using std::set;
using std::string;
using std::vector;

namespace unchroot {
namespace internal {
namespace proc {

// Splits the contents of a NUL separated proc file.
static vector<string> split(const string& contents)
{
  return strings::tokenize(contents, string(1, '\0'));
}


Try<set<pid_t>> pids(const string& procfs)
{
  Try<list<string>> entries = os::ls(procfs);
  if (entries.isError()) {
    return Error("Failed to list '" + procfs + "': " + entries.error());
  }

  set<pid_t> pids;

  foreach (const string& entry, entries.get()) {
    Try<pid_t> pid = numify<pid_t>(entry);

    // Ignore files that can't be numified.
    if (pid.isSome()) {
      pids.insert(pid.get());
    }
  }

  if (!pids.empty()) {
    return pids;
  } else {
    return Error("Failed to determine pids from '" + procfs + "'");
  }
}


Try<ProcessStatus> status(pid_t pid, const string& procfs)
{
  const string path = path::join(procfs, stringify(pid), "stat");

  Try<string> read = os::read(path);
  if (read.isError()) {
    return Error("Failed to read '" + path + "': " + read.error());
  }

  // The command name is enclosed in parentheses and may itself
  // contain spaces and parentheses, so the fields that follow are
  // located from the last ')' rather than by tokenizing the line.
  const string& line = read.get();
  size_t open = line.find('(');
  size_t close = line.rfind(')');
  if (open == string::npos || close == string::npos || close < open) {
    return Error("Failed to parse '" + path + "'");
  }

  const string comm = line.substr(open + 1, close - open - 1);

  vector<string> fields = strings::tokenize(line.substr(close + 1), " \n");
  if (fields.size() < 4 || fields[0].size() != 1) {
    return Error("Failed to parse '" + path + "'");
  }

  Try<pid_t> ppid = numify<pid_t>(fields[1]);
  Try<pid_t> pgrp = numify<pid_t>(fields[2]);
  Try<pid_t> session = numify<pid_t>(fields[3]);

  if (ppid.isError() || pgrp.isError() || session.isError()) {
    return Error("Failed to parse '" + path + "'");
  }

  return ProcessStatus(
      pid, comm, fields[0][0], ppid.get(), pgrp.get(), session.get());
}


Try<string> root(pid_t pid, const string& procfs)
{
  const string link = path::join(procfs, stringify(pid), "root");

  char buffer[PATH_MAX];
  ssize_t length = ::readlink(link.c_str(), buffer, sizeof(buffer) - 1);
  if (length < 0) {
    return ErrnoError("Failed to read link '" + link + "'");
  }

  const string target(buffer, length);
  if (!strings::startsWith(target, "/")) {
    return Error("Unexpected root '" + target + "' for process " +
                 stringify(pid));
  }

  // Resolve symlinks along the way so the result compares equal to
  // canonical paths. A root that is not visible from our own view is
  // kept as the kernel printed it.
  Result<string> realpath = os::realpath(target);
  if (realpath.isSome()) {
    return realpath.get();
  }

  return target;
}


Try<vector<string>> cmdline(pid_t pid, const string& procfs)
{
  const string path = path::join(procfs, stringify(pid), "cmdline");

  Try<string> read = os::read(path);
  if (read.isError()) {
    return Error("Failed to read '" + path + "': " + read.error());
  }

  return split(read.get());
}


Try<vector<string>> environment(pid_t pid, const string& procfs)
{
  const string path = path::join(procfs, stringify(pid), "environ");

  Try<string> read = os::read(path);
  if (read.isError()) {
    return Error("Failed to read '" + path + "': " + read.error());
  }

  return split(read.get());
}

} // namespace proc {
} // namespace internal {
} // namespace unchroot {
