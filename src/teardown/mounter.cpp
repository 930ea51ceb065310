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

#include "teardown/mounter.hpp"

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/hashset.hpp>

#include "linux/fs.hpp"

using std::string;
using std::vector;

namespace unchroot {
namespace internal {
namespace teardown {

LinuxMounter::LinuxMounter(const string& _mountinfo)
  : mountinfo(_mountinfo) {}


Try<vector<string>> LinuxMounter::targets(const string& path, bool excludeRoot)
{
  Try<fs::MountInfoTable> table = fs::MountInfoTable::read(mountinfo);
  if (table.isError()) {
    return Error(table.error());
  }

  return table->targets(path, excludeRoot);
}


Try<bool> LinuxMounter::mounted(const string& target)
{
  Try<fs::MountInfoTable> table = fs::MountInfoTable::read(mountinfo);
  if (table.isError()) {
    return Error(table.error());
  }

  return table->mounted(target);
}


Try<vector<string>> LinuxMounter::unmount(const vector<string>& targets)
{
  foreach (const string& target, targets) {
    // Failures are expected here: a target may still be busy, or it
    // may have gone away together with a mount above it. The mount
    // table below is what tells us how far we got.
    Try<Nothing> unmount = fs::unmount(target);
    if (unmount.isError()) {
      VLOG(1) << unmount.error();
    }
  }

  Try<fs::MountInfoTable> table = fs::MountInfoTable::read(mountinfo);
  if (table.isError()) {
    return Error(table.error());
  }

  hashset<string> mounted;
  foreach (const fs::MountInfoTable::Entry& entry, table->entries) {
    mounted.insert(entry.target);
  }

  vector<string> remaining;
  foreach (const string& target, targets) {
    if (mounted.contains(target)) {
      remaining.push_back(target);
    }
  }

  return remaining;
}


Try<Nothing> LinuxMounter::slave(const string& target)
{
  return fs::mount(None(), target, None(), MS_SLAVE | MS_REC, nullptr);
}


Try<Nothing> LinuxMounter::remountRestricted(const string& target)
{
  Try<fs::MountInfoTable> table = fs::MountInfoTable::read(mountinfo);
  if (table.isError()) {
    return Error(table.error());
  }

  Option<fs::MountInfoTable::Entry> entry = table->find(target);
  if (entry.isNone()) {
    return Error("Nothing is mounted at '" + target + "'");
  }

  // A bind remount replaces every per-mount flag, so the ones already
  // in effect (e.g., 'ro' or 'noatime') have to be passed again.
  return fs::mount(
      None(),
      target,
      None(),
      entry->flags() |
        MS_REMOUNT | MS_BIND | MS_NOEXEC | MS_NOSUID | MS_NODEV,
      nullptr);
}

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {
