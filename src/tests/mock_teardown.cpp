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

#include "tests/mock_teardown.hpp"

#include <algorithm>
#include <iterator>

#include <stout/error.hpp>
#include <stout/foreach.hpp>

#include "linux/fs.hpp"

using std::string;
using std::vector;

using unchroot::internal::teardown::ProcessRecord;

namespace unchroot {
namespace internal {
namespace tests {

ProcessRecord process(
    pid_t pid,
    pid_t parent,
    const string& root,
    bool core,
    const string& command)
{
  ProcessRecord process;
  process.pid = pid;
  process.parent = parent;
  process.root = root;
  process.command = command;
  process.core = core;
  return process;
}


Try<vector<ProcessRecord>> FakeScanner::scan()
{
  scans++;

  if (failure.isSome()) {
    return Error(failure.get());
  }

  return processes;
}


void FakeScanner::exit(pid_t pid)
{
  processes.erase(
      std::remove_if(
          processes.begin(),
          processes.end(),
          [pid](const ProcessRecord& process) { return process.pid == pid; }),
      processes.end());
}


void FakeMounter::mount(const string& target)
{
  table.push_back(target);
}


Try<vector<string>> FakeMounter::targets(const string& path, bool excludeRoot)
{
  if (failure.isSome()) {
    return Error(failure.get());
  }

  // Ordering is left to the real mount table.
  fs::MountInfoTable mountinfo;
  int id = 1;
  foreach (const string& target, table) {
    fs::MountInfoTable::Entry entry;
    entry.id = id++;
    entry.parent = 1;
    entry.devno = 0;
    entry.root = "/";
    entry.target = target;
    mountinfo.entries.push_back(entry);
  }

  return mountinfo.targets(path, excludeRoot);
}


Try<bool> FakeMounter::mounted(const string& target)
{
  if (failure.isSome()) {
    return Error(failure.get());
  }

  return std::find(table.begin(), table.end(), target) != table.end();
}


Try<vector<string>> FakeMounter::unmount(const vector<string>& targets)
{
  passes++;

  foreach (const string& target, targets) {
    events.push_back("unmount " + target);

    if (pinned.contains(target)) {
      continue;
    }

    if (busy.contains(target) && busy[target] > 0) {
      busy[target]--;
      continue;
    }

    // Take off the topmost mount; a target that is gone already
    // stays gone.
    vector<string>::reverse_iterator mount =
      std::find(table.rbegin(), table.rend(), target);

    if (mount != table.rend()) {
      table.erase(std::next(mount).base());
    }
  }

  if (failure.isSome()) {
    return Error(failure.get());
  }

  vector<string> remaining;
  foreach (const string& target, targets) {
    if (std::find(table.begin(), table.end(), target) != table.end()) {
      remaining.push_back(target);
    }
  }

  return remaining;
}


Try<Nothing> FakeMounter::slave(const string& target)
{
  if (unslavable.contains(target)) {
    return Error("Permission denied");
  }

  events.push_back("slave " + target);
  return Nothing();
}


Try<Nothing> FakeMounter::remountRestricted(const string& target)
{
  events.push_back("restrict " + target);
  return Nothing();
}


MockSignaler::MockSignaler()
{
  ON_CALL(*this, kill(_, _))
    .WillByDefault(Return(Nothing()));
  EXPECT_CALL(*this, kill(_, _))
    .WillRepeatedly(DoDefault());
}


MockSignaler::~MockSignaler() {}


MockDecider::MockDecider()
{
  ON_CALL(*this, decide(_))
    .WillByDefault(Return(Decider::ABORT));
  EXPECT_CALL(*this, decide(_))
    .WillRepeatedly(DoDefault());

  ON_CALL(*this, interactive())
    .WillByDefault(Return(false));
  EXPECT_CALL(*this, interactive())
    .WillRepeatedly(DoDefault());
}


MockDecider::~MockDecider() {}

} // namespace tests {
} // namespace internal {
} // namespace unchroot {
