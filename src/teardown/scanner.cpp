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

#include "teardown/scanner.hpp"

#include <algorithm>
#include <set>

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/strings.hpp>

using std::ostream;
using std::set;
using std::string;
using std::vector;

namespace unchroot {
namespace internal {
namespace teardown {

ostream& operator<<(ostream& stream, const ProcessRecord& process)
{
  stream << process.pid;

  if (!process.command.empty()) {
    stream << " " << process.command;
  }

  return stream;
}


ProcfsScanner::ProcfsScanner(const string& _marker, const string& _procfs)
  : marker(_marker),
    procfs(_procfs) {}


Try<vector<ProcessRecord>> ProcfsScanner::scan()
{
  Try<set<pid_t>> pids = proc::pids(procfs);
  if (pids.isError()) {
    return Error("Failed to enumerate processes: " + pids.error());
  }

  vector<ProcessRecord> processes;

  foreach (pid_t pid, pids.get()) {
    // Any of the following reads can fail because the process exited
    // in the meantime or because we may not look at it. Either way
    // the process is skipped.
    Try<proc::ProcessStatus> status = proc::status(pid, procfs);
    if (status.isError()) {
      VLOG(2) << "Skipping process " << pid << ": " << status.error();
      continue;
    }

    Try<string> root = proc::root(pid, procfs);
    if (root.isError()) {
      VLOG(2) << "Skipping process " << pid << ": " << root.error();
      continue;
    }

    Try<vector<string>> environment = proc::environment(pid, procfs);
    if (environment.isError()) {
      VLOG(2) << "Skipping process " << pid << ": " << environment.error();
      continue;
    }

    // The command line is informational only.
    Try<vector<string>> cmdline = proc::cmdline(pid, procfs);

    ProcessRecord process;
    process.pid = pid;
    process.parent = status->ppid;
    process.root = root.get();
    process.command = cmdline.isSome() ? strings::join(" ", cmdline.get()) : "";
    process.core = std::find(
        environment->begin(),
        environment->end(),
        marker) != environment->end();

    processes.push_back(process);
  }

  return processes;
}

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {
