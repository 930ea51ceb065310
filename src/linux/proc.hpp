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

#ifndef __PROC_HPP__
#define __PROC_HPP__

#include <sys/types.h> // For pid_t.

#include <set>
#include <string>
#include <vector>

#include <stout/try.hpp>

// All functions take the root of the proc filesystem as their last
// argument so that a fabricated tree can stand in for '/proc'.

namespace unchroot {
namespace internal {
namespace proc {

constexpr char PROCFS[] = "/proc";


struct ProcessStatus
{
  ProcessStatus(
      pid_t _pid,
      const std::string& _comm,
      char _state,
      pid_t _ppid,
      pid_t _pgrp,
      pid_t _session)
    : pid(_pid),
      comm(_comm),
      state(_state),
      ppid(_ppid),
      pgrp(_pgrp),
      session(_session) {}

  const pid_t pid;
  const std::string comm;
  const char state;
  const pid_t ppid;
  const pid_t pgrp;
  const pid_t session;
};


// Returns the pids of all processes found in the proc filesystem.
Try<std::set<pid_t>> pids(const std::string& procfs = PROCFS);


// Parses the leading fields of '<procfs>/<pid>/stat'.
Try<ProcessStatus> status(pid_t pid, const std::string& procfs = PROCFS);


// Resolves the '<procfs>/<pid>/root' link, i.e., the directory the
// process sees as '/', as an absolute path in our own view.
Try<std::string> root(pid_t pid, const std::string& procfs = PROCFS);


// Returns the arguments in '<procfs>/<pid>/cmdline'. Kernel threads
// have an empty command line.
Try<std::vector<std::string>> cmdline(
    pid_t pid,
    const std::string& procfs = PROCFS);


// Returns the 'KEY=VALUE' entries in '<procfs>/<pid>/environ'.
Try<std::vector<std::string>> environment(
    pid_t pid,
    const std::string& procfs = PROCFS);

} // namespace proc {
} // namespace internal {
} // namespace unchroot {

#endif // __PROC_HPP__
