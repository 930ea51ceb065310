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

#ifndef __TEARDOWN_SCANNER_HPP__
#define __TEARDOWN_SCANNER_HPP__

#include <sys/types.h>

#include <ostream>
#include <string>
#include <vector>

#include <stout/try.hpp>

#include "linux/proc.hpp"

namespace unchroot {
namespace internal {
namespace teardown {

// A snapshot of one process, taken during a scan.
struct ProcessRecord
{
  pid_t pid;
  pid_t parent;

  // The directory the process sees as '/', canonicalized.
  std::string root;

  // Arguments joined by spaces; empty for kernel threads.
  std::string command;

  // Whether the process carries the core marker in its environment.
  bool core;
};


std::ostream& operator<<(std::ostream& stream, const ProcessRecord& process);


// Enumerates the processes visible to the caller. Every call takes
// a fresh snapshot; nothing is cached between calls.
class ProcessScanner
{
public:
  virtual ~ProcessScanner() {}

  // Processes that exit while being scanned, or whose details we are
  // not allowed to read, are left out. Returns an error only if the
  // process table can not be enumerated at all.
  virtual Try<std::vector<ProcessRecord>> scan() = 0;
};


// Scans a Linux proc filesystem.
class ProcfsScanner : public ProcessScanner
{
public:
  // @param   marker    The 'KEY=VALUE' environment entry that marks
  //                    a process as core.
  // @param   procfs    The root of the proc filesystem.
  explicit ProcfsScanner(
      const std::string& marker,
      const std::string& procfs = proc::PROCFS);

  Try<std::vector<ProcessRecord>> scan() override;

private:
  const std::string marker;
  const std::string procfs;
};

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {

#endif // __TEARDOWN_SCANNER_HPP__
