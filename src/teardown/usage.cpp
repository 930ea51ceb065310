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

#include "teardown/usage.hpp"

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/option.hpp>

#include "linux/fs.hpp"

using std::string;
using std::vector;

namespace unchroot {
namespace internal {
namespace teardown {

UsageDetector::UsageDetector(ProcessScanner* _scanner, pid_t _self)
  : scanner(CHECK_NOTNULL(_scanner)),
    self(_self) {}


Try<Usage> UsageDetector::inUse(const string& path, bool force)
{
  Usage usage;
  usage.inUse = false;

  if (force) {
    return usage;
  }

  Try<vector<ProcessRecord>> processes = scanner->scan();
  if (processes.isError()) {
    return Error(processes.error());
  }

  hashmap<pid_t, ProcessRecord> table;
  foreach (const ProcessRecord& process, processes.get()) {
    table[process.pid] = process;
  }

  foreach (const ProcessRecord& process, processes.get()) {
    if (process.pid == self || !fs::contains(path, process.root)) {
      continue;
    }

    if (process.parent <= 1) {
      VLOG(1) << "Ignoring orphaned process " << process;
      continue;
    }

    Option<ProcessRecord> parent = table.get(process.parent);
    if (parent.isNone()) {
      VLOG(1) << "Ignoring process " << process
              << " whose parent " << process.parent << " is gone";
      continue;
    }

    if (parent->root != process.root) {
      VLOG(1) << "Ignoring process " << process
              << " whose parent " << process.parent
              << " runs in '" << parent->root << "'";
      continue;
    }

    if (process.core) {
      VLOG(1) << "Ignoring core process " << process;
      continue;
    }

    usage.blockers.push_back(process);
  }

  usage.inUse = !usage.blockers.empty();

  return usage;
}


Try<vector<ProcessRecord>> UsageDetector::list(const string& path)
{
  Try<vector<ProcessRecord>> processes = scanner->scan();
  if (processes.isError()) {
    return Error(processes.error());
  }

  vector<ProcessRecord> result;
  foreach (const ProcessRecord& process, processes.get()) {
    if (process.pid != self && fs::contains(path, process.root)) {
      result.push_back(process);
    }
  }

  return result;
}

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {
