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

#ifndef __TEARDOWN_USAGE_HPP__
#define __TEARDOWN_USAGE_HPP__

#include <unistd.h>

#include <string>
#include <vector>

#include <stout/try.hpp>

#include "teardown/scanner.hpp"

namespace unchroot {
namespace internal {
namespace teardown {

struct Usage
{
  bool inUse;
  std::vector<ProcessRecord> blockers;
};


// Decides whether an environment is used by processes running in it.
//
// A process counts as a blocker of an environment if its root is the
// environment's path or lies below it, and none of the following
// holds:
//   (1) its parent is gone, is init, or is unknown: the process was
//       reparented rather than launched by something still running;
//   (2) its parent's root differs from its own: it is a background
//       process that outlived the launcher which started it;
//   (3) it carries the core marker.
//
// NOTE: Rule (2) also hides processes that daemonize in other ways.
// It is kept as is since it is what distinguishes a lazily exiting
// background process from a live session.
class UsageDetector
{
public:
  // The scanner is not owned. The process `self` is never reported.
  explicit UsageDetector(ProcessScanner* scanner, pid_t self = ::getpid());

  // Returns the blockers of the environment at `path`, which must be
  // canonical. If `force` is set, no scan is made and the environment
  // is reported unused.
  Try<Usage> inUse(const std::string& path, bool force = false);

  // Returns every process whose root is `path` or lies below it,
  // without applying any of the rules above.
  Try<std::vector<ProcessRecord>> list(const std::string& path);

private:
  ProcessScanner* scanner;
  const pid_t self;
};

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {

#endif // __TEARDOWN_USAGE_HPP__
