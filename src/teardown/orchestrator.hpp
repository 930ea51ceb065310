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

#ifndef __TEARDOWN_ORCHESTRATOR_HPP__
#define __TEARDOWN_ORCHESTRATOR_HPP__

#include <string>
#include <vector>

#include <stout/duration.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include <unchroot/decider.hpp>

#include "teardown/constants.hpp"
#include "teardown/escalation.hpp"
#include "teardown/mounter.hpp"
#include "teardown/outcome.hpp"
#include "teardown/signaler.hpp"
#include "teardown/usage.hpp"

namespace unchroot {
namespace internal {
namespace teardown {

struct Environment
{
  Environment(const std::string& _name, const std::string& _path)
    : name(_name), path(_path) {}

  std::string name;
  std::string path;

  // The root to act on instead of `path`, e.g., when `path` is only
  // a view on top of encrypted storage.
  Option<std::string> alternate;
};


struct TeardownConfig
{
  TeardownConfig()
    : tries(DEFAULT_TRIES),
      interval(DEFAULT_INTERVAL),
      force(false),
      excludeRoot(false),
      escalate(false),
      strength(GRACEFUL),
      sharedMounts({DEFAULT_SHARED_MOUNTS}) {}

  // None() means unlimited.
  Option<size_t> tries;

  // Pause between two unmount passes.
  Duration interval;

  // Skip the usage checks altogether.
  bool force;

  // Leave the mount at the root of the environment in place.
  bool excludeRoot;

  // Initial strength and whether to switch to FORCEFUL after the
  // first signal.
  bool escalate;
  Strength strength;

  // Bind points, relative to the environment root, that are made
  // slaves before anything is unmounted.
  std::vector<std::string> sharedMounts;
};


class TeardownOrchestrator
{
public:
  // None of the pointers are owned.
  TeardownOrchestrator(
      const TeardownConfig& config,
      UsageDetector* detector,
      Mounter* mounter,
      Signaler* signaler,
      Decider* decider);

  // Unmounts everything in `environment`. An error means the process
  // or mount table could not be read; the caller should not go on.
  Try<Outcome> teardown(const Environment& environment);

  // Tears down the environments one after the other. Returns true if
  // every one of them was cleared.
  Try<bool> teardown(const std::vector<Environment>& environments);

  // Remounts `path` (usually the directory holding the environments)
  // with 'noexec', 'nosuid' and 'nodev' once no process runs below it
  // and nothing is mounted below it anymore. Returns whether it was
  // remounted.
  Try<bool> release(const std::string& path);

private:
  // Makes the shared bind points mounted in the environment slaves.
  // Returns false if one of them could not be.
  Try<bool> guard(const std::string& name, const std::string& path);

  const TeardownConfig config;
  UsageDetector* detector;
  Mounter* mounter;
  EscalationController escalation;
};

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {

#endif // __TEARDOWN_ORCHESTRATOR_HPP__
