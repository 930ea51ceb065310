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

#ifndef __TEARDOWN_ESCALATION_HPP__
#define __TEARDOWN_ESCALATION_HPP__

#include <sys/types.h>

#include <set>
#include <string>

#include <stout/option.hpp>
#include <stout/try.hpp>

#include <unchroot/decider.hpp>

#include "teardown/outcome.hpp"
#include "teardown/signaler.hpp"
#include "teardown/usage.hpp"

namespace unchroot {
namespace internal {
namespace teardown {

enum Strength
{
  GRACEFUL, // SIGTERM
  FORCEFUL  // SIGKILL
};


int signum(Strength strength);


std::string signame(Strength strength);


// Per environment bookkeeping of a teardown run.
struct RetryState
{
  explicit RetryState(Strength _strength = GRACEFUL, bool _escalate = false)
    : attempts(0),
      strength(_strength),
      escalate(_escalate) {}

  // Consecutive failed unmount passes since the last signal.
  size_t attempts;

  // Never goes from FORCEFUL back to GRACEFUL.
  Strength strength;

  // Switch to FORCEFUL after the first signal has been sent.
  bool escalate;

  // Every pid signaled during this run.
  std::set<pid_t> signaled;

  // Set once the run has been aborted.
  Option<Outcome> reason;
};


// Decides what happens after an unmount pass left mounts behind.
class EscalationController
{
public:
  enum State
  {
    TRYING,
    AWAITING_DECISION,
    ESCALATING,
    CLEARED,
    ABORTED
  };

  // @param   tries     Failed passes before a decision is needed, or
  //                    None() to keep trying forever.
  // None of the pointers are owned.
  EscalationController(
      const Option<size_t>& tries,
      UsageDetector* detector,
      Signaler* signaler,
      Decider* decider);

  // Records a failed pass over the environment `name` at the canonical
  // `path`. Returns TRYING if another pass should simply follow,
  // ESCALATING if processes were signaled (after which passes resume),
  // or ABORTED with `state->reason` set. An error means the process
  // table could not be read.
  Try<State> stalled(
      const std::string& name,
      const std::string& path,
      bool force,
      RetryState* state);

private:
  Try<Nothing> signal(const std::string& path, RetryState* state);

  const Option<size_t> tries;
  UsageDetector* detector;
  Signaler* signaler;
  Decider* decider;
};


std::ostream& operator<<(
    std::ostream& stream,
    const EscalationController::State& state);

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {

#endif // __TEARDOWN_ESCALATION_HPP__
