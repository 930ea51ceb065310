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

#include "teardown/escalation.hpp"

#include <signal.h>

#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/stringify.hpp>

using std::string;
using std::vector;

namespace unchroot {
namespace internal {
namespace teardown {

int signum(Strength strength)
{
  return strength == FORCEFUL ? SIGKILL : SIGTERM;
}


string signame(Strength strength)
{
  return strength == FORCEFUL ? "SIGKILL" : "SIGTERM";
}


EscalationController::EscalationController(
    const Option<size_t>& _tries,
    UsageDetector* _detector,
    Signaler* _signaler,
    Decider* _decider)
  : tries(_tries),
    detector(CHECK_NOTNULL(_detector)),
    signaler(CHECK_NOTNULL(_signaler)),
    decider(CHECK_NOTNULL(_decider))
{
  CHECK(tries.isNone() || tries.get() > 0);
}


Try<EscalationController::State> EscalationController::stalled(
    const string& name,
    const string& path,
    bool force,
    RetryState* state)
{
  CHECK_NOTNULL(state);

  state->attempts++;

  // Anything that blocks the environment now and was not running in it
  // when we started has entered it behind our back, e.g., another
  // session starting up in the same environment.
  if (!force) {
    Try<Usage> usage = detector->inUse(path);
    if (usage.isError()) {
      return Error(usage.error());
    }

    foreach (const ProcessRecord& blocker, usage->blockers) {
      if (state->signaled.count(blocker.pid) == 0) {
        LOG(WARNING) << "Process " << blocker << " started using '"
                     << name << "' during teardown";
        state->reason = RACE_DETECTED;
        return ABORTED;
      }
    }
  }

  if (tries.isNone() || state->attempts < tries.get()) {
    return TRYING;
  }

  // AWAITING_DECISION.
  Try<vector<ProcessRecord>> processes = detector->list(path);
  if (processes.isError()) {
    return Error(processes.error());
  }

  DecisionContext context;
  context.name = name;
  context.path = path;
  context.signal = signame(state->strength);
  context.attempts = state->attempts;
  foreach (const ProcessRecord& process, processes.get()) {
    context.processes.push_back(stringify(process));
  }

  switch (decider->decide(context)) {
    case Decider::LIST_ONLY:
      return TRYING;
    case Decider::ABORT:
      state->reason = decider->interactive() ? USER_DECLINED : BUDGET_EXHAUSTED;
      return ABORTED;
    case Decider::ESCALATE:
      state->strength = FORCEFUL;
      break;
    case Decider::PROCEED:
      break;
  }

  // ESCALATING.
  Try<Nothing> sent = signal(path, state);
  if (sent.isError()) {
    return Error(sent.error());
  }

  if (state->escalate) {
    state->strength = FORCEFUL;
  }

  state->attempts = 0;

  return ESCALATING;
}


Try<Nothing> EscalationController::signal(
    const string& path,
    RetryState* state)
{
  // The list is taken again since time may have passed while the
  // decision was made.
  Try<vector<ProcessRecord>> processes = detector->list(path);
  if (processes.isError()) {
    return Error(processes.error());
  }

  if (processes->empty()) {
    LOG(WARNING) << "No process runs in '" << path << "' to send "
                 << signame(state->strength) << " to; its mounts are held"
                 << " from outside of it, e.g., by an open file or working"
                 << " directory of a host process";
    return Nothing();
  }

  const int signal = signum(state->strength);

  foreach (const ProcessRecord& process, processes.get()) {
    LOG(INFO) << "Sending " << signame(state->strength)
              << " to process " << process;

    Try<Nothing> kill = signaler->kill(process.pid, signal);
    if (kill.isError()) {
      LOG(WARNING) << kill.error();
      continue;
    }

    state->signaled.insert(process.pid);
  }

  return Nothing();
}


std::ostream& operator<<(
    std::ostream& stream,
    const EscalationController::State& state)
{
  switch (state) {
    case EscalationController::TRYING:
      return stream << "TRYING";
    case EscalationController::AWAITING_DECISION:
      return stream << "AWAITING_DECISION";
    case EscalationController::ESCALATING:
      return stream << "ESCALATING";
    case EscalationController::CLEARED:
      return stream << "CLEARED";
    case EscalationController::ABORTED:
      return stream << "ABORTED";
  }

  return stream << "UNKNOWN";
}

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {
