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

#include "teardown/orchestrator.hpp"

#include <glog/logging.h>

#include <stout/check.hpp>
#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/stringify.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/realpath.hpp>
#include <stout/os/sleep.hpp>

using std::string;
using std::vector;

namespace unchroot {
namespace internal {
namespace teardown {

TeardownOrchestrator::TeardownOrchestrator(
    const TeardownConfig& _config,
    UsageDetector* _detector,
    Mounter* _mounter,
    Signaler* signaler,
    Decider* decider)
  : config(_config),
    detector(CHECK_NOTNULL(_detector)),
    mounter(CHECK_NOTNULL(_mounter)),
    escalation(_config.tries, _detector, signaler, decider) {}


Try<Outcome> TeardownOrchestrator::teardown(const Environment& environment)
{
  const string& name = environment.name;

  if (!os::exists(environment.path)) {
    LOG(WARNING) << "Environment '" << name << "' does not exist at '"
                 << environment.path << "'";
    return NOT_FOUND;
  }

  string root = environment.path;

  if (environment.alternate.isSome()) {
    if (os::exists(environment.alternate.get())) {
      root = environment.alternate.get();
    } else {
      LOG(WARNING) << "Alternate root '" << environment.alternate.get()
                   << "' of environment '" << name << "' does not exist,"
                   << " using '" << environment.path << "'";
    }
  }

  Result<string> realpath = os::realpath(root);
  if (realpath.isError()) {
    LOG(ERROR) << "Failed to canonicalize '" << root << "' of environment '"
               << name << "': " << realpath.error();
    return INACCESSIBLE;
  } else if (realpath.isNone()) {
    LOG(WARNING) << "Environment '" << name << "' disappeared from '"
                 << root << "'";
    return NOT_FOUND;
  }

  const string path = realpath.get();

  Try<Usage> usage = detector->inUse(path, config.force);
  if (usage.isError()) {
    return Error(usage.error());
  }

  if (usage->inUse) {
    LOG(WARNING) << "Environment '" << name << "' at '" << path
                 << "' is in use by:";
    foreach (const ProcessRecord& blocker, usage->blockers) {
      LOG(WARNING) << "  " << blocker;
    }
    return IN_USE;
  }

  Try<bool> guarded = guard(name, path);
  if (guarded.isError()) {
    return Error(guarded.error());
  }

  if (!guarded.get()) {
    return UNGUARDED;
  }

  RetryState state(config.strength, config.escalate);

  while (true) {
    Try<vector<string>> targets = mounter->targets(path, config.excludeRoot);
    if (targets.isError()) {
      return Error(targets.error());
    }

    if (targets->empty()) {
      break;
    }

    VLOG(1) << "Unmounting " << targets->size() << " mount(s) under '"
            << path << "'";

    Try<vector<string>> remaining = mounter->unmount(targets.get());
    if (remaining.isError()) {
      return Error(remaining.error());
    }

    if (remaining->empty()) {
      break;
    }

    VLOG(1) << remaining->size() << " mount(s) under '" << path
            << "' are still busy";

    Try<EscalationController::State> next =
      escalation.stalled(name, path, config.force, &state);

    if (next.isError()) {
      return Error(next.error());
    }

    if (next.get() == EscalationController::ABORTED) {
      CHECK_SOME(state.reason);
      LOG(WARNING) << "Gave up on environment '" << name << "': "
                   << state.reason.get();
      return state.reason.get();
    }

    if (config.interval > Duration::zero()) {
      Try<Nothing> sleep = os::sleep(config.interval);
      if (sleep.isError()) {
        LOG(WARNING) << "Failed to pause between passes: " << sleep.error();
      }
    }
  }

  LOG(INFO) << "Unmounted environment '" << name << "' at '" << path << "'";

  return CLEARED;
}


Try<bool> TeardownOrchestrator::teardown(
    const vector<Environment>& environments)
{
  bool cleared = true;

  foreach (const Environment& environment, environments) {
    Try<Outcome> outcome = teardown(environment);
    if (outcome.isError()) {
      return Error(
          "Failed to tear down environment '" + environment.name + "': " +
          outcome.error());
    }

    LOG(INFO) << environment.name << ": " << outcome.get();

    if (outcome.get() != CLEARED) {
      cleared = false;
    }
  }

  return cleared;
}


Try<bool> TeardownOrchestrator::release(const string& _path)
{
  Result<string> realpath = os::realpath(_path);
  if (!realpath.isSome()) {
    return Error(
        "Failed to canonicalize '" + _path + "': " +
        (realpath.isError() ? realpath.error() : "No such file or directory"));
  }

  const string path = realpath.get();

  Try<vector<ProcessRecord>> processes = detector->list(path);
  if (processes.isError()) {
    return Error(processes.error());
  }

  if (!processes->empty()) {
    LOG(INFO) << "Not restricting '" << path << "' which is still used by "
              << processes->size() << " process(es)";
    return false;
  }

  Try<vector<string>> targets = mounter->targets(path, true);
  if (targets.isError()) {
    return Error(targets.error());
  }

  if (!targets->empty()) {
    LOG(INFO) << "Not restricting '" << path << "' which still has "
              << targets->size() << " mount(s) below it";
    return false;
  }

  Try<bool> mounted = mounter->mounted(path);
  if (mounted.isError()) {
    return Error(mounted.error());
  }

  if (!mounted.get()) {
    VLOG(1) << "Nothing to restrict at '" << path << "'";
    return false;
  }

  Try<Nothing> remount = mounter->remountRestricted(path);
  if (remount.isError()) {
    return Error(
        "Failed to remount '" + path + "' restricted: " + remount.error());
  }

  LOG(INFO) << "Remounted '" << path << "' with noexec,nosuid,nodev";

  return true;
}


Try<bool> TeardownOrchestrator::guard(const string& name, const string& path)
{
  foreach (const string& shared, config.sharedMounts) {
    const string target = path::join(path, shared);

    Try<bool> mounted = mounter->mounted(target);
    if (mounted.isError()) {
      return Error(mounted.error());
    }

    if (!mounted.get()) {
      continue;
    }

    VLOG(1) << "Making '" << target << "' of environment '" << name
            << "' a slave mount";

    Try<Nothing> slave = mounter->slave(target);
    if (slave.isError()) {
      LOG(ERROR) << "Not tearing down environment '" << name << "': failed"
                 << " to make '" << target << "' a slave mount: "
                 << slave.error();
      return false;
    }
  }

  return true;
}

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {
