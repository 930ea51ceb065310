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

#include <unistd.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include <unchroot/decider.hpp>

#include "cli/environments.hpp"
#include "cli/flags.hpp"

#include "logging/logging.hpp"

#include "teardown/decider.hpp"
#include "teardown/escalation.hpp"
#include "teardown/mounter.hpp"
#include "teardown/orchestrator.hpp"
#include "teardown/scanner.hpp"
#include "teardown/signaler.hpp"
#include "teardown/usage.hpp"

using namespace unchroot::internal;
using namespace unchroot::internal::teardown;

using unchroot::Decider;

using std::cerr;
using std::cin;
using std::cout;
using std::endl;
using std::string;
using std::unique_ptr;
using std::vector;


// Points the operator at the log file, if there is one.
static void logs(const cli::Flags& flags)
{
  if (flags.log_dir.isNone()) {
    return;
  }

  Try<string> log = logging::getLogFile(
      logging::getLogSeverity(flags.logging_level));

  if (log.isSome()) {
    cerr << "See " << log.get() << " for details" << endl;
  }
}


int main(int argc, char** argv)
{
  cli::Flags flags;

  flags.setUsageMessage(
      "Usage: " + Path(argv[0]).basename() + " [options] <name|path>...\n"
      "\n"
      "Unmounts everything mounted in the given chroot environments,\n"
      "provided no process runs in them.\n"
      "\n");

  // Parsed flags are removed from `argv`, leaving the environments.
  Try<flags::Warnings> load = flags.load("UNCHROOT_", &argc, &argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], true, flags); // Catch signals.

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  vector<string> arguments;
  for (int i = 1; i < argc; i++) {
    arguments.push_back(argv[i]);
  }

  if (arguments.empty() && !flags.all) {
    cerr << flags.usage("Missing environments to tear down") << endl;
    return EXIT_FAILURE;
  }

  if (!arguments.empty() && flags.all) {
    cerr << flags.usage("Environments can not be combined with --all")
         << endl;
    return EXIT_FAILURE;
  }

  if (!flags.patient && flags.tries == 0) {
    cerr << flags.usage("Flag --tries must be positive") << endl;
    return EXIT_FAILURE;
  }

  Try<vector<Environment>> environments =
    cli::environments(flags, arguments);

  if (environments.isError()) {
    EXIT(EXIT_FAILURE) << environments.error();
  }

  TeardownConfig config;
  config.tries = flags.patient ? Option<size_t>::none() : flags.tries;
  config.interval = flags.interval;
  config.force = flags.force;
  config.excludeRoot = flags.exclude_root;
  config.escalate = flags.yes;
  config.strength = flags.kill ? FORCEFUL : GRACEFUL;
  config.sharedMounts = strings::tokenize(flags.shared_mounts, ",");

  unique_ptr<Decider> decider;
  if (flags.yes) {
    decider.reset(new PolicyDecider(Decider::PROCEED));
  } else if (::isatty(STDIN_FILENO)) {
    decider.reset(new InteractiveDecider(cin, cout));
  } else {
    decider.reset(new PolicyDecider(Decider::ABORT));
  }

  ProcfsScanner scanner(flags.core_marker, flags.proc);
  UsageDetector detector(&scanner);
  LinuxMounter mounter(path::join(flags.proc, "self", "mountinfo"));
  PosixSignaler signaler;

  TeardownOrchestrator orchestrator(
      config, &detector, &mounter, &signaler, decider.get());

  Try<bool> cleared = orchestrator.teardown(environments.get());
  if (cleared.isError()) {
    LOG(ERROR) << cleared.error();
    logs(flags);
    return EXIT_FAILURE;
  }

  if (flags.release_override) {
    Try<bool> released = orchestrator.release(flags.chroots);
    if (released.isError()) {
      LOG(ERROR) << "Failed to release '" << flags.chroots << "': "
                 << released.error();
      logs(flags);
      return EXIT_FAILURE;
    }
  }

  if (!cleared.get()) {
    logs(flags);
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
