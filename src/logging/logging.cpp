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

#include <signal.h> // For sigaction(), sigemptyset().

#include <glog/logging.h>
#include <glog/raw_logging.h>

#include <string>

#include <stout/error.hpp>
#include <stout/exit.hpp>
#include <stout/foreach.hpp>
#include <stout/nothing.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

#include <stout/os/mkdir.hpp>
#include <stout/os/signals.hpp>

#include "logging/logging.hpp"

using std::string;

namespace unchroot {
namespace internal {
namespace logging {

// Persistent copy of argv0 since InitGoogleLogging requires the
// string we pass to it to be accessible indefinitely.
static string argv0;


// Being stopped in the middle of a teardown leaves an environment
// partially unmounted, so say so before going away.
//
// NOTE: We use RAW_LOG instead of LOG because RAW_LOG doesn't
// allocate any memory or grab locks.
static void handler(int signal, siginfo_t* siginfo, void* context)
{
  if (siginfo->si_code == SI_USER ||
      siginfo->si_code == SI_QUEUE ||
      siginfo->si_code <= 0) {
    RAW_LOG(WARNING,
            "Received signal %d from process %d of user %d; exiting, "
            "environments may be left partially unmounted",
            signal, siginfo->si_pid, siginfo->si_uid);
  } else {
    RAW_LOG(WARNING,
            "Received signal %d; exiting, "
            "environments may be left partially unmounted",
            signal);
  }

  // Fall back to the default disposition so we terminate without
  // a stack trace.
  os::signals::reset(signal);
  raise(signal);
}


google::LogSeverity getLogSeverity(const string& logging_level)
{
  if (logging_level == "WARNING") {
    return google::WARNING;
  } else if (logging_level == "ERROR") {
    return google::ERROR;
  }

  return google::INFO;
}


void initialize(
    const string& _argv0,
    bool installFailureSignalHandler,
    const Option<Flags>& _flags)
{
  static bool initialized = false;

  if (initialized) {
    return;
  }

  argv0 = _argv0;

  // Use the default flags if not specified.
  const Flags flags = _flags.isSome() ? _flags.get() : Flags();

  if (flags.logging_level != "INFO" &&
      flags.logging_level != "WARNING" &&
      flags.logging_level != "ERROR") {
    EXIT(EXIT_FAILURE)
      << "'" << flags.logging_level << "' is not a valid logging level."
      << " Possible values for 'logging_level' flag are:"
      << " 'INFO', 'WARNING', 'ERROR'.";
  }

  FLAGS_minloglevel = getLogSeverity(flags.logging_level);
  FLAGS_logbufsecs = flags.logbufsecs;

  if (flags.log_dir.isSome()) {
    Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
    if (mkdir.isError()) {
      EXIT(EXIT_FAILURE)
        << "Could not initialize logging: Failed to create directory "
        << flags.log_dir.get() << ": " << mkdir.error();
    }

    FLAGS_log_dir = flags.log_dir.get();
    FLAGS_logtostderr = false;
  } else {
    FLAGS_logtostderr = true;
  }

  if (flags.quiet) {
    FLAGS_stderrthreshold = google::FATAL;

    // FLAGS_stderrthreshold is ignored when logging to stderr instead
    // of log files. Setting the minimum log level gets around this issue.
    if (FLAGS_logtostderr) {
      FLAGS_minloglevel = google::FATAL;
    }
  } else {
    FLAGS_stderrthreshold = FLAGS_minloglevel;
  }

  google::InitGoogleLogging(argv0.c_str());

  if (flags.log_dir.isSome()) {
    // GLOG only creates the log file with the first message.
    LOG_AT_LEVEL(FLAGS_minloglevel)
      << google::GetLogSeverityName(FLAGS_minloglevel)
      << " level logging started";
  }

  VLOG(1) << "Logging to "
          << (flags.log_dir.isSome() ? flags.log_dir.get() : "STDERR");

  if (installFailureSignalHandler) {
    // Handles SIGSEGV, SIGILL, SIGFPE, SIGABRT, SIGBUS, SIGTERM
    // by default.
    google::InstallFailureSignalHandler();

    // Being terminated or interrupted by the operator is not a crash,
    // so no stack trace for SIGTERM and SIGINT.
    struct sigaction action;
    action.sa_sigaction = handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_SIGINFO;

    foreach (int signal, {SIGTERM, SIGINT}) {
      if (sigaction(signal, &action, nullptr) < 0) {
        PLOG(FATAL) << "Failed to set sigaction for signal " << signal;
      }
    }
  }

  initialized = true;
}


Try<string> getLogFile(google::LogSeverity severity)
{
  if (FLAGS_log_dir.empty()) {
    return Error("The 'log_dir' option was not specified");
  }

  if (severity < 0 || google::NUM_SEVERITIES <= severity) {
    return Error("Unknown log severity: " + stringify(severity));
  }

  return path::join(FLAGS_log_dir, Path(argv0).basename()) + "." +
         google::GetLogSeverityName(severity);
}

} // namespace logging {
} // namespace internal {
} // namespace unchroot {
