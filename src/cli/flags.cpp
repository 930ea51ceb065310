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

#include "cli/flags.hpp"

#include "linux/proc.hpp"

#include "teardown/constants.hpp"

using namespace unchroot::internal::teardown;


unchroot::internal::cli::Flags::Flags()
{
  add(&Flags::chroots,
      "chroots",
      "Directory holding the environments. Environments given by name\n"
      "rather than by path are looked up in it.",
      DEFAULT_CHROOTS_DIR);

  add(&Flags::all,
      "all",
      "Tear down every environment found in `--chroots`.",
      false);

  add(&Flags::force,
      "force",
      "Tear environments down even if processes are running in them.\n"
      "This also disables the check for processes entering an\n"
      "environment while it is torn down.",
      false);

  add(&Flags::yes,
      "yes",
      "Do not ask before signaling the processes that keep mounts busy.\n"
      "They get SIGTERM first and SIGKILL from then on.",
      false);

  add(&Flags::kill,
      "kill",
      "Signal the processes that keep mounts busy with SIGKILL right\n"
      "away instead of starting with SIGTERM.",
      false);

  add(&Flags::patient,
      "patient",
      "Keep trying to unmount forever instead of signaling processes\n"
      "after `--tries` failed attempts.",
      false);

  add(&Flags::tries,
      "tries",
      "Number of failed unmount attempts before the processes that keep\n"
      "mounts busy are signaled.",
      DEFAULT_TRIES);

  add(&Flags::interval,
      "interval",
      "Pause between two unmount attempts (e.g., 500ms, 1secs, etc.).",
      DEFAULT_INTERVAL);

  add(&Flags::exclude_root,
      "exclude_root",
      "Unmount everything below the root of an environment but leave\n"
      "the mount at the root itself in place.",
      false);

  add(&Flags::shared_mounts,
      "shared_mounts",
      "Comma separated list of bind points, relative to the root of an\n"
      "environment, that are made slave mounts before anything is\n"
      "unmounted so that unmounting them does not reach the host.",
      DEFAULT_SHARED_MOUNTS);

  add(&Flags::core_marker,
      "core_marker",
      "Environment entry (`KEY=VALUE`) marking processes that never\n"
      "count as using an environment.",
      DEFAULT_CORE_MARKER);

  add(&Flags::alternate_root_dir,
      "alternate_root_dir",
      "Directory under which the real roots of environments kept on\n"
      "encrypted storage are mounted.",
      DEFAULT_ALTERNATE_ROOT_DIR);

  add(&Flags::release_override,
      "release_override",
      "Remount `--chroots` with `noexec`, `nosuid` and `nodev` once no\n"
      "environment below it is in use anymore.",
      false);

  add(&Flags::proc,
      "proc",
      "Mount point of the proc filesystem.",
      unchroot::internal::proc::PROCFS);
}
