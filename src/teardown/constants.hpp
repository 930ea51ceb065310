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

#ifndef __TEARDOWN_CONSTANTS_HPP__
#define __TEARDOWN_CONSTANTS_HPP__

#include <stddef.h>

#include <stout/duration.hpp>

namespace unchroot {
namespace internal {
namespace teardown {

// Consecutive failed unmount passes before the processes holding an
// environment busy have to be dealt with.
constexpr size_t DEFAULT_TRIES = 5;

// Pause between two unmount passes.
constexpr Duration DEFAULT_INTERVAL = Seconds(1);

// Environment entry that marks a process as environment-internal
// infrastructure (e.g., a message bus started for the environment)
// which never counts as a user of it.
constexpr char DEFAULT_CORE_MARKER[] = "UNCHROOT=CORE";

// Bind mounts of host resources inside an environment, relative to
// its root. These are made slaves before anything is unmounted.
constexpr char DEFAULT_SHARED_MOUNTS[] = "var/host/media";

constexpr char DEFAULT_CHROOTS_DIR[] = "/usr/local/chroots";

// Encrypted environments are opened below this directory, at the
// environment's canonical path.
constexpr char DEFAULT_ALTERNATE_ROOT_DIR[] = "/var/run/unchroot";

// Present in an environment whose storage is encrypted.
constexpr char ENCRYPTED_MARKER[] = ".ecryptfs";

constexpr char MOUNTINFO[] = "/proc/self/mountinfo";

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {

#endif // __TEARDOWN_CONSTANTS_HPP__
