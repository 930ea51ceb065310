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

#include "teardown/signaler.hpp"

#include <errno.h>
#include <signal.h>
#include <string.h>

#include <stout/error.hpp>
#include <stout/stringify.hpp>

namespace unchroot {
namespace internal {
namespace teardown {

Try<Nothing> PosixSignaler::kill(pid_t pid, int signal)
{
  if (::kill(pid, signal) < 0 && errno != ESRCH) {
    const int error = errno;
    return ErrnoError(
        error,
        "Failed to send " + stringify(strsignal(signal)) +
        " to process " + stringify(pid));
  }

  return Nothing();
}

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {
