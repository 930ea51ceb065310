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

#ifndef __TEARDOWN_SIGNALER_HPP__
#define __TEARDOWN_SIGNALER_HPP__

#include <sys/types.h>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace unchroot {
namespace internal {
namespace teardown {

class Signaler
{
public:
  virtual ~Signaler() {}

  // Sends `signal` to `pid`. A process that no longer exists is not
  // an error.
  virtual Try<Nothing> kill(pid_t pid, int signal) = 0;
};


class PosixSignaler : public Signaler
{
public:
  Try<Nothing> kill(pid_t pid, int signal) override;
};

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {

#endif // __TEARDOWN_SIGNALER_HPP__
