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

#ifndef __TEARDOWN_MOUNTER_HPP__
#define __TEARDOWN_MOUNTER_HPP__

#include <string>
#include <vector>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "teardown/constants.hpp"

namespace unchroot {
namespace internal {
namespace teardown {

// The mount operations needed to take an environment apart. The
// mount table is read afresh by every call.
class Mounter
{
public:
  virtual ~Mounter() {}

  // Returns the mount targets at or below `path`, deepest first. If
  // `excludeRoot` is set, a mount at `path` itself is left out.
  virtual Try<std::vector<std::string>> targets(
      const std::string& path,
      bool excludeRoot) = 0;

  // Returns whether something is mounted exactly at `target`.
  virtual Try<bool> mounted(const std::string& target) = 0;

  // Makes one attempt at unmounting each of the targets, in order.
  // A target that is busy or no longer mounted does not stop the
  // others from being tried. Returns the targets still mounted
  // afterwards.
  virtual Try<std::vector<std::string>> unmount(
      const std::vector<std::string>& targets) = 0;

  // Turns `target` and the mounts below it into slaves, so that
  // unmounting them does not propagate to the mounts they were
  // bound from.
  virtual Try<Nothing> slave(const std::string& target) = 0;

  // Remounts `target` with 'noexec', 'nosuid' and 'nodev' on top of
  // the per-mount options it already has.
  virtual Try<Nothing> remountRestricted(const std::string& target) = 0;
};


class LinuxMounter : public Mounter
{
public:
  explicit LinuxMounter(const std::string& mountinfo = MOUNTINFO);

  Try<std::vector<std::string>> targets(
      const std::string& path,
      bool excludeRoot) override;

  Try<bool> mounted(const std::string& target) override;

  Try<std::vector<std::string>> unmount(
      const std::vector<std::string>& targets) override;

  Try<Nothing> slave(const std::string& target) override;

  Try<Nothing> remountRestricted(const std::string& target) override;

private:
  const std::string mountinfo;
};

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {

#endif // __TEARDOWN_MOUNTER_HPP__
