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

#ifndef __CLI_FLAGS_HPP__
#define __CLI_FLAGS_HPP__

#include <string>

#include <stout/duration.hpp>

#include "logging/flags.hpp"

namespace unchroot {
namespace internal {
namespace cli {

class Flags : public virtual logging::Flags
{
public:
  Flags();

  std::string chroots;
  bool all;
  bool force;
  bool yes;
  bool kill;
  bool patient;
  size_t tries;
  Duration interval;
  bool exclude_root;
  std::string shared_mounts;
  std::string core_marker;
  std::string alternate_root_dir;
  bool release_override;
  std::string proc;
};

} // namespace cli {
} // namespace internal {
} // namespace unchroot {

#endif // __CLI_FLAGS_HPP__
