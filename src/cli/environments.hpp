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

#ifndef __CLI_ENVIRONMENTS_HPP__
#define __CLI_ENVIRONMENTS_HPP__

#include <string>
#include <vector>

#include <stout/try.hpp>

#include "cli/flags.hpp"

#include "teardown/orchestrator.hpp"

namespace unchroot {
namespace internal {
namespace cli {

// Turns the command line arguments into environments. An argument
// containing a '/' is taken as a path, anything else as the name of
// an environment in `--chroots`. With `--all` the arguments are
// ignored and every directory in `--chroots` is returned, sorted by
// name. Environments kept on encrypted storage get their alternate
// root set.
Try<std::vector<teardown::Environment>> environments(
    const Flags& flags,
    const std::vector<std::string>& arguments);

} // namespace cli {
} // namespace internal {
} // namespace unchroot {

#endif // __CLI_ENVIRONMENTS_HPP__
