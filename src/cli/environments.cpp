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

#include "cli/environments.hpp"

#include <algorithm>
#include <list>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/strings.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/ls.hpp>
#include <stout/os/realpath.hpp>
#include <stout/os/stat.hpp>

#include "teardown/constants.hpp"

using std::list;
using std::string;
using std::vector;

using unchroot::internal::teardown::Environment;

namespace unchroot {
namespace internal {
namespace cli {

static Environment environment(const Flags& flags, const string& argument)
{
  string path = argument;
  if (!strings::contains(argument, "/")) {
    path = path::join(flags.chroots, argument);
  }

  Environment environment(Path(path).basename(), path);

  if (os::exists(path::join(path, teardown::ENCRYPTED_MARKER))) {
    Result<string> realpath = os::realpath(path);
    if (realpath.isSome()) {
      environment.alternate =
        path::join(flags.alternate_root_dir, realpath.get());
    }
  }

  return environment;
}


Try<vector<Environment>> environments(
    const Flags& flags,
    const vector<string>& arguments)
{
  vector<string> names;

  if (flags.all) {
    Try<list<string>> entries = os::ls(flags.chroots);
    if (entries.isError()) {
      return Error(
          "Failed to list '" + flags.chroots + "': " + entries.error());
    }

    foreach (const string& entry, entries.get()) {
      if (os::stat::isdir(path::join(flags.chroots, entry))) {
        names.push_back(entry);
      }
    }

    std::sort(names.begin(), names.end());
  } else {
    names = arguments;
  }

  vector<Environment> result;
  foreach (const string& name, names) {
    result.push_back(environment(flags, name));
  }

  return result;
}

} // namespace cli {
} // namespace internal {
} // namespace unchroot {
