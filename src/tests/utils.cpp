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

#include "tests/utils.hpp"

#include <stout/gtest.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

#include <stout/os/chdir.hpp>
#include <stout/os/getcwd.hpp>
#include <stout/os/realpath.hpp>

#include "tests/environment.hpp"

using std::string;

namespace unchroot {
namespace internal {
namespace tests {

void TemporaryDirectoryTest::SetUp()
{
  // Save the current working directory.
  cwd = os::getcwd();

  Try<string> directory = environment->mkdtemp();
  ASSERT_SOME(directory) << "Failed to create a temporary directory";

  // Containment is decided on canonical paths and the temporary
  // directory may well live behind a symlink.
  Result<string> realpath = os::realpath(directory.get());
  ASSERT_SOME(realpath);

  sandbox = realpath.get();

  ASSERT_SOME(os::chdir(sandbox.get()));
}


void TemporaryDirectoryTest::TearDown()
{
  // Return to previous working directory; the directory itself is
  // removed by the environment once the test ends.
  ASSERT_SOME(os::chdir(cwd));

  sandbox = None();
}

} // namespace tests {
} // namespace internal {
} // namespace unchroot {
