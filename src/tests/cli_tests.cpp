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

#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <stout/duration.hpp>
#include <stout/flags.hpp>
#include <stout/gtest.hpp>
#include <stout/none.hpp>
#include <stout/path.hpp>
#include <stout/try.hpp>

#include <stout/os/mkdir.hpp>
#include <stout/os/write.hpp>

#include "cli/environments.hpp"
#include "cli/flags.hpp"

#include "teardown/constants.hpp"
#include "teardown/orchestrator.hpp"

#include "tests/utils.hpp"

using std::string;
using std::vector;

using unchroot::internal::teardown::Environment;

namespace unchroot {
namespace internal {
namespace tests {

class EnvironmentsTest : public TemporaryDirectoryTest
{
protected:
  void SetUp() override
  {
    TemporaryDirectoryTest::SetUp();

    flags.chroots = path::join(sandbox.get(), "chroots");
    flags.alternate_root_dir = path::join(sandbox.get(), "alternate");

    ASSERT_SOME(os::mkdir(path::join(flags.chroots, "foo")));
    ASSERT_SOME(os::mkdir(path::join(flags.chroots, "bar")));
    ASSERT_SOME(os::write(path::join(flags.chroots, "README"), ""));
  }

  cli::Flags flags;
};


TEST_F(EnvironmentsTest, Names)
{
  Try<vector<Environment>> environments =
    cli::environments(flags, {"foo", "qux"});

  ASSERT_SOME(environments);
  ASSERT_EQ(2u, environments->size());

  EXPECT_EQ("foo", environments->at(0).name);
  EXPECT_EQ(path::join(flags.chroots, "foo"), environments->at(0).path);
  EXPECT_NONE(environments->at(0).alternate);

  // Missing environments are left for the teardown to report.
  EXPECT_EQ("qux", environments->at(1).name);
  EXPECT_EQ(path::join(flags.chroots, "qux"), environments->at(1).path);
}


TEST_F(EnvironmentsTest, Paths)
{
  const string baz = path::join(sandbox.get(), "elsewhere", "baz");

  Try<vector<Environment>> environments =
    cli::environments(flags, {baz, "./foo/"});

  ASSERT_SOME(environments);
  ASSERT_EQ(2u, environments->size());

  EXPECT_EQ("baz", environments->at(0).name);
  EXPECT_EQ(baz, environments->at(0).path);

  EXPECT_EQ("foo", environments->at(1).name);
  EXPECT_EQ("./foo/", environments->at(1).path);
}


TEST_F(EnvironmentsTest, All)
{
  flags.all = true;

  Try<vector<Environment>> environments =
    cli::environments(flags, vector<string>());

  ASSERT_SOME(environments);
  ASSERT_EQ(2u, environments->size());
  EXPECT_EQ("bar", environments->at(0).name);
  EXPECT_EQ("foo", environments->at(1).name);

  flags.chroots = path::join(sandbox.get(), "missing");
  EXPECT_ERROR(cli::environments(flags, vector<string>()));
}


TEST_F(EnvironmentsTest, Encrypted)
{
  const string foo = path::join(flags.chroots, "foo");
  ASSERT_SOME(os::mkdir(path::join(foo, teardown::ENCRYPTED_MARKER)));

  Try<vector<Environment>> environments =
    cli::environments(flags, {"foo", "bar"});

  ASSERT_SOME(environments);
  ASSERT_EQ(2u, environments->size());

  EXPECT_SOME_EQ(
      path::join(flags.alternate_root_dir, foo),
      environments->at(0).alternate);

  EXPECT_NONE(environments->at(1).alternate);
}


TEST(CliFlagsTest, Defaults)
{
  cli::Flags flags;

  EXPECT_EQ(teardown::DEFAULT_CHROOTS_DIR, flags.chroots);
  EXPECT_EQ(teardown::DEFAULT_TRIES, flags.tries);
  EXPECT_EQ(teardown::DEFAULT_INTERVAL, flags.interval);
  EXPECT_EQ(teardown::DEFAULT_SHARED_MOUNTS, flags.shared_mounts);
  EXPECT_EQ("/proc", flags.proc);
  EXPECT_FALSE(flags.all);
  EXPECT_FALSE(flags.yes);
  EXPECT_FALSE(flags.kill);
}


TEST(CliFlagsTest, Load)
{
  cli::Flags flags;

  const char* argv[] = {
    "unchroot",
    "--tries=3",
    "--interval=250ms",
    "--patient",
    "--shared_mounts=var/host/media,mnt/usb",
    "foo"
  };

  int argc = sizeof(argv) / sizeof(argv[0]);
  char** _argv = const_cast<char**>(argv);

  Try<flags::Warnings> load = flags.load(None(), &argc, &_argv);
  ASSERT_SOME(load);

  EXPECT_EQ(3u, flags.tries);
  EXPECT_EQ(Milliseconds(250), flags.interval);
  EXPECT_TRUE(flags.patient);
  EXPECT_EQ("var/host/media,mnt/usb", flags.shared_mounts);

  // Only the environment is left.
  ASSERT_EQ(2, argc);
  EXPECT_EQ(string("foo"), _argv[1]);
}

} // namespace tests {
} // namespace internal {
} // namespace unchroot {
