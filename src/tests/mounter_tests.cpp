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

#include <algorithm>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <stout/duration.hpp>
#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/none.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include <stout/os/mkdir.hpp>
#include <stout/os/write.hpp>

#include "linux/fs.hpp"

#include "teardown/constants.hpp"
#include "teardown/decider.hpp"
#include "teardown/mounter.hpp"
#include "teardown/orchestrator.hpp"
#include "teardown/scanner.hpp"
#include "teardown/signaler.hpp"
#include "teardown/usage.hpp"

#include "tests/utils.hpp"

using namespace unchroot::internal::teardown;

using std::string;
using std::vector;

namespace unchroot {
namespace internal {
namespace tests {

class LinuxMounterTest : public TemporaryDirectoryTest
{
protected:
  // Writes a mount table with one entry per target.
  void fabricate(const vector<string>& targets)
  {
    string lines;
    int id = 20;
    foreach (const string& target, targets) {
      lines += stringify(id) + " 1 0:42 / " + target +
               " rw,relatime - tmpfs tmpfs rw\n";
      id++;
    }

    ASSERT_SOME(os::write(mountinfo(), lines));
  }

  string mountinfo()
  {
    return path::join(sandbox.get(), "mountinfo");
  }
};


TEST_F(LinuxMounterTest, Targets)
{
  fabricate({"/", "/chroots/my\\040env", "/chroots/my\\040env/proc"});

  LinuxMounter mounter(mountinfo());

  EXPECT_SOME_EQ(
      vector<string>({"/chroots/my env/proc", "/chroots/my env"}),
      mounter.targets("/chroots/my env", false));

  EXPECT_SOME_EQ(
      vector<string>({"/chroots/my env/proc"}),
      mounter.targets("/chroots/my env", true));

  EXPECT_SOME_TRUE(mounter.mounted("/chroots/my env/proc"));
  EXPECT_SOME_FALSE(mounter.mounted("/chroots/other"));
}


TEST_F(LinuxMounterTest, MissingTable)
{
  LinuxMounter mounter(path::join(sandbox.get(), "missing"));

  EXPECT_ERROR(mounter.targets("/chroots/foo", false));
  EXPECT_ERROR(mounter.mounted("/chroots/foo"));
  EXPECT_ERROR(mounter.unmount({"/chroots/foo"}));
}


// Whatever the unmount attempts did, the mount table decides what
// is left; targets that were never mounted are not reported.
TEST_F(LinuxMounterTest, UnmountReportsRemaining)
{
  const string busy = path::join(sandbox.get(), "busy");
  const string gone = path::join(sandbox.get(), "gone");

  fabricate({busy});

  LinuxMounter mounter(mountinfo());

  EXPECT_SOME_EQ(vector<string>({busy}), mounter.unmount({busy, gone}));
  EXPECT_SOME_EQ(vector<string>(), mounter.unmount({gone}));
}


TEST_F(LinuxMounterTest, ROOT_UnmountNested)
{
  const string root = path::join(sandbox.get(), "env");
  const string proc = path::join(root, "proc");

  ASSERT_SOME(os::mkdir(root));
  ASSERT_SOME(fs::mount(string("tmpfs"), root, string("tmpfs"), 0, nullptr));
  ASSERT_SOME(os::mkdir(proc));
  ASSERT_SOME(fs::mount(string("tmpfs"), proc, string("tmpfs"), 0, nullptr));

  LinuxMounter mounter;

  Try<vector<string>> targets = mounter.targets(root, false);
  ASSERT_SOME_EQ(vector<string>({proc, root}), targets);

  EXPECT_SOME_EQ(vector<string>(), mounter.unmount(targets.get()));
  EXPECT_SOME_FALSE(mounter.mounted(root));

  // Unmounting again is harmless.
  EXPECT_SOME_EQ(vector<string>(), mounter.unmount(targets.get()));
}


TEST_F(LinuxMounterTest, ROOT_RemountRestricted)
{
  const string root = path::join(sandbox.get(), "chroots");

  ASSERT_SOME(os::mkdir(root));
  ASSERT_SOME(fs::mount(root, root, None(), MS_BIND, nullptr));
  ASSERT_SOME(fs::mount(
      None(), root, None(), MS_REMOUNT | MS_BIND | MS_RDONLY, nullptr));

  LinuxMounter mounter;
  ASSERT_SOME(mounter.remountRestricted(root));

  Try<fs::MountInfoTable> table = fs::MountInfoTable::read();
  ASSERT_SOME(table);

  Option<fs::MountInfoTable::Entry> entry = table->find(root);
  ASSERT_SOME(entry);

  const vector<string> options = strings::tokenize(entry->vfsOptions, ",");
  EXPECT_EQ(1, std::count(options.begin(), options.end(), "noexec"));
  EXPECT_EQ(1, std::count(options.begin(), options.end(), "nosuid"));
  EXPECT_EQ(1, std::count(options.begin(), options.end(), "nodev"));

  // The mount stays read-only.
  EXPECT_EQ(1, std::count(options.begin(), options.end(), "ro"));

  EXPECT_SOME(fs::unmount(root));
}


TEST_F(LinuxMounterTest, RemountRestrictedNotMounted)
{
  fabricate({"/", "/chroots/foo"});

  LinuxMounter mounter(mountinfo());

  EXPECT_ERROR(mounter.remountRestricted("/chroots"));
}


// Tears down an environment with the host's media mount bound into
// it. Mounts below the media mount go away inside the environment
// only, not on the host.
TEST_F(LinuxMounterTest, ROOT_SharedMediaSurvives)
{
  const string media = path::join(sandbox.get(), "media");
  const string usb = path::join(media, "usb");
  const string root = path::join(sandbox.get(), "chroots", "foo");
  const string bound = path::join(root, DEFAULT_SHARED_MOUNTS);

  ASSERT_SOME(os::mkdir(media));
  ASSERT_SOME(fs::mount(string("tmpfs"), media, string("tmpfs"), 0, nullptr));
  ASSERT_SOME(fs::mount(None(), media, None(), MS_SHARED, nullptr));
  ASSERT_SOME(os::mkdir(usb));

  ASSERT_SOME(os::mkdir(bound));
  ASSERT_SOME(fs::mount(media, bound, None(), MS_BIND, nullptr));

  // Shows up below 'bound' too through propagation.
  ASSERT_SOME(fs::mount(string("tmpfs"), usb, string("tmpfs"), 0, nullptr));

  Try<fs::MountInfoTable> table = fs::MountInfoTable::read();
  ASSERT_SOME(table);
  ASSERT_TRUE(table->mounted(path::join(bound, "usb")));

  ProcfsScanner scanner(DEFAULT_CORE_MARKER);
  UsageDetector detector(&scanner);
  LinuxMounter mounter;
  PosixSignaler signaler;
  PolicyDecider decider(Decider::ABORT);

  TeardownConfig config;
  config.interval = Duration::zero();

  TeardownOrchestrator orchestrator(
      config, &detector, &mounter, &signaler, &decider);

  Try<Outcome> outcome =
    orchestrator.teardown(teardown::Environment("foo", root));

  EXPECT_SOME_EQ(CLEARED, outcome);

  table = fs::MountInfoTable::read();
  ASSERT_SOME(table);
  EXPECT_FALSE(table->mounted(bound));
  EXPECT_TRUE(table->mounted(usb));
  EXPECT_TRUE(table->mounted(media));

  EXPECT_SOME(fs::unmount(usb));
  EXPECT_SOME(fs::unmount(media));
}

} // namespace tests {
} // namespace internal {
} // namespace unchroot {
