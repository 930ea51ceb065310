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

#ifndef __FS_HPP__
#define __FS_HPP__

#include <sys/mount.h>
#include <sys/types.h>

#include <string>
#include <vector>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

// Define relevant MS_* flags for old includes.
// This is taken from the enum in sys/mount.h.
#ifndef MS_NOSUID
#define MS_NOSUID 2
#endif

#ifndef MS_NODEV
#define MS_NODEV 4
#endif

#ifndef MS_NOEXEC
#define MS_NOEXEC 8
#endif

#ifndef MS_NOATIME
#define MS_NOATIME 1024
#endif

#ifndef MS_NODIRATIME
#define MS_NODIRATIME 2048
#endif

#ifndef MS_REMOUNT
#define MS_REMOUNT 32
#endif

#ifndef MS_BIND
#define MS_BIND 4096
#endif

#ifndef MS_REC
#define MS_REC 16384
#endif

#ifndef MS_SLAVE
#define MS_SLAVE (1 << 19)
#endif

#ifndef MS_SHARED
#define MS_SHARED (1 << 20)
#endif

#ifndef MS_RELATIME
#define MS_RELATIME (1 << 21)
#endif

#ifndef MS_STRICTATIME
#define MS_STRICTATIME (1 << 24)
#endif

#ifndef MNT_DETACH
#define MNT_DETACH 2
#endif

#ifndef MS_NOSYMFOLLOW
#define MS_NOSYMFOLLOW 256
#endif

namespace unchroot {
namespace internal {
namespace fs {

// Decodes the octal escapes ("\040" for a space, "\011" for a tab,
// "\012" for a newline and "\134" for a backslash) the kernel uses
// when printing paths in /proc/[pid]/mountinfo. Sequences that are
// not a backslash followed by three octal digits are kept verbatim.
std::string unescape(const std::string& s);


// Returns true if 'path' is 'root' or lies below it. Both paths are
// expected to be absolute and canonical; a trailing slash on either
// one is ignored.
bool contains(const std::string& root, const std::string& path);


// Structure describing the per-process mounts as found in
// /proc/[pid]/mountinfo. In particular, entries in this table specify
// the propagation properties of mounts, information not present in
// /proc/mounts. Entry order is preserved when parsing.
struct MountInfoTable {
  // Structure describing an individual /proc/[pid]/mountinfo entry.
  // See the /proc/[pid]/mountinfo section in 'man proc' for further
  // details on each field. Path fields are stored unescaped.
  struct Entry {
    static Try<Entry> parse(const std::string& s);

    Entry() {}

    // Returns the MS_* flags matching the per-mount options, i.e.,
    // the flags a bind remount has to repeat to keep them.
    unsigned long flags() const;

    int id;                     // mountinfo[1]: mount ID.
    int parent;                 // mountinfo[2]: parent ID.
    dev_t devno;                // mountinfo[3]: st_dev.

    std::string root;           // mountinfo[4]: root of the mount.
    std::string target;         // mountinfo[5]: mount point.

    // Filesystem independent (VFS) options, e.g., "rw,noatime".
    std::string vfsOptions;     // mountinfo[6]: per-mount options.
    // Filesystem dependent options, e.g., "rw,mode=755".
    std::string fsOptions;      // mountinfo[11]: per-block options.

    // Current possible optional fields include shared:X, master:X,
    // propagate_from:X, unbindable.
    std::string optionalFields; // mountinfo[7]: optional fields.

    // mountinfo[8] is a separator.

    std::string type;           // mountinfo[9]: filesystem type.
    std::string source;         // mountinfo[10]: source dev, other.
  };

  // Read a mountinfo table from a file.
  // @param   path    The mountinfo file, by default the one of the
  //                  calling process.
  // @return  An instance of MountInfoTable if success.
  static Try<MountInfoTable> read(
      const std::string& path = "/proc/self/mountinfo");

  // Read a mountinfo table from a string.
  // @param   lines   The contents of a mountinfo table represented as
  //                  a string. Different entries in the string are
  //                  separated by a newline.
  // @return  An instance of MountInfoTable if success.
  static Try<MountInfoTable> parse(const std::string& lines);

  // Returns the target of every entry that is `path` itself or a
  // descendant of it, deepest path first. Targets of equal depth
  // keep reverse mount order so stacked mounts come off top first.
  // If `excludeRoot` is set, `path` itself is left out.
  std::vector<std::string> targets(
      const std::string& path,
      bool excludeRoot = false) const;

  // Returns true if some entry is mounted exactly at `target`.
  bool mounted(const std::string& target) const;

  // Returns the topmost entry mounted exactly at `target`, if any.
  Option<Entry> find(const std::string& target) const;

  std::vector<Entry> entries;
};


// Mount a file system.
// @param   source    Specify the file system (often a device name but
//                    it can also be a directory for a bind mount).
//                    If None(), nullptr will be passed as a dummy
//                    argument to mount(), i.e., it is not used for
//                    the specified mount operation. This is the case
//                    when only changing propagation or remounting.
// @param   target    Directory to be attached to.
// @param   type      File system type (listed in /proc/filesystems).
//                    If None(), nullptr will be passed as a dummy
//                    argument to mount().
// @param   flags     Mount flags.
// @param   data      Extra data interpreted by different file systems.
// @return  Whether the mount operation succeeds.
Try<Nothing> mount(const Option<std::string>& source,
                   const std::string& target,
                   const Option<std::string>& type,
                   unsigned long flags,
                   const void* data);


// Unmount a file system.
// @param   target    The (topmost) directory where the file system attaches.
// @param   flags     Unmount flags.
// @return  Whether the unmount operation succeeds.
Try<Nothing> unmount(const std::string& target, int flags = 0);

} // namespace fs {
} // namespace internal {
} // namespace unchroot {

#endif // __FS_HPP__
