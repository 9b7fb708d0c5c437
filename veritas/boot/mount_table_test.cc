/*
 *
 * Copyright 2026 Veritas authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */

#include "veritas/boot/mount_table.h"

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "veritas/test/util/status_matchers.h"

namespace veritas {
namespace {

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::StrEq;

TEST(MountTableTest, DefaultTableIsCorrectlyOrdered) {
  VERITAS_EXPECT_OK(ValidateMountOrder(DefaultMountTable()));
}

TEST(MountTableTest, DefaultTableContents) {
  absl::Span<const BootMountSpec> table = DefaultMountTable();
  ASSERT_THAT(table.size(), Eq(8));

  std::vector<std::string> targets;
  for (const BootMountSpec &spec : table) {
    targets.push_back(spec.target);
  }
  EXPECT_THAT(targets,
              ::testing::ElementsAre("/dev", "/dev/pts", "/dev/shm", "/proc",
                                     "/run", "/tmp", "/sys", "/sys/fs/cgroup"));

  EXPECT_THAT(table[0].fs_type, StrEq("devtmpfs"));
  EXPECT_THAT(table[0].flags, Eq(kMountNoSuidExec));
  EXPECT_THAT(table[1].flags, Eq(kMountNoSuidExec));
  EXPECT_THAT(table[3].options, StrEq("hidepid=2"));
  EXPECT_THAT(table[7].source, StrEq("cgroup_root"));
  EXPECT_THAT(table[7].fs_type, StrEq("tmpfs"));
}

TEST(MountTableTest, OnlyDeviceFilesystemsAllowDeviceNodes) {
  for (const BootMountSpec &spec : DefaultMountTable()) {
    EXPECT_NE(spec.flags & MS_NOSUID, 0u) << spec.target;
    EXPECT_NE(spec.flags & MS_NOEXEC, 0u) << spec.target;
    bool is_device_fs = std::string(spec.target) == "/dev" ||
                        std::string(spec.target) == "/dev/pts";
    EXPECT_THAT((spec.flags & MS_NODEV) == 0, Eq(is_device_fs)) << spec.target;
  }
}

TEST(MountTableTest, CgroupRootBeforeSysfsIsRejected) {
  const BootMountSpec table[] = {
      {"cgroup_root", "/sys/fs/cgroup", "tmpfs", kMountNoDevSuidExec, ""},
      {"sysfs", "/sys", "sysfs", kMountNoDevSuidExec, ""},
  };
  EXPECT_THAT(ValidateMountOrder(table),
              StatusIs(absl::StatusCode::kFailedPrecondition,
                       HasSubstr("/sys/fs/cgroup")));
}

TEST(MountTableTest, SiblingPrefixIsNotAnAncestor) {
  const BootMountSpec table[] = {
      {"tmpfs", "/run2/x", "tmpfs", kMountNoDevSuidExec, ""},
      {"tmpfs", "/run", "tmpfs", kMountNoDevSuidExec, ""},
  };
  VERITAS_EXPECT_OK(ValidateMountOrder(table));
}

TEST(MountTableTest, RelativeTargetIsRejected) {
  const BootMountSpec table[] = {
      {"tmpfs", "tmp", "tmpfs", kMountNoDevSuidExec, ""},
  };
  EXPECT_THAT(ValidateMountOrder(table),
              StatusIs(absl::StatusCode::kFailedPrecondition));
}

}  // namespace
}  // namespace veritas
