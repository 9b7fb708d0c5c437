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

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace veritas {
namespace {

constexpr BootMountSpec kDefaultMountTable[] = {
    {"devtmpfs", "/dev", "devtmpfs", kMountNoSuidExec, "mode=0755"},
    {"devpts", "/dev/pts", "devpts", kMountNoSuidExec, ""},
    {"shm", "/dev/shm", "tmpfs", kMountNoDevSuidExec, "mode=0755"},
    {"proc", "/proc", "proc", kMountNoDevSuidExec, "hidepid=2"},
    {"tmpfs", "/run", "tmpfs", kMountNoDevSuidExec, "mode=0755"},
    {"tmpfs", "/tmp", "tmpfs", kMountNoDevSuidExec, ""},
    {"sysfs", "/sys", "sysfs", kMountNoDevSuidExec, ""},
    {"cgroup_root", "/sys/fs/cgroup", "tmpfs", kMountNoDevSuidExec,
     "mode=0755"},
};

// Returns true if |ancestor| is a proper ancestor directory of |path|.
bool IsProperAncestor(absl::string_view ancestor, absl::string_view path) {
  if (ancestor == "/") {
    return path != "/";
  }
  return path.size() > ancestor.size() && absl::StartsWith(path, ancestor) &&
         path[ancestor.size()] == '/';
}

}  // namespace

absl::Span<const BootMountSpec> DefaultMountTable() {
  return kDefaultMountTable;
}

absl::Status ValidateMountOrder(absl::Span<const BootMountSpec> table) {
  for (size_t i = 0; i < table.size(); ++i) {
    absl::string_view target = table[i].target;
    if (!absl::StartsWith(target, "/")) {
      return absl::FailedPreconditionError(
          absl::StrCat("Mount target ", target, " is not an absolute path"));
    }
    for (size_t j = i + 1; j < table.size(); ++j) {
      if (IsProperAncestor(table[j].target, target)) {
        return absl::FailedPreconditionError(
            absl::StrCat("Mount target ", target, " is listed before ",
                         table[j].target, " which contains it"));
      }
    }
  }
  return absl::OkStatus();
}

}  // namespace veritas
