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

#ifndef VERITAS_BOOT_MOUNT_TABLE_H_
#define VERITAS_BOOT_MOUNT_TABLE_H_

#include <sys/mount.h>

#include "absl/status/status.h"
#include "absl/types/span.h"

namespace veritas {

// Mount flags for filesystems that must not contain devices, setuid binaries
// or executables.
inline constexpr unsigned long kMountNoDevSuidExec =
    MS_NODEV | MS_NOSUID | MS_NOEXEC;

// Mount flags for filesystems that may contain device nodes but no setuid
// binaries or executables.
inline constexpr unsigned long kMountNoSuidExec = MS_NOSUID | MS_NOEXEC;

// One virtual filesystem mounted during boot.
struct BootMountSpec {
  const char *source;
  const char *target;
  const char *fs_type;
  unsigned long flags;
  const char *options;
};

// Returns the filesystems mounted at boot, in mount order: the device,
// process, runtime and temporary filesystems, then sysfs, then the control
// group root nested beneath it.
absl::Span<const BootMountSpec> DefaultMountTable();

// Returns FAILED_PRECONDITION if any entry in |table| is listed before an
// entry whose target is one of its ancestor directories, or if a target is
// not an absolute path.
absl::Status ValidateMountOrder(absl::Span<const BootMountSpec> table);

}  // namespace veritas

#endif  // VERITAS_BOOT_MOUNT_TABLE_H_
