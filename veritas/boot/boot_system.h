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

#ifndef VERITAS_BOOT_BOOT_SYSTEM_H_
#define VERITAS_BOOT_BOOT_SYSTEM_H_

#include <memory>
#include <string>

#include "absl/status/status.h"
#include "veritas/boot/mount_table.h"
#include "veritas/util/byte_container_view.h"

namespace veritas {

// Abstraction over the kernel interfaces used while bringing up the enclave.
// This interface collects every operation of the boot sequence that needs a
// privileged process, so that the sequence itself can run against a mock.
class BootSystem {
 public:
  // Constructs the implementation backed by Linux system calls.
  static std::unique_ptr<BootSystem> CreateDefault();

  virtual ~BootSystem() = default;

  // Returns true if |path| exists.
  virtual bool PathExists(const std::string &path) const = 0;

  // Creates |path| and any missing parent directories.
  virtual absl::Status MakeDirectories(const std::string &path) = 0;

  // Mounts the filesystem described by |spec|.
  virtual absl::Status Mount(const BootMountSpec &spec) = 0;

  // Reopens standard stream |fd| (0, 1 or 2) on |path|. Standard input is
  // opened for reading, the output streams for writing.
  virtual absl::Status RedirectStandardStream(int fd,
                                              const std::string &path) = 0;

  // Mixes |entropy| into the kernel random pool and credits the pool with
  // eight bits of entropy per byte.
  virtual absl::Status AddEntropy(ByteContainerView entropy) = 0;

  // Flushes filesystem buffers.
  virtual void Sync() = 0;

  // Restarts the machine. Returns only on failure.
  virtual absl::Status Reboot() = 0;
};

}  // namespace veritas

#endif  // VERITAS_BOOT_BOOT_SYSTEM_H_
