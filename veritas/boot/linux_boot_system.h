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

#ifndef VERITAS_BOOT_LINUX_BOOT_SYSTEM_H_
#define VERITAS_BOOT_LINUX_BOOT_SYSTEM_H_

#include <string>

#include "absl/status/status.h"
#include "veritas/boot/boot_system.h"

namespace veritas {

// Path of the kernel random device that accepts RNDADDENTROPY.
inline constexpr char kKernelRandomDevicePath[] = "/dev/random";

// BootSystem implemented with Linux system calls. Most operations require
// the process to run as root, as the enclave init process does.
class LinuxBootSystem : public BootSystem {
 public:
  LinuxBootSystem() = default;

  bool PathExists(const std::string &path) const override;
  absl::Status MakeDirectories(const std::string &path) override;
  absl::Status Mount(const BootMountSpec &spec) override;
  absl::Status RedirectStandardStream(int fd,
                                      const std::string &path) override;
  absl::Status AddEntropy(ByteContainerView entropy) override;
  void Sync() override;
  absl::Status Reboot() override;
};

}  // namespace veritas

#endif  // VERITAS_BOOT_LINUX_BOOT_SYSTEM_H_
