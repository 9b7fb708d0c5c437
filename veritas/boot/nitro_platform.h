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

#ifndef VERITAS_BOOT_NITRO_PLATFORM_H_
#define VERITAS_BOOT_NITRO_PLATFORM_H_

#include <cstdint>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "veritas/boot/boot_report.h"
#include "veritas/boot/platform_initializer.h"

namespace veritas {

// The vsock context ID of the parent instance.
inline constexpr uint32_t kNitroParentCid = 3;

// The vsock port on which the parent instance waits for the heartbeat.
inline constexpr uint32_t kNitroHeartbeatPort = 9000;

// The byte sent to the parent instance and echoed back by it.
inline constexpr uint8_t kNitroHeartbeat = 0xB7;

// Default location of the Nitro Security Module kernel module.
inline constexpr char kDefaultNsmModulePath[] = "/nsm.ko";

// How long the heartbeat waits on each send or receive before giving up.
inline constexpr absl::Duration kNitroHeartbeatTimeout = absl::Seconds(5);

// Operations of the Nitro Enclaves platform used during initialization.
class NitroHardware {
 public:
  // Constructs the implementation backed by vsock and finit_module().
  static std::unique_ptr<NitroHardware> CreateDefault();

  virtual ~NitroHardware() = default;

  // Connects to |port| on vsock context |cid|, sends |heartbeat| and returns
  // the single byte received in reply.
  virtual absl::StatusOr<uint8_t> ExchangeHeartbeat(uint32_t cid,
                                                    uint32_t port,
                                                    uint8_t heartbeat) = 0;

  // Loads the kernel module stored at |path|.
  virtual absl::Status LoadKernelModule(const std::string &path) = 0;
};

// PlatformInitializer for AWS Nitro Enclaves. Signals liveness to the parent
// instance, then loads the NSM driver so that /dev/nsm becomes available.
class NitroPlatform : public PlatformInitializer {
 public:
  NitroPlatform(std::unique_ptr<NitroHardware> hardware,
                std::string nsm_module_path);

  // From PlatformInitializer.
  void Initialize(BootReport *report) override;

 private:
  absl::Status SendHeartbeat();

  std::unique_ptr<NitroHardware> hardware_;
  const std::string nsm_module_path_;
};

}  // namespace veritas

#endif  // VERITAS_BOOT_NITRO_PLATFORM_H_
