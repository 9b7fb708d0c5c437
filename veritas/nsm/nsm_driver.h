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

#ifndef VERITAS_NSM_NSM_DRIVER_H_
#define VERITAS_NSM_NSM_DRIVER_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "veritas/nsm/nsm_device.h"
#include "veritas/util/byte_container_view.h"
#include "veritas/util/fd_utils.h"

namespace veritas {

// The path of the NSM character device inside a Nitro enclave.
inline constexpr char kDefaultNsmDevicePath[] = "/dev/nsm";

// Limits imposed by the NSM driver on a single message exchange.
inline constexpr size_t kNsmRequestMaxSize = 0x1000;
inline constexpr size_t kNsmResponseMaxSize = 0x3000;

// NsmDriver talks to the NSM kernel driver through its ioctl interface.
//
// Every failure to reach the device, whether opening it or exchanging a
// message, is reported as UNAVAILABLE with the underlying errno attached (see
// GetErrno()).
class NsmDriver : public NsmDevice {
 public:
  // Opens the NSM device at |path|.
  static absl::StatusOr<std::unique_ptr<NsmDriver>> Open(
      absl::string_view path = kDefaultNsmDevicePath);

  // Returns an NsmDeviceOpener that calls Open(|path|).
  static NsmDeviceOpener Opener(std::string path = kDefaultNsmDevicePath);

  NsmDriver(const NsmDriver &other) = delete;
  NsmDriver &operator=(const NsmDriver &other) = delete;

  // From NsmDevice.
  absl::StatusOr<CleansingVector<uint8_t>> Transact(
      ByteContainerView request) override;

 private:
  explicit NsmDriver(ScopedFd fd);

  ScopedFd fd_;
};

}  // namespace veritas

#endif  // VERITAS_NSM_NSM_DRIVER_H_
