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

#ifndef VERITAS_NSM_NSM_DEVICE_H_
#define VERITAS_NSM_NSM_DEVICE_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "absl/status/statusor.h"
#include "veritas/nsm/nsm_messages.h"
#include "veritas/util/byte_container_view.h"
#include "veritas/util/cleansing_allocator.h"

namespace veritas {

// NsmDevice is an open handle to a Nitro Security Module. The handle is
// released when the object is destroyed.
class NsmDevice {
 public:
  virtual ~NsmDevice() = default;

  // Sends one CBOR-encoded request and returns the CBOR-encoded response.
  // Returns UNAVAILABLE if the device cannot service the request.
  virtual absl::StatusOr<CleansingVector<uint8_t>> Transact(
      ByteContainerView request) = 0;

  // Encodes |request|, sends it, and decodes the device's response.
  absl::StatusOr<NsmResponse> ProcessRequest(const NsmRequest &request);
};

// Acquires a fresh NsmDevice handle. Callers open a handle immediately before
// use and let it go out of scope as soon as the request completes.
using NsmDeviceOpener =
    std::function<absl::StatusOr<std::unique_ptr<NsmDevice>>()>;

}  // namespace veritas

#endif  // VERITAS_NSM_NSM_DEVICE_H_
