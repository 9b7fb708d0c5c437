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

#ifndef VERITAS_IDENTITY_ATTESTATION_BINDER_H_
#define VERITAS_IDENTITY_ATTESTATION_BINDER_H_

#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "veritas/nsm/nsm_device.h"
#include "veritas/util/byte_container_view.h"

namespace veritas {

// A signed attestation document produced by the NSM. It is opaque to this
// library; callers encode it for transport.
using AttestationDocument = std::vector<uint8_t>;

// AttestationBinder obtains attestation documents that bind a public key to
// the measured enclave image.
//
// Each call opens its own NSM handle, issues exactly one request, and releases
// the handle on every exit path, so concurrent calls never share a handle.
// Failures are returned to the caller without retrying:
//   * UNAVAILABLE if the device cannot be opened or used, or rejects the
//     request with an error code;
//   * INTERNAL if the device answers with anything other than an attestation
//     document.
class AttestationBinder {
 public:
  explicit AttestationBinder(NsmDeviceOpener opener);

  // Returns a document embedding |public_key|. No user data or nonce is
  // attested.
  absl::StatusOr<AttestationDocument> GetAttestation(
      ByteContainerView public_key) const;

 private:
  NsmDeviceOpener opener_;
};

}  // namespace veritas

#endif  // VERITAS_IDENTITY_ATTESTATION_BINDER_H_
