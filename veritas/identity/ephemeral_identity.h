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

#ifndef VERITAS_IDENTITY_EPHEMERAL_IDENTITY_H_
#define VERITAS_IDENTITY_EPHEMERAL_IDENTITY_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "veritas/crypto/keys.pb.h"
#include "veritas/crypto/signing_key.h"
#include "veritas/util/byte_container_view.h"

namespace veritas {

// EphemeralIdentity is the enclave's signing identity for one process
// lifetime. It is generated once, after the kernel entropy pool has been
// seeded, and never persisted. The private key is only reachable through
// Sign(); it cannot be read or exported.
//
// An EphemeralIdentity is immutable after creation and may be shared across
// threads by const reference.
class EphemeralIdentity {
 public:
  // Generates a fresh Ed25519 identity. Returns UNAVAILABLE without generating
  // anything if libcrypto reports that its random generator is not seeded.
  static absl::StatusOr<std::unique_ptr<EphemeralIdentity>> Generate();

  // Creates an identity around an existing |signing_key|.
  static absl::StatusOr<std::unique_ptr<EphemeralIdentity>> FromSigningKey(
      std::unique_ptr<SigningKey> signing_key);

  EphemeralIdentity(const EphemeralIdentity &other) = delete;
  EphemeralIdentity &operator=(const EphemeralIdentity &other) = delete;

  // Returns the raw public key.
  const std::vector<uint8_t> &public_key() const { return public_key_; }

  // Returns the lowercase hex encoding of the public key.
  std::string public_key_hex() const;

  SignatureScheme signature_scheme() const;

  // Returns a key that verifies this identity's signatures.
  absl::StatusOr<std::unique_ptr<VerifyingKey>> GetVerifyingKey() const;

  // Signs |message| with the private key.
  absl::Status Sign(ByteContainerView message,
                    std::vector<uint8_t> *signature) const;

 private:
  EphemeralIdentity(std::unique_ptr<SigningKey> signing_key,
                    std::vector<uint8_t> public_key);

  const std::unique_ptr<SigningKey> signing_key_;
  const std::vector<uint8_t> public_key_;
};

}  // namespace veritas

#endif  // VERITAS_IDENTITY_EPHEMERAL_IDENTITY_H_
