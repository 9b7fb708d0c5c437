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

#ifndef VERITAS_CRYPTO_SIGNING_KEY_H_
#define VERITAS_CRYPTO_SIGNING_KEY_H_

#include <cstdint>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "veritas/crypto/keys.pb.h"
#include "veritas/util/byte_container_view.h"

namespace veritas {

// VerifyingKey abstracts a verifying key from an asymmetric key-pair.
class VerifyingKey {
 public:
  virtual ~VerifyingKey() = default;

  virtual bool operator==(const VerifyingKey &other) const = 0;

  virtual bool operator!=(const VerifyingKey &other) const;

  // Returns the signature scheme used by this VerifyingKey.
  virtual SignatureScheme GetSignatureScheme() const = 0;

  // Returns the raw encoding of this VerifyingKey.
  virtual std::vector<uint8_t> SerializeToRaw() const = 0;

  // Returns a VerifyingKeyProto representation of this VerifyingKey.
  VerifyingKeyProto SerializeToKeyProto() const;

  // Verifies that |signature| is a valid signature over |message|. Returns
  // UNAUTHENTICATED if the signature does not verify.
  virtual absl::Status Verify(ByteContainerView message,
                              ByteContainerView signature) const = 0;
};

// SigningKey abstracts a signing key from an asymmetric key-pair.
//
// There is deliberately no way to serialize a SigningKey: the private half of
// an enclave identity only ever exists in process memory.
class SigningKey {
 public:
  virtual ~SigningKey() = default;

  // Returns the signature scheme used by this SigningKey.
  virtual SignatureScheme GetSignatureScheme() const = 0;

  // Returns a VerifyingKey that can verify signatures produced by this
  // SigningKey.
  virtual absl::StatusOr<std::unique_ptr<VerifyingKey>> GetVerifyingKey()
      const = 0;

  // Signs |message| and places the resulting signature in |signature|. Returns
  // a non-OK Status if the signing operation failed.
  virtual absl::Status Sign(ByteContainerView message,
                            std::vector<uint8_t> *signature) const = 0;
};

}  // namespace veritas

#endif  // VERITAS_CRYPTO_SIGNING_KEY_H_
