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

#ifndef VERITAS_CRYPTO_ED25519_SIGNING_KEY_H_
#define VERITAS_CRYPTO_ED25519_SIGNING_KEY_H_

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "veritas/crypto/keys.pb.h"
#include "veritas/crypto/signing_key.h"
#include "veritas/util/byte_container_view.h"
#include "veritas/util/function_deleter.h"

namespace veritas {

// Size of a raw Ed25519 public key, private seed, and signature in bytes.
inline constexpr size_t kEd25519PublicKeySize = 32;
inline constexpr size_t kEd25519SeedSize = 32;
inline constexpr size_t kEd25519SignatureSize = 64;

using EvpPkeyPtr = FunctionUniquePtr<EVP_PKEY, EVP_PKEY_free>;

// An implementation of the VerifyingKey interface for Ed25519 (RFC 8032).
class Ed25519VerifyingKey : public VerifyingKey {
 public:
  // Creates an Ed25519 verifying key from its raw 32-byte encoding.
  static absl::StatusOr<std::unique_ptr<Ed25519VerifyingKey>> Create(
      ByteContainerView raw_public_key);

  // Creates an Ed25519 verifying key from |key_proto|. Returns
  // INVALID_ARGUMENT if the proto names a different signature scheme.
  static absl::StatusOr<std::unique_ptr<Ed25519VerifyingKey>> CreateFromProto(
      const VerifyingKeyProto &key_proto);

  // From VerifyingKey.

  bool operator==(const VerifyingKey &other) const override;

  SignatureScheme GetSignatureScheme() const override;

  std::vector<uint8_t> SerializeToRaw() const override;

  absl::Status Verify(ByteContainerView message,
                      ByteContainerView signature) const override;

 private:
  Ed25519VerifyingKey(EvpPkeyPtr public_key,
                      std::vector<uint8_t> raw_public_key);

  EvpPkeyPtr public_key_;
  std::vector<uint8_t> raw_public_key_;
};

// An implementation of the SigningKey interface for Ed25519 (RFC 8032).
//
// Ed25519 signing is deterministic and the key is immutable after creation,
// so a single instance may sign from multiple threads concurrently.
class Ed25519SigningKey : public SigningKey {
 public:
  // Generates a new key from a seed drawn from libcrypto's random generator.
  static absl::StatusOr<std::unique_ptr<Ed25519SigningKey>> Create();

  // Creates a key from its 32-byte private seed.
  static absl::StatusOr<std::unique_ptr<Ed25519SigningKey>> CreateFromSeed(
      ByteContainerView seed);

  // Returns the raw 32-byte public key.
  absl::StatusOr<std::vector<uint8_t>> GetRawPublicKey() const;

  // From SigningKey.

  SignatureScheme GetSignatureScheme() const override;

  absl::StatusOr<std::unique_ptr<VerifyingKey>> GetVerifyingKey()
      const override;

  absl::Status Sign(ByteContainerView message,
                    std::vector<uint8_t> *signature) const override;

 private:
  explicit Ed25519SigningKey(EvpPkeyPtr private_key);

  EvpPkeyPtr private_key_;
};

}  // namespace veritas

#endif  // VERITAS_CRYPTO_ED25519_SIGNING_KEY_H_
