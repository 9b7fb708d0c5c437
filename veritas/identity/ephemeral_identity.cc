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

#include "veritas/identity/ephemeral_identity.h"

#include <openssl/rand.h>

#include <utility>

#include "absl/memory/memory.h"
#include "veritas/crypto/ed25519_signing_key.h"
#include "veritas/util/hex_util.h"
#include "veritas/util/logging.h"
#include "veritas/util/status_macros.h"

namespace veritas {

absl::StatusOr<std::unique_ptr<EphemeralIdentity>>
EphemeralIdentity::Generate() {
  if (RAND_status() != 1) {
    return absl::UnavailableError(
        "Refusing to generate an identity: the random generator is not "
        "seeded");
  }
  std::unique_ptr<Ed25519SigningKey> signing_key;
  VERITAS_ASSIGN_OR_RETURN(signing_key, Ed25519SigningKey::Create());
  return FromSigningKey(std::move(signing_key));
}

absl::StatusOr<std::unique_ptr<EphemeralIdentity>>
EphemeralIdentity::FromSigningKey(std::unique_ptr<SigningKey> signing_key) {
  if (signing_key == nullptr) {
    return absl::InvalidArgumentError("Signing key must not be null");
  }
  std::unique_ptr<VerifyingKey> verifying_key;
  VERITAS_ASSIGN_OR_RETURN(verifying_key, signing_key->GetVerifyingKey());
  std::vector<uint8_t> public_key = verifying_key->SerializeToRaw();
  VLOG(1) << "Created enclave identity with public key "
          << BytesToHex(public_key);
  return absl::WrapUnique(
      new EphemeralIdentity(std::move(signing_key), std::move(public_key)));
}

EphemeralIdentity::EphemeralIdentity(std::unique_ptr<SigningKey> signing_key,
                                     std::vector<uint8_t> public_key)
    : signing_key_(std::move(signing_key)),
      public_key_(std::move(public_key)) {}

std::string EphemeralIdentity::public_key_hex() const {
  return BytesToHex(public_key_);
}

SignatureScheme EphemeralIdentity::signature_scheme() const {
  return signing_key_->GetSignatureScheme();
}

absl::StatusOr<std::unique_ptr<VerifyingKey>>
EphemeralIdentity::GetVerifyingKey() const {
  return signing_key_->GetVerifyingKey();
}

absl::Status EphemeralIdentity::Sign(ByteContainerView message,
                                     std::vector<uint8_t> *signature) const {
  return signing_key_->Sign(message, signature);
}

}  // namespace veritas
