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

#ifndef VERITAS_IDENTITY_INTENT_SIGNER_H_
#define VERITAS_IDENTITY_INTENT_SIGNER_H_

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "veritas/crypto/signing_key.h"
#include "veritas/identity/ephemeral_identity.h"
#include "veritas/identity/intent_message.h"
#include "veritas/identity/intent_scope.h"
#include "veritas/identity/signed_response.h"
#include "veritas/util/hex_util.h"
#include "veritas/util/status_macros.h"

namespace veritas {

// Binds |data| to |intent| and |timestamp_ms|, signs the canonical bytes of
// the resulting IntentMessage with |identity|, and returns the message with
// its hex-encoded signature.
//
// No signature is produced if canonicalization fails; the error is returned
// instead.
template <typename T>
absl::StatusOr<SignedResponse<T>> SignIntent(const EphemeralIdentity &identity,
                                             T data, uint64_t timestamp_ms,
                                             IntentScope intent) {
  SignedResponse<T> signed_response;
  signed_response.response.intent = intent;
  signed_response.response.timestamp_ms = timestamp_ms;
  signed_response.response.data = std::move(data);

  std::vector<uint8_t> canonical_bytes;
  VERITAS_ASSIGN_OR_RETURN(canonical_bytes,
                           CanonicalizeIntentMessage(signed_response.response));
  std::vector<uint8_t> signature;
  VERITAS_RETURN_IF_ERROR(identity.Sign(canonical_bytes, &signature));
  signed_response.signature = BytesToHex(signature);
  return signed_response;
}

// Re-canonicalizes |signed_response.response| and checks its signature with
// |verifying_key|, as an independent verifier would.
template <typename T>
absl::Status VerifySignedResponse(const VerifyingKey &verifying_key,
                                  const SignedResponse<T> &signed_response) {
  std::vector<uint8_t> signature;
  VERITAS_ASSIGN_OR_RETURN(signature, HexToBytes(signed_response.signature));
  std::vector<uint8_t> canonical_bytes;
  VERITAS_ASSIGN_OR_RETURN(canonical_bytes,
                           CanonicalizeIntentMessage(signed_response.response));
  return verifying_key.Verify(canonical_bytes, signature);
}

}  // namespace veritas

#endif  // VERITAS_IDENTITY_INTENT_SIGNER_H_
