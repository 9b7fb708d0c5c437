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

#ifndef VERITAS_SERVICE_ENCLAVE_SERVICE_H_
#define VERITAS_SERVICE_ENCLAVE_SERVICE_H_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "veritas/crypto/ed25519_signing_key.h"
#include "veritas/identity/attestation_binder.h"
#include "veritas/identity/ephemeral_identity.h"
#include "veritas/identity/freshness.h"
#include "veritas/identity/intent_scope.h"
#include "veritas/identity/intent_signer.h"
#include "veritas/identity/signed_response.h"
#include "veritas/nsm/nsm_device.h"
#include "veritas/service/enclave_service.pb.h"
#include "veritas/util/hex_util.h"
#include "veritas/util/status_macros.h"

namespace veritas {

// Loads an EnclaveServiceConfig from the text-format file at |path|. Fields
// absent from the file keep their defaults.
absl::StatusOr<EnclaveServiceConfig> LoadEnclaveServiceConfig(
    const std::string &path);

// Renders |message| as JSON, keeping the field names of the .proto file.
absl::StatusOr<std::string> MessageToJson(
    const google::protobuf::Message &message);

// Returns |value| as a JSON number. JSON numbers are doubles, so values above
// 2^53 return OUT_OF_RANGE rather than lose precision; a signature over the
// exact integer could not be checked against the rounded one.
absl::StatusOr<google::protobuf::Value> JsonIntegerValue(uint64_t value);

// Renders the JSON envelope of a signed response from its parts:
//
//   {"response": {"intent": 0, "timestamp_ms": 1744038900000, "data": ...},
//    "signature": "..."}
//
// Returns OUT_OF_RANGE if |timestamp_ms| exceeds 2^53.
absl::StatusOr<std::string> SignedEnvelopeToJson(
    IntentScope intent, uint64_t timestamp_ms,
    const google::protobuf::Value &data, const std::string &signature);

// Renders |signed_response| with SignedEnvelopeToJson(). The payload type
// must provide
// `absl::StatusOr<google::protobuf::Value> ToJsonValue() const`, and any error
// it returns is propagated.
template <typename T>
absl::StatusOr<std::string> SignedResponseToJson(
    const SignedResponse<T> &signed_response) {
  google::protobuf::Value data;
  VERITAS_ASSIGN_OR_RETURN(data, signed_response.response.data.ToJsonValue());
  return SignedEnvelopeToJson(signed_response.response.intent,
                              signed_response.response.timestamp_ms, data,
                              signed_response.signature);
}

// Checks |signed_response| using only the key published in |identity|, as a
// remote verifier would. Returns INVALID_ARGUMENT if the published key is
// malformed or its raw and proto forms disagree, and UNAUTHENTICATED if the
// signature does not verify.
template <typename T>
absl::Status VerifyWithIdentity(const IdentityResponse &identity,
                                const SignedResponse<T> &signed_response) {
  std::unique_ptr<Ed25519VerifyingKey> verifying_key;
  VERITAS_ASSIGN_OR_RETURN(
      verifying_key,
      Ed25519VerifyingKey::CreateFromProto(identity.verifying_key()));
  std::vector<uint8_t> published_key;
  VERITAS_ASSIGN_OR_RETURN(published_key, HexToBytes(identity.pk()));
  if (published_key != verifying_key->SerializeToRaw()) {
    return absl::InvalidArgumentError(
        "Published public key does not match the verifying key");
  }
  return VerifySignedResponse(*verifying_key, signed_response);
}

// EnclaveService is the narrow interface through which request-handling code
// reaches the enclave's identity. It shares one EphemeralIdentity read-only,
// holds no mutable state, and may be used from any number of threads.
class EnclaveService {
 public:
  // Creates a service that attests through the NSM device named in |config|.
  static std::unique_ptr<EnclaveService> Create(
      std::shared_ptr<const EphemeralIdentity> identity,
      EnclaveServiceConfig config);

  EnclaveService(std::shared_ptr<const EphemeralIdentity> identity,
                 EnclaveServiceConfig config, NsmDeviceOpener opener);

  EnclaveService(const EnclaveService &other) = delete;
  EnclaveService &operator=(const EnclaveService &other) = delete;

  // Returns an attestation document embedding the identity's public key.
  // Hardware failures are returned as UNAVAILABLE and unexpected device
  // responses as INTERNAL.
  absl::StatusOr<GetAttestationResponse> GetAttestation() const;

  // Returns the identity's public key.
  absl::StatusOr<IdentityResponse> GetIdentity() const;

  // Signs |data| under |intent| with the identity.
  template <typename T>
  absl::StatusOr<SignedResponse<T>> Sign(T data, uint64_t timestamp_ms,
                                         IntentScope intent) const {
    return SignIntent(*identity_, std::move(data), timestamp_ms, intent);
  }

  // Signs |data| stamped |source_timestamp_ms| unless it is older than the
  // configured maximum payload age at |now_ms|, in which case
  // FAILED_PRECONDITION is returned and nothing is signed.
  template <typename T>
  absl::StatusOr<SignedResponse<T>> SignFresh(T data,
                                              uint64_t source_timestamp_ms,
                                              uint64_t now_ms,
                                              IntentScope intent) const {
    VERITAS_RETURN_IF_ERROR(CheckFreshness(source_timestamp_ms, now_ms,
                                           config_.max_payload_age_ms()));
    return Sign(std::move(data), source_timestamp_ms, intent);
  }

  const EphemeralIdentity &identity() const { return *identity_; }
  const EnclaveServiceConfig &config() const { return config_; }

 private:
  const std::shared_ptr<const EphemeralIdentity> identity_;
  const EnclaveServiceConfig config_;
  const AttestationBinder binder_;
};

}  // namespace veritas

#endif  // VERITAS_SERVICE_ENCLAVE_SERVICE_H_
