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

#include "veritas/service/enclave_service.h"

#include <google/protobuf/util/json_util.h>
#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "veritas/nsm/nsm_driver.h"
#include "veritas/util/hex_util.h"
#include "veritas/util/logging.h"
#include "veritas/util/proto_parse_util.h"

namespace veritas {
namespace {

// The largest integer a JSON number (an IEEE double) represents exactly.
constexpr uint64_t kMaxExactJsonInteger = uint64_t{1} << 53;

}  // namespace

absl::StatusOr<EnclaveServiceConfig> LoadEnclaveServiceConfig(
    const std::string &path) {
  EnclaveServiceConfig config;
  VERITAS_RETURN_IF_ERROR(ReadTextProtoFile(path, &config));
  return config;
}

absl::StatusOr<std::string> MessageToJson(
    const google::protobuf::Message &message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return absl::InternalError(
        absl::StrCat("Failed to render JSON: ", status.ToString()));
  }
  return json;
}

absl::StatusOr<google::protobuf::Value> JsonIntegerValue(uint64_t value) {
  if (value > kMaxExactJsonInteger) {
    return absl::OutOfRangeError(
        absl::StrCat(value, " cannot be represented exactly in JSON"));
  }
  google::protobuf::Value json_value;
  json_value.set_number_value(static_cast<double>(value));
  return json_value;
}

absl::StatusOr<std::string> SignedEnvelopeToJson(
    IntentScope intent, uint64_t timestamp_ms,
    const google::protobuf::Value &data, const std::string &signature) {
  google::protobuf::Value timestamp;
  VERITAS_ASSIGN_OR_RETURN(timestamp, JsonIntegerValue(timestamp_ms));

  google::protobuf::Struct envelope;
  google::protobuf::Struct *response =
      (*envelope.mutable_fields())["response"].mutable_struct_value();
  auto *fields = response->mutable_fields();
  (*fields)["intent"].set_number_value(static_cast<uint8_t>(intent));
  (*fields)["timestamp_ms"] = std::move(timestamp);
  (*fields)["data"] = data;
  (*envelope.mutable_fields())["signature"].set_string_value(signature);
  return MessageToJson(envelope);
}

std::unique_ptr<EnclaveService> EnclaveService::Create(
    std::shared_ptr<const EphemeralIdentity> identity,
    EnclaveServiceConfig config) {
  NsmDeviceOpener opener = NsmDriver::Opener(config.nsm_device_path());
  return absl::make_unique<EnclaveService>(std::move(identity),
                                           std::move(config),
                                           std::move(opener));
}

EnclaveService::EnclaveService(
    std::shared_ptr<const EphemeralIdentity> identity,
    EnclaveServiceConfig config, NsmDeviceOpener opener)
    : identity_(std::move(identity)),
      config_(std::move(config)),
      binder_(std::move(opener)) {
  CHECK(identity_ != nullptr) << "EnclaveService requires an identity";
}

absl::StatusOr<GetAttestationResponse> EnclaveService::GetAttestation() const {
  VLOG(1) << "Attestation requested";
  AttestationDocument document;
  VERITAS_ASSIGN_OR_RETURN(document,
                           binder_.GetAttestation(identity_->public_key()));
  GetAttestationResponse response;
  response.set_attestation(BytesToHex(document));
  return response;
}

absl::StatusOr<IdentityResponse> EnclaveService::GetIdentity() const {
  std::unique_ptr<VerifyingKey> verifying_key;
  VERITAS_ASSIGN_OR_RETURN(verifying_key, identity_->GetVerifyingKey());
  IdentityResponse response;
  response.set_pk(identity_->public_key_hex());
  *response.mutable_verifying_key() = verifying_key->SerializeToKeyProto();
  return response;
}

}  // namespace veritas
