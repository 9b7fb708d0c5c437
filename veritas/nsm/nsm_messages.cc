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

#include "veritas/nsm/nsm_messages.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "veritas/encoding/cbor.h"
#include "veritas/util/status_macros.h"

namespace veritas {
namespace {

constexpr char kAttestation[] = "Attestation";
constexpr char kGetRandom[] = "GetRandom";
constexpr char kError[] = "Error";

constexpr char kUserDataField[] = "user_data";
constexpr char kNonceField[] = "nonce";
constexpr char kPublicKeyField[] = "public_key";
constexpr char kDocumentField[] = "document";
constexpr char kRandomField[] = "random";

CborValue OptionalBytes(const absl::optional<std::vector<uint8_t>> &bytes) {
  return bytes.has_value() ? CborValue::Bytes(*bytes) : CborValue::Null();
}

CborValue SingleEntryMap(absl::string_view key, CborValue value) {
  CborMap map;
  map.emplace_back(CborValue::Text(key), std::move(value));
  return CborValue::Map(std::move(map));
}

// Interprets |value| as a byte sequence, accepting both byte strings and
// arrays of small unsigned integers.
absl::StatusOr<CleansingVector<uint8_t>> ToBytes(const CborValue &value,
                                                 absl::string_view field) {
  if (value.is_bytes()) {
    return value.bytes();
  }
  if (value.is_array()) {
    CleansingVector<uint8_t> bytes;
    bytes.reserve(value.array().size());
    for (const CborValue &element : value.array()) {
      if (!element.is_unsigned() || element.unsigned_value() > 0xff) {
        return absl::InvalidArgumentError(
            absl::StrCat("Field \"", field, "\" contains a non-byte element"));
      }
      bytes.push_back(static_cast<uint8_t>(element.unsigned_value()));
    }
    return bytes;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Field \"", field, "\" has type ",
                   CborTypeName(value.type()), ", expected bytes"));
}

absl::StatusOr<CleansingVector<uint8_t>> RequiredBytes(
    const CborValue &fields, absl::string_view field) {
  const CborValue *value = fields.FindKey(field);
  if (value == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Missing field \"", field, "\""));
  }
  return ToBytes(*value, field);
}

absl::StatusOr<absl::optional<std::vector<uint8_t>>> OptionalBytesField(
    const CborValue &fields, absl::string_view field) {
  const CborValue *value = fields.FindKey(field);
  if (value == nullptr || value->is_null()) {
    return absl::optional<std::vector<uint8_t>>();
  }
  CleansingVector<uint8_t> bytes;
  VERITAS_ASSIGN_OR_RETURN(bytes, ToBytes(*value, field));
  return absl::optional<std::vector<uint8_t>>(
      std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

// Splits a single-entry variant map into its name and body.
absl::Status SplitVariant(const CborValue &item, std::string *name,
                          const CborValue **body) {
  if (item.is_text()) {
    *name = item.text();
    *body = nullptr;
    return absl::OkStatus();
  }
  if (!item.is_map() || item.map().size() != 1 ||
      !item.map().front().first.is_text()) {
    return absl::InvalidArgumentError(
        "NSM message is neither a variant name nor a single-entry map");
  }
  *name = item.map().front().first.text();
  *body = &item.map().front().second;
  return absl::OkStatus();
}

absl::Status RequireMapBody(const CborValue *body, absl::string_view variant) {
  if (body == nullptr || !body->is_map()) {
    return absl::InvalidArgumentError(
        absl::StrCat("NSM variant ", variant, " must carry a map of fields"));
  }
  return absl::OkStatus();
}

}  // namespace

std::string NsmResponseVariantName(const NsmResponse &response) {
  if (absl::holds_alternative<NsmAttestationResponse>(response)) {
    return kAttestation;
  }
  if (absl::holds_alternative<NsmGetRandomResponse>(response)) {
    return kGetRandom;
  }
  if (absl::holds_alternative<NsmErrorResponse>(response)) {
    return kError;
  }
  return absl::get<NsmUnknownResponse>(response).variant;
}

std::vector<uint8_t> EncodeNsmRequest(const NsmRequest &request) {
  if (absl::holds_alternative<NsmGetRandomRequest>(request)) {
    return EncodeCbor(CborValue::Text(kGetRandom));
  }
  const NsmAttestationRequest &attestation =
      absl::get<NsmAttestationRequest>(request);
  CborMap fields;
  fields.emplace_back(CborValue::Text(kUserDataField),
                      OptionalBytes(attestation.user_data));
  fields.emplace_back(CborValue::Text(kNonceField),
                      OptionalBytes(attestation.nonce));
  fields.emplace_back(CborValue::Text(kPublicKeyField),
                      OptionalBytes(attestation.public_key));
  return EncodeCbor(
      SingleEntryMap(kAttestation, CborValue::Map(std::move(fields))));
}

absl::StatusOr<NsmRequest> DecodeNsmRequest(ByteContainerView encoded) {
  CborValue item;
  VERITAS_ASSIGN_OR_RETURN(item, DecodeCbor(encoded));
  std::string name;
  const CborValue *body;
  VERITAS_RETURN_IF_ERROR(SplitVariant(item, &name, &body));

  if (name == kGetRandom && body == nullptr) {
    return NsmRequest(NsmGetRandomRequest{});
  }
  if (name == kAttestation) {
    VERITAS_RETURN_IF_ERROR(RequireMapBody(body, name));
    NsmAttestationRequest request;
    VERITAS_ASSIGN_OR_RETURN(request.user_data,
                             OptionalBytesField(*body, kUserDataField));
    VERITAS_ASSIGN_OR_RETURN(request.nonce,
                             OptionalBytesField(*body, kNonceField));
    VERITAS_ASSIGN_OR_RETURN(request.public_key,
                             OptionalBytesField(*body, kPublicKeyField));
    return NsmRequest(std::move(request));
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unsupported NSM request: ", name));
}

std::vector<uint8_t> EncodeNsmResponse(const NsmResponse &response) {
  if (absl::holds_alternative<NsmAttestationResponse>(response)) {
    const std::vector<uint8_t> &document =
        absl::get<NsmAttestationResponse>(response).document;
    return EncodeCbor(SingleEntryMap(
        kAttestation,
        SingleEntryMap(kDocumentField, CborValue::Bytes(document))));
  }
  if (absl::holds_alternative<NsmGetRandomResponse>(response)) {
    return EncodeCbor(SingleEntryMap(
        kGetRandom,
        SingleEntryMap(kRandomField,
                       CborValue::Bytes(
                           absl::get<NsmGetRandomResponse>(response).random))));
  }
  if (absl::holds_alternative<NsmErrorResponse>(response)) {
    return EncodeCbor(SingleEntryMap(
        kError,
        CborValue::Text(absl::get<NsmErrorResponse>(response).error_code)));
  }
  return EncodeCbor(
      CborValue::Text(absl::get<NsmUnknownResponse>(response).variant));
}

absl::StatusOr<NsmResponse> DecodeNsmResponse(ByteContainerView encoded) {
  CborValue item;
  VERITAS_ASSIGN_OR_RETURN(item, DecodeCbor(encoded));
  std::string name;
  const CborValue *body;
  VERITAS_RETURN_IF_ERROR(SplitVariant(item, &name, &body));

  if (name == kAttestation) {
    VERITAS_RETURN_IF_ERROR(RequireMapBody(body, name));
    CleansingVector<uint8_t> document;
    VERITAS_ASSIGN_OR_RETURN(document, RequiredBytes(*body, kDocumentField));
    NsmAttestationResponse response;
    response.document.assign(document.begin(), document.end());
    return NsmResponse(std::move(response));
  }
  if (name == kGetRandom) {
    VERITAS_RETURN_IF_ERROR(RequireMapBody(body, name));
    NsmGetRandomResponse response;
    VERITAS_ASSIGN_OR_RETURN(response.random,
                             RequiredBytes(*body, kRandomField));
    return NsmResponse(std::move(response));
  }
  if (name == kError) {
    if (body == nullptr || !body->is_text()) {
      return absl::InvalidArgumentError(
          "NSM error response must carry an error code string");
    }
    return NsmResponse(NsmErrorResponse{body->text()});
  }
  return NsmResponse(NsmUnknownResponse{name});
}

}  // namespace veritas
