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

#ifndef VERITAS_NSM_NSM_MESSAGES_H_
#define VERITAS_NSM_NSM_MESSAGES_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/optional.h"
#include "absl/types/variant.h"
#include "veritas/util/byte_container_view.h"
#include "veritas/util/cleansing_allocator.h"

namespace veritas {

// Messages exchanged with the Nitro Security Module (NSM). On the wire each
// message is a CBOR item shaped the way the NSM driver expects: a unit request
// is the bare variant name as a text string, and every other message is a
// single-entry map from the variant name to a map of its fields.

// Asks the NSM for a signed attestation document. Each present field is
// embedded in the document.
struct NsmAttestationRequest {
  absl::optional<std::vector<uint8_t>> user_data;
  absl::optional<std::vector<uint8_t>> nonce;
  absl::optional<std::vector<uint8_t>> public_key;
};

// Asks the NSM for bytes from its hardware entropy source.
struct NsmGetRandomRequest {};

using NsmRequest = absl::variant<NsmAttestationRequest, NsmGetRandomRequest>;

struct NsmAttestationResponse {
  // A COSE_Sign1 structure signed by the NSM.
  std::vector<uint8_t> document;
};

struct NsmGetRandomResponse {
  CleansingVector<uint8_t> random;
};

// The NSM rejected the request, e.g. "InvalidArgument" or "InternalError".
struct NsmErrorResponse {
  std::string error_code;
};

// A well-formed response whose variant this library does not interpret.
struct NsmUnknownResponse {
  std::string variant;
};

using NsmResponse = absl::variant<NsmAttestationResponse, NsmGetRandomResponse,
                                  NsmErrorResponse, NsmUnknownResponse>;

// Returns the name of the variant held by |response|, for diagnostics.
std::string NsmResponseVariantName(const NsmResponse &response);

// Encodes |request| as the CBOR item the NSM driver expects. Absent optional
// fields are encoded as null.
std::vector<uint8_t> EncodeNsmRequest(const NsmRequest &request);

// Decodes a CBOR-encoded NSM request.
absl::StatusOr<NsmRequest> DecodeNsmRequest(ByteContainerView encoded);

// Encodes |response| as the NSM device would.
std::vector<uint8_t> EncodeNsmResponse(const NsmResponse &response);

// Decodes a CBOR-encoded NSM response. Byte fields are accepted either as CBOR
// byte strings or as arrays of integers in the range [0, 255]. Returns
// INVALID_ARGUMENT if |encoded| is not a well-formed NSM response.
absl::StatusOr<NsmResponse> DecodeNsmResponse(ByteContainerView encoded);

}  // namespace veritas

#endif  // VERITAS_NSM_NSM_MESSAGES_H_
