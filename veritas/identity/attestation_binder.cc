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

#include "veritas/identity/attestation_binder.h"

#include <memory>
#include <utility>

#include "absl/strings/str_cat.h"
#include "veritas/nsm/nsm_messages.h"
#include "veritas/util/logging.h"
#include "veritas/util/status_macros.h"

namespace veritas {

AttestationBinder::AttestationBinder(NsmDeviceOpener opener)
    : opener_(std::move(opener)) {}

absl::StatusOr<AttestationDocument> AttestationBinder::GetAttestation(
    ByteContainerView public_key) const {
  NsmAttestationRequest request;
  request.public_key =
      std::vector<uint8_t>(public_key.begin(), public_key.end());

  CleansingVector<uint8_t> encoded_response;
  {
    std::unique_ptr<NsmDevice> device;
    VERITAS_ASSIGN_OR_RETURN(device, opener_());
    VERITAS_ASSIGN_OR_RETURN(encoded_response,
                             device->Transact(EncodeNsmRequest(request)));
  }

  absl::StatusOr<NsmResponse> response_or = DecodeNsmResponse(encoded_response);
  if (!response_or.ok()) {
    return absl::InternalError(absl::StrCat("Malformed NSM response: ",
                                            response_or.status().message()));
  }
  NsmResponse response = std::move(response_or).value();

  if (absl::holds_alternative<NsmErrorResponse>(response)) {
    const std::string &error_code =
        absl::get<NsmErrorResponse>(response).error_code;
    LOG(ERROR) << "NSM rejected attestation request: " << error_code;
    return absl::UnavailableError(
        absl::StrCat("NSM rejected attestation request: ", error_code));
  }
  if (!absl::holds_alternative<NsmAttestationResponse>(response)) {
    return absl::InternalError(
        absl::StrCat("Unexpected response to attestation request: ",
                     NsmResponseVariantName(response)));
  }
  AttestationDocument document =
      std::move(absl::get<NsmAttestationResponse>(response).document);
  VLOG(1) << "Obtained attestation document of " << document.size()
          << " bytes";
  return document;
}

}  // namespace veritas
