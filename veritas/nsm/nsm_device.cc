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

#include "veritas/nsm/nsm_device.h"

#include "veritas/util/status_macros.h"

namespace veritas {

absl::StatusOr<NsmResponse> NsmDevice::ProcessRequest(
    const NsmRequest &request) {
  CleansingVector<uint8_t> encoded_response;
  VERITAS_ASSIGN_OR_RETURN(encoded_response,
                           Transact(EncodeNsmRequest(request)));
  return DecodeNsmResponse(encoded_response);
}

}  // namespace veritas
