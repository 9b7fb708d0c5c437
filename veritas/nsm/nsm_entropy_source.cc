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

#include "veritas/nsm/nsm_entropy_source.h"

#include <algorithm>
#include <memory>
#include <utility>

#include "absl/strings/str_cat.h"
#include "veritas/nsm/nsm_messages.h"
#include "veritas/util/logging.h"
#include "veritas/util/status_macros.h"

namespace veritas {

NsmEntropySource::NsmEntropySource(NsmDeviceOpener opener)
    : opener_(std::move(opener)) {}

absl::StatusOr<CleansingVector<uint8_t>> NsmEntropySource::GetEntropy(
    size_t size) {
  std::unique_ptr<NsmDevice> device;
  VERITAS_ASSIGN_OR_RETURN(device, opener_());

  CleansingVector<uint8_t> entropy;
  entropy.reserve(size);
  while (entropy.size() < size) {
    NsmResponse response;
    VERITAS_ASSIGN_OR_RETURN(response,
                             device->ProcessRequest(NsmGetRandomRequest{}));
    if (absl::holds_alternative<NsmErrorResponse>(response)) {
      return absl::UnavailableError(
          absl::StrCat("NSM GetRandom failed: ",
                       absl::get<NsmErrorResponse>(response).error_code));
    }
    if (!absl::holds_alternative<NsmGetRandomResponse>(response)) {
      return absl::InternalError(
          absl::StrCat("Unexpected NSM response to GetRandom: ",
                       NsmResponseVariantName(response)));
    }
    const CleansingVector<uint8_t> &random =
        absl::get<NsmGetRandomResponse>(response).random;
    if (random.empty()) {
      return absl::InternalError("NSM GetRandom returned no bytes");
    }
    size_t take = std::min(random.size(), size - entropy.size());
    entropy.insert(entropy.end(), random.begin(), random.begin() + take);
    VLOG(2) << "Collected " << entropy.size() << " of " << size
            << " entropy bytes";
  }
  return entropy;
}

}  // namespace veritas
