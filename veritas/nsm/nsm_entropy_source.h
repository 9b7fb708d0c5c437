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

#ifndef VERITAS_NSM_NSM_ENTROPY_SOURCE_H_
#define VERITAS_NSM_NSM_ENTROPY_SOURCE_H_

#include <cstddef>
#include <cstdint>

#include "absl/status/statusor.h"
#include "veritas/crypto/entropy_source.h"
#include "veritas/nsm/nsm_device.h"
#include "veritas/util/cleansing_allocator.h"

namespace veritas {

// An EntropySource backed by the NSM's GetRandom request. Each GetEntropy()
// call opens its own device handle and issues as many requests as needed.
class NsmEntropySource : public EntropySource {
 public:
  explicit NsmEntropySource(NsmDeviceOpener opener);

  // From EntropySource.
  absl::StatusOr<CleansingVector<uint8_t>> GetEntropy(size_t size) override;

 private:
  NsmDeviceOpener opener_;
};

}  // namespace veritas

#endif  // VERITAS_NSM_NSM_ENTROPY_SOURCE_H_
