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

#ifndef VERITAS_CRYPTO_ENTROPY_SOURCE_H_
#define VERITAS_CRYPTO_ENTROPY_SOURCE_H_

#include <cstddef>
#include <cstdint>

#include "absl/status/statusor.h"
#include "veritas/util/cleansing_allocator.h"

namespace veritas {

// EntropySource abstracts a hardware source of random bytes.
class EntropySource {
 public:
  virtual ~EntropySource() = default;

  // Returns exactly |size| bytes drawn from the source.
  virtual absl::StatusOr<CleansingVector<uint8_t>> GetEntropy(size_t size) = 0;
};

}  // namespace veritas

#endif  // VERITAS_CRYPTO_ENTROPY_SOURCE_H_
