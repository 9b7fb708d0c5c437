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

#ifndef VERITAS_CRYPTO_MOCK_ENTROPY_SOURCE_H_
#define VERITAS_CRYPTO_MOCK_ENTROPY_SOURCE_H_

#include <cstddef>
#include <cstdint>

#include <gmock/gmock.h>
#include "veritas/crypto/entropy_source.h"

namespace veritas {

// Mock for testing code that depends on `EntropySource`.
class MockEntropySource : public EntropySource {
 public:
  MOCK_METHOD(absl::StatusOr<CleansingVector<uint8_t>>, GetEntropy, (size_t),
              (override));
};

}  // namespace veritas

#endif  // VERITAS_CRYPTO_MOCK_ENTROPY_SOURCE_H_
