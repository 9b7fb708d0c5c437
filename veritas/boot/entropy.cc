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

#include "veritas/boot/entropy.h"

#include "absl/strings/str_cat.h"
#include "veritas/util/cleansing_allocator.h"
#include "veritas/util/status_macros.h"

namespace veritas {

absl::StatusOr<size_t> SeedEntropy(size_t size, EntropySource *source,
                                   BootSystem *system) {
  if (source == nullptr) {
    return absl::FailedPreconditionError("No entropy source available");
  }
  CleansingVector<uint8_t> entropy;
  VERITAS_ASSIGN_OR_RETURN(entropy, source->GetEntropy(size));
  if (entropy.size() != size) {
    return absl::InternalError(absl::StrCat("Entropy source returned ",
                                            entropy.size(), " bytes, expected ",
                                            size));
  }
  VERITAS_RETURN_IF_ERROR(system->AddEntropy(entropy));
  return entropy.size();
}

}  // namespace veritas
