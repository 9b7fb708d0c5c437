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

#ifndef VERITAS_BOOT_ENTROPY_H_
#define VERITAS_BOOT_ENTROPY_H_

#include <cstddef>

#include "absl/status/statusor.h"
#include "veritas/boot/boot_system.h"
#include "veritas/crypto/entropy_source.h"

namespace veritas {

// The number of bytes of hardware entropy mixed into the kernel pool at boot.
inline constexpr size_t kBootEntropySize = 4096;

// Draws exactly |size| bytes from |source| and credits them to the kernel
// random pool through |system|. Returns the number of bytes seeded.
absl::StatusOr<size_t> SeedEntropy(size_t size, EntropySource *source,
                                   BootSystem *system);

}  // namespace veritas

#endif  // VERITAS_BOOT_ENTROPY_H_
