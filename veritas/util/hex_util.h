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

#ifndef VERITAS_UTIL_HEX_UTIL_H_
#define VERITAS_UTIL_HEX_UTIL_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "veritas/util/byte_container_view.h"

namespace veritas {

// Returns true if |str| can be interpreted as a hex-encoding of a sequence of
// bytes.
bool IsHexEncoded(absl::string_view str);

// Returns the lowercase hex encoding of |bytes|.
std::string BytesToHex(ByteContainerView bytes);

// Decodes |hex| into bytes. Both upper and lower case digits are accepted.
// Returns INVALID_ARGUMENT if |hex| is not a valid hex encoding.
absl::StatusOr<std::vector<uint8_t>> HexToBytes(absl::string_view hex);

// Returns a hex representation of the provided input buffer of a given size.
// If |buf| is nullptr, returns "null".
// If |nbytes| is 0, returns "[]".
// Otherwise, returns "[0x" buf[0]...buf[nbytes-1] "]" formatted as hexadecimal
// digits.
std::string BufferToDebugHexString(const void *buf, size_t nbytes);

}  // namespace veritas

#endif  // VERITAS_UTIL_HEX_UTIL_H_
