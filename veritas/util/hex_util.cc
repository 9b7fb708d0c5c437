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

#include "veritas/util/hex_util.h"

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"

namespace veritas {

bool IsHexEncoded(absl::string_view str) {
  for (char c : str) {
    if (!absl::ascii_isxdigit(c)) {
      return false;
    }
  }
  return str.size() % 2 == 0;
}

std::string BytesToHex(ByteContainerView bytes) {
  return absl::BytesToHexString(absl::string_view(
      reinterpret_cast<const char *>(bytes.data()), bytes.size()));
}

absl::StatusOr<std::vector<uint8_t>> HexToBytes(absl::string_view hex) {
  if (!IsHexEncoded(hex)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Not a valid hex encoding (", hex.size(), " characters)"));
  }
  std::string decoded = absl::HexStringToBytes(hex);
  return std::vector<uint8_t>(decoded.begin(), decoded.end());
}

std::string BufferToDebugHexString(const void *buf, size_t nbytes) {
  if (!buf) {
    return "null";
  }
  if (nbytes == 0) {
    return "[]";
  }
  return absl::StrCat("[0x", BytesToHex(ByteContainerView(buf, nbytes)), "]");
}

}  // namespace veritas
