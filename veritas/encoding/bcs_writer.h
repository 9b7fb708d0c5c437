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

#ifndef VERITAS_ENCODING_BCS_WRITER_H_
#define VERITAS_ENCODING_BCS_WRITER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "veritas/util/byte_container_view.h"

namespace veritas {

// The largest length that may prefix a BCS sequence, string or byte vector.
inline constexpr uint32_t kBcsMaxSequenceLength = (1u << 31) - 1;

// BcsWriter produces Binary Canonical Serialization (BCS) output.
//
// Fixed-width integers are written little-endian, booleans as a single 0 or 1
// byte, and variable-length values as a ULEB128 length followed by their
// contents. Structs are written field by field in declaration order without
// tags, so two writers fed the same values always produce identical bytes.
class BcsWriter {
 public:
  BcsWriter() = default;

  BcsWriter(const BcsWriter &other) = delete;
  BcsWriter &operator=(const BcsWriter &other) = delete;

  void WriteU8(uint8_t value);
  void WriteU16(uint16_t value);
  void WriteU32(uint32_t value);
  void WriteU64(uint64_t value);
  void WriteBool(bool value);

  // Writes |value| in unsigned LEB128 form using the minimal number of bytes.
  void WriteUleb128(uint32_t value);

  // Writes the length prefix of a sequence. Returns INVALID_ARGUMENT if
  // |length| exceeds kBcsMaxSequenceLength.
  absl::Status WriteSequenceLength(size_t length);

  // Writes a length-prefixed byte vector.
  absl::Status WriteBytes(ByteContainerView bytes);

  // Writes a length-prefixed UTF-8 string.
  absl::Status WriteString(absl::string_view str);

  // Returns the bytes written so far.
  const std::vector<uint8_t> &bytes() const { return buffer_; }

  // Moves the written bytes out of the writer, leaving it empty.
  std::vector<uint8_t> Release();

 private:
  template <typename IntT>
  void WriteLittleEndian(IntT value);

  std::vector<uint8_t> buffer_;
};

}  // namespace veritas

#endif  // VERITAS_ENCODING_BCS_WRITER_H_
