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

#ifndef VERITAS_ENCODING_BCS_READER_H_
#define VERITAS_ENCODING_BCS_READER_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "veritas/util/byte_container_view.h"

namespace veritas {

// BcsReader decodes Binary Canonical Serialization input produced by
// BcsWriter. It is strict: truncated input, booleans other than 0 or 1,
// non-minimal ULEB128 encodings and lengths above kBcsMaxSequenceLength are
// all rejected with INVALID_ARGUMENT.
//
// The reader does not copy its input. The bytes viewed by |input| must outlive
// the reader.
class BcsReader {
 public:
  explicit BcsReader(ByteContainerView input);

  BcsReader(const BcsReader &other) = delete;
  BcsReader &operator=(const BcsReader &other) = delete;

  absl::StatusOr<uint8_t> ReadU8();
  absl::StatusOr<uint16_t> ReadU16();
  absl::StatusOr<uint32_t> ReadU32();
  absl::StatusOr<uint64_t> ReadU64();
  absl::StatusOr<bool> ReadBool();
  absl::StatusOr<uint32_t> ReadUleb128();
  absl::StatusOr<size_t> ReadSequenceLength();
  absl::StatusOr<std::vector<uint8_t>> ReadBytes();
  absl::StatusOr<std::string> ReadString();

  // Returns the number of bytes not yet consumed.
  size_t remaining() const { return input_.size() - position_; }

  // Returns INVALID_ARGUMENT if any input remains unconsumed.
  absl::Status Finish() const;

 private:
  template <typename IntT>
  absl::StatusOr<IntT> ReadLittleEndian();

  // Returns INVALID_ARGUMENT if fewer than |count| bytes remain.
  absl::Status Require(size_t count) const;

  ByteContainerView input_;
  size_t position_;
};

}  // namespace veritas

#endif  // VERITAS_ENCODING_BCS_READER_H_
