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

#include "veritas/encoding/bcs_writer.h"

#include <utility>

#include "absl/strings/str_cat.h"

namespace veritas {

template <typename IntT>
void BcsWriter::WriteLittleEndian(IntT value) {
  for (size_t i = 0; i < sizeof(IntT); ++i) {
    buffer_.push_back(static_cast<uint8_t>(value & 0xff));
    value >>= 8;
  }
}

void BcsWriter::WriteU8(uint8_t value) { buffer_.push_back(value); }

void BcsWriter::WriteU16(uint16_t value) { WriteLittleEndian(value); }

void BcsWriter::WriteU32(uint32_t value) { WriteLittleEndian(value); }

void BcsWriter::WriteU64(uint64_t value) { WriteLittleEndian(value); }

void BcsWriter::WriteBool(bool value) { buffer_.push_back(value ? 1 : 0); }

void BcsWriter::WriteUleb128(uint32_t value) {
  while (value >= 0x80) {
    buffer_.push_back(static_cast<uint8_t>((value & 0x7f) | 0x80));
    value >>= 7;
  }
  buffer_.push_back(static_cast<uint8_t>(value));
}

absl::Status BcsWriter::WriteSequenceLength(size_t length) {
  if (length > kBcsMaxSequenceLength) {
    return absl::InvalidArgumentError(
        absl::StrCat("Sequence length ", length, " exceeds the BCS limit of ",
                     kBcsMaxSequenceLength));
  }
  WriteUleb128(static_cast<uint32_t>(length));
  return absl::OkStatus();
}

absl::Status BcsWriter::WriteBytes(ByteContainerView bytes) {
  absl::Status status = WriteSequenceLength(bytes.size());
  if (!status.ok()) {
    return status;
  }
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
  return absl::OkStatus();
}

absl::Status BcsWriter::WriteString(absl::string_view str) {
  return WriteBytes(str);
}

std::vector<uint8_t> BcsWriter::Release() {
  std::vector<uint8_t> result = std::move(buffer_);
  buffer_.clear();
  return result;
}

}  // namespace veritas
