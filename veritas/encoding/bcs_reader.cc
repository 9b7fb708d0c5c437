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

#include "veritas/encoding/bcs_reader.h"

#include "absl/strings/str_cat.h"
#include "veritas/encoding/bcs_writer.h"
#include "veritas/util/status_macros.h"

namespace veritas {

BcsReader::BcsReader(ByteContainerView input) : input_(input), position_(0) {}

absl::Status BcsReader::Require(size_t count) const {
  if (remaining() < count) {
    return absl::InvalidArgumentError(
        absl::StrCat("Truncated BCS input: need ", count, " bytes at offset ",
                     position_, " but only ", remaining(), " remain"));
  }
  return absl::OkStatus();
}

template <typename IntT>
absl::StatusOr<IntT> BcsReader::ReadLittleEndian() {
  VERITAS_RETURN_IF_ERROR(Require(sizeof(IntT)));
  IntT value = 0;
  for (size_t i = 0; i < sizeof(IntT); ++i) {
    value |= static_cast<IntT>(input_[position_ + i]) << (8 * i);
  }
  position_ += sizeof(IntT);
  return value;
}

absl::StatusOr<uint8_t> BcsReader::ReadU8() {
  VERITAS_RETURN_IF_ERROR(Require(1));
  return input_[position_++];
}

absl::StatusOr<uint16_t> BcsReader::ReadU16() {
  return ReadLittleEndian<uint16_t>();
}

absl::StatusOr<uint32_t> BcsReader::ReadU32() {
  return ReadLittleEndian<uint32_t>();
}

absl::StatusOr<uint64_t> BcsReader::ReadU64() {
  return ReadLittleEndian<uint64_t>();
}

absl::StatusOr<bool> BcsReader::ReadBool() {
  uint8_t byte;
  VERITAS_ASSIGN_OR_RETURN(byte, ReadU8());
  if (byte > 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid BCS boolean value ", byte));
  }
  return byte == 1;
}

absl::StatusOr<uint32_t> BcsReader::ReadUleb128() {
  uint64_t value = 0;
  // A 32-bit value never needs more than five 7-bit groups.
  for (int shift = 0; shift < 35; shift += 7) {
    uint8_t byte;
    VERITAS_ASSIGN_OR_RETURN(byte, ReadU8());
    value |= static_cast<uint64_t>(byte & 0x7f) << shift;
    if ((byte & 0x80) == 0) {
      if (byte == 0 && shift > 0) {
        return absl::InvalidArgumentError("Non-canonical ULEB128 encoding");
      }
      if (value > UINT32_MAX) {
        return absl::InvalidArgumentError("ULEB128 value overflows u32");
      }
      return static_cast<uint32_t>(value);
    }
  }
  return absl::InvalidArgumentError("ULEB128 encoding is too long");
}

absl::StatusOr<size_t> BcsReader::ReadSequenceLength() {
  uint32_t length;
  VERITAS_ASSIGN_OR_RETURN(length, ReadUleb128());
  if (length > kBcsMaxSequenceLength) {
    return absl::InvalidArgumentError(
        absl::StrCat("Sequence length ", length, " exceeds the BCS limit"));
  }
  return static_cast<size_t>(length);
}

absl::StatusOr<std::vector<uint8_t>> BcsReader::ReadBytes() {
  size_t length;
  VERITAS_ASSIGN_OR_RETURN(length, ReadSequenceLength());
  VERITAS_RETURN_IF_ERROR(Require(length));
  std::vector<uint8_t> bytes(input_.begin() + position_,
                             input_.begin() + position_ + length);
  position_ += length;
  return bytes;
}

absl::StatusOr<std::string> BcsReader::ReadString() {
  size_t length;
  VERITAS_ASSIGN_OR_RETURN(length, ReadSequenceLength());
  VERITAS_RETURN_IF_ERROR(Require(length));
  std::string str(reinterpret_cast<const char *>(input_.data()) + position_,
                  length);
  position_ += length;
  return str;
}

absl::Status BcsReader::Finish() const {
  if (remaining() != 0) {
    return absl::InvalidArgumentError(
        absl::StrCat(remaining(), " trailing bytes after BCS value"));
  }
  return absl::OkStatus();
}

}  // namespace veritas
