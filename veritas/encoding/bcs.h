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

#ifndef VERITAS_ENCODING_BCS_H_
#define VERITAS_ENCODING_BCS_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "veritas/encoding/bcs_reader.h"
#include "veritas/encoding/bcs_writer.h"
#include "veritas/util/byte_container_view.h"
#include "veritas/util/status_macros.h"

namespace veritas {

// BcsSerialize() and BcsDeserialize() define the BCS form of a type.
//
// Primitive types, std::string and std::vector<T> are handled by the overloads
// below. A user-defined type opts in by providing the members
//
//   absl::Status SerializeBcs(BcsWriter *writer) const;
//   static absl::StatusOr<T> DeserializeBcs(BcsReader *reader);
//
// which must write and read the type's fields in declaration order.

inline absl::Status BcsSerialize(uint8_t value, BcsWriter *writer) {
  writer->WriteU8(value);
  return absl::OkStatus();
}

inline absl::Status BcsSerialize(uint16_t value, BcsWriter *writer) {
  writer->WriteU16(value);
  return absl::OkStatus();
}

inline absl::Status BcsSerialize(uint32_t value, BcsWriter *writer) {
  writer->WriteU32(value);
  return absl::OkStatus();
}

inline absl::Status BcsSerialize(uint64_t value, BcsWriter *writer) {
  writer->WriteU64(value);
  return absl::OkStatus();
}

inline absl::Status BcsSerialize(bool value, BcsWriter *writer) {
  writer->WriteBool(value);
  return absl::OkStatus();
}

inline absl::Status BcsSerialize(const std::string &value, BcsWriter *writer) {
  return writer->WriteString(value);
}

template <typename T>
absl::Status BcsSerialize(const T &value, BcsWriter *writer) {
  return value.SerializeBcs(writer);
}

template <typename T>
absl::Status BcsSerialize(const std::vector<T> &values, BcsWriter *writer) {
  VERITAS_RETURN_IF_ERROR(writer->WriteSequenceLength(values.size()));
  for (const T &value : values) {
    VERITAS_RETURN_IF_ERROR(BcsSerialize(value, writer));
  }
  return absl::OkStatus();
}

inline absl::Status BcsDeserialize(BcsReader *reader, uint8_t *value) {
  VERITAS_ASSIGN_OR_RETURN(*value, reader->ReadU8());
  return absl::OkStatus();
}

inline absl::Status BcsDeserialize(BcsReader *reader, uint16_t *value) {
  VERITAS_ASSIGN_OR_RETURN(*value, reader->ReadU16());
  return absl::OkStatus();
}

inline absl::Status BcsDeserialize(BcsReader *reader, uint32_t *value) {
  VERITAS_ASSIGN_OR_RETURN(*value, reader->ReadU32());
  return absl::OkStatus();
}

inline absl::Status BcsDeserialize(BcsReader *reader, uint64_t *value) {
  VERITAS_ASSIGN_OR_RETURN(*value, reader->ReadU64());
  return absl::OkStatus();
}

inline absl::Status BcsDeserialize(BcsReader *reader, bool *value) {
  VERITAS_ASSIGN_OR_RETURN(*value, reader->ReadBool());
  return absl::OkStatus();
}

inline absl::Status BcsDeserialize(BcsReader *reader, std::string *value) {
  VERITAS_ASSIGN_OR_RETURN(*value, reader->ReadString());
  return absl::OkStatus();
}

template <typename T>
absl::Status BcsDeserialize(BcsReader *reader, T *value) {
  VERITAS_ASSIGN_OR_RETURN(*value, T::DeserializeBcs(reader));
  return absl::OkStatus();
}

template <typename T>
absl::Status BcsDeserialize(BcsReader *reader, std::vector<T> *values) {
  size_t length;
  VERITAS_ASSIGN_OR_RETURN(length, reader->ReadSequenceLength());
  values->clear();
  for (size_t i = 0; i < length; ++i) {
    T value;
    VERITAS_RETURN_IF_ERROR(BcsDeserialize(reader, &value));
    values->push_back(std::move(value));
  }
  return absl::OkStatus();
}

// Returns the BCS encoding of |value|.
template <typename T>
absl::StatusOr<std::vector<uint8_t>> BcsEncode(const T &value) {
  BcsWriter writer;
  VERITAS_RETURN_IF_ERROR(BcsSerialize(value, &writer));
  return writer.Release();
}

// Decodes a T from |bytes|, which must contain exactly one encoded value.
template <typename T>
absl::StatusOr<T> BcsDecode(ByteContainerView bytes) {
  BcsReader reader(bytes);
  T value;
  VERITAS_RETURN_IF_ERROR(BcsDeserialize(&reader, &value));
  VERITAS_RETURN_IF_ERROR(reader.Finish());
  return value;
}

}  // namespace veritas

#endif  // VERITAS_ENCODING_BCS_H_
