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

#ifndef VERITAS_ENCODING_CBOR_H_
#define VERITAS_ENCODING_CBOR_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "veritas/util/byte_container_view.h"
#include "veritas/util/cleansing_allocator.h"

namespace veritas {

class CborValue;

using CborArray = std::vector<CborValue>;

// Map entries are kept in insertion order and encoded in that order.
using CborMap = std::vector<std::pair<CborValue, CborValue>>;

// CborValue is an in-memory model of the subset of CBOR (RFC 8949) used by the
// Nitro Security Module driver interface: unsigned integers, byte strings,
// text strings, arrays, maps, booleans and null. Negative integers, floating
// point values, tags and indefinite-length items are not supported.
class CborValue {
 public:
  enum class Type {
    kUnsigned,
    kBytes,
    kText,
    kArray,
    kMap,
    kBool,
    kNull,
  };

  // Constructs a null value.
  CborValue() : type_(Type::kNull) {}

  static CborValue Unsigned(uint64_t value);
  static CborValue Bytes(ByteContainerView bytes);
  static CborValue Text(absl::string_view text);
  static CborValue Array(CborArray elements);
  static CborValue Map(CborMap entries);
  static CborValue Bool(bool value);
  static CborValue Null();

  Type type() const { return type_; }
  bool is_unsigned() const { return type_ == Type::kUnsigned; }
  bool is_bytes() const { return type_ == Type::kBytes; }
  bool is_text() const { return type_ == Type::kText; }
  bool is_array() const { return type_ == Type::kArray; }
  bool is_map() const { return type_ == Type::kMap; }
  bool is_bool() const { return type_ == Type::kBool; }
  bool is_null() const { return type_ == Type::kNull; }

  // The accessors below must only be called on values of the matching type.
  uint64_t unsigned_value() const { return unsigned_value_; }
  bool bool_value() const { return unsigned_value_ != 0; }
  const CleansingVector<uint8_t> &bytes() const { return bytes_; }
  const std::string &text() const { return text_; }
  const CborArray &array() const { return array_; }
  const CborMap &map() const { return map_; }

  // Returns the value stored under the text key |key| if this is a map that
  // contains one, or nullptr otherwise.
  const CborValue *FindKey(absl::string_view key) const;

  bool operator==(const CborValue &other) const;
  bool operator!=(const CborValue &other) const { return !(*this == other); }

 private:
  explicit CborValue(Type type) : type_(type) {}

  Type type_;
  uint64_t unsigned_value_ = 0;
  // Byte strings may carry NSM entropy, so they are wiped on release.
  CleansingVector<uint8_t> bytes_;
  std::string text_;
  CborArray array_;
  CborMap map_;
};

// Returns the name of |type| for use in error messages.
absl::string_view CborTypeName(CborValue::Type type);

// Encodes |value| using definite lengths and the shortest argument encoding.
std::vector<uint8_t> EncodeCbor(const CborValue &value);

// Decodes exactly one CBOR data item from |input|. Returns INVALID_ARGUMENT if
// the input is malformed, nests too deeply, has trailing bytes, or uses a
// feature outside the supported subset.
absl::StatusOr<CborValue> DecodeCbor(ByteContainerView input);

}  // namespace veritas

#endif  // VERITAS_ENCODING_CBOR_H_
