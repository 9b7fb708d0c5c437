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

#include "veritas/encoding/cbor.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "veritas/util/status_macros.h"

namespace veritas {
namespace {

// CBOR major types.
constexpr uint8_t kMajorUnsigned = 0;
constexpr uint8_t kMajorNegative = 1;
constexpr uint8_t kMajorBytes = 2;
constexpr uint8_t kMajorText = 3;
constexpr uint8_t kMajorArray = 4;
constexpr uint8_t kMajorMap = 5;
constexpr uint8_t kMajorTag = 6;
constexpr uint8_t kMajorSimple = 7;

// Simple values of major type 7.
constexpr uint8_t kSimpleFalse = 20;
constexpr uint8_t kSimpleTrue = 21;
constexpr uint8_t kSimpleNull = 22;

// Additional-information values that select the width of the argument.
constexpr uint8_t kArgumentOneByte = 24;
constexpr uint8_t kArgumentTwoBytes = 25;
constexpr uint8_t kArgumentFourBytes = 26;
constexpr uint8_t kArgumentEightBytes = 27;
constexpr uint8_t kIndefiniteLength = 31;

// Bounds recursion on hostile input.
constexpr int kMaxNestingDepth = 16;

void WriteHead(uint8_t major_type, uint64_t argument,
               std::vector<uint8_t> *output) {
  uint8_t major = static_cast<uint8_t>(major_type << 5);
  if (argument < kArgumentOneByte) {
    output->push_back(major | static_cast<uint8_t>(argument));
    return;
  }
  int width;
  if (argument <= 0xff) {
    output->push_back(major | kArgumentOneByte);
    width = 1;
  } else if (argument <= 0xffff) {
    output->push_back(major | kArgumentTwoBytes);
    width = 2;
  } else if (argument <= 0xffffffff) {
    output->push_back(major | kArgumentFourBytes);
    width = 4;
  } else {
    output->push_back(major | kArgumentEightBytes);
    width = 8;
  }
  for (int i = width - 1; i >= 0; --i) {
    output->push_back(static_cast<uint8_t>(argument >> (8 * i)));
  }
}

void Encode(const CborValue &value, std::vector<uint8_t> *output) {
  switch (value.type()) {
    case CborValue::Type::kUnsigned:
      WriteHead(kMajorUnsigned, value.unsigned_value(), output);
      break;
    case CborValue::Type::kBytes:
      WriteHead(kMajorBytes, value.bytes().size(), output);
      output->insert(output->end(), value.bytes().begin(),
                     value.bytes().end());
      break;
    case CborValue::Type::kText:
      WriteHead(kMajorText, value.text().size(), output);
      output->insert(output->end(), value.text().begin(), value.text().end());
      break;
    case CborValue::Type::kArray:
      WriteHead(kMajorArray, value.array().size(), output);
      for (const CborValue &element : value.array()) {
        Encode(element, output);
      }
      break;
    case CborValue::Type::kMap:
      WriteHead(kMajorMap, value.map().size(), output);
      for (const auto &entry : value.map()) {
        Encode(entry.first, output);
        Encode(entry.second, output);
      }
      break;
    case CborValue::Type::kBool:
      WriteHead(kMajorSimple, value.bool_value() ? kSimpleTrue : kSimpleFalse,
                output);
      break;
    case CborValue::Type::kNull:
      WriteHead(kMajorSimple, kSimpleNull, output);
      break;
  }
}

class CborDecoder {
 public:
  explicit CborDecoder(ByteContainerView input) : input_(input), position_(0) {}

  absl::StatusOr<CborValue> DecodeItem(int depth) {
    if (depth > kMaxNestingDepth) {
      return absl::InvalidArgumentError("CBOR input nests too deeply");
    }
    uint8_t initial_byte;
    VERITAS_ASSIGN_OR_RETURN(initial_byte, ReadByte());
    uint8_t major_type = initial_byte >> 5;
    uint8_t additional_info = initial_byte & 0x1f;

    if (major_type == kMajorSimple) {
      switch (additional_info) {
        case kSimpleFalse:
          return CborValue::Bool(false);
        case kSimpleTrue:
          return CborValue::Bool(true);
        case kSimpleNull:
          return CborValue::Null();
        default:
          return absl::InvalidArgumentError(absl::StrCat(
              "Unsupported CBOR simple value ", additional_info));
      }
    }
    if (major_type == kMajorNegative || major_type == kMajorTag) {
      return absl::InvalidArgumentError(
          absl::StrCat("Unsupported CBOR major type ", major_type));
    }

    uint64_t argument;
    VERITAS_ASSIGN_OR_RETURN(argument, ReadArgument(additional_info));

    switch (major_type) {
      case kMajorUnsigned:
        return CborValue::Unsigned(argument);
      case kMajorBytes: {
        VERITAS_RETURN_IF_ERROR(Require(argument));
        CborValue value =
            CborValue::Bytes(ByteContainerView(input_.data() + position_,
                                               static_cast<size_t>(argument)));
        position_ += argument;
        return value;
      }
      case kMajorText: {
        VERITAS_RETURN_IF_ERROR(Require(argument));
        CborValue value = CborValue::Text(absl::string_view(
            reinterpret_cast<const char *>(input_.data()) + position_,
            static_cast<size_t>(argument)));
        position_ += argument;
        return value;
      }
      case kMajorArray: {
        // Every element takes at least one byte.
        VERITAS_RETURN_IF_ERROR(Require(argument));
        CborArray elements;
        elements.reserve(argument);
        for (uint64_t i = 0; i < argument; ++i) {
          CborValue element;
          VERITAS_ASSIGN_OR_RETURN(element, DecodeItem(depth + 1));
          elements.push_back(std::move(element));
        }
        return CborValue::Array(std::move(elements));
      }
      case kMajorMap: {
        VERITAS_RETURN_IF_ERROR(Require(argument));
        CborMap entries;
        entries.reserve(argument);
        for (uint64_t i = 0; i < argument; ++i) {
          CborValue key;
          VERITAS_ASSIGN_OR_RETURN(key, DecodeItem(depth + 1));
          CborValue value;
          VERITAS_ASSIGN_OR_RETURN(value, DecodeItem(depth + 1));
          entries.emplace_back(std::move(key), std::move(value));
        }
        return CborValue::Map(std::move(entries));
      }
    }
    return absl::InternalError(
        absl::StrCat("Unhandled CBOR major type ", major_type));
  }

  absl::Status Finish() const {
    if (position_ != input_.size()) {
      return absl::InvalidArgumentError(absl::StrCat(
          input_.size() - position_, " trailing bytes after CBOR item"));
    }
    return absl::OkStatus();
  }

 private:
  absl::Status Require(uint64_t count) const {
    if (input_.size() - position_ < count) {
      return absl::InvalidArgumentError(
          absl::StrCat("Truncated CBOR input at offset ", position_));
    }
    return absl::OkStatus();
  }

  absl::StatusOr<uint8_t> ReadByte() {
    VERITAS_RETURN_IF_ERROR(Require(1));
    return input_[position_++];
  }

  absl::StatusOr<uint64_t> ReadArgument(uint8_t additional_info) {
    if (additional_info < kArgumentOneByte) {
      return additional_info;
    }
    int width;
    switch (additional_info) {
      case kArgumentOneByte:
        width = 1;
        break;
      case kArgumentTwoBytes:
        width = 2;
        break;
      case kArgumentFourBytes:
        width = 4;
        break;
      case kArgumentEightBytes:
        width = 8;
        break;
      case kIndefiniteLength:
        return absl::InvalidArgumentError(
            "Indefinite-length CBOR items are not supported");
      default:
        return absl::InvalidArgumentError(absl::StrCat(
            "Reserved CBOR additional information ", additional_info));
    }
    VERITAS_RETURN_IF_ERROR(Require(width));
    uint64_t argument = 0;
    for (int i = 0; i < width; ++i) {
      argument = (argument << 8) | input_[position_++];
    }
    return argument;
  }

  ByteContainerView input_;
  size_t position_;
};

}  // namespace

CborValue CborValue::Unsigned(uint64_t value) {
  CborValue result(Type::kUnsigned);
  result.unsigned_value_ = value;
  return result;
}

CborValue CborValue::Bytes(ByteContainerView bytes) {
  CborValue result(Type::kBytes);
  result.bytes_.assign(bytes.begin(), bytes.end());
  return result;
}

CborValue CborValue::Text(absl::string_view text) {
  CborValue result(Type::kText);
  result.text_ = std::string(text);
  return result;
}

CborValue CborValue::Array(CborArray elements) {
  CborValue result(Type::kArray);
  result.array_ = std::move(elements);
  return result;
}

CborValue CborValue::Map(CborMap entries) {
  CborValue result(Type::kMap);
  result.map_ = std::move(entries);
  return result;
}

CborValue CborValue::Bool(bool value) {
  CborValue result(Type::kBool);
  result.unsigned_value_ = value ? 1 : 0;
  return result;
}

CborValue CborValue::Null() { return CborValue(Type::kNull); }

const CborValue *CborValue::FindKey(absl::string_view key) const {
  if (!is_map()) {
    return nullptr;
  }
  for (const auto &entry : map_) {
    if (entry.first.is_text() && entry.first.text() == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

bool CborValue::operator==(const CborValue &other) const {
  if (type_ != other.type_) {
    return false;
  }
  switch (type_) {
    case Type::kUnsigned:
    case Type::kBool:
      return unsigned_value_ == other.unsigned_value_;
    case Type::kBytes:
      return bytes_ == other.bytes_;
    case Type::kText:
      return text_ == other.text_;
    case Type::kArray:
      return array_ == other.array_;
    case Type::kMap:
      return map_ == other.map_;
    case Type::kNull:
      return true;
  }
  return false;
}

absl::string_view CborTypeName(CborValue::Type type) {
  switch (type) {
    case CborValue::Type::kUnsigned:
      return "unsigned integer";
    case CborValue::Type::kBytes:
      return "byte string";
    case CborValue::Type::kText:
      return "text string";
    case CborValue::Type::kArray:
      return "array";
    case CborValue::Type::kMap:
      return "map";
    case CborValue::Type::kBool:
      return "boolean";
    case CborValue::Type::kNull:
      return "null";
  }
  return "unknown";
}

std::vector<uint8_t> EncodeCbor(const CborValue &value) {
  std::vector<uint8_t> output;
  Encode(value, &output);
  return output;
}

absl::StatusOr<CborValue> DecodeCbor(ByteContainerView input) {
  CborDecoder decoder(input);
  CborValue value;
  VERITAS_ASSIGN_OR_RETURN(value, decoder.DecodeItem(0));
  VERITAS_RETURN_IF_ERROR(decoder.Finish());
  return value;
}

}  // namespace veritas
