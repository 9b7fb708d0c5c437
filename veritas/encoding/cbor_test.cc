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

#include <cstdint>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "veritas/test/util/status_matchers.h"
#include "veritas/util/hex_util.h"

namespace veritas {
namespace {

using ::testing::ElementsAre;
using ::testing::ElementsAreArray;
using ::testing::Eq;
using ::testing::IsNull;
using ::testing::NotNull;

std::vector<uint8_t> FromHex(const char *hex) {
  auto bytes_or = HexToBytes(hex);
  EXPECT_TRUE(bytes_or.ok()) << bytes_or.status();
  return bytes_or.ok() ? *bytes_or : std::vector<uint8_t>();
}

// Vectors from RFC 8949 Appendix A.
TEST(CborTest, EncodesUnsignedIntegersInShortestForm) {
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Unsigned(0))), Eq("00"));
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Unsigned(23))), Eq("17"));
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Unsigned(24))), Eq("1818"));
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Unsigned(1000))), Eq("1903e8"));
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Unsigned(1000000))),
              Eq("1a000f4240"));
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Unsigned(1000000000000ULL))),
              Eq("1b000000e8d4a51000"));
}

TEST(CborTest, EncodesSimpleValues) {
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Bool(false))), Eq("f4"));
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Bool(true))), Eq("f5"));
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Null())), Eq("f6"));
}

TEST(CborTest, EncodesStringsAndContainers) {
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Text("IETF"))),
              Eq("6449455446"));
  std::vector<uint8_t> bytes = {1, 2, 3, 4};
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Bytes(bytes))),
              Eq("4401020304"));
  CborArray array = {CborValue::Unsigned(1), CborValue::Unsigned(2),
                     CborValue::Unsigned(3)};
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Array(array))), Eq("83010203"));
  CborMap map;
  map.emplace_back(CborValue::Text("a"), CborValue::Unsigned(1));
  map.emplace_back(CborValue::Text("b"),
                   CborValue::Array({CborValue::Unsigned(2),
                                     CborValue::Unsigned(3)}));
  EXPECT_THAT(BytesToHex(EncodeCbor(CborValue::Map(map))),
              Eq("a26161016162820203"));
}

TEST(CborTest, DecodesWhatItEncodes) {
  CborMap inner;
  inner.emplace_back(CborValue::Text("user_data"), CborValue::Null());
  inner.emplace_back(CborValue::Text("public_key"),
                     CborValue::Bytes(std::string("\x01\x02", 2)));
  inner.emplace_back(CborValue::Text("flag"), CborValue::Bool(true));
  CborMap outer;
  outer.emplace_back(CborValue::Text("Attestation"),
                     CborValue::Map(std::move(inner)));
  CborValue value = CborValue::Map(std::move(outer));

  std::vector<uint8_t> encoded = EncodeCbor(value);
  EXPECT_THAT(DecodeCbor(encoded), IsOkAndHolds(Eq(value)));
}

TEST(CborTest, FindKeyLooksUpTextKeys) {
  CborValue decoded;
  VERITAS_ASSERT_OK_AND_ASSIGN(decoded,
                               DecodeCbor(FromHex("a26161016162820203")));
  const CborValue *a = decoded.FindKey("a");
  ASSERT_THAT(a, NotNull());
  EXPECT_TRUE(a->is_unsigned());
  EXPECT_THAT(a->unsigned_value(), Eq(1));
  const CborValue *b = decoded.FindKey("b");
  ASSERT_THAT(b, NotNull());
  ASSERT_TRUE(b->is_array());
  EXPECT_THAT(b->array().size(), Eq(2));
  EXPECT_THAT(decoded.FindKey("c"), IsNull());
  EXPECT_THAT(CborValue::Unsigned(1).FindKey("a"), IsNull());
}

TEST(CborTest, DecodesNonMinimalArguments) {
  EXPECT_THAT(DecodeCbor(FromHex("1900ff")),
              IsOkAndHolds(Eq(CborValue::Unsigned(255))));
}

TEST(CborTest, DecodesLongByteString) {
  std::vector<uint8_t> document(0x1234, 0x5a);
  std::vector<uint8_t> encoded = EncodeCbor(CborValue::Bytes(document));
  ASSERT_THAT(encoded.size(), Eq(document.size() + 3));
  CborValue decoded;
  VERITAS_ASSERT_OK_AND_ASSIGN(decoded, DecodeCbor(encoded));
  ASSERT_TRUE(decoded.is_bytes());
  EXPECT_THAT(decoded.bytes(), ElementsAreArray(document));
}

TEST(CborTest, RejectsTruncatedInput) {
  EXPECT_THAT(DecodeCbor(FromHex("44010203")),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(DecodeCbor(FromHex("1a000f42")),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(DecodeCbor(FromHex("82")),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(DecodeCbor(std::vector<uint8_t>()),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(CborTest, RejectsTrailingBytes) {
  EXPECT_THAT(DecodeCbor(FromHex("0101")),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(CborTest, RejectsUnsupportedItems) {
  // Negative integer, tag, float and indefinite-length array.
  for (const char *hex : {"20", "c11a514b67b0", "f93c00", "9f01ff"}) {
    EXPECT_THAT(DecodeCbor(FromHex(hex)),
                StatusIs(absl::StatusCode::kInvalidArgument))
        << hex;
  }
}

TEST(CborTest, RejectsExcessiveNesting) {
  std::vector<uint8_t> input(64, 0x81);
  input.push_back(0x00);
  EXPECT_THAT(DecodeCbor(input), StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(CborTest, RejectsHugeDeclaredArrayLength) {
  EXPECT_THAT(DecodeCbor(FromHex("9bffffffffffffffff")),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace veritas
