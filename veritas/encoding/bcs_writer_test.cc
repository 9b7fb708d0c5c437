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

#include <cstdint>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "veritas/encoding/bcs.h"
#include "veritas/test/util/status_matchers.h"
#include "veritas/util/hex_util.h"

namespace veritas {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::IsEmpty;

TEST(BcsWriterTest, FixedWidthIntegersAreLittleEndian) {
  BcsWriter writer;
  writer.WriteU8(0xab);
  writer.WriteU16(0x0102);
  writer.WriteU32(0x03040506);
  writer.WriteU64(0x0708090a0b0c0d0eULL);
  EXPECT_THAT(BytesToHex(writer.bytes()),
              Eq("ab"
                 "0201"
                 "06050403"
                 "0e0d0c0b0a090807"));
}

TEST(BcsWriterTest, BooleansAreSingleBytes) {
  BcsWriter writer;
  writer.WriteBool(true);
  writer.WriteBool(false);
  EXPECT_THAT(writer.bytes(), ElementsAre(1, 0));
}

TEST(BcsWriterTest, Uleb128UsesMinimalEncoding) {
  struct {
    uint32_t value;
    const char *hex;
  } cases[] = {
      {0, "00"},           {1, "01"},         {127, "7f"},
      {128, "8001"},       {300, "ac02"},     {16384, "808001"},
      {0x7fffffff, "ffffffff07"}, {0xffffffff, "ffffffff0f"},
  };
  for (const auto &test_case : cases) {
    BcsWriter writer;
    writer.WriteUleb128(test_case.value);
    EXPECT_THAT(BytesToHex(writer.bytes()), Eq(test_case.hex))
        << "value " << test_case.value;
  }
}

TEST(BcsWriterTest, StringsAreLengthPrefixed) {
  BcsWriter writer;
  VERITAS_ASSERT_OK(writer.WriteString("San Francisco"));
  EXPECT_THAT(BytesToHex(writer.bytes()),
              Eq("0d53616e204672616e636973636f"));
}

TEST(BcsWriterTest, EmptyBytesEncodeAsZeroLength) {
  BcsWriter writer;
  VERITAS_ASSERT_OK(writer.WriteBytes(std::vector<uint8_t>()));
  EXPECT_THAT(writer.bytes(), ElementsAre(0));
}

TEST(BcsWriterTest, LongSequenceLengthUsesMultipleBytes) {
  BcsWriter writer;
  std::string value(200, 'x');
  VERITAS_ASSERT_OK(writer.WriteString(value));
  ASSERT_THAT(writer.bytes().size(), Eq(202));
  EXPECT_THAT(writer.bytes()[0], Eq(0xc8));
  EXPECT_THAT(writer.bytes()[1], Eq(0x01));
}

TEST(BcsWriterTest, SequenceLengthAboveLimitIsRejected) {
  BcsWriter writer;
  size_t too_long = static_cast<size_t>(kBcsMaxSequenceLength) + 1;
  EXPECT_THAT(writer.WriteSequenceLength(too_long),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(writer.bytes(), IsEmpty());
  VERITAS_EXPECT_OK(writer.WriteSequenceLength(kBcsMaxSequenceLength));
}

TEST(BcsWriterTest, ReleaseEmptiesTheWriter) {
  BcsWriter writer;
  writer.WriteU8(7);
  EXPECT_THAT(writer.Release(), ElementsAre(7));
  EXPECT_THAT(writer.bytes(), IsEmpty());
}

TEST(BcsWriterTest, VectorsEncodeLengthThenElements) {
  std::vector<uint16_t> values = {1, 0x0200};
  std::vector<uint8_t> bytes;
  VERITAS_ASSERT_OK_AND_ASSIGN(bytes, BcsEncode(values));
  EXPECT_THAT(BytesToHex(bytes), Eq("0201000002"));
}

TEST(BcsWriterTest, EncodingIsDeterministic) {
  std::vector<std::string> values = {"alpha", "", "gamma"};
  std::vector<uint8_t> first;
  std::vector<uint8_t> second;
  VERITAS_ASSERT_OK_AND_ASSIGN(first, BcsEncode(values));
  VERITAS_ASSERT_OK_AND_ASSIGN(second, BcsEncode(values));
  EXPECT_THAT(first, Eq(second));
}

}  // namespace
}  // namespace veritas
