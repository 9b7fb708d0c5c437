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

#include "veritas/identity/freshness.h"

#include <cstdint>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "veritas/test/util/status_matchers.h"

namespace veritas {
namespace {

using ::testing::Gt;
using ::testing::HasSubstr;

constexpr uint64_t kHourMs = 3600000;
constexpr uint64_t kTimestamp = 1744038900000ULL;

TEST(FreshnessTest, AcceptsDataWithinWindow) {
  VERITAS_EXPECT_OK(CheckFreshness(kTimestamp, kTimestamp, kHourMs));
  VERITAS_EXPECT_OK(CheckFreshness(kTimestamp, kTimestamp + 1000, kHourMs));
}

TEST(FreshnessTest, AcceptsOneMillisecondUnderAndAtTheBoundary) {
  VERITAS_EXPECT_OK(CheckFreshness(kTimestamp, kTimestamp + kHourMs - 1,
                                   kHourMs));
  VERITAS_EXPECT_OK(CheckFreshness(kTimestamp, kTimestamp + kHourMs, kHourMs));
}

TEST(FreshnessTest, RejectsOneMillisecondOver) {
  EXPECT_THAT(CheckFreshness(kTimestamp, kTimestamp + kHourMs + 1, kHourMs),
              StatusIs(absl::StatusCode::kFailedPrecondition,
                       HasSubstr("stale")));
}

TEST(FreshnessTest, AcceptsFutureTimestamps) {
  VERITAS_EXPECT_OK(CheckFreshness(kTimestamp + kHourMs, kTimestamp, kHourMs));
}

TEST(FreshnessTest, DoesNotOverflowNearMaximum) {
  VERITAS_EXPECT_OK(CheckFreshness(UINT64_MAX - 1, UINT64_MAX, kHourMs));
  EXPECT_THAT(CheckFreshness(0, UINT64_MAX, kHourMs),
              StatusIs(absl::StatusCode::kFailedPrecondition));
}

TEST(FreshnessTest, ClockIsPastTheGoldenTimestamp) {
  EXPECT_THAT(UnixMillisNow(), Gt(kTimestamp));
}

}  // namespace
}  // namespace veritas
