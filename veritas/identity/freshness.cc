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

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace veritas {

uint64_t UnixMillisNow() {
  return static_cast<uint64_t>(absl::ToUnixMillis(absl::Now()));
}

absl::Status CheckFreshness(uint64_t timestamp_ms, uint64_t now_ms,
                            uint64_t max_age_ms) {
  // Same as timestamp_ms + max_age_ms < now_ms, without overflow.
  if (now_ms > timestamp_ms && now_ms - timestamp_ms > max_age_ms) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Data is stale: timestamp ", timestamp_ms, " is ",
        now_ms - timestamp_ms, " ms old, limit is ", max_age_ms, " ms"));
  }
  return absl::OkStatus();
}

}  // namespace veritas
