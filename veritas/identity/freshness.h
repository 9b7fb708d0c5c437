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

#ifndef VERITAS_IDENTITY_FRESHNESS_H_
#define VERITAS_IDENTITY_FRESHNESS_H_

#include <cstdint>

#include "absl/status/status.h"

namespace veritas {

// Returns the current wall-clock time in milliseconds since the Unix epoch.
uint64_t UnixMillisNow();

// Returns FAILED_PRECONDITION if data stamped |timestamp_ms| is older than
// |max_age_ms| at |now_ms|, i.e. if timestamp_ms + max_age_ms < now_ms. Data
// exactly |max_age_ms| old is still fresh. Timestamps in the future are
// accepted.
absl::Status CheckFreshness(uint64_t timestamp_ms, uint64_t now_ms,
                            uint64_t max_age_ms);

}  // namespace veritas

#endif  // VERITAS_IDENTITY_FRESHNESS_H_
