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

#ifndef VERITAS_IDENTITY_INTENT_SCOPE_H_
#define VERITAS_IDENTITY_INTENT_SCOPE_H_

#include <cstdint>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "veritas/encoding/bcs_reader.h"
#include "veritas/encoding/bcs_writer.h"

namespace veritas {

// The purpose a signed message was produced for. Each payload type is signed
// under its own scope so that a signature over one kind of fact can never be
// presented as another.
//
// The numeric tags are part of the signed bytes. New scopes are appended with
// the next free tag; existing tags are never renumbered or reused.
enum class IntentScope : uint8_t {
  kWeather = 0,
};

// Returns the name of |scope|, or "UNKNOWN" for values outside the enum.
absl::string_view IntentScopeName(IntentScope scope);

// Returns true if |tag| is the tag of a defined IntentScope.
bool IsValidIntentScopeTag(uint8_t tag);

// BCS form of an IntentScope: its tag as a single byte.
absl::Status BcsSerialize(IntentScope scope, BcsWriter *writer);

// Returns INVALID_ARGUMENT if the tag read does not name a defined scope.
absl::Status BcsDeserialize(BcsReader *reader, IntentScope *scope);

}  // namespace veritas

#endif  // VERITAS_IDENTITY_INTENT_SCOPE_H_
