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

#include "veritas/identity/intent_scope.h"

#include "absl/strings/str_cat.h"
#include "veritas/util/status_macros.h"

namespace veritas {

absl::string_view IntentScopeName(IntentScope scope) {
  switch (scope) {
    case IntentScope::kWeather:
      return "Weather";
  }
  return "UNKNOWN";
}

bool IsValidIntentScopeTag(uint8_t tag) {
  switch (static_cast<IntentScope>(tag)) {
    case IntentScope::kWeather:
      return true;
  }
  return false;
}

absl::Status BcsSerialize(IntentScope scope, BcsWriter *writer) {
  writer->WriteU8(static_cast<uint8_t>(scope));
  return absl::OkStatus();
}

absl::Status BcsDeserialize(BcsReader *reader, IntentScope *scope) {
  uint8_t tag;
  VERITAS_ASSIGN_OR_RETURN(tag, reader->ReadU8());
  if (!IsValidIntentScopeTag(tag)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown intent scope tag ", tag));
  }
  *scope = static_cast<IntentScope>(tag);
  return absl::OkStatus();
}

}  // namespace veritas
