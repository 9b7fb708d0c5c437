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

#ifndef VERITAS_IDENTITY_INTENT_MESSAGE_H_
#define VERITAS_IDENTITY_INTENT_MESSAGE_H_

#include <cstdint>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "veritas/encoding/bcs.h"
#include "veritas/identity/intent_scope.h"
#include "veritas/util/status_macros.h"

namespace veritas {

// IntentMessage is the unit of verifiable meaning: a payload together with the
// scope it was produced for and the time it refers to. Its canonical BCS
// encoding, which is exactly what gets signed, is
//
//   intent (u8) || timestamp_ms (u64, little-endian) || BCS(data)
//
// T must have a BCS form (see veritas/encoding/bcs.h).
template <typename T>
struct IntentMessage {
  IntentScope intent = IntentScope::kWeather;
  uint64_t timestamp_ms = 0;
  T data{};

  absl::Status SerializeBcs(BcsWriter *writer) const {
    VERITAS_RETURN_IF_ERROR(BcsSerialize(intent, writer));
    VERITAS_RETURN_IF_ERROR(BcsSerialize(timestamp_ms, writer));
    return BcsSerialize(data, writer);
  }

  static absl::StatusOr<IntentMessage<T>> DeserializeBcs(BcsReader *reader) {
    IntentMessage<T> message;
    VERITAS_RETURN_IF_ERROR(BcsDeserialize(reader, &message.intent));
    VERITAS_RETURN_IF_ERROR(BcsDeserialize(reader, &message.timestamp_ms));
    VERITAS_RETURN_IF_ERROR(BcsDeserialize(reader, &message.data));
    return message;
  }
};

template <typename T>
bool operator==(const IntentMessage<T> &lhs, const IntentMessage<T> &rhs) {
  return lhs.intent == rhs.intent && lhs.timestamp_ms == rhs.timestamp_ms &&
         lhs.data == rhs.data;
}

template <typename T>
bool operator!=(const IntentMessage<T> &lhs, const IntentMessage<T> &rhs) {
  return !(lhs == rhs);
}

// Returns the canonical bytes of |message|. Fails rather than returning a
// partial encoding if any part of the payload cannot be encoded.
template <typename T>
absl::StatusOr<std::vector<uint8_t>> CanonicalizeIntentMessage(
    const IntentMessage<T> &message) {
  return BcsEncode(message);
}

}  // namespace veritas

#endif  // VERITAS_IDENTITY_INTENT_MESSAGE_H_
