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

#ifndef VERITAS_IDENTITY_SIGNED_RESPONSE_H_
#define VERITAS_IDENTITY_SIGNED_RESPONSE_H_

#include <string>

#include "veritas/identity/intent_message.h"

namespace veritas {

// A payload as returned to callers: the exact message that was signed and the
// lowercase hex encoding of the signature over its canonical bytes.
template <typename T>
struct SignedResponse {
  IntentMessage<T> response;
  std::string signature;
};

}  // namespace veritas

#endif  // VERITAS_IDENTITY_SIGNED_RESPONSE_H_
