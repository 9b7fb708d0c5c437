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

#include "veritas/crypto/signing_key.h"

#include <string>

namespace veritas {

bool VerifyingKey::operator!=(const VerifyingKey &other) const {
  return !(*this == other);
}

VerifyingKeyProto VerifyingKey::SerializeToKeyProto() const {
  VerifyingKeyProto key_proto;
  key_proto.set_signature_scheme(GetSignatureScheme());
  std::vector<uint8_t> raw_key = SerializeToRaw();
  key_proto.set_key(std::string(raw_key.begin(), raw_key.end()));
  return key_proto;
}

}  // namespace veritas
