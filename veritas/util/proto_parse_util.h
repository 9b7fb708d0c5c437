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

#ifndef VERITAS_UTIL_PROTO_PARSE_UTIL_H_
#define VERITAS_UTIL_PROTO_PARSE_UTIL_H_

#include <string>

#include <google/protobuf/message.h>
#include "absl/status/status.h"

namespace veritas {

// Reads the text-format protobuf stored at |path| into |message|. Returns a
// POSIX error if the file cannot be opened and INVALID_ARGUMENT if its
// contents do not parse.
absl::Status ReadTextProtoFile(const std::string &path,
                               google::protobuf::Message *message);

}  // namespace veritas

#endif  // VERITAS_UTIL_PROTO_PARSE_UTIL_H_
