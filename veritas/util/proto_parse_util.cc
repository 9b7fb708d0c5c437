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

#include "veritas/util/proto_parse_util.h"

#include <fcntl.h>

#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/text_format.h>
#include "absl/strings/str_cat.h"
#include "veritas/util/posix_errors.h"

namespace veritas {

absl::Status ReadTextProtoFile(const std::string &path,
                               google::protobuf::Message *message) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return LastPosixError(absl::StrCat("Could not open ", path));
  }
  google::protobuf::io::FileInputStream stream(fd);
  stream.SetCloseOnDelete(true);
  if (!google::protobuf::TextFormat::Parse(&stream, message)) {
    return absl::InvalidArgumentError(absl::StrCat("Could not parse ", path));
  }
  return absl::OkStatus();
}

}  // namespace veritas
