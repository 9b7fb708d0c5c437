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

// For GNU strerror_r().
#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif  // _GNU_SOURCE

#include "veritas/util/posix_errors.h"

#include <cerrno>
#include <cstring>
#include <string>

#include "absl/strings/cord.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace veritas {
namespace {

constexpr char kErrnoPayloadUrl[] = "type.veritas.dev/veritas.PosixErrno";

// A thread-safe implementation of strerror().
std::string StrError(int errnum) {
  // A buffer of 1024 should be sufficient on GNU systems according to
  // https://man7.org/linux/man-pages/man3/strerror.3.html.
  thread_local char strerror_buffer[1024] = {0};

  return strerror_r(errnum, strerror_buffer, sizeof(strerror_buffer));
}

}  // namespace

absl::Status PosixError(int errnum, absl::string_view message) {
  if (errnum == 0) {
    return absl::OkStatus();
  }

  absl::Status status(absl::ErrnoToStatusCode(errnum),
                      message.empty()
                          ? StrError(errnum)
                          : absl::StrCat(message, ": ", StrError(errnum)));
  status.SetPayload(kErrnoPayloadUrl, absl::Cord(absl::StrCat(errnum)));
  return status;
}

absl::Status LastPosixError(absl::string_view message) {
  return PosixError(errno, message);
}

int GetErrno(const absl::Status &status) {
  absl::optional<absl::Cord> payload = status.GetPayload(kErrnoPayloadUrl);
  int errnum = 0;
  if (!payload.has_value() ||
      !absl::SimpleAtoi(std::string(payload.value()), &errnum)) {
    return 0;
  }
  return errnum;
}

}  // namespace veritas
