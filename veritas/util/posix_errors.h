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

#ifndef VERITAS_UTIL_POSIX_ERRORS_H_
#define VERITAS_UTIL_POSIX_ERRORS_H_

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace veritas {

/// Returns a Status representing a POSIX error. If `errnum` is zero,
/// `PosixError()` returns an OK status. Otherwise, the returned error message
/// includes the POSIX error explanation string and the status code is the
/// canonical code for `errnum`.
///
/// Callers should not rely on how `PosixError()` embeds error information in
/// the returned `Status`. Instead, callers can use `GetErrno()` to inspect a
/// `Status` for POSIX error information.
///
/// \param errnum A POSIX error number. See errno(3).
/// \param message An optional message to prepend to the POSIX error explanation
///                string.
/// \return An error representing `errnum`, or an OK status if `errnum` is zero.
absl::Status PosixError(int errnum, absl::string_view message = "");

/// Returns a Status representing the last POSIX error in this thread.
///
/// Equivalent to calling `PosixError(errno, message)`.
absl::Status LastPosixError(absl::string_view message = "");

/// Returns the POSIX error number that a `Status` represents, or zero if the
/// `Status` was not created by `PosixError()`.
int GetErrno(const absl::Status &status);

}  // namespace veritas

#endif  // VERITAS_UTIL_POSIX_ERRORS_H_
