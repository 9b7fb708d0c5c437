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

#include "veritas/util/posix_errors.h"

#include <cerrno>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "veritas/test/util/status_matchers.h"

namespace veritas {
namespace {

using ::testing::Eq;
using ::testing::HasSubstr;

TEST(PosixErrorsTest, ZeroErrnoIsOk) { VERITAS_EXPECT_OK(PosixError(0)); }

TEST(PosixErrorsTest, ErrnoMapsToCanonicalCode) {
  EXPECT_THAT(PosixError(ENOENT), StatusIs(absl::StatusCode::kNotFound));
  EXPECT_THAT(PosixError(EACCES),
              StatusIs(absl::StatusCode::kPermissionDenied));
  EXPECT_THAT(PosixError(EBUSY),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(PosixError(EAGAIN), StatusIs(absl::StatusCode::kUnavailable));
}

TEST(PosixErrorsTest, MessageIsPrepended) {
  EXPECT_THAT(PosixError(ENOENT, "Failed to open /dev/nsm"),
              StatusIs(absl::StatusCode::kNotFound,
                       HasSubstr("Failed to open /dev/nsm: ")));
}

TEST(PosixErrorsTest, GetErrnoRecoversErrorNumber) {
  EXPECT_THAT(GetErrno(PosixError(EINVAL, "mount")), Eq(EINVAL));
  EXPECT_THAT(GetErrno(absl::InternalError("not a POSIX error")), Eq(0));
  EXPECT_THAT(GetErrno(absl::OkStatus()), Eq(0));
}

TEST(PosixErrorsTest, LastPosixErrorReadsErrno) {
  errno = EPERM;
  absl::Status status = LastPosixError("reboot");
  EXPECT_THAT(GetErrno(status), Eq(EPERM));
}

}  // namespace
}  // namespace veritas
