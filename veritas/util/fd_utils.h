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

#ifndef VERITAS_UTIL_FD_UTILS_H_
#define VERITAS_UTIL_FD_UTILS_H_

#include <cstddef>
#include <cstdint>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "veritas/util/byte_container_view.h"

namespace veritas {

// ScopedFd owns a POSIX file descriptor and closes it when destroyed. A
// default-constructed ScopedFd owns nothing.
class ScopedFd {
 public:
  ScopedFd() : fd_(-1) {}
  explicit ScopedFd(int fd) : fd_(fd) {}

  ScopedFd(const ScopedFd &other) = delete;
  ScopedFd &operator=(const ScopedFd &other) = delete;

  ScopedFd(ScopedFd &&other) : fd_(other.release()) {}
  ScopedFd &operator=(ScopedFd &&other);

  ~ScopedFd();

  int get() const { return fd_; }
  bool is_valid() const { return fd_ >= 0; }

  // Gives up ownership of the descriptor without closing it.
  int release();

  // Closes the owned descriptor, if any. Returns the result of close().
  absl::Status Close();

 private:
  int fd_;
};

// Writes all of |data| to |fd|, retrying on EINTR and short writes.
absl::Status WriteAll(int fd, ByteContainerView data);

// Reads exactly |size| bytes from |fd| into |buffer|. Returns OUT_OF_RANGE if
// EOF is reached first.
absl::Status ReadExactly(int fd, size_t size, uint8_t *buffer);

// Bounds every blocking send and receive on the socket |fd| by |timeout|.
// Once it expires, the call fails with EAGAIN, which maps to UNAVAILABLE.
absl::Status SetSocketTimeouts(int fd, absl::Duration timeout);

}  // namespace veritas

#endif  // VERITAS_UTIL_FD_UTILS_H_
