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

#include "veritas/util/fd_utils.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <initializer_list>

#include "absl/strings/str_cat.h"
#include "veritas/util/logging.h"
#include "veritas/util/posix_errors.h"

namespace veritas {

ScopedFd &ScopedFd::operator=(ScopedFd &&other) {
  if (this != &other) {
    absl::Status status = Close();
    LOG_IF(ERROR, !status.ok()) << status;
    fd_ = other.release();
  }
  return *this;
}

ScopedFd::~ScopedFd() {
  absl::Status status = Close();
  LOG_IF(ERROR, !status.ok()) << status;
}

int ScopedFd::release() {
  int fd = fd_;
  fd_ = -1;
  return fd;
}

absl::Status ScopedFd::Close() {
  if (fd_ < 0) {
    return absl::OkStatus();
  }
  int fd = release();
  if (close(fd) == -1) {
    return LastPosixError(absl::StrCat("Failed to close fd ", fd));
  }
  return absl::OkStatus();
}

absl::Status WriteAll(int fd, ByteContainerView data) {
  size_t bytes_written = 0;
  while (bytes_written < data.size()) {
    ssize_t write_result =
        write(fd, data.data() + bytes_written, data.size() - bytes_written);
    if (write_result == -1) {
      if (errno == EINTR) {
        continue;
      }
      return LastPosixError(absl::StrCat("Failed to write to fd ", fd));
    }
    bytes_written += write_result;
  }
  return absl::OkStatus();
}

absl::Status ReadExactly(int fd, size_t size, uint8_t *buffer) {
  size_t bytes_read = 0;
  while (bytes_read < size) {
    ssize_t read_result = read(fd, buffer + bytes_read, size - bytes_read);
    if (read_result == -1) {
      if (errno == EINTR) {
        continue;
      }
      return LastPosixError(absl::StrCat("Failed to read from fd ", fd));
    }
    if (read_result == 0) {
      return absl::OutOfRangeError(absl::StrCat(
          "Reached EOF on fd ", fd, " after ", bytes_read, " of ", size,
          " bytes"));
    }
    bytes_read += read_result;
  }
  return absl::OkStatus();
}

absl::Status SetSocketTimeouts(int fd, absl::Duration timeout) {
  struct timeval timeout_value = absl::ToTimeval(timeout);
  for (int option : {SO_RCVTIMEO, SO_SNDTIMEO}) {
    if (setsockopt(fd, SOL_SOCKET, option, &timeout_value,
                   sizeof(timeout_value)) == -1) {
      return LastPosixError(
          absl::StrCat("Failed to set timeout on socket ", fd));
    }
  }
  return absl::OkStatus();
}

}  // namespace veritas
