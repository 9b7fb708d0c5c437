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

#include "veritas/nsm/nsm_driver.h"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/uio.h>

#include <cerrno>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "veritas/util/hex_util.h"
#include "veritas/util/logging.h"
#include "veritas/util/posix_errors.h"
#include "veritas/util/status_macros.h"

namespace veritas {
namespace {

// Mirrors struct nsm_message in the NSM kernel driver.
struct NsmMessage {
  struct iovec request;
  struct iovec response;
};

constexpr unsigned long kNsmIoctlMagic = 0x0A;
constexpr unsigned long kNsmIoctlRequest =
    _IOWR(kNsmIoctlMagic, 0, struct NsmMessage);

// Re-codes the last POSIX error as UNAVAILABLE, keeping its errno payload.
absl::Status DeviceError(absl::string_view message) {
  absl::Status posix_status = LastPosixError(message);
  absl::Status status(absl::StatusCode::kUnavailable, posix_status.message());
  posix_status.ForEachPayload(
      [&status](absl::string_view type_url, const absl::Cord &payload) {
        status.SetPayload(type_url, payload);
      });
  return status;
}

}  // namespace

absl::StatusOr<std::unique_ptr<NsmDriver>> NsmDriver::Open(
    absl::string_view path) {
  std::string device_path(path);
  int fd = open(device_path.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    return DeviceError(absl::StrCat("Failed to open NSM device ", path));
  }
  VLOG(1) << "Opened NSM device " << path;
  return absl::WrapUnique(new NsmDriver(ScopedFd(fd)));
}

NsmDeviceOpener NsmDriver::Opener(std::string path) {
  return [path]() -> absl::StatusOr<std::unique_ptr<NsmDevice>> {
    std::unique_ptr<NsmDriver> driver;
    VERITAS_ASSIGN_OR_RETURN(driver, Open(path));
    return std::unique_ptr<NsmDevice>(std::move(driver));
  };
}

NsmDriver::NsmDriver(ScopedFd fd) : fd_(std::move(fd)) {}

absl::StatusOr<CleansingVector<uint8_t>> NsmDriver::Transact(
    ByteContainerView request) {
  if (request.size() > kNsmRequestMaxSize) {
    return absl::InvalidArgumentError(
        absl::StrCat("NSM request of ", request.size(),
                     " bytes exceeds the driver limit of ",
                     kNsmRequestMaxSize));
  }
  // Responses may carry random bytes, so only requests are traced.
  VLOG(2) << "NSM request: "
          << BufferToDebugHexString(request.data(), request.size());
  std::vector<uint8_t> request_buffer(request.begin(), request.end());
  CleansingVector<uint8_t> response_buffer(kNsmResponseMaxSize);

  NsmMessage message;
  message.request.iov_base = request_buffer.data();
  message.request.iov_len = request_buffer.size();
  message.response.iov_base = response_buffer.data();
  message.response.iov_len = response_buffer.size();

  int result;
  do {
    result = ioctl(fd_.get(), kNsmIoctlRequest, &message);
  } while (result < 0 && errno == EINTR);
  if (result < 0) {
    return DeviceError("NSM ioctl failed");
  }
  if (message.response.iov_len > response_buffer.size()) {
    return absl::InternalError(
        absl::StrCat("NSM driver reported a response of ",
                     message.response.iov_len, " bytes, larger than the ",
                     response_buffer.size(), "-byte buffer"));
  }
  response_buffer.resize(message.response.iov_len);
  return response_buffer;
}

}  // namespace veritas
