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

#include "veritas/boot/nitro_platform.h"

#include <fcntl.h>
#include <linux/vm_sockets.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cstring>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "veritas/util/fd_utils.h"
#include "veritas/util/logging.h"
#include "veritas/util/posix_errors.h"
#include "veritas/util/status_macros.h"

namespace veritas {
namespace {

class LinuxNitroHardware : public NitroHardware {
 public:
  absl::StatusOr<uint8_t> ExchangeHeartbeat(uint32_t cid, uint32_t port,
                                            uint8_t heartbeat) override {
    ScopedFd socket_fd(socket(AF_VSOCK, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!socket_fd.is_valid()) {
      return LastPosixError("Failed to create vsock socket");
    }

    VERITAS_RETURN_IF_ERROR(
        SetSocketTimeouts(socket_fd.get(), kNitroHeartbeatTimeout));

    struct sockaddr_vm address;
    memset(&address, 0, sizeof(address));
    address.svm_family = AF_VSOCK;
    address.svm_cid = cid;
    address.svm_port = port;
    if (connect(socket_fd.get(), reinterpret_cast<struct sockaddr *>(&address),
                sizeof(address)) == -1) {
      return LastPosixError(
          absl::StrCat("Failed to connect to vsock ", cid, ":", port));
    }

    VERITAS_RETURN_IF_ERROR(
        WriteAll(socket_fd.get(), ByteContainerView(&heartbeat, 1)));
    uint8_t reply = 0;
    VERITAS_RETURN_IF_ERROR(ReadExactly(socket_fd.get(), 1, &reply));
    VERITAS_RETURN_IF_ERROR(socket_fd.Close());
    return reply;
  }

  absl::Status LoadKernelModule(const std::string &path) override {
    ScopedFd module_fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!module_fd.is_valid()) {
      return LastPosixError(absl::StrCat("Failed to open ", path));
    }
    if (syscall(SYS_finit_module, module_fd.get(), "", 0) == -1) {
      return LastPosixError(absl::StrCat("Failed to load module ", path));
    }
    return module_fd.Close();
  }
};

}  // namespace

std::unique_ptr<NitroHardware> NitroHardware::CreateDefault() {
  return absl::make_unique<LinuxNitroHardware>();
}

NitroPlatform::NitroPlatform(std::unique_ptr<NitroHardware> hardware,
                             std::string nsm_module_path)
    : hardware_(std::move(hardware)),
      nsm_module_path_(std::move(nsm_module_path)) {}

absl::Status NitroPlatform::SendHeartbeat() {
  uint8_t reply;
  VERITAS_ASSIGN_OR_RETURN(
      reply, hardware_->ExchangeHeartbeat(kNitroParentCid, kNitroHeartbeatPort,
                                          kNitroHeartbeat));
  if (reply != kNitroHeartbeat) {
    return absl::DataLossError(
        absl::StrCat("Unexpected heartbeat reply 0x",
                     absl::Hex(reply, absl::kZeroPad2), " from parent"));
  }
  return absl::OkStatus();
}

void NitroPlatform::Initialize(BootReport *report) {
  absl::Status status = SendHeartbeat();
  if (status.ok()) {
    VLOG(1) << "Heartbeat acknowledged by parent instance";
  } else {
    LOG(WARNING) << "Heartbeat failed: " << status;
    report->AddWarning(std::move(status));
  }

  status = hardware_->LoadKernelModule(nsm_module_path_);
  if (status.ok()) {
    LOG(INFO) << "Loaded " << nsm_module_path_;
  } else {
    LOG(WARNING) << "Failed to load NSM driver: " << status;
    report->AddWarning(std::move(status));
  }
}

}  // namespace veritas
