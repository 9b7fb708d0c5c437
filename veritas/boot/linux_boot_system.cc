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

#include "veritas/boot/linux_boot_system.h"

#include <fcntl.h>
#include <linux/random.h>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <sys/reboot.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "veritas/util/cleansing_allocator.h"
#include "veritas/util/fd_utils.h"
#include "veritas/util/posix_errors.h"
#include "veritas/util/status_macros.h"

namespace veritas {
namespace {

// Creates a single directory, treating an existing directory as success.
absl::Status MakeDirectory(const std::string &path) {
  if (mkdir(path.c_str(), 0755) == 0) {
    return absl::OkStatus();
  }
  int errnum = errno;
  struct stat path_stat;
  if (errnum == EEXIST && stat(path.c_str(), &path_stat) == 0 &&
      S_ISDIR(path_stat.st_mode)) {
    return absl::OkStatus();
  }
  return PosixError(errnum, absl::StrCat("Failed to create directory ", path));
}

}  // namespace

std::unique_ptr<BootSystem> BootSystem::CreateDefault() {
  return absl::make_unique<LinuxBootSystem>();
}

bool LinuxBootSystem::PathExists(const std::string &path) const {
  return access(path.c_str(), F_OK) == 0;
}

absl::Status LinuxBootSystem::MakeDirectories(const std::string &path) {
  if (path.empty()) {
    return absl::InvalidArgumentError("Cannot create an empty path");
  }
  for (size_t pos = path.find('/', 1); pos != std::string::npos;
       pos = path.find('/', pos + 1)) {
    if (pos == 0 || path[pos - 1] == '/') {
      continue;
    }
    VERITAS_RETURN_IF_ERROR(MakeDirectory(path.substr(0, pos)));
  }
  if (path.back() == '/') {
    return absl::OkStatus();
  }
  return MakeDirectory(path);
}

absl::Status LinuxBootSystem::Mount(const BootMountSpec &spec) {
  if (mount(spec.source, spec.target, spec.fs_type, spec.flags,
            spec.options) == -1) {
    return LastPosixError(absl::StrCat("Failed to mount ", spec.fs_type,
                                       " on ", spec.target));
  }
  return absl::OkStatus();
}

absl::Status LinuxBootSystem::RedirectStandardStream(int fd,
                                                     const std::string &path) {
  FILE *stream;
  const char *mode;
  switch (fd) {
    case STDIN_FILENO:
      stream = stdin;
      mode = "r";
      break;
    case STDOUT_FILENO:
      stream = stdout;
      mode = "w";
      break;
    case STDERR_FILENO:
      stream = stderr;
      mode = "w";
      break;
    default:
      return absl::InvalidArgumentError(
          absl::StrCat("Not a standard stream: ", fd));
  }
  if (freopen(path.c_str(), mode, stream) == nullptr) {
    return LastPosixError(
        absl::StrCat("Failed to reopen fd ", fd, " on ", path));
  }
  return absl::OkStatus();
}

absl::Status LinuxBootSystem::AddEntropy(ByteContainerView entropy) {
  if (entropy.size() > INT_MAX / 8) {
    return absl::InvalidArgumentError(
        absl::StrCat("Entropy buffer too large: ", entropy.size()));
  }

  // struct rand_pool_info ends in a flexible array of 32-bit words.
  size_t words = (entropy.size() + sizeof(uint32_t) - 1) / sizeof(uint32_t);
  CleansingVector<uint32_t> storage(
      sizeof(struct rand_pool_info) / sizeof(uint32_t) + words, 0);
  auto *info = reinterpret_cast<struct rand_pool_info *>(storage.data());
  info->entropy_count = static_cast<int>(entropy.size() * 8);
  info->buf_size = static_cast<int>(entropy.size());
  memcpy(info->buf, entropy.data(), entropy.size());

  ScopedFd fd(open(kKernelRandomDevicePath, O_WRONLY | O_CLOEXEC));
  if (!fd.is_valid()) {
    return LastPosixError(
        absl::StrCat("Failed to open ", kKernelRandomDevicePath));
  }
  if (ioctl(fd.get(), RNDADDENTROPY, info) == -1) {
    return LastPosixError("RNDADDENTROPY failed");
  }
  return fd.Close();
}

void LinuxBootSystem::Sync() { sync(); }

absl::Status LinuxBootSystem::Reboot() {
  if (reboot(RB_AUTOBOOT) == -1) {
    return LastPosixError("reboot failed");
  }
  return absl::OkStatus();
}

}  // namespace veritas
