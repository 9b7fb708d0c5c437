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

#include "veritas/boot/workload_supervisor.h"

#include <fcntl.h>
#include <stdlib.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>

#include "absl/strings/str_cat.h"
#include "veritas/util/fd_utils.h"
#include "veritas/util/logging.h"
#include "veritas/util/posix_errors.h"

namespace veritas {
namespace {

// Waits for |pid|, retrying when interrupted by a signal.
absl::StatusOr<int> WaitForChild(pid_t pid) {
  int wait_status = 0;
  while (waitpid(pid, &wait_status, 0) == -1) {
    if (errno != EINTR) {
      return LastPosixError(absl::StrCat("waitpid failed for pid ", pid));
    }
  }
  return wait_status;
}

}  // namespace

absl::Status ExportWorkloadEnvironment(const WorkloadEnvironment &environment) {
  if (setenv("SSL_CERT_FILE", environment.ssl_cert_file.c_str(), 1) == -1) {
    return LastPosixError("Failed to set SSL_CERT_FILE");
  }
  if (setenv("PATH", environment.path.c_str(), 1) == -1) {
    return LastPosixError("Failed to set PATH");
  }
  return absl::OkStatus();
}

std::string DescribeWaitStatus(int wait_status) {
  if (WIFEXITED(wait_status)) {
    return absl::StrCat("exited with status ", WEXITSTATUS(wait_status));
  }
  if (WIFSIGNALED(wait_status)) {
    return absl::StrCat("killed by signal ", WTERMSIG(wait_status));
  }
  return absl::StrCat("terminated with wait status ", wait_status);
}

absl::StatusOr<int> RunWorkload(const std::string &path,
                                const std::vector<std::string> &args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(path.c_str()));
  for (const std::string &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  // The child reports a failed execv() through this pipe. A successful execv()
  // closes the write end, so the parent reads EOF.
  int pipe_fds[2];
  if (pipe2(pipe_fds, O_CLOEXEC) == -1) {
    return LastPosixError("Failed to create exec status pipe");
  }
  ScopedFd read_end(pipe_fds[0]);
  ScopedFd write_end(pipe_fds[1]);

  pid_t pid = fork();
  if (pid == -1) {
    return LastPosixError("fork failed");
  }
  if (pid == 0) {
    execv(path.c_str(), argv.data());
    int exec_errno = errno;
    ssize_t ignored = write(write_end.get(), &exec_errno, sizeof(exec_errno));
    (void)ignored;
    _exit(127);
  }

  absl::Status close_status = write_end.Close();
  LOG_IF(WARNING, !close_status.ok()) << close_status;
  int exec_errno = 0;
  absl::Status read_status =
      ReadExactly(read_end.get(), sizeof(exec_errno),
                  reinterpret_cast<uint8_t *>(&exec_errno));

  absl::StatusOr<int> wait_status = WaitForChild(pid);
  if (read_status.ok()) {
    return PosixError(exec_errno, absl::StrCat("Failed to execute ", path));
  }
  if (read_status.code() != absl::StatusCode::kOutOfRange) {
    LOG(WARNING) << "Could not read exec status of " << path << ": "
                 << read_status;
  }
  return wait_status;
}

WorkloadSupervisor::WorkloadSupervisor(BootSystem *system) : system_(system) {}

absl::Status WorkloadSupervisor::RunAndRestart(
    const std::string &path, const std::vector<std::string> &args) {
  absl::StatusOr<int> wait_status = RunWorkload(path, args);
  if (wait_status.ok()) {
    LOG(INFO) << path << " " << DescribeWaitStatus(*wait_status);
  } else {
    LOG(ERROR) << "Workload failed: " << wait_status.status();
  }

  system_->Sync();
  LOG(INFO) << "Restarting enclave";
  return system_->Reboot();
}

}  // namespace veritas
