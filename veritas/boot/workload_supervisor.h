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

#ifndef VERITAS_BOOT_WORKLOAD_SUPERVISOR_H_
#define VERITAS_BOOT_WORKLOAD_SUPERVISOR_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "veritas/boot/boot_system.h"

namespace veritas {

inline constexpr char kDefaultWorkloadPath[] = "/sh";
inline constexpr char kDefaultWorkloadScript[] = "/run.sh";
inline constexpr char kDefaultSslCertFile[] = "/ca-certificates.crt";
inline constexpr char kDefaultSearchPath[] = "/bin:/sbin:/usr/bin:/usr/sbin:/";

// Environment exported by the init process for the workload.
struct WorkloadEnvironment {
  std::string ssl_cert_file = kDefaultSslCertFile;
  std::string path = kDefaultSearchPath;
};

// Sets SSL_CERT_FILE and PATH in the environment of the current process, to
// be inherited by the workload.
absl::Status ExportWorkloadEnvironment(const WorkloadEnvironment &environment);

// Renders a waitpid() status as "exited with status N" or "killed by signal
// N".
std::string DescribeWaitStatus(int wait_status);

// Starts |path| with arguments |args| (not including argv[0], which is set to
// |path|) and blocks until it terminates. Returns the raw waitpid() status.
// Fails without waiting if the program cannot be executed.
absl::StatusOr<int> RunWorkload(const std::string &path,
                                const std::vector<std::string> &args);

// Supervises the single workload of an enclave: the workload runs to
// completion, there is no restart on crash and no timeout. Once it exits the
// machine is restarted.
class WorkloadSupervisor {
 public:
  // |system| is not owned and must outlive the supervisor.
  explicit WorkloadSupervisor(BootSystem *system);

  // Runs the workload, logs its exit status, syncs filesystems and reboots.
  // Returns only if the reboot request fails, or if the underlying system
  // returns from a successful reboot request.
  absl::Status RunAndRestart(const std::string &path,
                             const std::vector<std::string> &args);

 private:
  BootSystem *const system_;
};

}  // namespace veritas

#endif  // VERITAS_BOOT_WORKLOAD_SUPERVISOR_H_
