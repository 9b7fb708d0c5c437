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

// veritas_init runs as PID 1 inside the enclave. It brings up the minimal
// runtime, launches the single workload, and restarts the enclave once the
// workload exits.

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/memory/memory.h"
#include "veritas/boot/boot_report.h"
#include "veritas/boot/boot_sequencer.h"
#include "veritas/boot/boot_system.h"
#include "veritas/boot/nitro_platform.h"
#include "veritas/boot/workload_supervisor.h"
#include "veritas/nsm/nsm_driver.h"
#include "veritas/nsm/nsm_entropy_source.h"
#include "veritas/util/logging.h"

ABSL_FLAG(std::string, workload, veritas::kDefaultWorkloadPath,
          "The program run once the enclave has booted");

ABSL_FLAG(std::vector<std::string>, workload_args,
          std::vector<std::string>({veritas::kDefaultWorkloadScript}),
          "Comma-separated arguments passed to the workload");

ABSL_FLAG(std::string, console, veritas::kDefaultConsolePath,
          "The console device that receives the standard streams");

ABSL_FLAG(std::string, ssl_cert_file, veritas::kDefaultSslCertFile,
          "The value of SSL_CERT_FILE exported to the workload");

ABSL_FLAG(std::string, path, veritas::kDefaultSearchPath,
          "The value of PATH exported to the workload");

ABSL_FLAG(std::string, nsm_device, veritas::kDefaultNsmDevicePath,
          "The Nitro Security Module device used as the entropy source");

ABSL_FLAG(std::string, nsm_module, veritas::kDefaultNsmModulePath,
          "The kernel module that provides the NSM device");

ABSL_FLAG(int, vlog_level, 0, "The VLOG verbosity threshold");

int main(int argc, char **argv) {
  absl::ParseCommandLine(argc, argv);

  // No writable filesystem exists yet, so logging is console-only.
  veritas::InitLogging("", argv[0], absl::GetFlag(FLAGS_vlog_level));

  std::unique_ptr<veritas::BootSystem> system =
      veritas::BootSystem::CreateDefault();
  veritas::NitroPlatform platform(veritas::NitroHardware::CreateDefault(),
                                  absl::GetFlag(FLAGS_nsm_module));
  veritas::NsmEntropySource entropy_source(
      veritas::NsmDriver::Opener(absl::GetFlag(FLAGS_nsm_device)));

  veritas::BootOptions options;
  options.console_path = absl::GetFlag(FLAGS_console);
  veritas::BootSequencer sequencer(system.get(), &platform, &entropy_source,
                                   std::move(options));
  veritas::BootReport report = veritas::BootProcessOnce(&sequencer);
  if (report.clean()) {
    LOG(INFO) << "Veritas enclave booted: " << report.ToString();
  } else {
    LOG(WARNING) << "Veritas enclave booted with " << report.ToString();
  }

  veritas::WorkloadEnvironment environment;
  environment.ssl_cert_file = absl::GetFlag(FLAGS_ssl_cert_file);
  environment.path = absl::GetFlag(FLAGS_path);
  absl::Status status = veritas::ExportWorkloadEnvironment(environment);
  LOG_IF(ERROR, !status.ok()) << status;

  veritas::WorkloadSupervisor supervisor(system.get());
  status = supervisor.RunAndRestart(absl::GetFlag(FLAGS_workload),
                                    absl::GetFlag(FLAGS_workload_args));
  LOG(ERROR) << "Enclave restart failed: " << status;
  return 1;
}
