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

#include "veritas/boot/boot_sequencer.h"

#include <unistd.h>

#include <atomic>
#include <utility>

#include "absl/strings/str_cat.h"
#include "veritas/util/logging.h"

namespace veritas {

BootSequencer::BootSequencer(BootSystem *system, PlatformInitializer *platform,
                             EntropySource *entropy_source, BootOptions options)
    : system_(system),
      platform_(platform),
      entropy_source_(entropy_source),
      options_(std::move(options)) {}

BootReport BootSequencer::Run() {
  BootReport report;
  MountFilesystems(&report);
  RedirectConsole(&report);
  if (platform_) {
    platform_->Initialize(&report);
  }
  SeedKernelEntropy(&report);
  return report;
}

void BootSequencer::MountFilesystems(BootReport *report) {
  absl::Status status = ValidateMountOrder(options_.mount_table);
  if (!status.ok()) {
    LOG(ERROR) << "Refusing to mount filesystems: " << status;
    report->AddWarning(std::move(status));
    return;
  }

  for (const BootMountSpec &spec : options_.mount_table) {
    if (!system_->PathExists(spec.target)) {
      status = system_->MakeDirectories(spec.target);
      if (!status.ok()) {
        LOG(WARNING) << "Failed to create mount point " << spec.target << ": "
                     << status;
        report->AddWarning(std::move(status));
        continue;
      }
      LOG(INFO) << "Created mount point " << spec.target;
    }

    status = system_->Mount(spec);
    if (!status.ok()) {
      LOG(WARNING) << status;
      report->AddWarning(std::move(status));
      continue;
    }
    LOG(INFO) << "Mounted " << spec.target;
  }
}

void BootSequencer::RedirectConsole(BootReport *report) {
  for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
    absl::Status status =
        system_->RedirectStandardStream(fd, options_.console_path);
    if (!status.ok()) {
      LOG(WARNING) << status;
      report->AddWarning(std::move(status));
    }
  }
}

void BootSequencer::SeedKernelEntropy(BootReport *report) {
  absl::StatusOr<size_t> seeded =
      SeedEntropy(options_.entropy_size, entropy_source_, system_);
  if (!seeded.ok()) {
    LOG(ERROR) << "Failed to seed kernel entropy, keys generated by this "
               << "enclave may be weak: " << seeded.status();
    report->AddWarning(seeded.status());
    return;
  }
  report->set_entropy_bytes_seeded(*seeded);
  LOG(INFO) << "Seeded kernel with entropy: " << *seeded;
}

BootReport BootProcessOnce(BootSequencer *sequencer) {
  static std::atomic<bool> boot_started(false);
  if (boot_started.exchange(true)) {
    BootReport report;
    report.AddWarning(absl::FailedPreconditionError(
        "The boot sequence already ran in this process"));
    LOG(WARNING) << report.warnings().back();
    return report;
  }
  return sequencer->Run();
}

}  // namespace veritas
