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

#ifndef VERITAS_BOOT_BOOT_SEQUENCER_H_
#define VERITAS_BOOT_BOOT_SEQUENCER_H_

#include <cstddef>
#include <string>

#include "absl/types/span.h"
#include "veritas/boot/boot_report.h"
#include "veritas/boot/boot_system.h"
#include "veritas/boot/entropy.h"
#include "veritas/boot/mount_table.h"
#include "veritas/boot/platform_initializer.h"
#include "veritas/crypto/entropy_source.h"

namespace veritas {

// Default console device to which the standard streams are redirected.
inline constexpr char kDefaultConsolePath[] = "/dev/console";

struct BootOptions {
  std::string console_path = kDefaultConsolePath;
  absl::Span<const BootMountSpec> mount_table = DefaultMountTable();
  size_t entropy_size = kBootEntropySize;
};

// Brings the enclave from a bare kernel to a state where user-space code can
// run safely. The steps run strictly in order:
//
//   1. Mount the virtual filesystems of the mount table, creating missing
//      mount points.
//   2. Reopen the standard streams on the console device.
//   3. Run the platform initializer.
//   4. Seed the kernel random pool from the entropy source.
//
// Every step is best-effort: failures are logged and recorded as warnings in
// the returned BootReport and the sequence continues. A failure to seed
// entropy is logged at ERROR severity, since keys generated afterwards are
// only as strong as the pool.
//
// The collaborators are not owned and must outlive the sequencer.
// |platform| and |entropy_source| may be null, which skips steps 3 and 4
// respectively (a missing entropy source is still reported).
class BootSequencer {
 public:
  BootSequencer(BootSystem *system, PlatformInitializer *platform,
                EntropySource *entropy_source,
                BootOptions options = BootOptions());

  BootSequencer(const BootSequencer &other) = delete;
  BootSequencer &operator=(const BootSequencer &other) = delete;

  // Runs the boot steps and returns their outcome.
  BootReport Run();

 private:
  void MountFilesystems(BootReport *report);
  void RedirectConsole(BootReport *report);
  void SeedKernelEntropy(BootReport *report);

  BootSystem *const system_;
  PlatformInitializer *const platform_;
  EntropySource *const entropy_source_;
  const BootOptions options_;
};

// Runs |sequencer| if no boot sequence has run through this function in the
// current process. Subsequent calls do nothing and return a report carrying a
// FAILED_PRECONDITION warning.
BootReport BootProcessOnce(BootSequencer *sequencer);

}  // namespace veritas

#endif  // VERITAS_BOOT_BOOT_SEQUENCER_H_
