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

#ifndef VERITAS_BOOT_PLATFORM_INITIALIZER_H_
#define VERITAS_BOOT_PLATFORM_INITIALIZER_H_

#include "veritas/boot/boot_report.h"

namespace veritas {

// Hardware-specific initialization run by the boot sequence after the
// console is available and before the kernel random pool is seeded.
class PlatformInitializer {
 public:
  virtual ~PlatformInitializer() = default;

  // Brings up the platform. Failures are recorded in |report| rather than
  // returned, because boot continues on a best-effort basis.
  virtual void Initialize(BootReport *report) = 0;
};

}  // namespace veritas

#endif  // VERITAS_BOOT_PLATFORM_INITIALIZER_H_
