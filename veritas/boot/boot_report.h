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

#ifndef VERITAS_BOOT_BOOT_REPORT_H_
#define VERITAS_BOOT_BOOT_REPORT_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/status/status.h"

namespace veritas {

// Outcome of a boot sequence. Boot steps are best-effort: a failing step adds
// a warning here and the sequence continues. Warnings are deliberately kept
// apart from absl::Status return values so that a non-fatal boot problem can
// never be mistaken for a fatal startup error.
class BootReport {
 public:
  BootReport() = default;

  // Records a non-fatal failure. |warning| must not be OK.
  void AddWarning(absl::Status warning);

  const std::vector<absl::Status> &warnings() const { return warnings_; }

  // Returns true if every step succeeded.
  bool clean() const { return warnings_.empty(); }

  size_t entropy_bytes_seeded() const { return entropy_bytes_seeded_; }
  void set_entropy_bytes_seeded(size_t size) { entropy_bytes_seeded_ = size; }

  // Returns a one-line summary suitable for logging.
  std::string ToString() const;

 private:
  std::vector<absl::Status> warnings_;
  size_t entropy_bytes_seeded_ = 0;
};

}  // namespace veritas

#endif  // VERITAS_BOOT_BOOT_REPORT_H_
