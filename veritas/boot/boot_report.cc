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

#include "veritas/boot/boot_report.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "veritas/util/logging.h"

namespace veritas {

void BootReport::AddWarning(absl::Status warning) {
  CHECK(!warning.ok()) << "Boot warnings must carry an error status";
  warnings_.push_back(std::move(warning));
}

std::string BootReport::ToString() const {
  if (clean()) {
    return absl::StrCat("clean boot, ", entropy_bytes_seeded_,
                        " entropy bytes seeded");
  }
  return absl::StrCat(
      warnings_.size(), " boot warning(s), ", entropy_bytes_seeded_,
      " entropy bytes seeded: ",
      absl::StrJoin(warnings_, "; ",
                    [](std::string *out, const absl::Status &status) {
                      absl::StrAppend(out, status.ToString());
                    }));
}

}  // namespace veritas
