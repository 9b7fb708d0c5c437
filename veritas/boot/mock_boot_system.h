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

#ifndef VERITAS_BOOT_MOCK_BOOT_SYSTEM_H_
#define VERITAS_BOOT_MOCK_BOOT_SYSTEM_H_

#include <string>

#include <gmock/gmock.h>
#include "veritas/boot/boot_system.h"

namespace veritas {

// Mock for testing code that depends on `BootSystem`.
class MockBootSystem : public BootSystem {
 public:
  MOCK_METHOD(bool, PathExists, (const std::string &), (const, override));
  MOCK_METHOD(absl::Status, MakeDirectories, (const std::string &),
              (override));
  MOCK_METHOD(absl::Status, Mount, (const BootMountSpec &), (override));
  MOCK_METHOD(absl::Status, RedirectStandardStream, (int, const std::string &),
              (override));
  MOCK_METHOD(absl::Status, AddEntropy, (ByteContainerView), (override));
  MOCK_METHOD(void, Sync, (), (override));
  MOCK_METHOD(absl::Status, Reboot, (), (override));
};

}  // namespace veritas

#endif  // VERITAS_BOOT_MOCK_BOOT_SYSTEM_H_
