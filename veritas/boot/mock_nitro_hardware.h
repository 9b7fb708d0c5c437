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

#ifndef VERITAS_BOOT_MOCK_NITRO_HARDWARE_H_
#define VERITAS_BOOT_MOCK_NITRO_HARDWARE_H_

#include <cstdint>
#include <string>

#include <gmock/gmock.h>
#include "veritas/boot/nitro_platform.h"

namespace veritas {

// Mock for testing code that depends on `NitroHardware`.
class MockNitroHardware : public NitroHardware {
 public:
  MOCK_METHOD(absl::StatusOr<uint8_t>, ExchangeHeartbeat,
              (uint32_t, uint32_t, uint8_t), (override));
  MOCK_METHOD(absl::Status, LoadKernelModule, (const std::string &),
              (override));
};

}  // namespace veritas

#endif  // VERITAS_BOOT_MOCK_NITRO_HARDWARE_H_
