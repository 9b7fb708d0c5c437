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

#include "veritas/boot/nitro_platform.h"

#include <memory>
#include <utility>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/memory/memory.h"
#include "veritas/boot/mock_nitro_hardware.h"
#include "veritas/test/util/status_matchers.h"

namespace veritas {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::StrictMock;

class NitroPlatformTest : public ::testing::Test {
 protected:
  NitroPlatformTest() {
    auto hardware = absl::make_unique<StrictMock<MockNitroHardware>>();
    hardware_ = hardware.get();
    platform_ = absl::make_unique<NitroPlatform>(std::move(hardware),
                                                 kDefaultNsmModulePath);
  }

  StrictMock<MockNitroHardware> *hardware_;
  std::unique_ptr<NitroPlatform> platform_;
};

TEST_F(NitroPlatformTest, HeartbeatThenModuleLoad) {
  {
    InSequence sequence;
    EXPECT_CALL(*hardware_, ExchangeHeartbeat(3, 9000, 0xB7))
        .WillOnce(Return(kNitroHeartbeat));
    EXPECT_CALL(*hardware_, LoadKernelModule("/nsm.ko"))
        .WillOnce(Return(absl::OkStatus()));
  }

  BootReport report;
  platform_->Initialize(&report);
  EXPECT_TRUE(report.clean());
}

TEST_F(NitroPlatformTest, HeartbeatFailureStillLoadsModule) {
  EXPECT_CALL(*hardware_, ExchangeHeartbeat(kNitroParentCid,
                                            kNitroHeartbeatPort,
                                            kNitroHeartbeat))
      .WillOnce(Return(absl::UnavailableError("no parent")));
  EXPECT_CALL(*hardware_, LoadKernelModule(kDefaultNsmModulePath))
      .WillOnce(Return(absl::OkStatus()));

  BootReport report;
  platform_->Initialize(&report);
  EXPECT_THAT(report.warnings(),
              ElementsAre(StatusIs(absl::StatusCode::kUnavailable)));
}

TEST_F(NitroPlatformTest, WrongHeartbeatReplyIsAWarning) {
  EXPECT_CALL(*hardware_, ExchangeHeartbeat)
      .WillOnce(Return(static_cast<uint8_t>(0x00)));
  EXPECT_CALL(*hardware_, LoadKernelModule)
      .WillOnce(Return(absl::OkStatus()));

  BootReport report;
  platform_->Initialize(&report);
  EXPECT_THAT(report.warnings(),
              ElementsAre(StatusIs(absl::StatusCode::kDataLoss,
                                   ::testing::HasSubstr("0x00"))));
}

TEST_F(NitroPlatformTest, ModuleLoadFailureIsAWarning) {
  EXPECT_CALL(*hardware_, ExchangeHeartbeat)
      .WillOnce(Return(kNitroHeartbeat));
  EXPECT_CALL(*hardware_, LoadKernelModule)
      .WillOnce(Return(absl::NotFoundError("/nsm.ko")));

  BootReport report;
  platform_->Initialize(&report);
  ASSERT_THAT(report.warnings().size(), Eq(1));
  EXPECT_THAT(report.warnings()[0], StatusIs(absl::StatusCode::kNotFound));
}

}  // namespace
}  // namespace veritas
