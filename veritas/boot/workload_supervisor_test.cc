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

#include "veritas/boot/workload_supervisor.h"

#include <signal.h>
#include <stdlib.h>
#include <sys/wait.h>

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "veritas/boot/mock_boot_system.h"
#include "veritas/test/util/status_matchers.h"

namespace veritas {
namespace {

using ::testing::Eq;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::StrEq;
using ::testing::StrictMock;

constexpr char kShell[] = "/bin/sh";

TEST(DescribeWaitStatusTest, ExitStatus) {
  EXPECT_THAT(DescribeWaitStatus(0), StrEq("exited with status 0"));
  EXPECT_THAT(DescribeWaitStatus(3 << 8), StrEq("exited with status 3"));
}

TEST(DescribeWaitStatusTest, TerminatingSignal) {
  EXPECT_THAT(DescribeWaitStatus(SIGKILL), StrEq("killed by signal 9"));
}

TEST(RunWorkloadTest, ReturnsExitStatus) {
  int wait_status;
  VERITAS_ASSERT_OK_AND_ASSIGN(wait_status,
                               RunWorkload(kShell, {"-c", "exit 3"}));
  ASSERT_TRUE(WIFEXITED(wait_status));
  EXPECT_THAT(WEXITSTATUS(wait_status), Eq(3));
  EXPECT_THAT(DescribeWaitStatus(wait_status), StrEq("exited with status 3"));
}

TEST(RunWorkloadTest, ReportsTerminatingSignal) {
  int wait_status;
  VERITAS_ASSERT_OK_AND_ASSIGN(wait_status,
                               RunWorkload(kShell, {"-c", "kill -9 $$"}));
  EXPECT_THAT(DescribeWaitStatus(wait_status), StrEq("killed by signal 9"));
}

TEST(RunWorkloadTest, PassesArgumentsInOrder) {
  int wait_status;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      wait_status,
      RunWorkload(kShell, {"-c", "test \"$0:$1\" = \"first:second\"", "first",
                           "second"}));
  EXPECT_THAT(DescribeWaitStatus(wait_status), StrEq("exited with status 0"));
}

TEST(RunWorkloadTest, MissingProgramFailsWithoutWaiting) {
  EXPECT_THAT(RunWorkload("/nonexistent/veritas-workload", {}),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST(ExportWorkloadEnvironmentTest, SetsVariables) {
  WorkloadEnvironment environment;
  VERITAS_ASSERT_OK(ExportWorkloadEnvironment(environment));
  EXPECT_THAT(getenv("SSL_CERT_FILE"), StrEq("/ca-certificates.crt"));
  EXPECT_THAT(getenv("PATH"), StrEq("/bin:/sbin:/usr/bin:/usr/sbin:/"));

  int wait_status;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      wait_status,
      RunWorkload(kShell,
                  {"-c", "test \"$SSL_CERT_FILE\" = /ca-certificates.crt"}));
  EXPECT_THAT(DescribeWaitStatus(wait_status), StrEq("exited with status 0"));
}

TEST(WorkloadSupervisorTest, SyncsAndRebootsAfterWorkloadExits) {
  StrictMock<MockBootSystem> system;
  {
    InSequence sequence;
    EXPECT_CALL(system, Sync());
    EXPECT_CALL(system, Reboot())
        .WillOnce(Return(absl::PermissionDeniedError("not pid 1")));
  }

  WorkloadSupervisor supervisor(&system);
  EXPECT_THAT(supervisor.RunAndRestart(kShell, {"-c", "exit 0"}),
              StatusIs(absl::StatusCode::kPermissionDenied));
}

TEST(WorkloadSupervisorTest, RebootsEvenIfWorkloadCannotStart) {
  StrictMock<MockBootSystem> system;
  EXPECT_CALL(system, Sync());
  EXPECT_CALL(system, Reboot()).WillOnce(Return(absl::OkStatus()));

  WorkloadSupervisor supervisor(&system);
  VERITAS_EXPECT_OK(
      supervisor.RunAndRestart("/nonexistent/veritas-workload", {}));
}

}  // namespace
}  // namespace veritas
