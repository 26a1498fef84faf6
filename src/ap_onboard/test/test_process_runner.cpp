// Copyright 2026 bburda
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "ap_onboard/session/process_runner.hpp"

using namespace ap_onboard;
using namespace std::chrono_literals;

class ProcessRunnerTest : public ::testing::Test {
 protected:
  ProcessRunner runner_;
};

TEST_F(ProcessRunnerTest, CapturesStdoutAndExitCode) {
  auto result = runner_.run({"/bin/sh", "-c", "echo hello"}, 5s);

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_FALSE(result->timed_out);
  EXPECT_EQ(result->stdout_output, "hello\n");
  EXPECT_TRUE(result->stderr_output.empty());
}

TEST_F(ProcessRunnerTest, CapturesStderrSeparately) {
  auto result = runner_.run({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"}, 5s);

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->exit_code, 3);
  EXPECT_EQ(result->stdout_output, "out\n");
  EXPECT_EQ(result->stderr_output, "err\n");
  EXPECT_EQ(result->combined(), "out\n\nerr");
}

TEST_F(ProcessRunnerTest, ArgumentsAreNotInterpretedByAShell) {
  auto result = runner_.run({"/bin/echo", "$HOME; rm -rf /"}, 5s);

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->stdout_output, "$HOME; rm -rf /\n");
}

TEST_F(ProcessRunnerTest, EnvironmentOverridesReachChild) {
  auto result = runner_.run({"/bin/sh", "-c", "printf '%s' \"$AP_ONBOARD_TEST_VAR\""}, 5s,
                            {{"AP_ONBOARD_TEST_VAR", "secret value"}});

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->stdout_output, "secret value");
}

TEST_F(ProcessRunnerTest, DeadlineKillsChild) {
  const auto start = std::chrono::steady_clock::now();
  auto result = runner_.run({"/bin/sh", "-c", "sleep 30"}, 300ms);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_TRUE(result->timed_out);
  EXPECT_EQ(result->exit_code, 128 + 9);
  EXPECT_LT(elapsed, 5s);
}

TEST_F(ProcessRunnerTest, DeadlineKillsChildThatClosedItsOutput) {
  const auto start = std::chrono::steady_clock::now();
  auto result = runner_.run({"/bin/sh", "-c", "exec >/dev/null 2>&1; sleep 30"}, 300ms);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_TRUE(result->timed_out);
  EXPECT_EQ(result->exit_code, 128 + 9);
  EXPECT_LT(elapsed, 5s);
}

TEST_F(ProcessRunnerTest, MissingProgramIsAnError) {
  auto result = runner_.run({"ap-onboard-no-such-program"}, 5s);

  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().find("ap-onboard-no-such-program"), std::string::npos);
}

TEST_F(ProcessRunnerTest, EmptyArgvIsAnError) {
  auto result = runner_.run({}, 5s);

  ASSERT_FALSE(result.has_value());
}

TEST_F(ProcessRunnerTest, CommandAvailability) {
  EXPECT_TRUE(runner_.is_command_available("sh"));
  EXPECT_TRUE(runner_.is_command_available("/bin/sh"));
  EXPECT_FALSE(runner_.is_command_available("ap-onboard-no-such-program"));
  EXPECT_FALSE(runner_.is_command_available(""));
}

TEST(ProcessRunnerStaticTest, EscapeShellArg) {
  EXPECT_EQ(ProcessRunner::escape_shell_arg("http://c:8080/inform"), "'http://c:8080/inform'");
  EXPECT_EQ(ProcessRunner::escape_shell_arg("it's"), "'it'\\''s'");
  EXPECT_EQ(ProcessRunner::escape_shell_arg(""), "''");
}
