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

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "ap_onboard/session/password_helper_session_strategy.hpp"
#include "fake_process_runner.hpp"

using namespace ap_onboard;
using ap_onboard::test_support::exited;
using ap_onboard::test_support::FakeProcessRunner;

class PasswordHelperSessionStrategyTest : public ::testing::Test {
 protected:
  void SetUp() override {
    runner_ = std::make_shared<FakeProcessRunner>();
    runner_->installed = {"sshpass", "ssh"};
    strategy_ = std::make_unique<PasswordHelperSessionStrategy>(SessionConfig{}, runner_);
  }

  std::shared_ptr<FakeProcessRunner> runner_;
  std::unique_ptr<PasswordHelperSessionStrategy> strategy_;
  SessionTarget target_{"192.168.1.20", "http://192.168.1.10:8080/inform", std::nullopt};
};

TEST_F(PasswordHelperSessionStrategyTest, CommandLineCarriesNoPassword) {
  target_.password = "hunter2";
  auto argv = strategy_->build_command(target_);

  ASSERT_GE(argv.size(), 3u);
  EXPECT_EQ(argv[0], "sshpass");
  EXPECT_EQ(argv[1], "-e");
  EXPECT_EQ(argv[2], "ssh");
  EXPECT_EQ(std::find(argv.begin(), argv.end(), "hunter2"), argv.end());
  EXPECT_EQ(argv.back(), "set-inform 'http://192.168.1.10:8080/inform'");
  EXPECT_EQ(argv[argv.size() - 2], "ubnt@192.168.1.20");
}

TEST_F(PasswordHelperSessionStrategyTest, CommandLineDisablesHostChecksAndAllowsLegacyAlgorithms) {
  auto argv = strategy_->build_command(target_);
  auto has = [&argv](const std::string & value) {
    return std::find(argv.begin(), argv.end(), value) != argv.end();
  };

  EXPECT_TRUE(has("StrictHostKeyChecking=no"));
  EXPECT_TRUE(has("UserKnownHostsFile=/dev/null"));
  EXPECT_TRUE(has("ConnectTimeout=10"));
  EXPECT_TRUE(has("HostKeyAlgorithms=ssh-rsa"));
  EXPECT_TRUE(has("PubkeyAcceptedAlgorithms=+ssh-rsa"));
  EXPECT_TRUE(has("KexAlgorithms=+diffie-hellman-group14-sha1,diffie-hellman-group1-sha1"));
  EXPECT_TRUE(has("PubkeyAuthentication=no"));
  EXPECT_TRUE(has("22"));
}

TEST_F(PasswordHelperSessionStrategyTest, PasswordTravelsInEnvironment) {
  runner_->result = exited(0, "Adoption request sent\n");

  auto outcome = strategy_->open_and_run(target_);

  ASSERT_TRUE(outcome.has_value());
  ASSERT_EQ(runner_->invocations.size(), 1u);
  const auto & env = runner_->invocations[0].env;
  ASSERT_EQ(env.size(), 1u);
  EXPECT_EQ(env[0].first, "SSHPASS");
  EXPECT_EQ(env[0].second, "ubnt");
  EXPECT_EQ(runner_->invocations[0].timeout, std::chrono::milliseconds(15000));
}

TEST_F(PasswordHelperSessionStrategyTest, OverridePasswordIsUsed) {
  target_.password = "hunter2";
  runner_->result = exited(0, "ok");

  ASSERT_TRUE(strategy_->open_and_run(target_).has_value());
  EXPECT_EQ(runner_->invocations[0].env[0].second, "hunter2");
}

TEST_F(PasswordHelperSessionStrategyTest, EmptyOverrideFallsBackToDefault) {
  target_.password = "";
  runner_->result = exited(0, "ok");

  ASSERT_TRUE(strategy_->open_and_run(target_).has_value());
  EXPECT_EQ(runner_->invocations[0].env[0].second, "ubnt");
}

TEST_F(PasswordHelperSessionStrategyTest, SuccessReturnsTrimmedOutput) {
  runner_->result = exited(0, "  Adoption request sent to 'http://192.168.1.10:8080/inform'\r\n");

  auto outcome = strategy_->open_and_run(target_);

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, "Adoption request sent to 'http://192.168.1.10:8080/inform'");
}

TEST_F(PasswordHelperSessionStrategyTest, ErrorOutputWithZeroExitIsCommandFailure) {
  runner_->result = exited(0, "Error: bad command\n");

  auto outcome = strategy_->open_and_run(target_);

  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().kind, FailureKind::CommandFailed);
}

TEST_F(PasswordHelperSessionStrategyTest, WrongPasswordExitCodeIsAuthenticationFailure) {
  runner_->result = exited(5);

  auto outcome = strategy_->open_and_run(target_);

  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().kind, FailureKind::AuthenticationFailed);
}

TEST_F(PasswordHelperSessionStrategyTest, NonZeroExitIsClassifiedFromOutput) {
  runner_->result = exited(255, "", "ssh: connect to host 192.168.1.20 port 22: Connection refused\n");

  auto outcome = strategy_->open_and_run(target_);

  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().kind, FailureKind::ConnectionRefused);
  EXPECT_EQ(outcome.error().message, "Connection refused at 192.168.1.20");
}

TEST_F(PasswordHelperSessionStrategyTest, DeadlineIsConnectionTimeout) {
  runner_->result = exited(137);
  runner_->result.timed_out = true;

  auto outcome = strategy_->open_and_run(target_);

  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().kind, FailureKind::ConnectionTimeout);
}

TEST_F(PasswordHelperSessionStrategyTest, MissingHelperIsOther) {
  runner_->installed = {"ssh"};

  auto outcome = strategy_->open_and_run(target_);

  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().kind, FailureKind::Other);
  EXPECT_TRUE(runner_->invocations.empty());
}

TEST_F(PasswordHelperSessionStrategyTest, SpawnFailureIsOther) {
  runner_->spawn_error = "Failed to run sshpass: No such file or directory";

  auto outcome = strategy_->open_and_run(target_);

  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().kind, FailureKind::Other);
}
