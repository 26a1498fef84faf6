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

#include "ap_onboard/session/password_helper_session_strategy.hpp"

#include <rclcpp/rclcpp.hpp>
#include <utility>

#include "ap_onboard/session/output_classifier.hpp"

namespace ap_onboard {

namespace {

rclcpp::Logger logger() {
  return rclcpp::get_logger("sshpass_session");
}

}  // namespace

PasswordHelperSessionStrategy::PasswordHelperSessionStrategy(SessionConfig config,
                                                             std::shared_ptr<ProcessRunner> runner)
  : config_(std::move(config)), runner_(std::move(runner)) {
  if (!runner_) {
    runner_ = std::make_shared<ProcessRunner>();
  }
}

std::vector<std::string> PasswordHelperSessionStrategy::build_command(const SessionTarget & target) const {
  std::vector<std::string> argv = {HELPER_BINARY, "-e"};
  auto ssh_args = ssh_client_arguments(target, config_);
  argv.insert(argv.end(), ssh_args.begin(), ssh_args.end());
  argv.push_back(build_inform_command(target.inform_url));
  return argv;
}

SessionOutcome PasswordHelperSessionStrategy::open_and_run(const SessionTarget & target) {
  RCLCPP_INFO(logger(), "Connecting to %s via system SSH (sshpass)...", target.host.c_str());

  if (!runner_->is_command_available(HELPER_BINARY)) {
    return session_failure(FailureKind::Other, "sshpass is not installed");
  }
  if (!runner_->is_command_available("ssh")) {
    return session_failure(FailureKind::Other, "ssh client is not installed");
  }

  auto run = runner_->run(build_command(target), process_deadline(config_),
                          {{"SSHPASS", effective_password(target, config_)}});
  if (!run) {
    return session_failure(FailureKind::Other, "Failed to run sshpass: " + run.error());
  }

  const auto & result = *run;
  if (result.timed_out) {
    return session_failure(FailureKind::ConnectionTimeout, "Timed out connecting to " + target.host);
  }

  RCLCPP_DEBUG(logger(), "SSH stdout: %s", trim_copy(result.stdout_output).c_str());
  RCLCPP_DEBUG(logger(), "SSH stderr: %s", trim_copy(result.stderr_output).c_str());

  if (result.exit_code != 0) {
    // sshpass exit code 5 means the password was rejected
    if (result.exit_code == 5) {
      return session_failure(FailureKind::AuthenticationFailed, auth_failed_message(target.host));
    }
    auto error = classify_process_failure(result.combined(), target.host);
    return tl::make_unexpected(error);
  }

  return classify_command_output(result.stdout_output);
}

}  // namespace ap_onboard
