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

#include "ap_onboard/adoption/strategy_chain.hpp"

#include <rclcpp/rclcpp.hpp>
#include <utility>

#include "ap_onboard/session/native_session_strategy.hpp"
#include "ap_onboard/session/password_helper_session_strategy.hpp"
#include "ap_onboard/session/scripted_session_strategy.hpp"

namespace ap_onboard {

StrategyChainFactory::StrategyChainFactory(SessionConfig config, std::shared_ptr<ProcessRunner> runner)
  : config_(std::move(config)), runner_(std::move(runner)) {
  if (!runner_) {
    runner_ = std::make_shared<ProcessRunner>();
  }
}

ToolAvailability StrategyChainFactory::probe_tools() const {
  ToolAvailability tools;
  tools.password_helper = runner_->is_command_available(PasswordHelperSessionStrategy::HELPER_BINARY);
  tools.automation = runner_->is_command_available(ScriptedSessionStrategy::AUTOMATION_BINARY);
  return tools;
}

std::vector<std::unique_ptr<SessionStrategy>> StrategyChainFactory::build() const {
  return build(probe_tools());
}

std::vector<std::unique_ptr<SessionStrategy>> StrategyChainFactory::build(const ToolAvailability & tools) const {
  std::vector<std::unique_ptr<SessionStrategy>> chain;

  if (tools.password_helper) {
    chain.push_back(std::make_unique<PasswordHelperSessionStrategy>(config_, runner_));
  } else {
    if (!tools.automation) {
      RCLCPP_DEBUG(rclcpp::get_logger("strategy_chain"), "Neither sshpass nor expect found");
    }
    chain.push_back(std::make_unique<ScriptedSessionStrategy>(config_, runner_));
  }
  chain.push_back(std::make_unique<NativeSessionStrategy>(config_));

  return chain;
}

}  // namespace ap_onboard
