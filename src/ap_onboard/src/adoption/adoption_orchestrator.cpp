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

#include "ap_onboard/adoption/adoption_orchestrator.hpp"

#include <optional>
#include <rclcpp/rclcpp.hpp>
#include <utility>

namespace ap_onboard {

namespace {

rclcpp::Logger logger() {
  return rclcpp::get_logger("adoption_orchestrator");
}

}  // namespace

AdoptionOrchestrator::AdoptionOrchestrator(std::vector<std::unique_ptr<SessionStrategy>> strategies)
  : strategies_(std::move(strategies)) {
}

bool AdoptionOrchestrator::is_terminal(FailureKind kind) {
  return kind == FailureKind::AuthenticationFailed || kind == FailureKind::CommandFailed;
}

SessionOutcome AdoptionOrchestrator::adopt(const SessionTarget & target) {
  if (strategies_.empty()) {
    return session_failure(FailureKind::Other, "No session strategy available");
  }

  std::optional<SessionError> first_failure;
  std::optional<SessionError> native_failure;

  for (size_t i = 0; i < strategies_.size(); ++i) {
    auto & strategy = strategies_[i];
    RCLCPP_INFO(logger(), "Adopting %s with strategy %zu/%zu (%s)", target.host.c_str(), i + 1, strategies_.size(),
                strategy->get_name().c_str());

    auto outcome = strategy->open_and_run(target);
    if (outcome) {
      RCLCPP_INFO(logger(), "Adoption of %s succeeded via %s", target.host.c_str(), strategy->get_name().c_str());
      return outcome;
    }

    const auto & error = outcome.error();
    if (is_terminal(error.kind)) {
      RCLCPP_WARN(logger(), "%s: %s (not retrying)", strategy->get_name().c_str(), to_user_message(error).c_str());
      return outcome;
    }

    RCLCPP_WARN(logger(), "%s failed, trying next strategy: %s", strategy->get_name().c_str(),
                to_user_message(error).c_str());
    if (!first_failure) {
      first_failure = error;
    }
    if (strategy->is_native_protocol() && !native_failure) {
      native_failure = error;
    }
  }

  const auto & reported = native_failure ? *native_failure : *first_failure;
  return session_failure(FailureKind::Other, reported.message);
}

std::vector<std::string> AdoptionOrchestrator::strategy_names() const {
  std::vector<std::string> names;
  names.reserve(strategies_.size());
  for (const auto & strategy : strategies_) {
    names.push_back(strategy->get_name());
  }
  return names;
}

}  // namespace ap_onboard
