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

#pragma once

#include <memory>
#include <vector>

#include "ap_onboard/config.hpp"
#include "ap_onboard/session/process_runner.hpp"
#include "ap_onboard/session/session_strategy.hpp"

namespace ap_onboard {

/// Which optional client tools are installed right now
struct ToolAvailability {
  bool password_helper{false};  // sshpass
  bool automation{false};       // expect
};

/**
 * @brief Builds the ordered strategy list for one adoption
 *
 * Order: sshpass-driven ssh when sshpass is installed, otherwise the expect-driven ssh;
 * the libssh strategy is always last. Tool availability is probed on every call.
 */
class StrategyChainFactory {
 public:
  explicit StrategyChainFactory(SessionConfig config, std::shared_ptr<ProcessRunner> runner = nullptr);

  /// Probe installed tools (not cached)
  ToolAvailability probe_tools() const;

  /// Build a chain from a fresh probe
  std::vector<std::unique_ptr<SessionStrategy>> build() const;

  /// Build a chain for a given tool set
  std::vector<std::unique_ptr<SessionStrategy>> build(const ToolAvailability & tools) const;

 private:
  SessionConfig config_;
  std::shared_ptr<ProcessRunner> runner_;
};

}  // namespace ap_onboard
