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
#include <string>
#include <vector>

#include "ap_onboard/session/session_strategy.hpp"

namespace ap_onboard {

/**
 * @brief Runs session strategies in preference order until one settles the adoption
 *
 * Strategies run one at a time against the same target. Success ends the chain.
 * AuthenticationFailed and CommandFailed also end it: the device would give the same answer
 * to any strategy, and repeated logins risk lockout. Other failures fall through to the next
 * strategy. When the chain is exhausted the error is reported as Other, carrying the text of the
 * native-protocol attempt if one failed, else that of the first failed strategy. External-tool
 * failures often only say that the tool is missing; libssh reports the network cause.
 */
class AdoptionOrchestrator {
 public:
  explicit AdoptionOrchestrator(std::vector<std::unique_ptr<SessionStrategy>> strategies);

  AdoptionOrchestrator(const AdoptionOrchestrator &) = delete;
  AdoptionOrchestrator & operator=(const AdoptionOrchestrator &) = delete;

  SessionOutcome adopt(const SessionTarget & target);

  /// Strategy names in the order they will be tried
  std::vector<std::string> strategy_names() const;

  /// True if this failure ends the chain instead of falling back
  static bool is_terminal(FailureKind kind);

 private:
  std::vector<std::unique_ptr<SessionStrategy>> strategies_;
};

}  // namespace ap_onboard
