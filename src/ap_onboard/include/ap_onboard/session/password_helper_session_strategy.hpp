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

#include "ap_onboard/config.hpp"
#include "ap_onboard/session/process_runner.hpp"
#include "ap_onboard/session/session_strategy.hpp"

namespace ap_onboard {

/**
 * @brief Runs the system ssh client with the password supplied by sshpass
 *
 * The password reaches sshpass through the SSHPASS environment variable, never argv.
 */
class PasswordHelperSessionStrategy : public SessionStrategy {
 public:
  static constexpr const char * HELPER_BINARY = "sshpass";

  explicit PasswordHelperSessionStrategy(SessionConfig config, std::shared_ptr<ProcessRunner> runner = nullptr);

  SessionOutcome open_and_run(const SessionTarget & target) override;

  std::string get_name() const override {
    return "sshpass";
  }

  /// Full argv for one attempt
  std::vector<std::string> build_command(const SessionTarget & target) const;

 private:
  SessionConfig config_;
  std::shared_ptr<ProcessRunner> runner_;
};

}  // namespace ap_onboard
