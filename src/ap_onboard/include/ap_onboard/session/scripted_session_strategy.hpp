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

#include "ap_onboard/config.hpp"
#include "ap_onboard/session/process_runner.hpp"
#include "ap_onboard/session/session_strategy.hpp"

namespace ap_onboard {

/**
 * @brief Drives the system ssh client through a throw-away expect script
 *
 * Used when sshpass is not installed. The script answers the password prompt, treats a
 * repeated prompt as a wrong password and forwards ssh's exit status on end of session.
 * It lives in a TempScriptFile and is removed after the run whatever the outcome.
 */
class ScriptedSessionStrategy : public SessionStrategy {
 public:
  static constexpr const char * AUTOMATION_BINARY = "expect";

  /// Exit codes the generated script uses for its own verdicts
  static constexpr int EXIT_CONNECTION_REFUSED = 3;
  static constexpr int EXIT_TIMEOUT = 4;
  static constexpr int EXIT_AUTH_FAILED = 5;

  explicit ScriptedSessionStrategy(SessionConfig config, std::shared_ptr<ProcessRunner> runner = nullptr);

  SessionOutcome open_and_run(const SessionTarget & target) override;

  std::string get_name() const override {
    return "expect";
  }

  /// Generate the expect script for one attempt
  std::string build_script(const SessionTarget & target) const;

  /// Quote a value as a single Tcl word
  static std::string tcl_quote(const std::string & value);

 private:
  SessionConfig config_;
  std::shared_ptr<ProcessRunner> runner_;
};

}  // namespace ap_onboard
