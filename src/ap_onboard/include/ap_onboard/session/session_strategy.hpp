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

#include <chrono>
#include <string>
#include <vector>

#include "ap_onboard/config.hpp"
#include "ap_onboard/session/session_types.hpp"

namespace ap_onboard {

/**
 * @brief One way of opening an administrative session and running set-inform
 *
 * Implementations:
 * - PasswordHelperSessionStrategy: system ssh driven by sshpass
 * - ScriptedSessionStrategy: system ssh driven by a temporary expect script
 * - NativeSessionStrategy: libssh with an explicit algorithm preference list
 *
 * Every implementation enforces its own connect deadline and reports failures with the
 * shared FailureKind taxonomy so AdoptionOrchestrator can decide whether to fall back.
 */
class SessionStrategy {
 public:
  virtual ~SessionStrategy() = default;

  /// Connect, authenticate, run the adoption command and return its output
  virtual SessionOutcome open_and_run(const SessionTarget & target) = 0;

  /// Get strategy name for logging
  virtual std::string get_name() const = 0;

  /// True if the strategy speaks SSH in-process instead of driving an external client
  virtual bool is_native_protocol() const {
    return false;
  }
};

/// Remote command that points the device at the controller
std::string build_inform_command(const std::string & inform_url);

/// Password for an attempt: the target's override, else the configured factory default
const std::string & effective_password(const SessionTarget & target, const SessionConfig & config);

/**
 * @brief Options passed to the system ssh client by the external-process strategies
 *
 * Host identity checks and public-key authentication are disabled, the host-key algorithm is
 * restricted to ssh-rsa, legacy key exchanges are allowed and connect time is bounded.
 * Ends with "<user>@<host>"; the remote command is appended by the caller.
 */
std::vector<std::string> ssh_client_arguments(const SessionTarget & target, const SessionConfig & config);

/// Deadline for a whole external ssh run: connect timeout plus command allowance
std::chrono::milliseconds process_deadline(const SessionConfig & config);

}  // namespace ap_onboard
