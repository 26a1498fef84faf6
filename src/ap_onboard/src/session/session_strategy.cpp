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

#include "ap_onboard/session/session_strategy.hpp"

#include "ap_onboard/session/algorithm_preferences.hpp"
#include "ap_onboard/session/process_runner.hpp"

namespace ap_onboard {

namespace {

// Time allowed for set-inform to run once the session is up
constexpr std::chrono::seconds COMMAND_ALLOWANCE{5};

}  // namespace

std::string build_inform_command(const std::string & inform_url) {
  return "set-inform " + ProcessRunner::escape_shell_arg(inform_url);
}

const std::string & effective_password(const SessionTarget & target, const SessionConfig & config) {
  if (target.password && !target.password->empty()) {
    return *target.password;
  }
  return config.default_password;
}

std::vector<std::string> ssh_client_arguments(const SessionTarget & target, const SessionConfig & config) {
  return {
      "ssh",
      "-o",
      "StrictHostKeyChecking=no",
      "-o",
      "UserKnownHostsFile=/dev/null",
      "-o",
      "ConnectTimeout=" + std::to_string(config.connect_timeout.count()),
      "-o",
      std::string("HostKeyAlgorithms=") + LEGACY_HOST_KEY_ALGORITHM,
      "-o",
      std::string("PubkeyAcceptedAlgorithms=+") + LEGACY_HOST_KEY_ALGORITHM,
      "-o",
      "KexAlgorithms=+" + join_algorithms(LEGACY_KEX_ALGORITHMS),
      "-o",
      "PubkeyAuthentication=no",
      "-p",
      std::to_string(config.port),
      config.username + "@" + target.host,
  };
}

std::chrono::milliseconds process_deadline(const SessionConfig & config) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(config.connect_timeout + COMMAND_ALLOWANCE);
}

}  // namespace ap_onboard
