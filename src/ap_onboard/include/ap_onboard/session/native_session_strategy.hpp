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

#include "ap_onboard/config.hpp"
#include "ap_onboard/session/session_strategy.hpp"

namespace ap_onboard {

/**
 * @brief SSH session implemented in-process with libssh
 *
 * Negotiates with KEX_ALGORITHMS / HOST_KEY_ALGORITHMS instead of the library defaults and
 * never checks the host key: targets are freshly reset devices on the local subnet with no
 * prior trust state.
 */
class NativeSessionStrategy : public SessionStrategy {
 public:
  /// Upper bound for reading set-inform output once the channel is open
  static constexpr std::chrono::seconds COMMAND_TIMEOUT{30};

  explicit NativeSessionStrategy(SessionConfig config);

  SessionOutcome open_and_run(const SessionTarget & target) override;

  std::string get_name() const override {
    return "libssh";
  }

  bool is_native_protocol() const override {
    return true;
  }

 private:
  SessionConfig config_;
};

}  // namespace ap_onboard
