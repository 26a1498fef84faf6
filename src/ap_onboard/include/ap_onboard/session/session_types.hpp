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

#include <optional>
#include <string>
#include <tl/expected.hpp>

namespace ap_onboard {

/// Failure classes shared by every session strategy
enum class FailureKind {
  ConnectionRefused,     // nothing listening on the administrative port
  ConnectionTimeout,     // connect deadline exceeded
  AuthenticationFailed,  // credentials rejected
  CommandFailed,         // session worked but the device rejected the command
  Other                  // tool missing, protocol error, anything unclassified
};

/// Typed failure of one adoption attempt
struct SessionError {
  FailureKind kind;
  std::string message;
};

/// Captured command output on success
using SessionOutcome = tl::expected<std::string, SessionError>;

/**
 * @brief Device to adopt and where to point it
 */
struct SessionTarget {
  std::string host;
  std::string inform_url;
  /// Overrides the factory-default password when set
  std::optional<std::string> password;
};

std::string to_string(FailureKind kind);

/// Render an error for the operator, e.g. "Connection refused: Connection refused at 10.0.0.2"
std::string to_user_message(const SessionError & error);

/// Build a SessionOutcome failure
inline tl::unexpected<SessionError> session_failure(FailureKind kind, std::string message) {
  return tl::make_unexpected(SessionError{kind, std::move(message)});
}

}  // namespace ap_onboard
