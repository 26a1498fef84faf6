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

#include "ap_onboard/session/session_types.hpp"

namespace ap_onboard {

std::string to_string(FailureKind kind) {
  switch (kind) {
    case FailureKind::ConnectionRefused:
      return "connection-refused";
    case FailureKind::ConnectionTimeout:
      return "connection-timeout";
    case FailureKind::AuthenticationFailed:
      return "authentication-failed";
    case FailureKind::CommandFailed:
      return "command-failed";
    case FailureKind::Other:
      return "other";
  }
  return "other";
}

std::string to_user_message(const SessionError & error) {
  switch (error.kind) {
    case FailureKind::ConnectionRefused:
      return "Connection refused: " + error.message;
    case FailureKind::ConnectionTimeout:
      return "Connection timeout: " + error.message;
    case FailureKind::AuthenticationFailed:
      return "Authentication failed: " + error.message;
    case FailureKind::CommandFailed:
      return "Command failed: " + error.message;
    case FailureKind::Other:
      break;
  }
  return "SSH error: " + error.message;
}

}  // namespace ap_onboard
