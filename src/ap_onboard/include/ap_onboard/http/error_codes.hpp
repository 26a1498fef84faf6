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

#include <string>

namespace ap_onboard {

/**
 * @brief Error codes used in REST error responses
 *
 * Every error body has the shape {"error_code", "message", "parameters"?}. Device-specific
 * failures use error_code "vendor-error" with one of the x-onboard-* codes below in
 * "vendor_code".
 */

/// Invalid request format or missing required parameters
constexpr const char * ERR_INVALID_REQUEST = "invalid-request";

/// Invalid parameter value or type
constexpr const char * ERR_INVALID_PARAMETER = "invalid-parameter";

/// Resource (setup code) not found
constexpr const char * ERR_RESOURCE_NOT_FOUND = "resource-not-found";

/// Service temporarily unavailable
constexpr const char * ERR_SERVICE_UNAVAILABLE = "service-unavailable";

/// Internal server error
constexpr const char * ERR_INTERNAL_ERROR = "internal-error";

/// Generic vendor-specific error (used with vendor_code field)
constexpr const char * ERR_VENDOR_ERROR = "vendor-error";

/// Discovery socket could not be set up
constexpr const char * ERR_X_ONBOARD_SCAN_FAILED = "x-onboard-scan-failed";

/// Device rejected the administrative credentials
constexpr const char * ERR_X_ONBOARD_AUTH_FAILED = "x-onboard-auth-failed";

/// Nothing listening on the device's administrative port
constexpr const char * ERR_X_ONBOARD_CONNECTION_REFUSED = "x-onboard-connection-refused";

/// Device did not answer within the connect deadline
constexpr const char * ERR_X_ONBOARD_CONNECTION_TIMEOUT = "x-onboard-connection-timeout";

/// Session worked but set-inform reported an error
constexpr const char * ERR_X_ONBOARD_COMMAND_FAILED = "x-onboard-command-failed";

/// Every session strategy failed
constexpr const char * ERR_X_ONBOARD_ADOPTION_FAILED = "x-onboard-adoption-failed";

/// Setup code exists but is no longer valid
constexpr const char * ERR_X_ONBOARD_SETUP_CODE_EXPIRED = "x-onboard-setup-code-expired";

/// Setup-code service unreachable or answered unexpectedly
constexpr const char * ERR_X_ONBOARD_SETUP_SERVICE_UNAVAILABLE = "x-onboard-setup-service-unavailable";

/**
 * @brief Check if an error code is a vendor-specific code
 * @param error_code Error code to check
 * @return true if code starts with "x-onboard-"
 */
inline bool is_vendor_error_code(const std::string & error_code) {
  return error_code.rfind("x-onboard-", 0) == 0;
}

}  // namespace ap_onboard
