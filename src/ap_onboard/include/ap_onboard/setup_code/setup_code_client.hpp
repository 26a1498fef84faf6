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
#include <tl/expected.hpp>

namespace ap_onboard {

/// Site information returned for a valid setup code
struct SetupCodeInfo {
  std::string inform_url;
  std::string site_id;
  std::string site_name;
};

enum class SetupCodeErrorCode {
  InvalidCode,   // 404 without the expired flag
  ExpiredCode,   // 404 with "expired": true
  NetworkError,  // service unreachable or timed out
  Other          // unexpected status or malformed body
};

struct SetupCodeError {
  SetupCodeErrorCode code;
  std::string message;
};

/**
 * @brief Parse a setup-code lookup response
 * @param status HTTP status code
 * @param body Response body (JSON)
 */
tl::expected<SetupCodeInfo, SetupCodeError> parse_setup_code_response(int status, const std::string & body);

/**
 * @brief Client for GET <base>/api/setup-code?code=<code>
 *
 * Exchanges an operator-entered setup code for the controller inform URL. Stateless; one
 * request per call.
 */
class SetupCodeClient {
 public:
  /// @param base_url Scheme, host and optional port, e.g. "https://wizard.example.com"
  explicit SetupCodeClient(std::string base_url, std::chrono::seconds timeout = std::chrono::seconds(10));

  tl::expected<SetupCodeInfo, SetupCodeError> validate(const std::string & code) const;

  const std::string & base_url() const {
    return base_url_;
  }

 private:
  std::string base_url_;
  std::chrono::seconds timeout_;
};

}  // namespace ap_onboard
