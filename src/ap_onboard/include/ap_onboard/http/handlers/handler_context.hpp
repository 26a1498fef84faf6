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

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <rclcpp/rclcpp.hpp>
#include <string>
#include <tl/expected.hpp>

#include "ap_onboard/config.hpp"
#include "ap_onboard/http/error_codes.hpp"
#include "ap_onboard/http/http_utils.hpp"

namespace ap_onboard {

class OnboardNode;

namespace handlers {

/**
 * @brief Shared context for all HTTP handlers
 *
 * Gives handlers the onboarding node and the CORS policy, and holds the response helpers
 * that keep every endpoint on the same JSON error format.
 */
class HandlerContext {
 public:
  HandlerContext(OnboardNode * node, const CorsConfig & cors_config) : node_(node), cors_config_(cors_config) {
  }

  /// Onboarding node; null only in handler unit tests
  OnboardNode * node() const {
    return node_;
  }

  const CorsConfig & cors_config() const {
    return cors_config_;
  }

  /**
   * @brief Apply the CORS policy before routing
   *
   * Adds the allow headers when the request's Origin is allowed. Preflight requests are
   * answered here: 204 with Access-Control-Max-Age for an allowed origin, 403 otherwise.
   * @return Handled for preflight requests, Unhandled for everything that still needs a route
   */
  httplib::Server::HandlerResponse apply_cors(const httplib::Request & req, httplib::Response & res) const;

  /// Set CORS headers for an origin already known to be allowed
  void set_cors_headers(httplib::Response & res, const std::string & origin) const;

  bool is_origin_allowed(const std::string & origin) const;

  /**
   * @brief Error body shared by all endpoints
   *
   * {"error_code", "message", ["vendor_code"], ["parameters"]}. Vendor codes (x-onboard-*)
   * are reported as error_code "vendor-error" with the specific code in "vendor_code".
   */
  static nlohmann::json error_body(const std::string & error_code, const std::string & message,
                                   const nlohmann::json & parameters = {});

  static void send_error(httplib::Response & res, httplib::StatusCode status, const std::string & error_code,
                         const std::string & message, const nlohmann::json & parameters = {});

  static void send_json(httplib::Response & res, const nlohmann::json & data);

  /// Parse a JSON request body; the error is a message suitable for a 400 response
  static tl::expected<nlohmann::json, std::string> parse_json_body(const httplib::Request & req);

  static rclcpp::Logger logger() {
    return rclcpp::get_logger("rest_server");
  }

 private:
  OnboardNode * node_;
  CorsConfig cors_config_;
};

}  // namespace handlers
}  // namespace ap_onboard
