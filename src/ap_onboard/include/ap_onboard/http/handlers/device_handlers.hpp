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

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <tl/expected.hpp>

#include "ap_onboard/http/handlers/handler_context.hpp"
#include "ap_onboard/session/session_types.hpp"

namespace ap_onboard {
namespace handlers {

/// Accepted range for the timeout_ms query parameter
constexpr int64_t MIN_SCAN_TIMEOUT_MS = 100;
constexpr int64_t MAX_SCAN_TIMEOUT_MS = 60000;

/**
 * @brief HTTP status and vendor code reported for an adoption failure
 */
struct AdoptionFailureMapping {
  httplib::StatusCode status;
  const char * vendor_code;
};

/**
 * @brief Handlers for device discovery and adoption
 *
 * Handles:
 * - GET /devices[?timeout_ms=N] - run a discovery scan
 * - POST /devices/adopt - point a device at a controller inform URL
 */
class DeviceHandlers {
 public:
  explicit DeviceHandlers(HandlerContext & ctx) : ctx_(ctx) {
  }

  /// GET /devices - broadcast a probe and list the devices that answered
  void handle_list_devices(const httplib::Request & req, httplib::Response & res);

  /// POST /devices/adopt - run set-inform on a device
  void handle_adopt_device(const httplib::Request & req, httplib::Response & res);

  static AdoptionFailureMapping map_failure(FailureKind kind);

  /**
   * @brief Build a session target from an adopt request body
   *
   * Requires non-empty string "ip" and "inform_url"; "password" is optional and may be null.
   * An empty password is treated as absent.
   * @return Target or a description of the first invalid field
   */
  static tl::expected<SessionTarget, std::string> parse_adopt_request(const nlohmann::json & body);

  /**
   * @brief Parse the optional timeout_ms query value
   * @return std::nullopt when absent, the timeout, or an error message
   */
  static tl::expected<std::optional<std::chrono::milliseconds>, std::string>
  parse_scan_timeout(const std::string & value);

 private:
  HandlerContext & ctx_;
};

}  // namespace handlers
}  // namespace ap_onboard
