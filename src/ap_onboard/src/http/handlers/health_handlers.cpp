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

#include "ap_onboard/http/handlers/health_handlers.hpp"

#include <chrono>

#include "ap_onboard/onboard_node.hpp"

using json = nlohmann::json;
using httplib::StatusCode;

namespace ap_onboard {
namespace handlers {

void HealthHandlers::handle_health(const httplib::Request & req, httplib::Response & res) {
  (void)req;  // Unused parameter

  try {
    json response = {{"status", "healthy"}, {"timestamp", std::chrono::system_clock::now().time_since_epoch().count()}};

    HandlerContext::send_json(res, response);
  } catch (const std::exception & e) {
    HandlerContext::send_error(res, StatusCode::InternalServerError_500, ERR_INTERNAL_ERROR, "Internal server error");
    RCLCPP_ERROR(HandlerContext::logger(), "Error in handle_health: %s", e.what());
  }
}

void HealthHandlers::handle_root(const httplib::Request & req, httplib::Response & res) {
  (void)req;  // Unused parameter

  try {
    json endpoints = json::array();
    for (const auto & endpoint : PUBLIC_ENDPOINTS) {
      endpoints.push_back(std::string(endpoint.method) + " " + api_path(endpoint.path));
    }

    json response = {
        {"name", "Access Point Onboarding Service"},
        {"version", "0.1.0"},
        {"api_base", API_BASE_PATH},
        {"endpoints", endpoints},
    };

    if (auto * node = ctx_.node()) {
      response["discovery"] = {{"port", node->get_discovery_config().port},
                               {"default_timeout_ms", node->get_discovery_config().timeout.count()}};
    }

    HandlerContext::send_json(res, response);
  } catch (const std::exception & e) {
    HandlerContext::send_error(res, StatusCode::InternalServerError_500, ERR_INTERNAL_ERROR, "Internal server error");
    RCLCPP_ERROR(HandlerContext::logger(), "Error in handle_root: %s", e.what());
  }
}

}  // namespace handlers
}  // namespace ap_onboard
