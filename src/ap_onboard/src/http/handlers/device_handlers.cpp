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

#include "ap_onboard/http/handlers/device_handlers.hpp"

#include <stdexcept>

#include "ap_onboard/discovery/discovery_scanner.hpp"
#include "ap_onboard/onboard_node.hpp"

using json = nlohmann::json;
using httplib::StatusCode;

namespace ap_onboard {
namespace handlers {

AdoptionFailureMapping DeviceHandlers::map_failure(FailureKind kind) {
  switch (kind) {
    case FailureKind::AuthenticationFailed:
      return {StatusCode::Unauthorized_401, ERR_X_ONBOARD_AUTH_FAILED};
    case FailureKind::ConnectionRefused:
      return {StatusCode::BadGateway_502, ERR_X_ONBOARD_CONNECTION_REFUSED};
    case FailureKind::ConnectionTimeout:
      return {StatusCode::GatewayTimeout_504, ERR_X_ONBOARD_CONNECTION_TIMEOUT};
    case FailureKind::CommandFailed:
      return {StatusCode::BadGateway_502, ERR_X_ONBOARD_COMMAND_FAILED};
    case FailureKind::Other:
    default:
      return {StatusCode::BadGateway_502, ERR_X_ONBOARD_ADOPTION_FAILED};
  }
}

tl::expected<SessionTarget, std::string> DeviceHandlers::parse_adopt_request(const json & body) {
  if (!body.is_object()) {
    return tl::make_unexpected("Request body must be a JSON object");
  }

  SessionTarget target;
  if (!body.contains("ip") || !body["ip"].is_string() || body["ip"].get<std::string>().empty()) {
    return tl::make_unexpected("Missing or invalid 'ip'");
  }
  target.host = body["ip"].get<std::string>();

  if (!body.contains("inform_url") || !body["inform_url"].is_string() ||
      body["inform_url"].get<std::string>().empty()) {
    return tl::make_unexpected("Missing or invalid 'inform_url'");
  }
  target.inform_url = body["inform_url"].get<std::string>();

  if (body.contains("password") && !body["password"].is_null()) {
    if (!body["password"].is_string()) {
      return tl::make_unexpected("'password' must be a string");
    }
    auto password = body["password"].get<std::string>();
    if (!password.empty()) {
      target.password = std::move(password);
    }
  }
  return target;
}

tl::expected<std::optional<std::chrono::milliseconds>, std::string>
DeviceHandlers::parse_scan_timeout(const std::string & value) {
  if (value.empty()) {
    return std::optional<std::chrono::milliseconds>{};
  }

  int64_t timeout_ms = 0;
  try {
    size_t consumed = 0;
    timeout_ms = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      return tl::make_unexpected("timeout_ms must be an integer");
    }
  } catch (const std::exception &) {
    return tl::make_unexpected("timeout_ms must be an integer");
  }

  if (timeout_ms < MIN_SCAN_TIMEOUT_MS || timeout_ms > MAX_SCAN_TIMEOUT_MS) {
    return tl::make_unexpected("timeout_ms must be between " + std::to_string(MIN_SCAN_TIMEOUT_MS) + " and " +
                               std::to_string(MAX_SCAN_TIMEOUT_MS));
  }
  return std::optional<std::chrono::milliseconds>{std::chrono::milliseconds(timeout_ms)};
}

void DeviceHandlers::handle_list_devices(const httplib::Request & req, httplib::Response & res) {
  try {
    auto timeout = parse_scan_timeout(query_param(req, "timeout_ms"));
    if (!timeout) {
      HandlerContext::send_error(res, StatusCode::BadRequest_400, ERR_INVALID_PARAMETER, timeout.error(),
                                 {{"parameter", "timeout_ms"}});
      return;
    }

    auto & scanner = ctx_.node()->get_discovery_scanner();
    auto window = timeout->value_or(scanner.config().timeout);

    RCLCPP_INFO(HandlerContext::logger(), "Scanning for devices (%lld ms)", static_cast<long long>(window.count()));
    auto result = scanner.scan_async(window).get();
    if (!result) {
      RCLCPP_WARN(HandlerContext::logger(), "Scan failed (%s): %s", discovery::to_string(result.error().code).c_str(),
                  result.error().message.c_str());
      HandlerContext::send_error(res, StatusCode::ServiceUnavailable_503, ERR_X_ONBOARD_SCAN_FAILED,
                                 result.error().message, {{"reason", discovery::to_string(result.error().code)}});
      return;
    }

    json devices = json::array();
    for (const auto & device : *result) {
      devices.push_back(discovery::to_json(device));
    }

    HandlerContext::send_json(res, {{"devices", devices}, {"count", devices.size()}});
  } catch (const std::exception & e) {
    HandlerContext::send_error(res, StatusCode::InternalServerError_500, ERR_INTERNAL_ERROR, "Failed to scan devices",
                               {{"details", e.what()}});
    RCLCPP_ERROR(HandlerContext::logger(), "Error in handle_list_devices: %s", e.what());
  }
}

void DeviceHandlers::handle_adopt_device(const httplib::Request & req, httplib::Response & res) {
  try {
    auto body = HandlerContext::parse_json_body(req);
    if (!body) {
      HandlerContext::send_error(res, StatusCode::BadRequest_400, ERR_INVALID_REQUEST, body.error());
      return;
    }

    auto target = parse_adopt_request(*body);
    if (!target) {
      HandlerContext::send_error(res, StatusCode::BadRequest_400, ERR_INVALID_REQUEST, target.error());
      return;
    }

    auto outcome = ctx_.node()->adopt(*target);
    if (!outcome) {
      auto mapping = map_failure(outcome.error().kind);
      HandlerContext::send_error(res, mapping.status, mapping.vendor_code, to_user_message(outcome.error()),
                                 {{"ip", target->host}, {"reason", to_string(outcome.error().kind)}});
      return;
    }

    HandlerContext::send_json(res, {{"success", true}, {"ip", target->host}, {"output", *outcome}});
  } catch (const std::exception & e) {
    HandlerContext::send_error(res, StatusCode::InternalServerError_500, ERR_INTERNAL_ERROR, "Failed to adopt device",
                               {{"details", e.what()}});
    RCLCPP_ERROR(HandlerContext::logger(), "Error in handle_adopt_device: %s", e.what());
  }
}

}  // namespace handlers
}  // namespace ap_onboard
