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
#include "ap_onboard/http/handlers/handler_context.hpp"

using json = nlohmann::json;
using httplib::StatusCode;

namespace ap_onboard {
namespace handlers {

httplib::Server::HandlerResponse HandlerContext::apply_cors(const httplib::Request & req,
                                                            httplib::Response & res) const {
  if (!cors_config_.enabled) {
    return httplib::Server::HandlerResponse::Unhandled;
  }

  const std::string origin = req.get_header_value("Origin");
  const bool allowed = !origin.empty() && is_origin_allowed(origin);
  if (allowed) {
    set_cors_headers(res, origin);
  }

  if (req.method != "OPTIONS") {
    return httplib::Server::HandlerResponse::Unhandled;
  }

  if (allowed) {
    res.set_header("Access-Control-Max-Age", std::to_string(cors_config_.max_age_seconds));
    res.status = StatusCode::NoContent_204;
  } else {
    RCLCPP_DEBUG(logger(), "Rejected preflight for %s from origin '%s'", req.path.c_str(), origin.c_str());
    res.status = StatusCode::Forbidden_403;
  }
  return httplib::Server::HandlerResponse::Handled;
}

void HandlerContext::set_cors_headers(httplib::Response & res, const std::string & origin) const {
  res.set_header("Access-Control-Allow-Origin", origin);
  if (!cors_config_.methods_header.empty()) {
    res.set_header("Access-Control-Allow-Methods", cors_config_.methods_header);
  }
  if (!cors_config_.headers_header.empty()) {
    res.set_header("Access-Control-Allow-Headers", cors_config_.headers_header);
  }
  if (cors_config_.allow_credentials) {
    res.set_header("Access-Control-Allow-Credentials", "true");
  }
}

bool HandlerContext::is_origin_allowed(const std::string & origin) const {
  // "*" echoes the caller's origin back; credentials with "*" never get past CorsConfigBuilder
  for (const auto & allowed : cors_config_.allowed_origins) {
    if (allowed == "*" || allowed == origin) {
      return true;
    }
  }
  return false;
}

json HandlerContext::error_body(const std::string & error_code, const std::string & message, const json & parameters) {
  json body = {{"error_code", error_code}, {"message", message}};
  if (is_vendor_error_code(error_code)) {
    body["error_code"] = ERR_VENDOR_ERROR;
    body["vendor_code"] = error_code;
  }
  if (!parameters.empty()) {
    body["parameters"] = parameters;
  }
  return body;
}

void HandlerContext::send_error(httplib::Response & res, httplib::StatusCode status, const std::string & error_code,
                                const std::string & message, const json & parameters) {
  res.status = status;
  res.set_content(error_body(error_code, message, parameters).dump(2), "application/json");
}

void HandlerContext::send_json(httplib::Response & res, const json & data) {
  res.set_content(data.dump(2), "application/json");
}

tl::expected<json, std::string> HandlerContext::parse_json_body(const httplib::Request & req) {
  if (req.body.empty()) {
    return tl::make_unexpected(std::string("Request body is empty"));
  }
  try {
    return json::parse(req.body);
  } catch (const json::parse_error & e) {
    return tl::make_unexpected(std::string("Invalid JSON in request body: ") + e.what());
  }
}

}  // namespace handlers
}  // namespace ap_onboard
