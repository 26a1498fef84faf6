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

#include "ap_onboard/setup_code/setup_code_client.hpp"

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <rclcpp/rclcpp.hpp>
#include <utility>

namespace ap_onboard {

namespace {

rclcpp::Logger logger() {
  return rclcpp::get_logger("setup_code_client");
}

constexpr const char * SETUP_CODE_PATH = "/api/setup-code";

}  // namespace

tl::expected<SetupCodeInfo, SetupCodeError> parse_setup_code_response(int status, const std::string & body) {
  using json = nlohmann::json;

  if (status >= 200 && status < 300) {
    try {
      auto data = json::parse(body);
      SetupCodeInfo info;
      info.inform_url = data.at("informUrl").get<std::string>();
      info.site_id = data.at("siteId").get<std::string>();
      info.site_name = data.at("siteName").get<std::string>();
      return info;
    } catch (const json::exception & e) {
      return tl::make_unexpected(
          SetupCodeError{SetupCodeErrorCode::Other, std::string("Failed to parse response: ") + e.what()});
    }
  }

  if (status == 404) {
    try {
      auto data = json::parse(body);
      std::string message = data.at("error").get<std::string>();
      if (data.value("expired", false)) {
        return tl::make_unexpected(SetupCodeError{SetupCodeErrorCode::ExpiredCode, message});
      }
      return tl::make_unexpected(SetupCodeError{SetupCodeErrorCode::InvalidCode, message});
    } catch (const json::exception & e) {
      return tl::make_unexpected(
          SetupCodeError{SetupCodeErrorCode::Other, std::string("Failed to parse error: ") + e.what()});
    }
  }

  return tl::make_unexpected(SetupCodeError{SetupCodeErrorCode::Other, "Unexpected response: " + std::to_string(status)});
}

SetupCodeClient::SetupCodeClient(std::string base_url, std::chrono::seconds timeout)
  : base_url_(std::move(base_url)), timeout_(timeout) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

tl::expected<SetupCodeInfo, SetupCodeError> SetupCodeClient::validate(const std::string & code) const {
  RCLCPP_INFO(logger(), "Validating setup code: %s", code.c_str());

  httplib::Client client(base_url_);
  client.set_connection_timeout(timeout_);
  client.set_read_timeout(timeout_);
  client.set_write_timeout(timeout_);

  auto res = client.Get(SETUP_CODE_PATH, httplib::Params{{"code", code}}, httplib::Headers{});
  if (!res) {
    RCLCPP_WARN(logger(), "Setup code request failed: %s", httplib::to_string(res.error()).c_str());
    return tl::make_unexpected(SetupCodeError{SetupCodeErrorCode::NetworkError,
                                              "Can't connect to the setup service. Check your internet connection."});
  }

  auto result = parse_setup_code_response(res->status, res->body);
  if (result) {
    RCLCPP_INFO(logger(), "Setup code valid - site: %s, inform URL: %s", result->site_name.c_str(),
                result->inform_url.c_str());
  }
  return result;
}

}  // namespace ap_onboard
