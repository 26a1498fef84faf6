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

#include "ap_onboard/config.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace ap_onboard {

CorsConfigBuilder & CorsConfigBuilder::with_origins(std::vector<std::string> origins) {
  config_.allowed_origins = std::move(origins);
  return *this;
}

CorsConfigBuilder & CorsConfigBuilder::with_methods(std::vector<std::string> methods) {
  config_.allowed_methods = std::move(methods);
  return *this;
}

CorsConfigBuilder & CorsConfigBuilder::with_headers(std::vector<std::string> headers) {
  config_.allowed_headers = std::move(headers);
  return *this;
}

CorsConfigBuilder & CorsConfigBuilder::with_credentials(bool credentials) {
  config_.allow_credentials = credentials;
  return *this;
}

CorsConfigBuilder & CorsConfigBuilder::with_max_age(int seconds) {
  config_.max_age_seconds = seconds;
  return *this;
}

CorsConfig CorsConfigBuilder::build() {
  // Enable CORS only if origins are configured
  config_.enabled = !config_.allowed_origins.empty();

  if (config_.enabled) {
    if (config_.allow_credentials) {
      auto has_wildcard = std::find(config_.allowed_origins.begin(), config_.allowed_origins.end(), "*");
      if (has_wildcard != config_.allowed_origins.end()) {
        throw std::invalid_argument("CORS: allow_credentials cannot be true when allowed_origins contains '*'");
      }
    }

    for (const auto & method : config_.allowed_methods) {
      if (!config_.methods_header.empty()) {
        config_.methods_header += ", ";
      }
      config_.methods_header += method;
    }

    for (const auto & header : config_.allowed_headers) {
      if (!config_.headers_header.empty()) {
        config_.headers_header += ", ";
      }
      config_.headers_header += header;
    }
  }

  return std::move(config_);
}

SessionConfigBuilder & SessionConfigBuilder::with_username(std::string username) {
  config_.username = std::move(username);
  return *this;
}

SessionConfigBuilder & SessionConfigBuilder::with_default_password(std::string password) {
  config_.default_password = std::move(password);
  return *this;
}

SessionConfigBuilder & SessionConfigBuilder::with_port(int port) {
  port_ = port;
  return *this;
}

SessionConfigBuilder & SessionConfigBuilder::with_connect_timeout(int seconds) {
  connect_timeout_s_ = seconds;
  return *this;
}

SessionConfig SessionConfigBuilder::build() {
  if (config_.username.empty()) {
    throw std::invalid_argument("Session: username must not be empty");
  }
  if (port_ < 1 || port_ > 65535) {
    throw std::invalid_argument("Session: port must be between 1 and 65535, got " + std::to_string(port_));
  }
  if (connect_timeout_s_ < 1 || connect_timeout_s_ > 120) {
    throw std::invalid_argument("Session: connect timeout must be between 1 and 120 seconds, got " +
                                std::to_string(connect_timeout_s_));
  }

  config_.port = static_cast<uint16_t>(port_);
  config_.connect_timeout = std::chrono::seconds(connect_timeout_s_);
  return std::move(config_);
}

}  // namespace ap_onboard
