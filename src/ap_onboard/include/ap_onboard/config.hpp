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
#include <cstdint>
#include <string>
#include <vector>

namespace ap_onboard {

/**
 * @brief CORS (Cross-Origin Resource Sharing) configuration settings
 */
struct CorsConfig {
  bool enabled{false};
  std::vector<std::string> allowed_origins;
  std::vector<std::string> allowed_methods;
  std::vector<std::string> allowed_headers;
  bool allow_credentials{false};
  int max_age_seconds{86400};

  // Pre-built header values for performance
  std::string methods_header;
  std::string headers_header;
};

/**
 * @brief Builder for CorsConfig with fluent interface
 *
 * Usage:
 *   auto config = CorsConfigBuilder()
 *       .with_origins({"http://localhost:1420"})
 *       .with_methods({"GET", "POST", "OPTIONS"})
 *       .with_headers({"Content-Type", "Accept"})
 *       .build();
 */
class CorsConfigBuilder {
 public:
  CorsConfigBuilder & with_origins(std::vector<std::string> origins);
  CorsConfigBuilder & with_methods(std::vector<std::string> methods);
  CorsConfigBuilder & with_headers(std::vector<std::string> headers);
  CorsConfigBuilder & with_credentials(bool credentials);
  CorsConfigBuilder & with_max_age(int seconds);
  CorsConfig build();

 private:
  CorsConfig config_;
};

/// Well-known discovery port of the access point firmware
constexpr uint16_t DEFAULT_DISCOVERY_PORT = 10001;

/// Settings for the UDP discovery broadcast
struct DiscoveryConfig {
  uint16_t port{DEFAULT_DISCOVERY_PORT};
  std::chrono::milliseconds timeout{5000};
};

/**
 * @brief Connection settings shared by every session strategy
 *
 * Defaults are the factory-default credentials of an unconfigured access point.
 */
struct SessionConfig {
  std::string username{"ubnt"};
  std::string default_password{"ubnt"};
  uint16_t port{22};
  std::chrono::seconds connect_timeout{10};
};

/**
 * @brief Builder for SessionConfig
 *
 * @throws std::invalid_argument from build() when the username is empty,
 *         the port is outside 1-65535 or the connect timeout is outside 1-120 seconds.
 */
class SessionConfigBuilder {
 public:
  SessionConfigBuilder & with_username(std::string username);
  SessionConfigBuilder & with_default_password(std::string password);
  SessionConfigBuilder & with_port(int port);
  SessionConfigBuilder & with_connect_timeout(int seconds);
  SessionConfig build();

 private:
  SessionConfig config_;
  int port_{22};
  int connect_timeout_s_{10};
};

}  // namespace ap_onboard
