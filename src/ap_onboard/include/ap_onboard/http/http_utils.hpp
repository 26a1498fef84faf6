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

#include <array>
#include <string>

namespace ap_onboard {

/// API version prefix for all endpoints
constexpr const char * API_BASE_PATH = "/api/v1";

/// Endpoint paths below API_BASE_PATH
constexpr const char * HEALTH_PATH = "/health";
constexpr const char * DEVICES_PATH = "/devices";
constexpr const char * ADOPT_PATH = "/devices/adopt";
constexpr const char * SETUP_CODES_PATH = "/setup-codes";

/// Largest accepted request body; adoption requests are a few hundred bytes
constexpr size_t MAX_REQUEST_BODY_BYTES = 16 * 1024;

struct EndpointInfo {
  const char * method;
  const char * path;
};

/// Endpoints advertised by GET /api/v1/ in registration order
constexpr std::array<EndpointInfo, 4> PUBLIC_ENDPOINTS = {{
    {"GET", HEALTH_PATH},
    {"GET", DEVICES_PATH},
    {"POST", ADOPT_PATH},
    {"GET", "/setup-codes/{code}"},
}};

/// Build versioned endpoint path, e.g. "/devices" -> "/api/v1/devices"
inline std::string api_path(const std::string & endpoint) {
  return std::string(API_BASE_PATH) + endpoint;
}

/// Route pattern capturing the setup code as match 1
inline std::string setup_code_route() {
  return api_path(SETUP_CODES_PATH) + R"(/([^/]+)$)";
}

/// Query parameter value, or an empty string when absent
inline std::string query_param(const httplib::Request & req, const char * name) {
  return req.has_param(name) ? req.get_param_value(name) : std::string();
}

}  // namespace ap_onboard
