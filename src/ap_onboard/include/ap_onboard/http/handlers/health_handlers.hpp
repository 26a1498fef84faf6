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

#include "ap_onboard/http/handlers/handler_context.hpp"

namespace ap_onboard {
namespace handlers {

/**
 * @brief Health and service info endpoint handlers
 *
 * Handles:
 * - GET /health - Health check
 * - GET / - Root endpoint with the endpoint list
 */
class HealthHandlers {
 public:
  explicit HealthHandlers(HandlerContext & ctx) : ctx_(ctx) {
  }

  /// GET /health - Health check endpoint
  void handle_health(const httplib::Request & req, httplib::Response & res);

  /// GET / - Root endpoint with service capabilities
  void handle_root(const httplib::Request & req, httplib::Response & res);

 private:
  HandlerContext & ctx_;
};

}  // namespace handlers
}  // namespace ap_onboard
