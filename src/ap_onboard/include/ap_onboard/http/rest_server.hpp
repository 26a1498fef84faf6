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

#include <memory>
#include <string>

#include "ap_onboard/config.hpp"
#include "ap_onboard/http/handlers/handlers.hpp"
#include "ap_onboard/http/http_server.hpp"

namespace ap_onboard {

class OnboardNode;

/**
 * @brief REST API server for the access point onboarding service.
 *
 * Provides a RESTful interface for:
 * - Device discovery (UDP broadcast scan)
 * - Device adoption (set-inform over SSH)
 * - Setup-code lookup
 *
 * The server delegates request handling to specialized handler classes
 * organized by domain (health, devices, setup codes).
 */
class RESTServer {
 public:
  RESTServer(OnboardNode * node, const std::string & host, int port, const CorsConfig & cors_config);
  ~RESTServer();

  void start();
  void stop();

 private:
  void setup_routes();
  void setup_pre_routing_handler();
  void setup_global_error_handlers();

  OnboardNode * node_;
  std::string host_;
  int port_;
  CorsConfig cors_config_;

  std::unique_ptr<HttpServerManager> http_server_;

  // Handler context and domain-specific handlers
  std::unique_ptr<handlers::HandlerContext> handler_ctx_;
  std::unique_ptr<handlers::HealthHandlers> health_handlers_;
  std::unique_ptr<handlers::DeviceHandlers> device_handlers_;
  std::unique_ptr<handlers::SetupCodeHandlers> setup_code_handlers_;
};

}  // namespace ap_onboard
