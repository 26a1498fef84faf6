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

#include "ap_onboard/http/rest_server.hpp"

#include <rclcpp/rclcpp.hpp>
#include <stdexcept>

#include "ap_onboard/http/http_utils.hpp"
#include "ap_onboard/onboard_node.hpp"

using httplib::StatusCode;

namespace ap_onboard {

RESTServer::RESTServer(OnboardNode * node, const std::string & host, int port, const CorsConfig & cors_config)
  : node_(node), host_(host), port_(port), cors_config_(cors_config) {
  http_server_ = std::make_unique<HttpServerManager>();

  handler_ctx_ = std::make_unique<handlers::HandlerContext>(node_, cors_config_);

  health_handlers_ = std::make_unique<handlers::HealthHandlers>(*handler_ctx_);
  device_handlers_ = std::make_unique<handlers::DeviceHandlers>(*handler_ctx_);
  setup_code_handlers_ = std::make_unique<handlers::SetupCodeHandlers>(*handler_ctx_);

  setup_pre_routing_handler();
  setup_global_error_handlers();
  setup_routes();
}

void RESTServer::setup_pre_routing_handler() {
  httplib::Server * srv = http_server_->get_server();
  if (!srv) {
    return;
  }

  // Runs before any route handler
  srv->set_pre_routing_handler([this](const httplib::Request & req, httplib::Response & res) {
    return handler_ctx_->apply_cors(req, res);
  });
}

void RESTServer::setup_global_error_handlers() {
  httplib::Server * srv = http_server_->get_server();
  if (!srv) {
    return;
  }

  srv->set_exception_handler([](const httplib::Request & req, httplib::Response & res, std::exception_ptr ep) {
    std::string details = "unknown exception";
    try {
      if (ep) {
        std::rethrow_exception(ep);
      }
    } catch (const std::exception & e) {
      details = e.what();
    } catch (...) {
      details = "non-standard exception";
    }
    RCLCPP_ERROR(rclcpp::get_logger("rest_server"), "Unhandled exception in %s %s: %s", req.method.c_str(),
                 req.path.c_str(), details.c_str());
    handlers::HandlerContext::send_error(res, StatusCode::InternalServerError_500, ERR_INTERNAL_ERROR,
                                         "Internal server error", {{"details", details}});
  });
}

RESTServer::~RESTServer() {
  stop();
}

void RESTServer::setup_routes() {
  httplib::Server * srv = http_server_->get_server();
  if (!srv) {
    throw std::runtime_error("No server instance available for route setup");
  }

  // Health check
  srv->Get(api_path(HEALTH_PATH), [this](const httplib::Request & req, httplib::Response & res) {
    health_handlers_->handle_health(req, res);
  });

  // Root - service info and entry points
  srv->Get(api_path("/"), [this](const httplib::Request & req, httplib::Response & res) {
    health_handlers_->handle_root(req, res);
  });

  // Devices
  srv->Get(api_path(DEVICES_PATH), [this](const httplib::Request & req, httplib::Response & res) {
    device_handlers_->handle_list_devices(req, res);
  });

  srv->Post(api_path(ADOPT_PATH), [this](const httplib::Request & req, httplib::Response & res) {
    device_handlers_->handle_adopt_device(req, res);
  });

  // Setup codes
  srv->Get(setup_code_route(), [this](const httplib::Request & req, httplib::Response & res) {
    setup_code_handlers_->handle_get_setup_code(req, res);
  });
}

void RESTServer::start() {
  if (!http_server_->listen(host_, port_)) {
    throw std::runtime_error("Cannot bind REST API to " + host_ + ":" + std::to_string(port_));
  }
}

void RESTServer::stop() {
  if (http_server_) {
    http_server_->stop();
  }
}

}  // namespace ap_onboard
