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
#include "ap_onboard/http/http_server.hpp"

#include <rclcpp/rclcpp.hpp>

#include "ap_onboard/http/http_utils.hpp"

namespace ap_onboard {

namespace {

rclcpp::Logger logger() {
  return rclcpp::get_logger("http_server");
}

}  // namespace

HttpServerManager::HttpServerManager() : server_(std::make_unique<httplib::Server>()) {
  server_->set_payload_max_length(MAX_REQUEST_BODY_BYTES);

  // Failed requests only; scans and adoptions already log their own progress
  server_->set_logger([](const httplib::Request & req, const httplib::Response & res) {
    if (res.status >= 400) {
      RCLCPP_DEBUG(logger(), "%s %s -> %d", req.method.c_str(), req.path.c_str(), res.status);
    }
  });
}

httplib::Server * HttpServerManager::get_server() {
  return server_.get();
}

bool HttpServerManager::listen(const std::string & host, int port) {
  if (!server_->bind_to_port(host.c_str(), port)) {
    RCLCPP_ERROR(logger(), "Failed to bind %s:%d (address in use or not local)", host.c_str(), port);
    return false;
  }
  RCLCPP_INFO(logger(), "Serving %s on %s:%d", API_BASE_PATH, host.c_str(), port);
  server_->listen_after_bind();
  return true;
}

void HttpServerManager::stop() {
  if (server_->is_running()) {
    RCLCPP_INFO(logger(), "Stopping HTTP server...");
    server_->stop();
  }
}

bool HttpServerManager::is_running() const {
  return server_->is_running();
}

}  // namespace ap_onboard
