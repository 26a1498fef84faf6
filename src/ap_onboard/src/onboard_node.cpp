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

#include "ap_onboard/onboard_node.hpp"

#include <chrono>
#include <stdexcept>

#include "ap_onboard/adoption/adoption_orchestrator.hpp"
#include "ap_onboard/adoption/strategy_chain.hpp"

namespace ap_onboard {

namespace {

std::string join(const std::vector<std::string> & values) {
  std::string out;
  for (const auto & value : values) {
    if (!out.empty()) {
      out += ", ";
    }
    out += value;
  }
  return out;
}

}  // namespace

OnboardNode::OnboardNode(const rclcpp::NodeOptions & options) : Node("ap_onboard", options) {
  RCLCPP_INFO(get_logger(), "Initializing access point onboarding service...");

  // Declare parameters with defaults
  declare_parameter("server.host", "127.0.0.1");
  declare_parameter("server.port", 8080);
  declare_parameter("cors.allowed_origins", std::vector<std::string>{});
  declare_parameter("cors.allowed_methods", std::vector<std::string>{"GET", "POST", "OPTIONS"});
  declare_parameter("cors.allowed_headers", std::vector<std::string>{"Content-Type", "Accept"});
  declare_parameter("cors.allow_credentials", false);
  declare_parameter("cors.max_age_seconds", 86400);
  declare_parameter("discovery.timeout_ms", 5000);
  declare_parameter("discovery.port", static_cast<int>(DEFAULT_DISCOVERY_PORT));
  declare_parameter("session.username", "ubnt");
  declare_parameter("session.default_password", "ubnt");
  declare_parameter("session.port", 22);
  declare_parameter("session.connect_timeout_s", 10);
  declare_parameter("setup_code.api_base_url", "https://ubiquitywizard.onrender.com");
  declare_parameter("setup_code.timeout_s", 10);

  server_host_ = get_parameter("server.host").as_string();
  server_port_ = static_cast<int>(get_parameter("server.port").as_int());

  // Throws std::invalid_argument if configuration is invalid
  cors_config_ = CorsConfigBuilder()
                     .with_origins(get_parameter("cors.allowed_origins").as_string_array())
                     .with_methods(get_parameter("cors.allowed_methods").as_string_array())
                     .with_headers(get_parameter("cors.allowed_headers").as_string_array())
                     .with_credentials(get_parameter("cors.allow_credentials").as_bool())
                     .with_max_age(static_cast<int>(get_parameter("cors.max_age_seconds").as_int()))
                     .build();

  if (server_port_ < 1024 || server_port_ > 65535) {
    RCLCPP_ERROR(get_logger(), "Invalid port %d. Must be between 1024-65535. Using default 8080.", server_port_);
    server_port_ = 8080;
  }

  if (server_host_.empty()) {
    RCLCPP_WARN(get_logger(), "Empty host specified. Using default 127.0.0.1");
    server_host_ = "127.0.0.1";
  }

  if (server_host_ == "0.0.0.0") {
    RCLCPP_WARN(get_logger(), "Binding to 0.0.0.0 - REST API accessible from ALL network interfaces!");
  }

  auto timeout_ms = get_parameter("discovery.timeout_ms").as_int();
  if (timeout_ms < 100 || timeout_ms > 60000) {
    RCLCPP_WARN(get_logger(), "Invalid discovery timeout %ldms. Must be between 100-60000ms. Using default 5000ms.",
                static_cast<long>(timeout_ms));
    timeout_ms = 5000;
  }
  discovery_config_.timeout = std::chrono::milliseconds(timeout_ms);

  auto discovery_port = get_parameter("discovery.port").as_int();
  if (discovery_port < 1 || discovery_port > 65535) {
    RCLCPP_WARN(get_logger(), "Invalid discovery port %ld. Using default %u.", static_cast<long>(discovery_port),
                static_cast<unsigned>(DEFAULT_DISCOVERY_PORT));
    discovery_port = DEFAULT_DISCOVERY_PORT;
  }
  discovery_config_.port = static_cast<uint16_t>(discovery_port);

  auto connect_timeout_s = get_parameter("session.connect_timeout_s").as_int();
  if (connect_timeout_s < 1 || connect_timeout_s > 120) {
    RCLCPP_WARN(get_logger(), "Invalid connect timeout %lds. Must be between 1-120s. Using default 10s.",
                static_cast<long>(connect_timeout_s));
    connect_timeout_s = 10;
  }

  auto session_port = get_parameter("session.port").as_int();
  if (session_port < 1 || session_port > 65535) {
    RCLCPP_WARN(get_logger(), "Invalid session port %ld. Using default 22.", static_cast<long>(session_port));
    session_port = 22;
  }

  auto username = get_parameter("session.username").as_string();
  if (username.empty()) {
    RCLCPP_WARN(get_logger(), "Empty session username. Using default 'ubnt'.");
    username = "ubnt";
  }

  session_config_ = SessionConfigBuilder()
                        .with_username(username)
                        .with_default_password(get_parameter("session.default_password").as_string())
                        .with_port(static_cast<int>(session_port))
                        .with_connect_timeout(static_cast<int>(connect_timeout_s))
                        .build();

  auto setup_timeout_s = get_parameter("setup_code.timeout_s").as_int();
  if (setup_timeout_s < 1 || setup_timeout_s > 120) {
    RCLCPP_WARN(get_logger(), "Invalid setup-code timeout %lds. Must be between 1-120s. Using default 10s.",
                static_cast<long>(setup_timeout_s));
    setup_timeout_s = 10;
  }
  auto api_base_url = get_parameter("setup_code.api_base_url").as_string();

  RCLCPP_INFO(get_logger(), "Configuration: REST API at %s:%d, discovery port %u (%ldms), SSH %s@*:%u (%lds)",
              server_host_.c_str(), server_port_, static_cast<unsigned>(discovery_config_.port),
              static_cast<long>(discovery_config_.timeout.count()), session_config_.username.c_str(),
              static_cast<unsigned>(session_config_.port), static_cast<long>(session_config_.connect_timeout.count()));
  RCLCPP_INFO(get_logger(), "Setup-code service: %s", api_base_url.c_str());

  if (cors_config_.enabled) {
    RCLCPP_INFO(get_logger(), "CORS enabled - origins: [%s], methods: [%s], credentials: %s, max_age: %ds",
                join(cors_config_.allowed_origins).c_str(), join(cors_config_.allowed_methods).c_str(),
                cors_config_.allow_credentials ? "true" : "false", cors_config_.max_age_seconds);
  } else {
    RCLCPP_INFO(get_logger(), "CORS: disabled (no configuration provided)");
  }

  scanner_ = std::make_unique<discovery::DiscoveryScanner>(discovery_config_);
  process_runner_ = std::make_shared<ProcessRunner>();
  setup_code_client_ = std::make_unique<SetupCodeClient>(api_base_url, std::chrono::seconds(setup_timeout_s));

  rest_server_ = std::make_unique<RESTServer>(this, server_host_, server_port_, cors_config_);
  start_rest_server();

  RCLCPP_INFO(get_logger(), "Onboarding service ready on %s:%d", server_host_.c_str(), server_port_);
}

OnboardNode::~OnboardNode() {
  RCLCPP_INFO(get_logger(), "Shutting down onboarding service...");
  stop_rest_server();
}

SessionOutcome OnboardNode::adopt(const SessionTarget & target) const {
  StrategyChainFactory factory(session_config_, process_runner_);
  AdoptionOrchestrator orchestrator(factory.build());

  RCLCPP_INFO(get_logger(), "Adopting %s (custom password: %s)", target.host.c_str(),
              target.password && !target.password->empty() ? "yes" : "no");
  auto outcome = orchestrator.adopt(target);
  if (outcome) {
    RCLCPP_INFO(get_logger(), "Adoption of %s succeeded", target.host.c_str());
  } else {
    RCLCPP_WARN(get_logger(), "Adoption of %s failed (%s): %s", target.host.c_str(),
                to_string(outcome.error().kind).c_str(), outcome.error().message.c_str());
  }
  return outcome;
}

void OnboardNode::start_rest_server() {
  server_thread_ = std::make_unique<std::thread>([this]() {
    {
      std::lock_guard<std::mutex> lock(server_mutex_);
      server_running_ = true;
    }
    server_cv_.notify_all();

    try {
      rest_server_->start();
    } catch (const std::exception & e) {
      RCLCPP_ERROR(get_logger(), "REST server failed to start: %s", e.what());
    }

    {
      std::lock_guard<std::mutex> lock(server_mutex_);
      server_running_ = false;
    }
    server_cv_.notify_all();
  });

  // Wait for server thread to start
  std::unique_lock<std::mutex> lock(server_mutex_);
  server_cv_.wait(lock, [this] {
    return server_running_.load();
  });
}

void OnboardNode::stop_rest_server() {
  if (rest_server_) {
    rest_server_->stop();
  }

  if (server_thread_ && server_thread_->joinable()) {
    std::unique_lock<std::mutex> lock(server_mutex_);
    server_cv_.wait(lock, [this] {
      return !server_running_.load();
    });
    lock.unlock();
    server_thread_->join();
  }
}

}  // namespace ap_onboard
