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

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <rclcpp/rclcpp.hpp>
#include <string>
#include <thread>

#include "ap_onboard/config.hpp"
#include "ap_onboard/discovery/discovery_scanner.hpp"
#include "ap_onboard/http/rest_server.hpp"
#include "ap_onboard/session/process_runner.hpp"
#include "ap_onboard/session/session_types.hpp"
#include "ap_onboard/setup_code/setup_code_client.hpp"

namespace ap_onboard {

class OnboardNode : public rclcpp::Node {
 public:
  explicit OnboardNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());
  ~OnboardNode() override;

  /**
   * @brief Get the discovery scanner
   * @note Valid for the lifetime of the node. The REST server is stopped before
   *       the node is destroyed.
   */
  discovery::DiscoveryScanner & get_discovery_scanner() {
    return *scanner_;
  }

  const DiscoveryConfig & get_discovery_config() const {
    return discovery_config_;
  }

  const SessionConfig & get_session_config() const {
    return session_config_;
  }

  const SetupCodeClient & get_setup_code_client() const {
    return *setup_code_client_;
  }

  /**
   * @brief Adopt one device
   *
   * Probes the installed client tools, builds a fresh strategy chain and runs it.
   * Blocks until a strategy succeeds or the chain is exhausted. Safe to call
   * concurrently; calls share no mutable state.
   */
  SessionOutcome adopt(const SessionTarget & target) const;

 private:
  void start_rest_server();
  void stop_rest_server();

  // Configuration parameters
  std::string server_host_;
  int server_port_;
  CorsConfig cors_config_;
  DiscoveryConfig discovery_config_;
  SessionConfig session_config_;

  std::unique_ptr<discovery::DiscoveryScanner> scanner_;
  std::shared_ptr<ProcessRunner> process_runner_;
  std::unique_ptr<SetupCodeClient> setup_code_client_;
  std::unique_ptr<RESTServer> rest_server_;

  // REST server thread management
  std::unique_ptr<std::thread> server_thread_;
  std::atomic<bool> server_running_{false};
  std::mutex server_mutex_;
  std::condition_variable server_cv_;
};

}  // namespace ap_onboard
