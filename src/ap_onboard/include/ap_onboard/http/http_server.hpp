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

namespace ap_onboard {

/**
 * @brief Owns the cpp-httplib server for the onboarding API
 *
 * Binding is split from serving so a port that is already taken is reported instead of
 * leaving the API silently absent.
 */
class HttpServerManager {
 public:
  HttpServerManager();
  ~HttpServerManager() = default;

  HttpServerManager(const HttpServerManager &) = delete;
  HttpServerManager & operator=(const HttpServerManager &) = delete;

  httplib::Server * get_server();

  /**
   * @brief Bind to host:port and serve until stop()
   * @return false if the address could not be bound; true once serving has ended
   */
  bool listen(const std::string & host, int port);

  void stop();

  bool is_running() const;

 private:
  std::unique_ptr<httplib::Server> server_;
};

}  // namespace ap_onboard
