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
#include "ap_onboard/setup_code/setup_code_client.hpp"

namespace ap_onboard {
namespace handlers {

/**
 * @brief Handlers for setup-code lookup
 *
 * Handles:
 * - GET /setup-codes/{code} - resolve a setup code to the controller inform URL
 */
class SetupCodeHandlers {
 public:
  explicit SetupCodeHandlers(HandlerContext & ctx) : ctx_(ctx) {
  }

  /// GET /setup-codes/{code}
  void handle_get_setup_code(const httplib::Request & req, httplib::Response & res);

  /// HTTP status for a lookup failure
  static httplib::StatusCode status_for(SetupCodeErrorCode code);

 private:
  HandlerContext & ctx_;
};

}  // namespace handlers
}  // namespace ap_onboard
