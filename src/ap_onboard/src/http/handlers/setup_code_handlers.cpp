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

#include "ap_onboard/http/handlers/setup_code_handlers.hpp"

#include "ap_onboard/onboard_node.hpp"

using json = nlohmann::json;
using httplib::StatusCode;

namespace ap_onboard {
namespace handlers {

httplib::StatusCode SetupCodeHandlers::status_for(SetupCodeErrorCode code) {
  switch (code) {
    case SetupCodeErrorCode::InvalidCode:
      return StatusCode::NotFound_404;
    case SetupCodeErrorCode::ExpiredCode:
      return StatusCode::Gone_410;
    case SetupCodeErrorCode::NetworkError:
      return StatusCode::ServiceUnavailable_503;
    case SetupCodeErrorCode::Other:
    default:
      return StatusCode::BadGateway_502;
  }
}

void SetupCodeHandlers::handle_get_setup_code(const httplib::Request & req, httplib::Response & res) {
  std::string code;
  try {
    if (req.matches.size() < 2) {
      HandlerContext::send_error(res, StatusCode::BadRequest_400, ERR_INVALID_REQUEST, "Invalid request");
      return;
    }
    code = req.matches[1];

    auto result = ctx_.node()->get_setup_code_client().validate(code);
    if (!result) {
      const auto & error = result.error();
      std::string error_code;
      switch (error.code) {
        case SetupCodeErrorCode::InvalidCode:
          error_code = ERR_RESOURCE_NOT_FOUND;
          break;
        case SetupCodeErrorCode::ExpiredCode:
          error_code = ERR_X_ONBOARD_SETUP_CODE_EXPIRED;
          break;
        default:
          error_code = ERR_X_ONBOARD_SETUP_SERVICE_UNAVAILABLE;
          break;
      }
      HandlerContext::send_error(res, status_for(error.code), error_code, error.message, {{"code", code}});
      return;
    }

    HandlerContext::send_json(
        res, {{"inform_url", result->inform_url}, {"site_id", result->site_id}, {"site_name", result->site_name}});
  } catch (const std::exception & e) {
    HandlerContext::send_error(res, StatusCode::InternalServerError_500, ERR_INTERNAL_ERROR,
                               "Failed to look up setup code", {{"details", e.what()}, {"code", code}});
    RCLCPP_ERROR(HandlerContext::logger(), "Error in handle_get_setup_code for code '%s': %s", code.c_str(),
                 e.what());
  }
}

}  // namespace handlers
}  // namespace ap_onboard
