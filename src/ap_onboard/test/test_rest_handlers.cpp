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

#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <cstring>
#include <nlohmann/json.hpp>
#include <regex>
#include <string>

#include "ap_onboard/http/error_codes.hpp"
#include "ap_onboard/http/handlers/device_handlers.hpp"
#include "ap_onboard/http/handlers/handler_context.hpp"
#include "ap_onboard/http/handlers/setup_code_handlers.hpp"
#include "ap_onboard/http/http_server.hpp"
#include "ap_onboard/http/http_utils.hpp"

using namespace ap_onboard;
using namespace ap_onboard::handlers;
using json = nlohmann::json;

// =============================================================================
// HandlerContext static method tests (don't require OnboardNode)
// =============================================================================

TEST(HandlerContextStaticTest, SendErrorSetsStatusAndBody) {
  httplib::Response res;

  HandlerContext::send_error(res, httplib::StatusCode::BadRequest_400, ERR_INVALID_REQUEST, "Test error message");

  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");

  auto body = json::parse(res.body);
  EXPECT_EQ(body["error_code"], ERR_INVALID_REQUEST);
  EXPECT_EQ(body["message"], "Test error message");
  EXPECT_FALSE(body.contains("parameters"));
}

TEST(HandlerContextStaticTest, VendorCodeIsReportedSeparately) {
  httplib::Response res;

  HandlerContext::send_error(res, httplib::StatusCode::Unauthorized_401, ERR_X_ONBOARD_AUTH_FAILED,
                             "Authentication failed: wrong password", {{"ip", "10.0.0.2"}});

  EXPECT_EQ(res.status, 401);
  auto body = json::parse(res.body);
  EXPECT_EQ(body["error_code"], ERR_VENDOR_ERROR);
  EXPECT_EQ(body["vendor_code"], ERR_X_ONBOARD_AUTH_FAILED);
  EXPECT_EQ(body["parameters"]["ip"], "10.0.0.2");
}

TEST(HandlerContextStaticTest, SendJsonSetsContentTypeAndBody) {
  httplib::Response res;

  HandlerContext::send_json(res, {{"devices", json::array()}, {"count", 0}});

  EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");
  auto body = json::parse(res.body);
  EXPECT_TRUE(body["devices"].is_array());
  EXPECT_EQ(body["count"], 0);
}

TEST(HandlerContextStaticTest, ErrorBodyOmitsEmptyParameters) {
  auto body = HandlerContext::error_body(ERR_X_ONBOARD_SCAN_FAILED, "Failed to bind socket");

  EXPECT_EQ(body["error_code"], ERR_VENDOR_ERROR);
  EXPECT_EQ(body["vendor_code"], ERR_X_ONBOARD_SCAN_FAILED);
  EXPECT_EQ(body["message"], "Failed to bind socket");
  EXPECT_FALSE(body.contains("parameters"));
}

TEST(HandlerContextStaticTest, ParseJsonBody) {
  httplib::Request req;
  req.body = R"({"ip": "10.0.0.2"})";
  auto parsed = HandlerContext::parse_json_body(req);
  ASSERT_TRUE(parsed.has_value()) << parsed.error();
  EXPECT_EQ((*parsed)["ip"], "10.0.0.2");

  req.body = "{not json";
  auto malformed = HandlerContext::parse_json_body(req);
  ASSERT_FALSE(malformed.has_value());
  EXPECT_EQ(malformed.error().rfind("Invalid JSON in request body", 0), 0u);

  req.body.clear();
  auto empty = HandlerContext::parse_json_body(req);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), "Request body is empty");
}

TEST(HandlerContextStaticTest, LoggerReturnsValidLogger) {
  auto logger = HandlerContext::logger();
  EXPECT_NE(logger.get_name(), nullptr);
  EXPECT_GT(strlen(logger.get_name()), 0u);
}

TEST(ErrorCodesTest, VendorPrefixDetection) {
  EXPECT_TRUE(is_vendor_error_code(ERR_X_ONBOARD_SCAN_FAILED));
  EXPECT_TRUE(is_vendor_error_code("x-onboard-anything"));
  EXPECT_FALSE(is_vendor_error_code(ERR_INVALID_REQUEST));
  EXPECT_FALSE(is_vendor_error_code("vendor-x-onboard"));
}

// =============================================================================
// CORS
// =============================================================================

TEST(HandlerContextCorsTest, OriginMatching) {
  auto cors = CorsConfigBuilder().with_origins({"http://localhost:1420"}).with_methods({"GET", "POST"}).build();
  HandlerContext ctx(nullptr, cors);

  EXPECT_TRUE(ctx.is_origin_allowed("http://localhost:1420"));
  EXPECT_FALSE(ctx.is_origin_allowed("http://evil.example"));

  httplib::Response res;
  ctx.set_cors_headers(res, "http://localhost:1420");
  EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "http://localhost:1420");
  EXPECT_EQ(res.get_header_value("Access-Control-Allow-Methods"), "GET, POST");
  EXPECT_FALSE(res.has_header("Access-Control-Allow-Credentials"));
}

TEST(HandlerContextCorsTest, PreflightFromAllowedOriginIsAnswered) {
  auto cors = CorsConfigBuilder().with_origins({"http://localhost:1420"}).with_max_age(600).build();
  HandlerContext ctx(nullptr, cors);

  httplib::Request req;
  req.method = "OPTIONS";
  req.path = api_path(ADOPT_PATH);
  req.set_header("Origin", "http://localhost:1420");
  httplib::Response res;

  EXPECT_EQ(ctx.apply_cors(req, res), httplib::Server::HandlerResponse::Handled);
  EXPECT_EQ(res.status, 204);
  EXPECT_EQ(res.get_header_value("Access-Control-Max-Age"), "600");
  EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "http://localhost:1420");
}

TEST(HandlerContextCorsTest, PreflightFromUnknownOriginIsForbidden) {
  auto cors = CorsConfigBuilder().with_origins({"http://localhost:1420"}).build();
  HandlerContext ctx(nullptr, cors);

  httplib::Request req;
  req.method = "OPTIONS";
  req.set_header("Origin", "http://evil.example");
  httplib::Response res;

  EXPECT_EQ(ctx.apply_cors(req, res), httplib::Server::HandlerResponse::Handled);
  EXPECT_EQ(res.status, 403);
  EXPECT_FALSE(res.has_header("Access-Control-Allow-Origin"));
}

TEST(HandlerContextCorsTest, OrdinaryRequestsContinueToRouting) {
  auto cors = CorsConfigBuilder().with_origins({"http://localhost:1420"}).build();
  HandlerContext ctx(nullptr, cors);

  httplib::Request req;
  req.method = "GET";
  req.set_header("Origin", "http://localhost:1420");
  httplib::Response res;

  EXPECT_EQ(ctx.apply_cors(req, res), httplib::Server::HandlerResponse::Unhandled);
  EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "http://localhost:1420");

  HandlerContext disabled(nullptr, CorsConfig{});
  httplib::Request preflight;
  preflight.method = "OPTIONS";
  preflight.set_header("Origin", "http://localhost:1420");
  httplib::Response untouched;
  EXPECT_EQ(disabled.apply_cors(preflight, untouched), httplib::Server::HandlerResponse::Unhandled);
  EXPECT_FALSE(untouched.has_header("Access-Control-Allow-Origin"));
}

TEST(HandlerContextCorsTest, WildcardAllowsAnyOrigin) {
  auto cors = CorsConfigBuilder().with_origins({"*"}).build();
  HandlerContext ctx(nullptr, cors);

  EXPECT_TRUE(ctx.is_origin_allowed("http://anything.example"));
}

// =============================================================================
// Device handler helpers
// =============================================================================

TEST(DeviceHandlersTest, FailureKindMapping) {
  auto auth = DeviceHandlers::map_failure(FailureKind::AuthenticationFailed);
  EXPECT_EQ(auth.status, httplib::StatusCode::Unauthorized_401);
  EXPECT_STREQ(auth.vendor_code, ERR_X_ONBOARD_AUTH_FAILED);

  auto refused = DeviceHandlers::map_failure(FailureKind::ConnectionRefused);
  EXPECT_EQ(refused.status, httplib::StatusCode::BadGateway_502);
  EXPECT_STREQ(refused.vendor_code, ERR_X_ONBOARD_CONNECTION_REFUSED);

  auto timeout = DeviceHandlers::map_failure(FailureKind::ConnectionTimeout);
  EXPECT_EQ(timeout.status, httplib::StatusCode::GatewayTimeout_504);
  EXPECT_STREQ(timeout.vendor_code, ERR_X_ONBOARD_CONNECTION_TIMEOUT);

  auto command = DeviceHandlers::map_failure(FailureKind::CommandFailed);
  EXPECT_EQ(command.status, httplib::StatusCode::BadGateway_502);
  EXPECT_STREQ(command.vendor_code, ERR_X_ONBOARD_COMMAND_FAILED);

  auto other = DeviceHandlers::map_failure(FailureKind::Other);
  EXPECT_EQ(other.status, httplib::StatusCode::BadGateway_502);
  EXPECT_STREQ(other.vendor_code, ERR_X_ONBOARD_ADOPTION_FAILED);
}

TEST(DeviceHandlersTest, ParseAdoptRequest) {
  auto target = DeviceHandlers::parse_adopt_request(
      {{"ip", "192.168.1.20"}, {"inform_url", "http://192.168.1.10:8080/inform"}, {"password", "hunter2"}});

  ASSERT_TRUE(target.has_value()) << target.error();
  EXPECT_EQ(target->host, "192.168.1.20");
  EXPECT_EQ(target->inform_url, "http://192.168.1.10:8080/inform");
  ASSERT_TRUE(target->password.has_value());
  EXPECT_EQ(*target->password, "hunter2");
}

TEST(DeviceHandlersTest, PasswordIsOptional) {
  auto without = DeviceHandlers::parse_adopt_request({{"ip", "10.0.0.2"}, {"inform_url", "http://c/inform"}});
  ASSERT_TRUE(without.has_value());
  EXPECT_FALSE(without->password.has_value());

  auto null_pw =
      DeviceHandlers::parse_adopt_request({{"ip", "10.0.0.2"}, {"inform_url", "http://c/inform"}, {"password", nullptr}});
  ASSERT_TRUE(null_pw.has_value());
  EXPECT_FALSE(null_pw->password.has_value());

  auto empty_pw =
      DeviceHandlers::parse_adopt_request({{"ip", "10.0.0.2"}, {"inform_url", "http://c/inform"}, {"password", ""}});
  ASSERT_TRUE(empty_pw.has_value());
  EXPECT_FALSE(empty_pw->password.has_value());
}

TEST(DeviceHandlersTest, ParseAdoptRequestRejectsBadBodies) {
  EXPECT_FALSE(DeviceHandlers::parse_adopt_request(json::array()).has_value());
  EXPECT_FALSE(DeviceHandlers::parse_adopt_request({{"inform_url", "http://c/inform"}}).has_value());
  EXPECT_FALSE(DeviceHandlers::parse_adopt_request({{"ip", ""}, {"inform_url", "http://c/inform"}}).has_value());
  EXPECT_FALSE(DeviceHandlers::parse_adopt_request({{"ip", "10.0.0.2"}}).has_value());
  EXPECT_FALSE(DeviceHandlers::parse_adopt_request({{"ip", 42}, {"inform_url", "http://c/inform"}}).has_value());
  EXPECT_FALSE(
      DeviceHandlers::parse_adopt_request({{"ip", "10.0.0.2"}, {"inform_url", "http://c/inform"}, {"password", 7}})
          .has_value());
}

TEST(DeviceHandlersTest, ParseScanTimeout) {
  auto absent = DeviceHandlers::parse_scan_timeout("");
  ASSERT_TRUE(absent.has_value());
  EXPECT_FALSE(absent->has_value());

  auto valid = DeviceHandlers::parse_scan_timeout("2500");
  ASSERT_TRUE(valid.has_value());
  ASSERT_TRUE(valid->has_value());
  EXPECT_EQ(**valid, std::chrono::milliseconds(2500));

  EXPECT_FALSE(DeviceHandlers::parse_scan_timeout("99").has_value());
  EXPECT_FALSE(DeviceHandlers::parse_scan_timeout("60001").has_value());
  EXPECT_FALSE(DeviceHandlers::parse_scan_timeout("5s").has_value());
  EXPECT_FALSE(DeviceHandlers::parse_scan_timeout("abc").has_value());
}

// =============================================================================
// Setup-code handler helpers
// =============================================================================

TEST(SetupCodeHandlersTest, StatusMapping) {
  EXPECT_EQ(SetupCodeHandlers::status_for(SetupCodeErrorCode::InvalidCode), httplib::StatusCode::NotFound_404);
  EXPECT_EQ(SetupCodeHandlers::status_for(SetupCodeErrorCode::ExpiredCode), httplib::StatusCode::Gone_410);
  EXPECT_EQ(SetupCodeHandlers::status_for(SetupCodeErrorCode::NetworkError),
            httplib::StatusCode::ServiceUnavailable_503);
  EXPECT_EQ(SetupCodeHandlers::status_for(SetupCodeErrorCode::Other), httplib::StatusCode::BadGateway_502);
}

// =============================================================================
// Routing helpers and server binding
// =============================================================================

TEST(HttpUtilsTest, SetupCodeRouteCapturesCode) {
  std::smatch match;
  const std::string path = "/api/v1/setup-codes/ABC123";

  ASSERT_TRUE(std::regex_match(path, match, std::regex(setup_code_route())));
  EXPECT_EQ(match[1], "ABC123");
  EXPECT_FALSE(std::regex_match(std::string("/api/v1/setup-codes/a/b"), std::regex(setup_code_route())));
}

TEST(HttpUtilsTest, QueryParam) {
  httplib::Request req;
  req.params.emplace("timeout_ms", "2500");

  EXPECT_EQ(query_param(req, "timeout_ms"), "2500");
  EXPECT_EQ(query_param(req, "missing"), "");
}

TEST(HttpServerManagerTest, UnbindableAddressIsReported) {
  HttpServerManager manager;

  // TEST-NET-1 is never assigned to a local interface
  EXPECT_FALSE(manager.listen("192.0.2.1", 18390));
  EXPECT_FALSE(manager.is_running());
}
