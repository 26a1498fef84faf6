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
#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <string>

#include "ap_onboard/session/native_session_strategy.hpp"

using namespace ap_onboard;
using namespace std::chrono_literals;

namespace {

/// Loopback TCP socket bound to an ephemeral port; closed on destruction
class LoopbackSocket {
 public:
  LoopbackSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (fd_ < 0 || ::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
      return;
    }
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) == 0) {
      port_ = ntohs(addr.sin_port);
    }
  }

  ~LoopbackSocket() {
    close();
  }

  LoopbackSocket(const LoopbackSocket &) = delete;
  LoopbackSocket & operator=(const LoopbackSocket &) = delete;

  /// Accept connections into the backlog without ever answering them
  bool listen() {
    return fd_ >= 0 && ::listen(fd_, 4) == 0;
  }

  void close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  uint16_t port() const {
    return port_;
  }

 private:
  int fd_{-1};
  uint16_t port_{0};
};

SessionConfig config_for_port(uint16_t port) {
  return SessionConfigBuilder().with_port(port).with_connect_timeout(1).build();
}

}  // namespace

TEST(NativeSessionStrategyTest, ReportsNativeProtocol) {
  NativeSessionStrategy strategy(SessionConfig{});

  EXPECT_EQ(strategy.get_name(), "libssh");
  EXPECT_TRUE(strategy.is_native_protocol());
}

TEST(NativeSessionStrategyTest, ClosedPortIsConnectionRefused) {
  LoopbackSocket socket;
  const uint16_t port = socket.port();
  ASSERT_NE(port, 0);
  socket.close();

  NativeSessionStrategy strategy(config_for_port(port));
  auto outcome = strategy.open_and_run({"127.0.0.1", "http://127.0.0.1:8080/inform", std::nullopt});

  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().kind, FailureKind::ConnectionRefused) << outcome.error().message;
  EXPECT_EQ(outcome.error().message, "Connection refused at 127.0.0.1");
}

TEST(NativeSessionStrategyTest, SilentServerHitsConnectDeadline) {
  LoopbackSocket socket;
  ASSERT_TRUE(socket.listen());

  NativeSessionStrategy strategy(config_for_port(socket.port()));
  const auto start = std::chrono::steady_clock::now();
  auto outcome = strategy.open_and_run({"127.0.0.1", "http://127.0.0.1:8080/inform", std::nullopt});
  const auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().kind, FailureKind::ConnectionTimeout) << outcome.error().message;
  EXPECT_GE(elapsed, 900ms);
  EXPECT_LT(elapsed, 3s);
}

TEST(NativeSessionStrategyTest, UnroutableAddressHitsConnectDeadline) {
  NativeSessionStrategy strategy(config_for_port(22));
  const auto start = std::chrono::steady_clock::now();
  auto outcome = strategy.open_and_run({"10.255.255.1", "http://10.255.255.2:8080/inform", std::nullopt});
  const auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(outcome.has_value());
  if (outcome.error().kind == FailureKind::Other) {
    GTEST_SKIP() << "No route to the test address here: " << outcome.error().message;
  }
  EXPECT_EQ(outcome.error().kind, FailureKind::ConnectionTimeout) << outcome.error().message;
  EXPECT_LT(elapsed, 3s);
}
