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

#include "ap_onboard/session/native_session_strategy.hpp"

#include <libssh/libssh.h>

#include <array>
#include <memory>
#include <rclcpp/rclcpp.hpp>
#include <thread>
#include <utility>

#include "ap_onboard/session/algorithm_preferences.hpp"
#include "ap_onboard/session/output_classifier.hpp"

namespace ap_onboard {

namespace {

rclcpp::Logger logger() {
  return rclcpp::get_logger("native_session");
}

struct SessionDeleter {
  void operator()(ssh_session session) const {
    if (session) {
      if (ssh_is_connected(session)) {
        ssh_disconnect(session);
      }
      ssh_free(session);
    }
  }
};

struct ChannelDeleter {
  void operator()(ssh_channel channel) const {
    if (channel) {
      if (ssh_channel_is_open(channel)) {
        ssh_channel_close(channel);
      }
      ssh_channel_free(channel);
    }
  }
};

using SessionHandle = std::unique_ptr<ssh_session_struct, SessionDeleter>;
using ChannelHandle = std::unique_ptr<ssh_channel_struct, ChannelDeleter>;

constexpr std::chrono::milliseconds CONNECT_POLL_INTERVAL{20};
constexpr int READ_SLICE_MS = 200;

bool contains(const std::string & haystack, const char * needle) {
  return haystack.find(needle) != std::string::npos;
}

// Reads whatever is pending on one stream. Returns false on channel error.
bool drain_nonblocking(ssh_channel channel, int is_stderr, std::string & output) {
  std::array<char, 1024> buffer;
  while (true) {
    int n = ssh_channel_read_nonblocking(channel, buffer.data(), static_cast<uint32_t>(buffer.size()), is_stderr);
    if (n == SSH_ERROR) {
      return false;
    }
    if (n <= 0) {
      return true;
    }
    output.append(buffer.data(), static_cast<size_t>(n));
  }
}

}  // namespace

NativeSessionStrategy::NativeSessionStrategy(SessionConfig config) : config_(std::move(config)) {
}

SessionOutcome NativeSessionStrategy::open_and_run(const SessionTarget & target) {
  RCLCPP_INFO(logger(), "Connecting to %s via SSH...", target.host.c_str());

  SessionHandle session(ssh_new());
  if (!session) {
    return session_failure(FailureKind::Other, "Failed to allocate SSH session");
  }

  const std::string kex = join_algorithms(KEX_ALGORITHMS);
  const std::string host_keys = join_algorithms(HOST_KEY_ALGORITHMS);
  unsigned int port = config_.port;
  long timeout_s = static_cast<long>(config_.connect_timeout.count());
  int pubkey_auth = 0;
  bool process_config = false;

  if (ssh_options_set(session.get(), SSH_OPTIONS_HOST, target.host.c_str()) != SSH_OK ||
      ssh_options_set(session.get(), SSH_OPTIONS_PORT, &port) != SSH_OK ||
      ssh_options_set(session.get(), SSH_OPTIONS_USER, config_.username.c_str()) != SSH_OK ||
      ssh_options_set(session.get(), SSH_OPTIONS_TIMEOUT, &timeout_s) != SSH_OK ||
      ssh_options_set(session.get(), SSH_OPTIONS_PROCESS_CONFIG, &process_config) != SSH_OK ||
      ssh_options_set(session.get(), SSH_OPTIONS_KEY_EXCHANGE, kex.c_str()) != SSH_OK ||
      ssh_options_set(session.get(), SSH_OPTIONS_HOSTKEYS, host_keys.c_str()) != SSH_OK ||
      ssh_options_set(session.get(), SSH_OPTIONS_PUBKEY_AUTH, &pubkey_auth) != SSH_OK ||
      ssh_options_set(session.get(), SSH_OPTIONS_KNOWNHOSTS, "/dev/null") != SSH_OK ||
      ssh_options_set(session.get(), SSH_OPTIONS_GLOBAL_KNOWNHOSTS, "/dev/null") != SSH_OK) {
    return session_failure(FailureKind::Other,
                           "Failed to configure SSH session: " + std::string(ssh_get_error(session.get())));
  }

  // Non-blocking connect so the deadline holds even if the library timeout does not fire
  ssh_set_blocking(session.get(), 0);
  const auto connect_deadline = std::chrono::steady_clock::now() + config_.connect_timeout;
  int rc = ssh_connect(session.get());
  while (rc == SSH_AGAIN) {
    if (std::chrono::steady_clock::now() >= connect_deadline) {
      return session_failure(FailureKind::ConnectionTimeout, "Timed out connecting to " + target.host);
    }
    std::this_thread::sleep_for(CONNECT_POLL_INTERVAL);
    rc = ssh_connect(session.get());
  }
  ssh_set_blocking(session.get(), 1);

  if (rc != SSH_OK) {
    std::string msg = ssh_get_error(session.get());
    if (contains(msg, "refused")) {
      return session_failure(FailureKind::ConnectionRefused, "Connection refused at " + target.host);
    }
    if (contains(msg, "timed out") || contains(msg, "Timeout")) {
      return session_failure(FailureKind::ConnectionTimeout, "Timed out connecting to " + target.host);
    }
    return session_failure(FailureKind::Other, "Failed to connect to " + target.host + ": " + msg);
  }

  // Host key deliberately not verified (see class comment)
  RCLCPP_INFO(logger(), "Connected to %s, authenticating...", target.host.c_str());

  int auth = ssh_userauth_password(session.get(), nullptr, effective_password(target, config_).c_str());
  if (auth == SSH_AUTH_DENIED || auth == SSH_AUTH_PARTIAL) {
    return session_failure(FailureKind::AuthenticationFailed, auth_failed_message(target.host));
  }
  if (auth != SSH_AUTH_SUCCESS) {
    return session_failure(FailureKind::Other, "Auth error: " + std::string(ssh_get_error(session.get())));
  }

  RCLCPP_INFO(logger(), "Authenticated to %s, executing set-inform...", target.host.c_str());

  ChannelHandle channel(ssh_channel_new(session.get()));
  if (!channel || ssh_channel_open_session(channel.get()) != SSH_OK) {
    return session_failure(FailureKind::Other,
                           "Failed to open channel: " + std::string(ssh_get_error(session.get())));
  }

  const std::string command = build_inform_command(target.inform_url);
  if (ssh_channel_request_exec(channel.get(), command.c_str()) != SSH_OK) {
    return session_failure(FailureKind::CommandFailed,
                           "Failed to execute command: " + std::string(ssh_get_error(session.get())));
  }

  std::string output;
  std::array<char, 1024> buffer;
  const auto read_deadline = std::chrono::steady_clock::now() + COMMAND_TIMEOUT;
  while (!ssh_channel_is_eof(channel.get())) {
    if (std::chrono::steady_clock::now() >= read_deadline) {
      return session_failure(FailureKind::ConnectionTimeout, "Timed out waiting for set-inform on " + target.host);
    }
    int n = ssh_channel_read_timeout(channel.get(), buffer.data(), static_cast<uint32_t>(buffer.size()), 0,
                                     READ_SLICE_MS);
    if (n == SSH_ERROR) {
      return session_failure(FailureKind::Other, "Failed to read output: " + std::string(ssh_get_error(session.get())));
    }
    if (n > 0) {
      output.append(buffer.data(), static_cast<size_t>(n));
    }
    if (!drain_nonblocking(channel.get(), 1, output)) {
      return session_failure(FailureKind::Other, "Failed to read output: " + std::string(ssh_get_error(session.get())));
    }
  }
  // Data that arrived together with EOF
  if (!drain_nonblocking(channel.get(), 0, output) || !drain_nonblocking(channel.get(), 1, output)) {
    return session_failure(FailureKind::Other, "Failed to read output: " + std::string(ssh_get_error(session.get())));
  }

  ssh_channel_send_eof(channel.get());
  int exit_status = ssh_channel_get_exit_status(channel.get());
  RCLCPP_INFO(logger(), "set-inform exit status: %d", exit_status);
  RCLCPP_INFO(logger(), "set-inform output: %s", trim_copy(output).c_str());

  return classify_command_output(output);
}

}  // namespace ap_onboard
