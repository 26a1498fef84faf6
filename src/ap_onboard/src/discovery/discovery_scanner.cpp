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

#include "ap_onboard/discovery/discovery_scanner.hpp"

#include <algorithm>
#include <array>
#include <rclcpp/rclcpp.hpp>
#include <utility>

#include "ap_onboard/discovery/udp_broadcast_transport.hpp"

namespace ap_onboard {
namespace discovery {

namespace {

rclcpp::Logger logger() {
  return rclcpp::get_logger("discovery_scanner");
}

}  // namespace

bool DeviceCollector::add(DiscoveredDevice device) {
  if (!seen_macs_.insert(device.mac).second) {
    return false;
  }
  devices_.push_back(std::move(device));
  return true;
}

bool DeviceCollector::add_frame(const uint8_t * data, size_t size, const std::string & source_ip) {
  auto device = decode_response(data, size, source_ip);
  if (!device) {
    RCLCPP_DEBUG(logger(), "Dropping %zu-byte frame from %s: no device identity", size, source_ip.c_str());
    return false;
  }
  if (!add(std::move(*device))) {
    RCLCPP_DEBUG(logger(), "Duplicate response from %s ignored", source_ip.c_str());
    return false;
  }
  return true;
}

std::vector<DiscoveredDevice> DeviceCollector::take() {
  std::vector<DiscoveredDevice> out;
  out.swap(devices_);
  seen_macs_.clear();
  return out;
}

DiscoveryScanner::DiscoveryScanner(DiscoveryConfig config, TransportFactory factory)
  : config_(config), factory_(std::move(factory)) {
  if (!factory_) {
    factory_ = [](std::chrono::milliseconds receive_timeout) -> std::unique_ptr<DatagramTransport> {
      return std::make_unique<UdpBroadcastTransport>(receive_timeout);
    };
  }
}

tl::expected<std::vector<DiscoveredDevice>, ScanError> DiscoveryScanner::scan() {
  return scan(config_.timeout);
}

tl::expected<std::vector<DiscoveredDevice>, ScanError> DiscoveryScanner::scan(std::chrono::milliseconds timeout) {
  auto transport = factory_(timeout);

  auto opened = transport->open();
  if (!opened) {
    RCLCPP_ERROR(logger(), "%s", opened.error().message.c_str());
    return tl::make_unexpected(opened.error());
  }

  auto sent = transport->send_broadcast(encode_probe(), config_.port);
  if (!sent) {
    RCLCPP_ERROR(logger(), "%s", sent.error().message.c_str());
    transport->close();
    return tl::make_unexpected(sent.error());
  }

  RCLCPP_INFO(logger(), "Sent discovery broadcast on port %u", static_cast<unsigned>(config_.port));

  DeviceCollector collector;
  std::array<uint8_t, RECV_BUFFER_SIZE> buffer{};
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

    auto result = transport->receive(buffer.data(), buffer.size(), remaining);
    if (result.status == ReceiveStatus::Timeout) {
      break;
    }
    if (result.status == ReceiveStatus::Interrupted) {
      RCLCPP_DEBUG(logger(), "Receive interrupted, %ldms left in the window", static_cast<long>(remaining.count()));
      continue;
    }
    if (result.status == ReceiveStatus::Error) {
      RCLCPP_WARN(logger(), "Receive error, ending scan early: %s", result.error.c_str());
      break;
    }

    const size_t size = std::min(result.size, buffer.size());
    RCLCPP_DEBUG(logger(), "Received %zu bytes from %s", size, result.source_ip.c_str());
    collector.add_frame(buffer.data(), size, result.source_ip);
  }

  transport->close();

  auto devices = collector.take();
  RCLCPP_INFO(logger(), "Discovery complete: found %zu device(s)", devices.size());
  return devices;
}

std::future<tl::expected<std::vector<DiscoveredDevice>, ScanError>>
DiscoveryScanner::scan_async(std::chrono::milliseconds timeout) {
  // The worker gets its own copy of the scanner so the future does not depend on this object
  return std::async(std::launch::async, [config = config_, factory = factory_, timeout]() {
    DiscoveryScanner worker(config, factory);
    return worker.scan(timeout);
  });
}

std::string to_string(ScanErrorCode code) {
  switch (code) {
    case ScanErrorCode::SocketCreate:
      return "socket-create";
    case ScanErrorCode::SocketOption:
      return "socket-option";
    case ScanErrorCode::Bind:
      return "bind";
    case ScanErrorCode::Send:
      return "send";
  }
  return "unknown";
}

}  // namespace discovery
}  // namespace ap_onboard
