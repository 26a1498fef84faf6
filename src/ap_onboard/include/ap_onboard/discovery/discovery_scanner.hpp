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

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <tl/expected.hpp>
#include <unordered_set>
#include <vector>

#include "ap_onboard/config.hpp"
#include "ap_onboard/discovery/datagram_transport.hpp"
#include "ap_onboard/discovery/frame_codec.hpp"

namespace ap_onboard {
namespace discovery {

/// Size of the receive buffer; larger datagrams are truncated by the kernel
constexpr size_t RECV_BUFFER_SIZE = 4096;

/**
 * @brief Accumulates decoded devices for one scan, deduplicated by MAC
 *
 * The first response for a MAC wins; later responses for the same MAC are discarded.
 * Insertion order is preserved.
 */
class DeviceCollector {
 public:
  /// @return true if the device was new
  bool add(DiscoveredDevice device);

  /// Decode a raw frame and add it. @return true if a new device was recorded
  bool add_frame(const uint8_t * data, size_t size, const std::string & source_ip);

  const std::vector<DiscoveredDevice> & devices() const {
    return devices_;
  }

  std::vector<DiscoveredDevice> take();

 private:
  std::vector<DiscoveredDevice> devices_;
  std::unordered_set<std::string> seen_macs_;
};

using TransportFactory = std::function<std::unique_ptr<DatagramTransport>(std::chrono::milliseconds)>;

/**
 * @brief Broadcasts the discovery probe and collects replies
 *
 * Each scan creates its own transport through the factory and destroys it before returning,
 * so no socket outlives or is shared between scans.
 */
class DiscoveryScanner {
 public:
  /// @param factory Transport factory; defaults to UdpBroadcastTransport
  explicit DiscoveryScanner(DiscoveryConfig config = DiscoveryConfig{}, TransportFactory factory = nullptr);

  /// Scan with the configured timeout
  tl::expected<std::vector<DiscoveredDevice>, ScanError> scan();

  /**
   * @brief Send one probe and collect replies until `timeout` elapses
   *
   * Setup failures are returned as ScanError. A receive failure other than a timeout ends
   * collection early and the devices gathered so far are returned.
   */
  tl::expected<std::vector<DiscoveredDevice>, ScanError> scan(std::chrono::milliseconds timeout);

  /// Run scan(timeout) on a dedicated worker thread
  std::future<tl::expected<std::vector<DiscoveredDevice>, ScanError>> scan_async(std::chrono::milliseconds timeout);

  const DiscoveryConfig & config() const {
    return config_;
  }

 private:
  DiscoveryConfig config_;
  TransportFactory factory_;
};

/// Human-readable name of a scan error code
std::string to_string(ScanErrorCode code);

}  // namespace discovery
}  // namespace ap_onboard
