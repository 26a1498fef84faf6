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
#include <string>

#include "ap_onboard/discovery/datagram_transport.hpp"

namespace ap_onboard {
namespace discovery {

/**
 * @brief POSIX UDP socket bound to 0.0.0.0:0 with SO_BROADCAST enabled
 */
class UdpBroadcastTransport : public DatagramTransport {
 public:
  /// @param receive_timeout Value applied as SO_RCVTIMEO on the socket
  explicit UdpBroadcastTransport(std::chrono::milliseconds receive_timeout);
  ~UdpBroadcastTransport() override;

  UdpBroadcastTransport(const UdpBroadcastTransport &) = delete;
  UdpBroadcastTransport & operator=(const UdpBroadcastTransport &) = delete;

  tl::expected<void, ScanError> open() override;
  tl::expected<void, ScanError> send_broadcast(const std::vector<uint8_t> & payload, uint16_t port) override;
  ReceiveResult receive(uint8_t * buffer, size_t capacity, std::chrono::milliseconds wait) override;
  void close() override;

 private:
  std::chrono::milliseconds receive_timeout_;
  int fd_{-1};
};

}  // namespace discovery
}  // namespace ap_onboard
