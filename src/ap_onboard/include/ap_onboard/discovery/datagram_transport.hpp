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
#include <cstddef>
#include <cstdint>
#include <string>
#include <tl/expected.hpp>
#include <vector>

namespace ap_onboard {
namespace discovery {

/// Transport setup failures that abort a scan
enum class ScanErrorCode {
  SocketCreate,  // socket() failed
  SocketOption,  // setsockopt() failed
  Bind,          // bind() to the ephemeral port failed
  Send           // broadcast sendto() failed
};

/// Typed error for discovery scans
struct ScanError {
  ScanErrorCode code;
  std::string message;
};

enum class ReceiveStatus {
  Datagram,  // `size` bytes were written to the buffer
  Timeout,      // nothing arrived before the wait expired
  Interrupted,  // the wait ended early with nothing read (signal, spurious wakeup); retry
  Error         // any other receive failure
};

struct ReceiveResult {
  ReceiveStatus status{ReceiveStatus::Timeout};
  size_t size{0};
  std::string source_ip;
  std::string error;
};

/**
 * @brief Datagram socket used by the discovery scanner
 *
 * One instance serves exactly one scan. Implementations release the underlying socket in
 * close() and in their destructor.
 */
class DatagramTransport {
 public:
  virtual ~DatagramTransport() = default;

  /// Create the socket, enable broadcast and bind to an ephemeral local port
  virtual tl::expected<void, ScanError> open() = 0;

  /// Send payload to the IPv4 limited-broadcast address on `port`
  virtual tl::expected<void, ScanError> send_broadcast(const std::vector<uint8_t> & payload, uint16_t port) = 0;

  /// Wait up to `wait` for one datagram and copy at most `capacity` bytes into `buffer`
  virtual ReceiveResult receive(uint8_t * buffer, size_t capacity, std::chrono::milliseconds wait) = 0;

  virtual void close() = 0;
};

}  // namespace discovery
}  // namespace ap_onboard
