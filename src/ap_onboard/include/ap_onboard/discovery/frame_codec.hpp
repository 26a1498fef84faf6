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

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ap_onboard {
namespace discovery {

/// TLV type codes of the vendor discovery protocol
constexpr uint8_t TLV_MAC_ADDRESS = 0x01;
constexpr uint8_t TLV_IP_INFO = 0x02;
constexpr uint8_t TLV_FIRMWARE = 0x03;
constexpr uint8_t TLV_MANAGED = 0x06;
constexpr uint8_t TLV_PLATFORM = 0x0B;
constexpr uint8_t TLV_MODEL = 0x14;

/// Length of the response header preceding the TLV records
constexpr size_t RESPONSE_HEADER_SIZE = 4;

/// type (1 byte) + big-endian length (2 bytes)
constexpr size_t TLV_HEADER_SIZE = 3;

constexpr size_t MAC_LENGTH = 6;

/**
 * @brief A device that answered the discovery broadcast
 *
 * Identity is the MAC address. `ip` is the UDP source address of the reply and is the only
 * address used for follow-up connections; `reported_ip` is whatever the device put in its
 * payload and may be unreachable (WAN address, second interface).
 */
struct DiscoveredDevice {
  std::string mac;
  std::string ip;
  std::string reported_ip;
  std::string model;
  std::string firmware;
  std::string hostname;
  bool is_managed{false};
};

/// Build the fixed 4-byte discovery request
std::vector<uint8_t> encode_probe();

/// Check that a datagram is exactly the discovery request
bool is_probe(const uint8_t * data, size_t size);
bool is_probe(const std::vector<uint8_t> & data);

/**
 * @brief Decode one discovery response
 *
 * Records whose declared length runs past the end of the buffer stop the parse; fields
 * decoded up to that point are kept. Unknown record types are skipped.
 *
 * @param data Raw datagram
 * @param size Number of valid bytes in data
 * @param source_ip Address the datagram was received from
 * @return The device, or std::nullopt when no MAC record was decoded
 */
std::optional<DiscoveredDevice> decode_response(const uint8_t * data, size_t size, const std::string & source_ip);

std::optional<DiscoveredDevice> decode_response(const std::vector<uint8_t> & data, const std::string & source_ip);

/// Render 6 bytes as "AA:BB:CC:DD:EE:FF"
std::string format_mac(const uint8_t * bytes);

/// JSON representation used by the REST API
nlohmann::json to_json(const DiscoveredDevice & device);

}  // namespace discovery
}  // namespace ap_onboard
