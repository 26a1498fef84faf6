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

#include "ap_onboard/discovery/frame_codec.hpp"

#include <array>

namespace ap_onboard {
namespace discovery {

namespace {

constexpr std::array<uint8_t, 4> PROBE_PAYLOAD = {0x01, 0x00, 0x00, 0x00};

// Firmware strings are not guaranteed to be valid UTF-8. Each maximal ill-formed subpart
// (a truncated sequence, or a byte that cannot start one) becomes a single U+FFFD so the
// record can always be serialized.
std::string to_lossy_utf8(const uint8_t * data, size_t size) {
  static const char * const REPLACEMENT = "\xEF\xBF\xBD";
  std::string out;
  out.reserve(size);

  size_t i = 0;
  while (i < size) {
    const uint8_t c = data[i];
    if (c < 0x80) {
      out += static_cast<char>(c);
      ++i;
      continue;
    }

    size_t len = 0;
    // Allowed range of the second byte; excludes overlongs, surrogates and > U+10FFFF
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
      len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
      len = 3;
      if (c == 0xE0) {
        lo = 0xA0;
      } else if (c == 0xED) {
        hi = 0x9F;
      }
    } else if (c >= 0xF0 && c <= 0xF4) {
      len = 4;
      if (c == 0xF0) {
        lo = 0x90;
      } else if (c == 0xF4) {
        hi = 0x8F;
      }
    }

    if (len == 0) {
      out += REPLACEMENT;
      ++i;
      continue;
    }

    size_t consumed = 1;
    while (consumed < len && i + consumed < size) {
      const uint8_t next = data[i + consumed];
      const bool ok = consumed == 1 ? (next >= lo && next <= hi) : (next & 0xC0) == 0x80;
      if (!ok) {
        break;
      }
      ++consumed;
    }

    if (consumed == len) {
      out.append(reinterpret_cast<const char *>(data + i), len);
    } else {
      out += REPLACEMENT;
    }
    i += consumed;
  }
  return out;
}

std::string format_ipv4(const uint8_t * bytes) {
  return std::to_string(bytes[0]) + "." + std::to_string(bytes[1]) + "." + std::to_string(bytes[2]) + "." +
         std::to_string(bytes[3]);
}

}  // namespace

std::vector<uint8_t> encode_probe() {
  return std::vector<uint8_t>(PROBE_PAYLOAD.begin(), PROBE_PAYLOAD.end());
}

bool is_probe(const uint8_t * data, size_t size) {
  if (data == nullptr || size != PROBE_PAYLOAD.size()) {
    return false;
  }
  for (size_t i = 0; i < size; ++i) {
    if (data[i] != PROBE_PAYLOAD[i]) {
      return false;
    }
  }
  return true;
}

bool is_probe(const std::vector<uint8_t> & data) {
  return is_probe(data.data(), data.size());
}

std::string format_mac(const uint8_t * bytes) {
  static const char HEX[] = "0123456789ABCDEF";
  std::string mac;
  mac.reserve(MAC_LENGTH * 3 - 1);
  for (size_t i = 0; i < MAC_LENGTH; ++i) {
    if (i > 0) {
      mac += ':';
    }
    mac += HEX[(bytes[i] >> 4) & 0x0F];
    mac += HEX[bytes[i] & 0x0F];
  }
  return mac;
}

std::optional<DiscoveredDevice> decode_response(const uint8_t * data, size_t size, const std::string & source_ip) {
  if (data == nullptr || size < RESPONSE_HEADER_SIZE) {
    return std::nullopt;
  }

  DiscoveredDevice device;
  device.ip = source_ip;
  device.reported_ip = source_ip;

  size_t pos = RESPONSE_HEADER_SIZE;
  while (size - pos >= TLV_HEADER_SIZE) {
    const uint8_t type = data[pos];
    const size_t length = (static_cast<size_t>(data[pos + 1]) << 8) | data[pos + 2];
    pos += TLV_HEADER_SIZE;

    // Truncated trailing record: keep what we have
    if (length > size - pos) {
      break;
    }

    const uint8_t * value = data + pos;
    switch (type) {
      case TLV_MAC_ADDRESS:
        if (length == MAC_LENGTH) {
          device.mac = format_mac(value);
        }
        break;
      case TLV_IP_INFO:
        if (length >= 4) {
          device.reported_ip = format_ipv4(value);
        }
        break;
      case TLV_FIRMWARE:
        device.firmware = to_lossy_utf8(value, length);
        break;
      case TLV_MODEL:
        device.model = to_lossy_utf8(value, length);
        break;
      case TLV_PLATFORM:
        device.hostname = to_lossy_utf8(value, length);
        break;
      case TLV_MANAGED:
        device.is_managed = true;
        break;
      default:
        break;
    }

    pos += length;
  }

  if (device.mac.empty()) {
    return std::nullopt;
  }
  return device;
}

std::optional<DiscoveredDevice> decode_response(const std::vector<uint8_t> & data, const std::string & source_ip) {
  return decode_response(data.data(), data.size(), source_ip);
}

nlohmann::json to_json(const DiscoveredDevice & device) {
  return {{"mac", device.mac},           {"ip", device.ip},
          {"reportedIp", device.reported_ip}, {"model", device.model},
          {"firmware", device.firmware}, {"hostname", device.hostname},
          {"isManaged", device.is_managed}};
}

}  // namespace discovery
}  // namespace ap_onboard
