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

#include <array>
#include <string>

namespace ap_onboard {

/**
 * @brief Algorithms offered during SSH negotiation, in preference order
 *
 * Factory-default access points run old Dropbear builds that only know the legacy
 * Diffie-Hellman groups, and that advertise rsa-sha2-256 while still signing the host key
 * with SHA-1. `ssh-rsa` therefore has to be the first host-key algorithm so both ends
 * verify with the same hash. These lists replace the library defaults; do not reorder.
 */
constexpr std::array<const char *, 6> KEX_ALGORITHMS = {
    "curve25519-sha256",             "curve25519-sha256@libssh.org", "diffie-hellman-group16-sha512",
    "diffie-hellman-group14-sha256", "diffie-hellman-group14-sha1",  "diffie-hellman-group1-sha1",
};

constexpr std::array<const char *, 7> HOST_KEY_ALGORITHMS = {
    "ssh-rsa",     "rsa-sha2-256",        "rsa-sha2-512",        "ssh-ed25519",
    "ecdsa-sha2-nistp256", "ecdsa-sha2-nistp384", "ecdsa-sha2-nistp521",
};

/// Legacy key exchanges the system ssh client must additionally allow
constexpr std::array<const char *, 2> LEGACY_KEX_ALGORITHMS = {
    "diffie-hellman-group14-sha1",
    "diffie-hellman-group1-sha1",
};

/// Host-key algorithm the system ssh client is restricted to
constexpr const char * LEGACY_HOST_KEY_ALGORITHM = "ssh-rsa";

/// Join a list into the comma-separated form used by ssh options
template <size_t N>
std::string join_algorithms(const std::array<const char *, N> & algorithms) {
  std::string joined;
  for (const char * name : algorithms) {
    if (!joined.empty()) {
      joined += ',';
    }
    joined += name;
  }
  return joined;
}

}  // namespace ap_onboard
