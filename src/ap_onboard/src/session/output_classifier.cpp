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

#include "ap_onboard/session/output_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace ap_onboard {

namespace {

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

bool contains(const std::string & haystack, const std::string & needle) {
  return haystack.find(needle) != std::string::npos;
}

bool starts_with(const std::string & text, const std::string & prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

std::string trim_copy(const std::string & text) {
  const char * ws = " \t\r\n";
  auto begin = text.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = text.find_last_not_of(ws);
  return text.substr(begin, end - begin + 1);
}

std::string auth_failed_message(const std::string & host) {
  return "Authentication failed for " + host + " - password may have been changed from factory default";
}

SessionOutcome classify_command_output(const std::string & output) {
  std::string trimmed = trim_copy(output);
  std::string lower = to_lower(trimmed);

  // Typical success: "Adoption request sent to http://...  Firmware '...'  AP-ID[...]"
  if (contains(lower, "error") && !contains(lower, "inform")) {
    return session_failure(FailureKind::CommandFailed, "set-inform returned an error: " + trimmed);
  }
  return trimmed;
}

SessionError classify_process_failure(const std::string & combined, const std::string & host) {
  if (contains(combined, "Permission denied") || contains(combined, "Authentication failed")) {
    return SessionError{FailureKind::AuthenticationFailed, auth_failed_message(host)};
  }
  if (contains(combined, "Connection refused")) {
    return SessionError{FailureKind::ConnectionRefused, "Connection refused at " + host};
  }
  if (contains(combined, "timed out") || contains(combined, "Connection timeout")) {
    return SessionError{FailureKind::ConnectionTimeout, "Timed out connecting to " + host};
  }
  return SessionError{FailureKind::Other, "Failed to connect to " + host + ": " + trim_copy(combined)};
}

std::string strip_automation_artifacts(const std::string & output) {
  std::istringstream in(output);
  std::string line;
  std::string kept;

  while (std::getline(in, line)) {
    std::string clean = trim_copy(line);
    if (clean.empty()) {
      continue;
    }
    if (starts_with(clean, "spawn ")) {
      continue;
    }
    if (contains(to_lower(clean), "password:")) {
      continue;
    }
    if (starts_with(clean, "Warning: Permanently added")) {
      continue;
    }
    if (!kept.empty()) {
      kept += '\n';
    }
    kept += clean;
  }
  return kept;
}

}  // namespace ap_onboard
