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

#include <string>

#include "ap_onboard/session/session_types.hpp"

namespace ap_onboard {

/**
 * @brief Decide whether set-inform output means success
 *
 * The firmware does not reliably set a non-zero exit code when set-inform fails, so the text
 * is the primary signal: output mentioning "error" without mentioning "inform" is a
 * CommandFailed. Matching is case-insensitive.
 *
 * @return Trimmed output on success
 */
SessionOutcome classify_command_output(const std::string & output);

/**
 * @brief Map the output of a failed ssh client run to a failure kind
 * @param combined stdout and stderr of the client
 * @param host Target host, used in the message
 */
SessionError classify_process_failure(const std::string & combined, const std::string & host);

/**
 * @brief Remove lines echoed by the automation itself
 *
 * Drops the expect spawn banner, password prompts, "Warning: Permanently added" known-hosts
 * notices and blank lines, so banner text cannot trip the "error" heuristic.
 */
std::string strip_automation_artifacts(const std::string & output);

/// Message used for every AuthenticationFailed outcome
std::string auth_failed_message(const std::string & host);

std::string trim_copy(const std::string & text);

}  // namespace ap_onboard
