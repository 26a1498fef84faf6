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
#include <tl/expected.hpp>
#include <utility>
#include <vector>

namespace ap_onboard {

/// Result of a finished (or killed) child process
struct ProcessResult {
  /// Exit status, or 128 + signal number when the child was killed
  int exit_code{-1};
  /// True when the deadline expired and the child was killed
  bool timed_out{false};
  std::string stdout_output;
  std::string stderr_output;

  /// stdout and stderr joined by a newline, trimmed
  std::string combined() const;
};

using EnvironmentOverrides = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Runs external programs with a deadline and captures their output
 *
 * Programs are started with fork/execvp (no shell), so arguments never need quoting.
 * The child runs in its own process group; on deadline the whole group is killed.
 */
class ProcessRunner {
 public:
  ProcessRunner() = default;
  virtual ~ProcessRunner() = default;

  /**
   * @brief Execute argv[0] with arguments and wait for it
   * @param argv Program and arguments
   * @param timeout Deadline for the whole run
   * @param env Variables added to (or replacing in) the inherited environment
   * @return Result, or an error message when the program could not be started
   */
  virtual tl::expected<ProcessResult, std::string> run(const std::vector<std::string> & argv,
                                                       std::chrono::milliseconds timeout,
                                                       const EnvironmentOverrides & env = {});

  /**
   * @brief Check if command exists in PATH
   *
   * Evaluated on every call; installation state may change while the process runs.
   */
  virtual bool is_command_available(const std::string & command);

  /**
   * @brief Escape shell arguments
   */
  static std::string escape_shell_arg(const std::string & arg);
};

}  // namespace ap_onboard
