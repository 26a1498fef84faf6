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

#include "ap_onboard/session/scripted_session_strategy.hpp"

#include <rclcpp/rclcpp.hpp>
#include <sstream>
#include <utility>

#include "ap_onboard/session/output_classifier.hpp"
#include "ap_onboard/session/temp_script_file.hpp"

namespace ap_onboard {

namespace {

rclcpp::Logger logger() {
  return rclcpp::get_logger("expect_session");
}

}  // namespace

ScriptedSessionStrategy::ScriptedSessionStrategy(SessionConfig config, std::shared_ptr<ProcessRunner> runner)
  : config_(std::move(config)), runner_(std::move(runner)) {
  if (!runner_) {
    runner_ = std::make_shared<ProcessRunner>();
  }
}

std::string ScriptedSessionStrategy::tcl_quote(const std::string & value) {
  // Double-quoted word with every substitution character escaped
  std::string quoted = "\"";
  for (char c : value) {
    switch (c) {
      case '\\':
      case '"':
      case '$':
      case '[':
      case ']':
      case '{':
      case '}':
        quoted += '\\';
        quoted += c;
        break;
      case '\n':
        quoted += "\\n";
        break;
      case '\r':
        quoted += "\\r";
        break;
      case '\t':
        quoted += "\\t";
        break;
      default:
        quoted += c;
        break;
    }
  }
  quoted += "\"";
  return quoted;
}

std::string ScriptedSessionStrategy::build_script(const SessionTarget & target) const {
  auto argv = ssh_client_arguments(target, config_);
  argv.push_back(build_inform_command(target.inform_url));

  const auto timeout_s = std::chrono::duration_cast<std::chrono::seconds>(process_deadline(config_)).count();

  std::ostringstream script;
  script << "#!/usr/bin/expect -f\n";
  script << "set timeout " << timeout_s << "\n";
  script << "log_user 1\n";
  script << "set prompts 0\n";
  script << "spawn";
  for (const auto & arg : argv) {
    script << " " << tcl_quote(arg);
  }
  script << "\n";
  script << "expect {\n";
  script << "  \"assword:\" {\n";
  script << "    incr prompts\n";
  script << "    if {$prompts > 1} {\n";
  script << "      puts \"\\nPermission denied (password prompt repeated)\"\n";
  script << "      exit " << EXIT_AUTH_FAILED << "\n";
  script << "    }\n";
  script << "    send -- " << tcl_quote(effective_password(target, config_) + "\r") << "\n";
  script << "    exp_continue\n";
  script << "  }\n";
  script << "  \"Connection refused\" { exit " << EXIT_CONNECTION_REFUSED << " }\n";
  script << "  \"timed out\" { exit " << EXIT_TIMEOUT << " }\n";
  script << "  timeout {\n";
  script << "    puts \"\\nConnection timed out\"\n";
  script << "    exit " << EXIT_TIMEOUT << "\n";
  script << "  }\n";
  script << "  eof\n";
  script << "}\n";
  script << "set result [wait]\n";
  script << "exit [lindex $result 3]\n";
  return script.str();
}

SessionOutcome ScriptedSessionStrategy::open_and_run(const SessionTarget & target) {
  RCLCPP_INFO(logger(), "Connecting to %s via system SSH (expect)...", target.host.c_str());

  if (!runner_->is_command_available(AUTOMATION_BINARY)) {
    return session_failure(FailureKind::Other, "expect is not installed");
  }
  if (!runner_->is_command_available("ssh")) {
    return session_failure(FailureKind::Other, "ssh client is not installed");
  }

  auto script = TempScriptFile::create("ap_onboard_adopt", build_script(target));
  if (!script) {
    return session_failure(FailureKind::Other, script.error());
  }

  // One extra second so the script's own timeout verdict wins over the hard kill
  auto run = runner_->run({AUTOMATION_BINARY, "-f", script->path()},
                          process_deadline(config_) + std::chrono::seconds(1));
  if (!run) {
    return session_failure(FailureKind::Other, "Failed to run expect: " + run.error());
  }

  const auto & result = *run;
  if (result.timed_out) {
    return session_failure(FailureKind::ConnectionTimeout, "Timed out connecting to " + target.host);
  }

  const std::string output = strip_automation_artifacts(result.stdout_output);
  RCLCPP_DEBUG(logger(), "expect output: %s", output.c_str());

  switch (result.exit_code) {
    case 0:
      return classify_command_output(output);
    case EXIT_AUTH_FAILED:
      return session_failure(FailureKind::AuthenticationFailed, auth_failed_message(target.host));
    case EXIT_CONNECTION_REFUSED:
      return session_failure(FailureKind::ConnectionRefused, "Connection refused at " + target.host);
    case EXIT_TIMEOUT:
      return session_failure(FailureKind::ConnectionTimeout, "Timed out connecting to " + target.host);
    default:
      break;
  }

  auto error = classify_process_failure(trim_copy(output + "\n" + result.stderr_output), target.host);
  return tl::make_unexpected(error);
}

}  // namespace ap_onboard
