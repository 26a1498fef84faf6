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

#include "ap_onboard/session/process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

extern char ** environ;

namespace ap_onboard {

namespace {

constexpr std::chrono::milliseconds REAP_POLL_INTERVAL{5};

// Closes a pipe end once and only once
class FdGuard {
 public:
  explicit FdGuard(int fd = -1) : fd_(fd) {
  }
  ~FdGuard() {
    reset();
  }
  FdGuard(const FdGuard &) = delete;
  FdGuard & operator=(const FdGuard &) = delete;

  int get() const {
    return fd_;
  }
  void reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

 private:
  int fd_;
};

bool make_pipe(FdGuard & read_end, FdGuard & write_end) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return false;
  }
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
  return true;
}

std::vector<std::string> build_environment(const EnvironmentOverrides & overrides) {
  std::vector<std::string> entries;
  for (char ** e = environ; e != nullptr && *e != nullptr; ++e) {
    std::string entry(*e);
    auto eq = entry.find('=');
    std::string name = entry.substr(0, eq);
    bool overridden = false;
    for (const auto & [key, value] : overrides) {
      if (key == name) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      entries.push_back(std::move(entry));
    }
  }
  for (const auto & [key, value] : overrides) {
    entries.push_back(key + "=" + value);
  }
  return entries;
}

std::string trim(const std::string & s) {
  const char * ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

}  // namespace

std::string ProcessResult::combined() const {
  return trim(stdout_output + "\n" + stderr_output);
}

tl::expected<ProcessResult, std::string> ProcessRunner::run(const std::vector<std::string> & argv,
                                                            std::chrono::milliseconds timeout,
                                                            const EnvironmentOverrides & env) {
  if (argv.empty()) {
    return tl::make_unexpected(std::string("No command given"));
  }

  // Prepare everything the child needs before fork()
  std::vector<char *> child_argv;
  for (const auto & arg : argv) {
    child_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  child_argv.push_back(nullptr);

  auto env_entries = build_environment(env);
  std::vector<char *> child_env;
  for (auto & entry : env_entries) {
    child_env.push_back(const_cast<char *>(entry.c_str()));
  }
  child_env.push_back(nullptr);

  FdGuard out_read, out_write, err_read, err_write, exec_read, exec_write;
  if (!make_pipe(out_read, out_write) || !make_pipe(err_read, err_write) || !make_pipe(exec_read, exec_write)) {
    return tl::make_unexpected("Failed to create pipes for " + argv[0] + ": " + std::strerror(errno));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    return tl::make_unexpected("Failed to fork for " + argv[0] + ": " + std::strerror(errno));
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
    }
    ::dup2(out_write.get(), STDOUT_FILENO);
    ::dup2(err_write.get(), STDERR_FILENO);
    ::execvpe(child_argv[0], child_argv.data(), child_env.data());
    int exec_errno = errno;
    ssize_t ignored = ::write(exec_write.get(), &exec_errno, sizeof(exec_errno));
    (void)ignored;
    ::_exit(127);
  }

  // Parent
  out_write.reset();
  err_write.reset();
  exec_write.reset();

  int exec_errno = 0;
  ssize_t n = ::read(exec_read.get(), &exec_errno, sizeof(exec_errno));
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    return tl::make_unexpected("Failed to run " + argv[0] + ": " + std::strerror(exec_errno));
  }

  ProcessResult result;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<char, 4096> buffer;
  bool out_open = true;
  bool err_open = true;

  while (out_open || err_open) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      result.timed_out = true;
      ::kill(-pid, SIGKILL);
      break;
    }
    int wait_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());

    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (out_open) {
      fds[count++] = pollfd{out_read.get(), POLLIN, 0};
    }
    if (err_open) {
      fds[count++] = pollfd{err_read.get(), POLLIN, 0};
    }

    int ready = ::poll(fds.data(), count, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::kill(-pid, SIGKILL);
      break;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      ssize_t got = ::read(fds[i].fd, buffer.data(), buffer.size());
      bool is_out = fds[i].fd == out_read.get();
      if (got > 0) {
        (is_out ? result.stdout_output : result.stderr_output).append(buffer.data(), static_cast<size_t>(got));
      } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
        (is_out ? out_open : err_open) = false;
      }
    }
  }

  // Both pipes can reach EOF while the child keeps running, so reaping is bounded too
  int status = 0;
  while (true) {
    pid_t reaped = ::waitpid(pid, &status, WNOHANG);
    if (reaped == pid) {
      break;
    }
    if (reaped < 0 && errno != EINTR) {
      return tl::make_unexpected("Failed to wait for " + argv[0] + ": " + std::strerror(errno));
    }
    if (reaped == 0 && std::chrono::steady_clock::now() >= deadline && !result.timed_out) {
      result.timed_out = true;
      ::kill(-pid, SIGKILL);
    }
    std::this_thread::sleep_for(REAP_POLL_INTERVAL);
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }

  return result;
}

bool ProcessRunner::is_command_available(const std::string & command) {
  if (command.empty()) {
    return false;
  }
  if (command.find('/') != std::string::npos) {
    return access(command.c_str(), X_OK) == 0;
  }

  // Search in PATH for the command using access() instead of system()
  const char * path_env = std::getenv("PATH");
  if (!path_env) {
    return false;
  }

  std::string path(path_env);
  std::istringstream ss(path);
  std::string dir;

  while (std::getline(ss, dir, ':')) {
    if (dir.empty()) {
      continue;
    }
    std::string full_path = dir + "/" + command;
    if (access(full_path.c_str(), X_OK) == 0) {
      return true;
    }
  }

  return false;
}

std::string ProcessRunner::escape_shell_arg(const std::string & arg) {
  std::string escaped = "'";
  for (char c : arg) {
    if (c == '\'') {
      escaped += "'\\''";
    } else {
      escaped += c;
    }
  }
  escaped += "'";
  return escaped;
}

}  // namespace ap_onboard
