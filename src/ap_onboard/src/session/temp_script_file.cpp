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

#include "ap_onboard/session/temp_script_file.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <rclcpp/rclcpp.hpp>
#include <system_error>
#include <utility>
#include <vector>

namespace ap_onboard {

tl::expected<TempScriptFile, std::string> TempScriptFile::create(const std::string & prefix,
                                                                 const std::string & contents) {
  std::error_code ec;
  auto dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    dir = "/tmp";
  }

  std::string pattern = (dir / (prefix + "_XXXXXX")).string();
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');

  int fd = ::mkstemp(name.data());
  if (fd < 0) {
    return tl::make_unexpected("Failed to create script file: " + std::string(std::strerror(errno)));
  }

  // From here on the file exists; the guard removes it if anything below fails
  TempScriptFile file(std::string(name.data()));

  if (::fchmod(fd, S_IRWXU) != 0) {
    std::string error = "Failed to chmod script file: " + std::string(std::strerror(errno));
    ::close(fd);
    return tl::make_unexpected(error);
  }

  size_t written = 0;
  while (written < contents.size()) {
    ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::string error = "Failed to write script file: " + std::string(std::strerror(errno));
      ::close(fd);
      return tl::make_unexpected(error);
    }
    written += static_cast<size_t>(n);
  }

  if (::close(fd) != 0) {
    return tl::make_unexpected("Failed to close script file: " + std::string(std::strerror(errno)));
  }

  return std::move(file);
}

TempScriptFile::TempScriptFile(std::string path) : path_(std::move(path)) {
}

TempScriptFile::~TempScriptFile() {
  remove();
}

TempScriptFile::TempScriptFile(TempScriptFile && other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

TempScriptFile & TempScriptFile::operator=(TempScriptFile && other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

void TempScriptFile::remove() {
  if (path_.empty()) {
    return;
  }
  if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
    RCLCPP_WARN(rclcpp::get_logger("temp_script_file"), "Failed to remove %s: %s", path_.c_str(),
                std::strerror(errno));
  }
  path_.clear();
}

}  // namespace ap_onboard
