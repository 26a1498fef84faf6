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
#include <tl/expected.hpp>

namespace ap_onboard {

/**
 * @brief Owner-only executable file that is deleted when the object goes away
 *
 * Created with mkstemp() in the system temp directory, so concurrent adoptions never share
 * a file. The destructor removes the file on every exit path, including when running it
 * failed.
 */
class TempScriptFile {
 public:
  /**
   * @brief Create the file, write contents and chmod it to 0700
   * @param prefix File name prefix, e.g. "ap_onboard_adopt"
   * @param contents Script text
   */
  static tl::expected<TempScriptFile, std::string> create(const std::string & prefix, const std::string & contents);

  ~TempScriptFile();

  TempScriptFile(const TempScriptFile &) = delete;
  TempScriptFile & operator=(const TempScriptFile &) = delete;

  TempScriptFile(TempScriptFile && other) noexcept;
  TempScriptFile & operator=(TempScriptFile && other) noexcept;

  const std::string & path() const {
    return path_;
  }

 private:
  explicit TempScriptFile(std::string path);

  void remove();

  std::string path_;
};

}  // namespace ap_onboard
