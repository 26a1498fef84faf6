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

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include "ap_onboard/session/temp_script_file.hpp"

using namespace ap_onboard;

namespace {

bool exists(const std::string & path) {
  return access(path.c_str(), F_OK) == 0;
}

std::string read_all(const std::string & path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

TEST(TempScriptFileTest, CreatesOwnerOnlyExecutableFile) {
  auto file = TempScriptFile::create("ap_onboard_test", "#!/bin/sh\necho hi\n");
  ASSERT_TRUE(file.has_value()) << file.error();

  struct stat st{};
  ASSERT_EQ(stat(file->path().c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0700);
  EXPECT_EQ(read_all(file->path()), "#!/bin/sh\necho hi\n");
}

TEST(TempScriptFileTest, NameCarriesPrefix) {
  auto file = TempScriptFile::create("ap_onboard_prefix", "");
  ASSERT_TRUE(file.has_value()) << file.error();

  EXPECT_NE(file->path().find("ap_onboard_prefix_"), std::string::npos);
}

TEST(TempScriptFileTest, ConcurrentFilesHaveDistinctPaths) {
  auto first = TempScriptFile::create("ap_onboard_test", "a");
  auto second = TempScriptFile::create("ap_onboard_test", "b");
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());

  EXPECT_NE(first->path(), second->path());
  EXPECT_EQ(read_all(first->path()), "a");
  EXPECT_EQ(read_all(second->path()), "b");
}

TEST(TempScriptFileTest, DestructorRemovesFile) {
  std::string path;
  {
    auto file = TempScriptFile::create("ap_onboard_test", "data");
    ASSERT_TRUE(file.has_value());
    path = file->path();
    EXPECT_TRUE(exists(path));
  }
  EXPECT_FALSE(exists(path));
}

TEST(TempScriptFileTest, MoveTransfersOwnership) {
  auto created = TempScriptFile::create("ap_onboard_test", "data");
  ASSERT_TRUE(created.has_value());
  const std::string path = created->path();

  {
    TempScriptFile moved(std::move(*created));
    EXPECT_EQ(moved.path(), path);
    EXPECT_TRUE(created->path().empty());
    EXPECT_TRUE(exists(path));
  }
  EXPECT_FALSE(exists(path));
}

TEST(TempScriptFileTest, MoveAssignmentReleasesPreviousFile) {
  auto first = TempScriptFile::create("ap_onboard_test", "a");
  auto second = TempScriptFile::create("ap_onboard_test", "b");
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  const std::string first_path = first->path();
  const std::string second_path = second->path();

  *first = std::move(*second);

  EXPECT_FALSE(exists(first_path));
  EXPECT_TRUE(exists(second_path));
  EXPECT_EQ(first->path(), second_path);
}

TEST(TempScriptFileTest, AlreadyDeletedFileIsTolerated) {
  std::string path;
  {
    auto file = TempScriptFile::create("ap_onboard_test", "data");
    ASSERT_TRUE(file.has_value());
    path = file->path();
    ASSERT_EQ(unlink(path.c_str()), 0);
  }
  EXPECT_FALSE(exists(path));
}
