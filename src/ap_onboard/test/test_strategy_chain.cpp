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

#include <memory>
#include <string>
#include <vector>

#include "ap_onboard/adoption/adoption_orchestrator.hpp"
#include "ap_onboard/adoption/strategy_chain.hpp"
#include "fake_process_runner.hpp"

using namespace ap_onboard;
using ap_onboard::test_support::FakeProcessRunner;

namespace {

std::vector<std::string> names(const std::vector<std::unique_ptr<SessionStrategy>> & chain) {
  std::vector<std::string> result;
  for (const auto & strategy : chain) {
    result.push_back(strategy->get_name());
  }
  return result;
}

}  // namespace

TEST(StrategyChainTest, PasswordHelperPreferredWhenInstalled) {
  StrategyChainFactory factory(SessionConfig{});

  auto chain = factory.build(ToolAvailability{true, true});

  EXPECT_EQ(names(chain), (std::vector<std::string>{"sshpass", "libssh"}));
}

TEST(StrategyChainTest, ScriptedUsedWithoutPasswordHelper) {
  StrategyChainFactory factory(SessionConfig{});

  auto chain = factory.build(ToolAvailability{false, true});

  EXPECT_EQ(names(chain), (std::vector<std::string>{"expect", "libssh"}));
}

TEST(StrategyChainTest, NativeAlwaysLast) {
  StrategyChainFactory factory(SessionConfig{});

  for (bool helper : {false, true}) {
    for (bool automation : {false, true}) {
      auto chain = factory.build(ToolAvailability{helper, automation});
      ASSERT_EQ(chain.size(), 2u);
      EXPECT_EQ(chain.back()->get_name(), "libssh");
    }
  }
}

TEST(StrategyChainTest, ProbeAsksRunnerEveryTime) {
  auto runner = std::make_shared<FakeProcessRunner>();
  StrategyChainFactory factory(SessionConfig{}, runner);

  auto tools = factory.probe_tools();
  EXPECT_FALSE(tools.password_helper);
  EXPECT_FALSE(tools.automation);

  runner->installed = {"sshpass"};
  tools = factory.probe_tools();
  EXPECT_TRUE(tools.password_helper);
  EXPECT_FALSE(tools.automation);

  EXPECT_EQ(runner->probes.size(), 4u);
}

TEST(StrategyChainTest, BuildUsesFreshProbe) {
  auto runner = std::make_shared<FakeProcessRunner>();
  StrategyChainFactory factory(SessionConfig{}, runner);

  EXPECT_EQ(names(factory.build()), (std::vector<std::string>{"expect", "libssh"}));

  runner->installed = {"sshpass", "ssh"};
  EXPECT_EQ(names(factory.build()), (std::vector<std::string>{"sshpass", "libssh"}));
}

TEST(StrategyChainTest, ChainPlugsIntoOrchestrator) {
  StrategyChainFactory factory(SessionConfig{});
  AdoptionOrchestrator orchestrator(factory.build(ToolAvailability{true, false}));

  EXPECT_EQ(orchestrator.strategy_names(), (std::vector<std::string>{"sshpass", "libssh"}));
}
