#include "gtest/gtest.h"
#include "sandbox/command_gate.hpp"

using namespace std;
using namespace vibe;

class CommandGateTest : public ::testing::Test {
};

TEST_F(CommandGateTest, BlocksPackageManagers) {
    EXPECT_FALSE(is_command_allowed("pip install requests"));
    EXPECT_FALSE(is_command_allowed("cd app && npm install"));
    EXPECT_FALSE(is_command_allowed("sudo apt-get install curl"));
    EXPECT_FALSE(is_command_allowed("cargo add serde"));
    EXPECT_FALSE(is_command_allowed("python3 -m pip install flask"));
}

TEST_F(CommandGateTest, MatchesCaseInsensitively) {
    EXPECT_FALSE(is_command_allowed("PIP INSTALL numpy"));
    EXPECT_FALSE(is_command_allowed("Brew Install wget"));
}

TEST_F(CommandGateTest, AllowsOrdinaryCommands) {
    EXPECT_TRUE(is_command_allowed("python3 main.py"));
    EXPECT_TRUE(is_command_allowed("ls -la"));
    EXPECT_TRUE(is_command_allowed("pip list"));
    EXPECT_TRUE(is_command_allowed(""));
}

TEST_F(CommandGateTest, SubstringMatchOverBlocks) {
    // 子串匹配会误伤引号中的内容
    EXPECT_FALSE(is_command_allowed("echo 'pip install is forbidden'"));
}

TEST_F(CommandGateTest, ReportsMatchedPattern) {
    auto pattern = find_blocked_pattern("yarn add lodash");
    ASSERT_TRUE(pattern);
    EXPECT_EQ(*pattern, "yarn add");
    EXPECT_FALSE(find_blocked_pattern("yarn --version"));

    string message = blocked_command_message(*pattern);
    EXPECT_EQ(message.rfind(BLOCKED_MARKER, 0), 0u);
    EXPECT_NE(message.find("'yarn add'"), string::npos);
}

TEST_F(CommandGateTest, NpmShortInstallNeedsTrailingSpace) {
    EXPECT_FALSE(is_command_allowed("npm i lodash"));
    EXPECT_TRUE(is_command_allowed("npm info"));
}
