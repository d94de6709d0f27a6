#include "peer/internal/commands.hpp"

#include <gtest/gtest.h>

using namespace p2ps;

TEST(CommandsTest, NoArgCommands) {
    EXPECT_EQ(parseCommand("exit")->code, EXIT);
    EXPECT_EQ(parseCommand("help")->code, HELP);
    EXPECT_EQ(parseCommand("samples")->code, SAMPLES);
    EXPECT_EQ(parseCommand("  list  ")->code, LIST);
    EXPECT_EQ(parseCommand("mine")->code, MINE);
    EXPECT_EQ(parseCommand("disconnect")->code, DISCONNECT);
    EXPECT_EQ(parseCommand("status")->code, STATUS);
}

TEST(CommandsTest, UnknownOrEmpty) {
    EXPECT_FALSE(parseCommand("").has_value());
    EXPECT_FALSE(parseCommand("   ").has_value());
    EXPECT_FALSE(parseCommand("bogus").has_value());
    EXPECT_FALSE(parseCommand("list everything").has_value());
}

TEST(CommandsTest, ConnectMapsLocalhost) {
    auto cmd = parseCommand("connect localhost 5001");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->code, CONNECT);
    EXPECT_EQ(cmd->ip, "127.0.0.1");
    EXPECT_EQ(cmd->port, 5001);
}

TEST(CommandsTest, TestTakesAddress) {
    auto cmd = parseCommand("test 192.168.1.20 6000");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->code, TEST_PEER);
    EXPECT_EQ(cmd->ip, "192.168.1.20");
    EXPECT_EQ(cmd->port, 6000);
}

TEST(CommandsTest, PeerCommandsNeedValidPort) {
    EXPECT_FALSE(parseCommand("connect 127.0.0.1").has_value());
    EXPECT_FALSE(parseCommand("connect 127.0.0.1 70000").has_value());
    EXPECT_FALSE(parseCommand("connect 127.0.0.1 port").has_value());
    EXPECT_FALSE(parseCommand("test 127.0.0.1 0").has_value());
}

TEST(CommandsTest, DownloadKeepsSpacesInName) {
    auto cmd = parseCommand("download   my notes.txt  ");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->code, DOWNLOAD);
    EXPECT_EQ(cmd->f_name, "my notes.txt");

    EXPECT_FALSE(parseCommand("download").has_value());
    EXPECT_FALSE(parseCommand("download   ").has_value());
}

TEST(CommandsTest, ParsePort) {
    EXPECT_EQ(parsePort("5000"), std::optional<uint16_t>(5000));
    EXPECT_EQ(parsePort("65535", 1024), std::optional<uint16_t>(65535));
    EXPECT_EQ(parsePort("1024", 1024), std::optional<uint16_t>(1024));

    EXPECT_EQ(parsePort("1023", 1024), std::nullopt);
    EXPECT_EQ(parsePort("65536"), std::nullopt);
    EXPECT_EQ(parsePort("0"), std::nullopt);
    EXPECT_EQ(parsePort("-5"), std::nullopt);
    EXPECT_EQ(parsePort(""), std::nullopt);
    EXPECT_EQ(parsePort("123456"), std::nullopt);
}

TEST(CommandsTest, SplitArgs) {
    EXPECT_EQ(splitArgs("  a   b\tc "), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(splitArgs("").empty());
}
