#include <gtest/gtest.h>
#include "../../include/quorumkv/kv/command.hpp"

using namespace quorumkv::kv;

TEST(CommandTest, ParsesSet) {
    Command cmd;
    ASSERT_TRUE(Command::deserialize("SET foo bar", cmd));
    EXPECT_EQ(cmd.type, CommandType::SET);
    EXPECT_EQ(cmd.key, "foo");
    EXPECT_EQ(cmd.value, "bar");
}

TEST(CommandTest, ParsesDelete) {
    Command cmd;
    ASSERT_TRUE(Command::deserialize("DELETE foo", cmd));
    EXPECT_EQ(cmd.type, CommandType::DELETE);
    EXPECT_EQ(cmd.key, "foo");
    EXPECT_TRUE(cmd.value.empty());
}

TEST(CommandTest, CollapsesRepeatedWhitespace) {
    Command cmd;
    ASSERT_TRUE(Command::deserialize("  SET\tfoo   bar\n", cmd));
    EXPECT_EQ(cmd.key, "foo");
    EXPECT_EQ(cmd.value, "bar");
}

TEST(CommandTest, MalformedInputIsRejected) {
    const char* inputs[] = {
        "",
        "   ",
        "SET onlytoken",
        "SET a b c",
        "DELETE",
        "DELETE a b",
        "PUT a b",
        "set a b",
        "GET a",
    };

    for (const char* input : inputs) {
        Command cmd(CommandType::DELETE, "untouched");
        EXPECT_FALSE(Command::deserialize(input, cmd)) << "input: '" << input << "'";
        EXPECT_EQ(cmd.key, "untouched");
    }
}

TEST(CommandTest, SerializeMatchesGrammar) {
    EXPECT_EQ(Command(CommandType::SET, "k", "v").serialize(), "SET k v");
    EXPECT_EQ(Command(CommandType::DELETE, "k").serialize(), "DELETE k");

    Command cmd;
    ASSERT_TRUE(Command::deserialize(Command(CommandType::SET, "user:1", "{\"a\":1}").serialize(), cmd));
    EXPECT_EQ(cmd.value, "{\"a\":1}");
}

TEST(CommandTest, Validity) {
    EXPECT_TRUE(Command(CommandType::SET, "k", "v").is_valid());
    EXPECT_TRUE(Command(CommandType::DELETE, "k").is_valid());

    EXPECT_FALSE(Command(CommandType::SET, "", "v").is_valid());
    EXPECT_FALSE(Command(CommandType::SET, "k", "").is_valid());
    EXPECT_FALSE(Command(CommandType::SET, "k", "two words").is_valid());
    EXPECT_FALSE(Command(CommandType::SET, "a key", "v").is_valid());
    EXPECT_FALSE(Command(CommandType::DELETE, "").is_valid());
}
