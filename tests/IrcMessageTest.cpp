#include "chat/IrcMessage.h"

#include <gtest/gtest.h>

using meshirc::chat::IrcMessage;

TEST(IrcMessage, ParsesVerbParamsAndTrailing) {
    auto msg = IrcMessage::parse("privmsg #meshtastic-ctrl :hello there mesh\r\n");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->verb, "PRIVMSG");
    ASSERT_EQ(msg->param_count(), 2u);
    EXPECT_EQ(msg->param(0), "#meshtastic-ctrl");
    EXPECT_EQ(msg->param(1), "hello there mesh");
    EXPECT_TRUE(msg->has_trailing);
}

TEST(IrcMessage, ParsesPrefix) {
    auto msg = IrcMessage::parse(":op!op@host NICK newnick");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->prefix, "op!op@host");
    EXPECT_EQ(msg->verb, "NICK");
    EXPECT_EQ(msg->param(0), "newnick");
    EXPECT_FALSE(msg->has_trailing);
}

TEST(IrcMessage, UserLineKeepsFourParams) {
    auto msg = IrcMessage::parse("USER op 0 * :Real Name");
    ASSERT_TRUE(msg.has_value());
    ASSERT_EQ(msg->param_count(), 4u);
    EXPECT_EQ(msg->param(3), "Real Name");
}

TEST(IrcMessage, EmptyTrailingIsAParam) {
    auto msg = IrcMessage::parse("TOPIC #room :");
    ASSERT_TRUE(msg.has_value());
    ASSERT_EQ(msg->param_count(), 2u);
    EXPECT_EQ(msg->param(1), "");
}

TEST(IrcMessage, BlankAndVerblessLinesAreIgnored) {
    EXPECT_FALSE(IrcMessage::parse("").has_value());
    EXPECT_FALSE(IrcMessage::parse("   \r\n").has_value());
    EXPECT_FALSE(IrcMessage::parse(":prefix.only").has_value());
}

TEST(IrcMessage, MissingParamReadsAsEmpty) {
    auto msg = IrcMessage::parse("PING");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->param(0), "");
}

TEST(IrcMessage, LongLinesAreTruncated) {
    const std::string text(600, 'x');
    auto msg = IrcMessage::parse("PRIVMSG #room :" + text);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->param(1).size(), IrcMessage::kMaxLineBytes - 2 - std::string("PRIVMSG #room :").size());
}

TEST(IrcMessage, NumericReplyPadsCode) {
    EXPECT_EQ(meshirc::chat::numeric_reply("gw", 1, "op", ":Welcome"), ":gw 001 op :Welcome");
    EXPECT_EQ(meshirc::chat::numeric_reply("gw", 451, "", ":You have not registered"),
              ":gw 451 * :You have not registered");
}
