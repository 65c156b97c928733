#include "util/Strings.hpp"
#include "util/Time.hpp"

#include <gtest/gtest.h>

namespace util = meshirc::util;

TEST(Strings, IrcCasemappingFoldsBrackets) {
    EXPECT_EQ(util::irc_lower("Op[Away]\\~"), "op{away}|^");
    EXPECT_TRUE(util::irc_equals("NICK[1]", "nick{1}"));
    EXPECT_FALSE(util::irc_equals("nick", "nick2"));
}

TEST(Strings, SplitFirstWord) {
    auto [word, rest] = util::split_first_word("  DM   MK1 hello there");
    EXPECT_EQ(word, "DM");
    EXPECT_EQ(rest, "MK1 hello there");

    auto [only, nothing] = util::split_first_word("NODES");
    EXPECT_EQ(only, "NODES");
    EXPECT_EQ(nothing, "");
}

TEST(Strings, OrNa) {
    EXPECT_EQ(util::or_na(std::optional<int>{}), "N/A");
    EXPECT_EQ(util::or_na(std::optional<int>{-72}), "-72");
    EXPECT_EQ(util::or_na(std::optional<float>{9.0f}, 1), "9.0");
}

TEST(Time, FormatUptime) {
    EXPECT_EQ(util::format_uptime(std::chrono::seconds(0)), "0:00:00");
    EXPECT_EQ(util::format_uptime(std::chrono::seconds(3725)), "1:02:05");
    EXPECT_EQ(util::format_uptime(std::chrono::seconds(86400 + 61)), "1 day, 0:01:01");
    EXPECT_EQ(util::format_uptime(std::chrono::seconds(2 * 86400)), "2 days, 0:00:00");
}

TEST(Time, ParseIso8601) {
    auto tp = util::parse_iso8601_utc("2024-05-01T12:30:00Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(util::format_utc(*tp, "%Y-%m-%d %H:%M"), "2024-05-01 12:30");

    auto short_form = util::parse_iso8601_utc("2024-05-01 06:00");
    ASSERT_TRUE(short_form.has_value());
    EXPECT_EQ(util::format_utc(*short_form, "%H:%M"), "06:00");

    EXPECT_FALSE(util::parse_iso8601_utc("yesterday").has_value());
}
