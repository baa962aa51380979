#include <gtest/gtest.h>
#include "../../src/utils/text/string_utils.hpp"

using namespace Relay::Utils::Text;

TEST(TextTest, TrimAndLower) {
    EXPECT_EQ(trim("  \tapi.local \r\n"), "api.local");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("HTTP://Host"), "http://host");
}

TEST(TextTest, SplitCommaListDropsBlanks) {
    auto parts = split(" a:80, b ,,c:8080 ,", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a:80");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "c:8080");
    EXPECT_TRUE(split("", ',').empty());
}

TEST(TextTest, ParseBool) {
    EXPECT_EQ(parse_bool("TRUE"), true);
    EXPECT_EQ(parse_bool(" yes "), true);
    EXPECT_EQ(parse_bool("1"), true);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_EQ(parse_bool("0"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST(TextTest, ParseUint) {
    EXPECT_EQ(parse_uint("500"), 500L);
    EXPECT_EQ(parse_uint(" 42 "), 42L);
    EXPECT_FALSE(parse_uint("").has_value());
    EXPECT_FALSE(parse_uint("-5").has_value());
    EXPECT_FALSE(parse_uint("12ms").has_value());
    EXPECT_FALSE(parse_uint("abc").has_value());
    EXPECT_FALSE(parse_uint("1234567890123456789012").has_value());
}
