#include <gtest/gtest.h>
#include "../../src/utils/text/string_utils.hpp"

using namespace Gleaner::Utils::Text;

TEST(TextTest, TrimAndCase) {
    EXPECT_EQ(trim("  \t hello \r\n"), "hello");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("MiXeD 42"), "mixed 42");
    EXPECT_EQ(to_upper("MiXeD 42"), "MIXED 42");
    EXPECT_TRUE(starts_with("socks5://p", "socks5"));
    EXPECT_FALSE(starts_with("ab", "abc"));
    EXPECT_TRUE(ends_with("page.html", ".html"));
    EXPECT_TRUE(icontains("Verify You Are Human", "you are"));
    EXPECT_FALSE(icontains("short", "longer needle"));
}

TEST(TextTest, CollapseWhitespace) {
    EXPECT_EQ(collapse_whitespace("  Oak \n\n desk\t large  "), "Oak desk large");
    EXPECT_EQ(collapse_whitespace("\n\t "), "");
}

TEST(TextTest, SplitAndJoin) {
    auto parts = split("red, green, , blue", ", ");
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(join(parts, "|"), "red|green||blue");
    EXPECT_EQ(split("whole", "").size(), 1u);
    EXPECT_EQ(join({}, ","), "");
}

TEST(TextTest, Base64) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("user:pass"), "dXNlcjpwYXNz");
}

TEST(TextTest, ExtractNumber) {
    EXPECT_DOUBLE_EQ(*extract_number("$1,299.00"), 1299.0);
    EXPECT_DOUBLE_EQ(*extract_number("Price: 45 EUR"), 45.0);
    EXPECT_DOUBLE_EQ(*extract_number("-3.5 degrees"), -3.5);
    EXPECT_DOUBLE_EQ(*extract_number("4.5 out of 5"), 4.5);
    EXPECT_DOUBLE_EQ(*extract_number("12."), 12.0);
    EXPECT_FALSE(extract_number("sold out").has_value());
}
