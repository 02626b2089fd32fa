#include <gtest/gtest.h>

#include "core/cli_parse.h"

using namespace tessera::core;

TEST(CliParse, Integers) {
    int value = 0;
    EXPECT_TRUE(parse_positive_int("42", value));
    EXPECT_EQ(value, 42);
    EXPECT_FALSE(parse_positive_int("0", value));
    EXPECT_FALSE(parse_positive_int("4x", value));
    EXPECT_TRUE(parse_non_negative_int("0", value));
    EXPECT_FALSE(parse_non_negative_int("-3", value));

    size_t size = 0;
    EXPECT_TRUE(parse_non_negative_size("0", size));
    EXPECT_FALSE(parse_non_negative_size("-1", size));
    EXPECT_FALSE(parse_positive_size("0", size));

    uint64_t seed = 0;
    EXPECT_TRUE(parse_uint64("18446744073709551615", seed));
    EXPECT_EQ(seed, 18446744073709551615ull);
    EXPECT_FALSE(parse_uint64("+1", seed));
}

TEST(CliParse, Doubles) {
    double value = 0.0;
    EXPECT_TRUE(parse_double("1.25", value));
    EXPECT_DOUBLE_EQ(value, 1.25);
    EXPECT_FALSE(parse_double("1.2.3", value));
    EXPECT_FALSE(parse_double("nan", value));
    EXPECT_FALSE(parse_positive_double("0", value));
    EXPECT_TRUE(parse_rate("1", value));
    EXPECT_TRUE(parse_rate("0", value));
    EXPECT_FALSE(parse_rate("1.01", value));
}

TEST(CliParse, PairsAndResolutions) {
    int a = 0;
    int b = 0;
    EXPECT_TRUE(parse_pair("12,-4", a, b));
    EXPECT_EQ(a, 12);
    EXPECT_EQ(b, -4);
    EXPECT_FALSE(parse_pair("1,2,3", a, b));
    EXPECT_FALSE(parse_pair(",2", a, b));

    EXPECT_TRUE(parse_resolution("1920x1080", a, b));
    EXPECT_EQ(a, 1920);
    EXPECT_EQ(b, 1080);
    EXPECT_TRUE(parse_resolution("64X32", a, b));
    EXPECT_FALSE(parse_resolution("0x10", a, b));
    EXPECT_FALSE(parse_resolution("10x", a, b));
}

TEST(CliParse, Colors) {
    std::array<unsigned char, 4> color{};
    ASSERT_TRUE(parse_color("10,20,30", color));
    EXPECT_EQ(color, (std::array<unsigned char, 4>{10, 20, 30, 255}));
    ASSERT_TRUE(parse_color("1,2,3,4", color));
    EXPECT_EQ(color[3], 4);
    EXPECT_FALSE(parse_color("1,2", color));
    EXPECT_FALSE(parse_color("1,2,3,4,5", color));
    EXPECT_FALSE(parse_color("1,2,256", color));
    EXPECT_FALSE(parse_color("1,,3", color));
}

TEST(CliParse, QuotedStrings) {
    std::string out;
    std::string error;
    size_t pos = 0;
    ASSERT_TRUE(parse_quoted(R"("a \"b\" \\ c" tail)", pos, out, error)) << error;
    EXPECT_EQ(out, R"(a "b" \ c)");
    EXPECT_EQ(pos, 14u);

    pos = 0;
    EXPECT_FALSE(parse_quoted(R"("open)", pos, out, error));
    EXPECT_EQ(to_quoted(R"(x"y\z)"), R"("x\"y\\z")");
}

TEST(CliParse, StringHelpers) {
    EXPECT_EQ(trim_copy("  a b \t\n"), "a b");
    EXPECT_EQ(trim_copy("   "), "");
    EXPECT_EQ(to_lower_copy("MiXeD.PNG"), "mixed.png");
}
