#include <gtest/gtest.h>

#include "relay/utility.hpp"

using namespace relay;

TEST(trim, removes_surrounding_whitespace)
{
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim(" \t\r\n"), "");
    EXPECT_EQ(trim("  add "), "add");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(tokenize, empty_and_blank_lines)
{
    EXPECT_TRUE(tokenize("").empty());
    EXPECT_TRUE(tokenize("   \t ").empty());
}

TEST(tokenize, splits_on_runs_of_whitespace)
{
    EXPECT_EQ(tokenize("show"), arguments({"show"}));
    EXPECT_EQ(tokenize("  remove\t 42  "), arguments({"remove", "42"}));
    EXPECT_EQ(tokenize("a b\tc\r"), arguments({"a", "b", "c"}));
}

TEST(join, with_separators)
{
    EXPECT_EQ(join({}), "");
    EXPECT_EQ(join({"remove"}), "remove");
    EXPECT_EQ(join({"remove", "42"}), "remove 42");
    EXPECT_EQ(join({"a", "b", "c"}, ","), "a,b,c");
}

TEST(to_int64, accepts_integers)
{
    EXPECT_EQ(to_int64("0"), std::optional<std::int64_t>(0));
    EXPECT_EQ(to_int64("42"), std::optional<std::int64_t>(42));
    EXPECT_EQ(to_int64("-7"), std::optional<std::int64_t>(-7));
}

TEST(to_int64, rejects_non_integers)
{
    EXPECT_FALSE(to_int64(""));
    EXPECT_FALSE(to_int64("abc"));
    EXPECT_FALSE(to_int64("12abc"));
    EXPECT_FALSE(to_int64(" 12"));
    EXPECT_FALSE(to_int64("1.5"));
    EXPECT_FALSE(to_int64("99999999999999999999"));
}
