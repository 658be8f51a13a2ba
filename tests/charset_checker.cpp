#include <gtest/gtest.h>

#include "relay/charset_checker.hpp"

using namespace relay;
using namespace relay::detail;

TEST(allowed_chars_checker, default_construction)
{
    EXPECT_NO_THROW(allowed_chars_checker<name_charset>());
    EXPECT_EQ(allowed_chars_checker<name_charset>()(), "");
}

TEST(allowed_chars_checker, charset)
{
    EXPECT_EQ(allowed_chars_checker<name_charset>::charset,
              "abcdefghijklmnopqrstuvwxyz0123456789_");
}

TEST(allowed_chars_checker, check)
{
    EXPECT_EQ(allowed_chars_checker<name_charset>()("count_by_birthday"),
              "count_by_birthday");
    EXPECT_THROW(allowed_chars_checker<name_charset>()("add-x"),
                 charset_validator_error);
    EXPECT_THROW(allowed_chars_checker<name_charset>()("Show"),
                 charset_validator_error);
}

TEST(allowed_chars_checker, exception)
{
    try {
        allowed_chars_checker<name_charset>()("remove\t");
        FAIL() << "expected exception";
    }
    catch (const charset_validator_error& ex) {
        EXPECT_STREQ(ex.what(), "may not contain '\\11', character not allowed");
    }
}
