#include <gtest/gtest.h>

#include <sstream> // for std::ostringstream

#include "relay/error_kind.hpp"

using namespace relay;

TEST(error_kind, to_cstring)
{
    EXPECT_STREQ(to_cstring(error_kind::no_command), "no-command");
    EXPECT_STREQ(to_cstring(error_kind::recursive_script), "recursive-script");
    EXPECT_STREQ(to_cstring(error_kind::connection_failure),
                 "connection-failure");
}

TEST(error_kind, is_silent_when_scripted)
{
    EXPECT_TRUE(is_silent_when_scripted(error_kind::no_command));
    EXPECT_FALSE(is_silent_when_scripted(error_kind::unknown_command));
    EXPECT_FALSE(is_silent_when_scripted(error_kind::recursive_script));
}

TEST(command_error, output)
{
    {
        std::ostringstream os;
        os << command_error{error_kind::unknown_command, "\"frobnicate\""};
        EXPECT_EQ(os.str(), "no such command: \"frobnicate\"");
    }
    {
        std::ostringstream os;
        os << command_error{error_kind::recursive_script, {}};
        EXPECT_EQ(os.str(), "script is already running");
    }
    {
        std::ostringstream os;
        os << error_kind::argument_type_mismatch;
        EXPECT_EQ(os.str(), "argument-type-mismatch");
    }
}
