#include <gtest/gtest.h>

#include <sstream> // for std::istringstream
#include <stdexcept> // for std::invalid_argument, std::logic_error

#include "relay/command_descriptor.hpp"
#include "relay/session.hpp"

using namespace relay;

namespace {

auto make_remove() -> command_descriptor
{
    return make_remote_descriptor("remove", "removes an element.", "<id>",
        checks::all_of({checks::exact_count(1u), checks::integer_at(1u)}));
}

auto error_of(const validation_result& result) -> std::optional<error_kind>
{
    if (const auto p = std::get_if<command_error>(&result)) {
        return p->kind;
    }
    return {};
}

}

TEST(capability, to_cstring)
{
    EXPECT_STREQ(to_cstring(capability::local_only), "local");
    EXPECT_STREQ(to_cstring(capability::remote_forwarded), "remote");
}

TEST(is_date, valid_dates)
{
    EXPECT_TRUE(is_date("2000-01-31"));
    EXPECT_TRUE(is_date("2024-02-29"));
    EXPECT_TRUE(is_date("1999-12-01"));
}

TEST(is_date, invalid_dates)
{
    EXPECT_FALSE(is_date(""));
    EXPECT_FALSE(is_date("2000-1-31"));
    EXPECT_FALSE(is_date("2000/01/31"));
    EXPECT_FALSE(is_date("2023-02-29"));
    EXPECT_FALSE(is_date("2000-13-01"));
    EXPECT_FALSE(is_date("2000-00-10"));
    EXPECT_FALSE(is_date("+200-01-01"));
    EXPECT_FALSE(is_date("2000-01-3x"));
}

TEST(checks, exact_count)
{
    const auto check = checks::exact_count(1u);
    EXPECT_FALSE(check({"remove", "1"}));
    const auto too_few = check({"remove"});
    ASSERT_TRUE(too_few);
    EXPECT_EQ(too_few->kind, error_kind::argument_count_mismatch);
    EXPECT_EQ(too_few->detail, "\"remove\" takes 1 argument(s), got 0");
    const auto too_many = check({"remove", "1", "2"});
    ASSERT_TRUE(too_many);
    EXPECT_EQ(too_many->kind, error_kind::argument_count_mismatch);
}

TEST(checks, count_range)
{
    const auto check = checks::count_range(0u, 1u);
    EXPECT_FALSE(check({"help"}));
    EXPECT_FALSE(check({"help", "show"}));
    const auto err = check({"help", "a", "b"});
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, error_kind::argument_count_mismatch);
}

TEST(checks, integer_at)
{
    const auto check = checks::integer_at(1u);
    EXPECT_FALSE(check({"remove", "-3"}));
    const auto err = check({"remove", "abc"});
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, error_kind::argument_type_mismatch);
    EXPECT_EQ(err->detail, "\"abc\" is not an integer");
    const auto missing = check({"remove"});
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->kind, error_kind::argument_count_mismatch);
}

TEST(checks, date_at)
{
    const auto check = checks::date_at(1u);
    EXPECT_FALSE(check({"count_by_birthday", "2001-09-11"}));
    const auto err = check({"count_by_birthday", "yesterday"});
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, error_kind::argument_type_mismatch);
}

TEST(checks, all_of_reports_first_failure)
{
    const auto check = checks::all_of({
        checks::exact_count(1u), checks::integer_at(1u)
    });
    EXPECT_FALSE(check({"remove", "5"}));
    EXPECT_EQ(check({"remove", "x", "y"})->kind,
              error_kind::argument_count_mismatch);
    EXPECT_EQ(check({"remove", "x"})->kind,
              error_kind::argument_type_mismatch);
}

TEST(command_descriptor, validate_empty_tokens)
{
    EXPECT_EQ(error_of(make_remove().validate({})), error_kind::no_command);
}

TEST(command_descriptor, validate_remote)
{
    const auto descriptor = make_remove();
    const auto result = descriptor.validate({"REMOVE", "42"});
    ASSERT_TRUE(std::holds_alternative<command>(result));
    const auto& cmd = std::get<command>(result);
    EXPECT_EQ(capability_of(cmd), capability::remote_forwarded);
    ASSERT_TRUE(std::holds_alternative<remote_command>(cmd));
    EXPECT_EQ(std::get<remote_command>(cmd).args,
              arguments({"remove", "42"}));
    EXPECT_EQ(serialize(std::get<remote_command>(cmd)), "remove 42");
}

TEST(command_descriptor, validate_rejects_bad_arguments)
{
    const auto descriptor = make_remove();
    EXPECT_EQ(error_of(descriptor.validate({"remove"})),
              error_kind::argument_count_mismatch);
    EXPECT_EQ(error_of(descriptor.validate({"remove", "abc"})),
              error_kind::argument_type_mismatch);
}

TEST(command_descriptor, validate_local_and_run)
{
    auto calls = 0;
    const auto descriptor = make_local_descriptor("ping", "answers.", "",
        checks::exact_count(0u),
        [&calls](session&, const arguments& args) -> outcome {
            ++calls;
            return text_output{args[0] + "!"};
        });
    EXPECT_EQ(descriptor.tag, capability::local_only);
    const auto result = descriptor.validate({"Ping"});
    ASSERT_TRUE(std::holds_alternative<command>(result));
    const auto& cmd = std::get<command>(result);
    ASSERT_TRUE(std::holds_alternative<local_command>(cmd));
    EXPECT_EQ(capability_of(cmd), capability::local_only);
    EXPECT_EQ(calls, 0);

    auto interactive = std::istringstream{};
    auto source = stream_line_source{interactive, "test"};
    const auto registry = command_registry{};
    auto controller = script_controller{source};
    auto context = session{registry, controller};
    EXPECT_EQ(std::get<local_command>(cmd).run(context),
              outcome(text_output{"ping!"}));
    EXPECT_EQ(calls, 1);
}

TEST(command_descriptor, validate_without_check)
{
    const auto descriptor = make_remote_descriptor("show", "shows.", "", {});
    EXPECT_TRUE(std::holds_alternative<command>(
        descriptor.validate({"show", "anything", "goes"})));
}

TEST(command_descriptor, validate_local_without_action)
{
    const auto descriptor = command_descriptor{
        .name = "broken",
        .tag = capability::local_only,
    };
    EXPECT_THROW(static_cast<void>(descriptor.validate({"broken"})),
                 std::logic_error);
}

TEST(local_command, run_without_action)
{
    auto interactive = std::istringstream{};
    auto source = stream_line_source{interactive, "test"};
    const auto registry = command_registry{};
    auto controller = script_controller{source};
    auto context = session{registry, controller};
    const auto cmd = local_command{{"broken"}, {}};
    EXPECT_THROW(static_cast<void>(cmd.run(context)), std::logic_error);
}

TEST(make_local_descriptor, requires_action)
{
    EXPECT_THROW(make_local_descriptor("nothing", "", "", {}, {}),
                 std::invalid_argument);
}
