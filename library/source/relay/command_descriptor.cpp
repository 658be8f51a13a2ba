#include <cctype> // for std::isdigit
#include <chrono> // for std::chrono::year_month_day
#include <iomanip> // for std::quoted
#include <sstream> // for std::ostringstream
#include <stdexcept> // for std::invalid_argument, std::logic_error

#include "relay/command_descriptor.hpp"

namespace relay {

namespace {

auto count_error(const arguments& tokens, std::string_view expected)
    -> command_error
{
    std::ostringstream os;
    os << std::quoted(tokens[0]);
    os << " takes ";
    os << expected;
    os << ", got ";
    os << (size(tokens) - 1u);
    return {error_kind::argument_count_mismatch, os.str()};
}

auto type_error(const std::string& arg, std::string_view expected)
    -> command_error
{
    std::ostringstream os;
    os << std::quoted(arg);
    os << " is not ";
    os << expected;
    return {error_kind::argument_type_mismatch, os.str()};
}

}

auto command_descriptor::validate(const arguments& tokens) const
    -> validation_result
{
    if (empty(tokens)) {
        return command_error{error_kind::no_command, {}};
    }
    if (check) {
        if (auto err = check(tokens)) {
            return *std::move(err);
        }
    }
    auto args = tokens;
    args[0] = name.get();
    switch (tag) {
    case capability::local_only:
        if (!action) {
            throw std::logic_error{"local command " + name.get() +
                                   " has no action"};
        }
        return command{local_command{std::move(args), action}};
    case capability::remote_forwarded:
        break;
    }
    return command{remote_command{std::move(args)}};
}

auto make_local_descriptor(command_name name,
                           std::string summary,
                           std::string synopsis,
                           argument_checker check,
                           local_command::action_type action)
    -> command_descriptor
{
    if (!action) {
        throw std::invalid_argument{"local command needs an action"};
    }
    return command_descriptor{
        .name = std::move(name),
        .tag = capability::local_only,
        .summary = std::move(summary),
        .synopsis = std::move(synopsis),
        .check = std::move(check),
        .action = std::move(action),
    };
}

auto make_remote_descriptor(command_name name,
                            std::string summary,
                            std::string synopsis,
                            argument_checker check)
    -> command_descriptor
{
    return command_descriptor{
        .name = std::move(name),
        .tag = capability::remote_forwarded,
        .summary = std::move(summary),
        .synopsis = std::move(synopsis),
        .check = std::move(check),
        .action = {},
    };
}

auto is_date(std::string_view text) -> bool
{
    // YYYY-MM-DD
    if ((size(text) != 10u) || (text[4] != '-') || (text[7] != '-')) {
        return false;
    }
    for (auto i = std::size_t{}; i < size(text); ++i) {
        if ((i != 4u) && (i != 7u) &&
            !std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    const auto y = to_int64(text.substr(0u, 4u));
    const auto m = to_int64(text.substr(5u, 2u));
    const auto d = to_int64(text.substr(8u, 2u));
    if (!y || !m || !d) {
        return false;
    }
    const auto ymd = std::chrono::year_month_day{
        std::chrono::year{static_cast<int>(*y)},
        std::chrono::month{static_cast<unsigned>(*m)},
        std::chrono::day{static_cast<unsigned>(*d)}
    };
    return ymd.ok();
}

}

namespace relay::checks {

auto exact_count(std::size_t n) -> argument_checker
{
    return [n](const arguments& tokens) -> std::optional<command_error> {
        if (size(tokens) != (n + 1u)) {
            return count_error(tokens, std::to_string(n) + " argument(s)");
        }
        return {};
    };
}

auto count_range(std::size_t min, std::size_t max) -> argument_checker
{
    return [min,max](const arguments& tokens) -> std::optional<command_error> {
        const auto n = size(tokens) - 1u;
        if ((n < min) || (n > max)) {
            return count_error(tokens, std::to_string(min) + " to " +
                               std::to_string(max) + " arguments");
        }
        return {};
    };
}

auto integer_at(std::size_t index) -> argument_checker
{
    return [index](const arguments& tokens) -> std::optional<command_error> {
        if (index >= size(tokens)) {
            return count_error(tokens, "an integer argument");
        }
        if (!to_int64(tokens[index])) {
            return type_error(tokens[index], "an integer");
        }
        return {};
    };
}

auto date_at(std::size_t index) -> argument_checker
{
    return [index](const arguments& tokens) -> std::optional<command_error> {
        if (index >= size(tokens)) {
            return count_error(tokens, "a date argument");
        }
        if (!is_date(tokens[index])) {
            return type_error(tokens[index], "a YYYY-MM-DD date");
        }
        return {};
    };
}

auto all_of(std::vector<argument_checker> checkers) -> argument_checker
{
    return [checkers = std::move(checkers)](const arguments& tokens)
        -> std::optional<command_error> {
        for (auto&& checker: checkers) {
            if (auto err = checker(tokens)) {
                return err;
            }
        }
        return {};
    };
}

}
