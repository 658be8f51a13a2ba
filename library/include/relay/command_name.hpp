#ifndef relay_command_name_hpp
#define relay_command_name_hpp

#include <ostream>
#include <string>
#include <string_view>

#include "relay/checked.hpp"
#include "relay/charset_checker.hpp"

namespace relay {

/// @brief Normalizes the given text into the form used for command lookup.
/// @details Trims surrounding whitespace and lower-cases what remains.
auto normalize_command_name(std::string_view text) -> std::string;

struct command_name_checker
{
    auto operator()() const noexcept -> std::string
    {
        return {};
    }

    /// @throws charset_validator_error if the normalized value contains
    ///   characters other than lower case letters, digits, or underscores.
    auto operator()(std::string_view v) const -> std::string;

    auto operator()(const std::string& v) const -> std::string
    {
        return operator()(std::string_view{v});
    }

    auto operator()(const char* v) const -> std::string
    {
        return operator()(std::string_view{v});
    }
};

/// @brief Command name.
/// @details The key by which commands are registered and looked up.
/// @note This is a strongly typed <code>std::string</code> that always holds
///   its normalized form, so <code>"ADD "</code>, <code>"add"</code>, and
///   <code>" Add"</code> all construct equal names. A
///   <code>charset_validator_error</code> exception is thrown for text which
///   can't name a command.
using command_name = detail::checked<std::string, command_name_checker>;

auto operator<<(std::ostream& os, const command_name& name) -> std::ostream&;

}

#endif /* relay_command_name_hpp */
