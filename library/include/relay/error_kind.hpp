#ifndef relay_error_kind_hpp
#define relay_error_kind_hpp

#include <ostream>
#include <string>

namespace relay {

/// @brief Classification of everything that can go wrong handling a line.
enum class error_kind: unsigned {
    no_command,
    unknown_command,
    argument_count_mismatch,
    argument_type_mismatch,
    script_not_found,
    recursive_script,
    connection_failure,
};

constexpr auto to_cstring(error_kind kind) noexcept -> const char*
{
    switch (kind) {
    case error_kind::no_command: return "no-command";
    case error_kind::unknown_command: return "unknown-command";
    case error_kind::argument_count_mismatch: return "argument-count-mismatch";
    case error_kind::argument_type_mismatch: return "argument-type-mismatch";
    case error_kind::script_not_found: return "script-not-found";
    case error_kind::recursive_script: return "recursive-script";
    case error_kind::connection_failure: return "connection-failure";
    }
    return "unknown";
}

/// @brief Whether the given kind is kept quiet while running a script.
/// @note Blank script lines produce <code>no_command</code>.
constexpr auto is_silent_when_scripted(error_kind kind) noexcept -> bool
{
    return kind == error_kind::no_command;
}

/// @brief Gets the generic user facing message for the given kind.
auto to_message(error_kind kind) -> std::string;

auto operator<<(std::ostream& os, error_kind value) -> std::ostream&;

/// @brief A classified error along with what it pertains to.
struct command_error {
    error_kind kind{};

    /// @brief Specifics, like the offending token or an OS error string.
    std::string detail;

    auto operator==(const command_error&) const -> bool = default;
};

auto operator<<(std::ostream& os, const command_error& value)
    -> std::ostream&;

}

#endif /* relay_error_kind_hpp */
