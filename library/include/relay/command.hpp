#ifndef relay_command_hpp
#define relay_command_hpp

#include <functional> // for std::function
#include <ostream>
#include <string>
#include <variant>

#include "relay/error_kind.hpp"
#include "relay/utility.hpp"

namespace relay {

struct session;

/// @brief Where a command's work gets done.
enum class capability {
    /// @brief Runs entirely within this process.
    local_only,

    /// @brief Validated form is sent to the remote peer for a textual result.
    remote_forwarded,
};

constexpr auto to_cstring(capability value) noexcept -> const char*
{
    switch (value) {
    case capability::local_only: return "local";
    case capability::remote_forwarded: return "remote";
    }
    return "unknown";
}

auto operator<<(std::ostream& os, capability value) -> std::ostream&;

struct no_output {
    auto operator==(const no_output&) const -> bool = default;
};

auto operator<<(std::ostream& os, const no_output&) -> std::ostream&;

struct text_output {
    std::string text;
    auto operator==(const text_output&) const -> bool = default;
};

auto operator<<(std::ostream& os, const text_output& value) -> std::ostream&;

/// @brief What executing a command came to.
using outcome = std::variant<
    no_output,
    text_output,
    command_error
>;

auto operator<<(std::ostream& os, const outcome& value) -> std::ostream&;

/// @brief A validated command that runs within this process.
struct local_command {
    using action_type = std::function<auto(session&, const arguments&) -> outcome>;

    /// @brief Arguments as validated, the command name being the first.
    arguments args;

    action_type action;

    /// @brief Runs this command within the given session.
    /// @throws std::logic_error if there's no action to run.
    auto run(session& context) const -> outcome;
};

/// @brief A validated command that's forwarded to the remote peer.
struct remote_command {
    /// @brief Arguments as validated, the command name being the first.
    arguments args;

    auto operator==(const remote_command&) const -> bool = default;
};

/// @brief Gets the request payload for the given command.
/// @return Normalized command name followed by the arguments, space separated.
auto serialize(const remote_command& command) -> std::string;

/// @brief Validated command ready to run.
using command = std::variant<local_command, remote_command>;

constexpr auto capability_of(const command& value) noexcept -> capability
{
    return std::holds_alternative<local_command>(value)
        ? capability::local_only
        : capability::remote_forwarded;
}

using validation_result = std::variant<command, command_error>;

}

#endif /* relay_command_hpp */
