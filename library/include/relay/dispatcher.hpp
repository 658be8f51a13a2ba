#ifndef relay_dispatcher_hpp
#define relay_dispatcher_hpp

#include <cstddef> // for std::size_t
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "relay/command.hpp"
#include "relay/command_registry.hpp"
#include "relay/display.hpp"
#include "relay/error_kind.hpp"
#include "relay/line_source.hpp"
#include "relay/remote_peer.hpp"
#include "relay/script_controller.hpp"
#include "relay/session.hpp"

namespace relay {

/// @brief How a session came to its end.
enum class session_end {
    end_of_input,
    exit_requested,
    connection_failure,
};

constexpr auto to_cstring(session_end value) noexcept -> const char*
{
    switch (value) {
    case session_end::end_of_input: return "end-of-input";
    case session_end::exit_requested: return "exit-requested";
    case session_end::connection_failure: return "connection-failure";
    }
    return "unknown";
}

auto operator<<(std::ostream& os, session_end value) -> std::ostream&;

struct dispatcher_options
{
    /// @brief Whether an error in a script abandons every running script.
    /// @note When not set, the script carries on with its next line.
    bool stop_script_on_error{};

    /// @brief Shown at start of an interactive session.
    std::string greeting{
        "enter \"help\" to see available commands, "
        "\"exit\" or end of input to close the session."
    };
};

/// @brief The read-validate-execute loop.
/// @details Owns the command registry and the script controller. Reads
///   lines from the controller's current source, resolves and validates
///   them through the registry, and runs the resulting commands either
///   locally or through the remote peer.
struct dispatcher
{
    dispatcher(command_registry commands,
               line_source& interactive,
               remote_peer& peer,
               display& sink,
               dispatcher_options opts = {});

    dispatcher(const dispatcher&) = delete;
    auto operator=(const dispatcher&) -> dispatcher& = delete;

    /// @brief Starts the remote peer then handles lines until the session
    ///   ends.
    auto run() -> session_end;

    /// @brief Reads and handles one line from the current source.
    /// @return How the session ended, if it did.
    auto step() -> std::optional<session_end>;

    /// @brief Handles the given line.
    /// @return How the session ended, if it did.
    auto process(std::string_view line) -> std::optional<session_end>;

    [[nodiscard]] auto commands() const noexcept -> const command_registry&
    {
        return registry;
    }

    [[nodiscard]] auto scripts() noexcept -> script_controller&
    {
        return controller;
    }

    [[nodiscard]] auto scripted() const noexcept -> bool
    {
        return controller.scripted();
    }

    /// @brief Number of scripts that were running when the connection failed.
    /// @note Zero if the connection never failed or failed interactively.
    [[nodiscard]] auto abandoned_scripts() const noexcept -> std::size_t
    {
        return abandoned;
    }

private:
    auto execute(const command& cmd) -> std::optional<session_end>;
    auto present(const outcome& result) -> void;
    auto report(const command_error& err) -> void;
    auto location() -> std::string;
    auto show(std::string_view text, bool suppress_when_scripted,
              bool is_error) -> void;
    auto fail(const connection_failure& failure) -> session_end;
    auto finish(session_end end) -> session_end;

    command_registry registry;
    script_controller controller;
    session context;
    remote_peer* peer{};
    display* sink{};
    dispatcher_options options;
    std::size_t abandoned{};
};

}

#endif /* relay_dispatcher_hpp */
