#ifndef relay_options_hpp
#define relay_options_hpp

#include <filesystem>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "relay/tcp_peer.hpp"

namespace relay {

namespace option_names {
constexpr auto host_prefix = std::string_view{"--host="};
constexpr auto port_prefix = std::string_view{"--port="};
constexpr auto timeout_prefix = std::string_view{"--timeout="};
constexpr auto file_prefix = std::string_view{"--file="};
constexpr auto editor_prefix = std::string_view{"--editor="};
constexpr auto history_prefix = std::string_view{"--history="};
constexpr auto stop_on_error_argument = std::string_view{"--stop-on-error"};
constexpr auto help_argument = std::string_view{"--help"};
constexpr auto usage_argument = std::string_view{"--usage"};
}

constexpr auto emacs_editor_str = "emacs";
constexpr auto vi_editor_str = "vi";

/// @brief Configuration of the shell executable.
struct shell_options
{
    tcp_peer_options peer;

    /// @brief Script to run before reading interactively.
    std::optional<std::filesystem::path> script;

    std::string editor{emacs_editor_str};
    int history_size{100};
    bool stop_script_on_error{};
    bool help{};
    bool usage{};
};

/// @brief Parses the given command line arguments.
/// @param[in] args Arguments, the first being the program name.
/// @param[out] diags Where to describe what's wrong with the arguments.
/// @return Options, or an empty optional if any argument isn't recognized
///   or has an invalid value.
auto parse_options(const std::span<const std::string>& args,
                   std::ostream& diags) -> std::optional<shell_options>;

auto write_usage(std::ostream& os, std::string_view program) -> void;

auto write_help(std::ostream& os, std::string_view program) -> void;

}

#endif /* relay_options_hpp */
