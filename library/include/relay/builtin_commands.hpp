#ifndef relay_builtin_commands_hpp
#define relay_builtin_commands_hpp

#include <string>

#include "relay/command_registry.hpp"

namespace relay {

namespace builtin_names {
constexpr auto exit = "exit";
constexpr auto execute = "execute";
constexpr auto help = "help";
}

/// @brief Registers the commands that manage the session itself.
/// @details These are the local <code>exit</code>, <code>execute</code>, and
///   <code>help</code> commands.
auto add_session_commands(command_registry& registry) -> void;

/// @brief Registers the commands forwarded to the collection server.
auto add_collection_commands(command_registry& registry) -> void;

/// @brief Makes a registry having both the session and collection commands.
auto make_standard_registry() -> command_registry;

/// @brief Makes the help listing for every command in the given registry.
auto help_listing(const command_registry& registry) -> std::string;

/// @brief Makes the usage line of the given command.
auto usage_line(const command_descriptor& descriptor) -> std::string;

}

#endif /* relay_builtin_commands_hpp */
