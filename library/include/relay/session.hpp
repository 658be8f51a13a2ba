#ifndef relay_session_hpp
#define relay_session_hpp

#include "relay/command_registry.hpp"
#include "relay/script_controller.hpp"

namespace relay {

/// @brief Context handed to local commands.
/// @details Gives local commands access to the state of the session they're
///   run in, in place of any global state.
struct session
{
    const command_registry& commands;
    script_controller& scripts;

    /// @brief Set by a command to have the dispatcher end the session.
    bool exit_requested{};
};

}

#endif /* relay_session_hpp */
