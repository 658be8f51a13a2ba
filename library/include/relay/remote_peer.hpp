#ifndef relay_remote_peer_hpp
#define relay_remote_peer_hpp

#include <optional>
#include <ostream>
#include <string>
#include <variant>

#include "relay/command.hpp"

namespace relay {

struct connection_failure {
    std::string detail;
    auto operator==(const connection_failure&) const -> bool = default;
};

auto operator<<(std::ostream& os, const connection_failure& value)
    -> std::ostream&;

struct reply {
    std::string text;
    auto operator==(const reply&) const -> bool = default;
};

using remote_result = std::variant<reply, connection_failure>;

/// @brief The one way remote commands reach the remote peer.
struct remote_peer
{
    virtual ~remote_peer() = default;

    /// @brief Establishes the connection.
    /// @return Empty optional on success, else why the peer is unreachable.
    virtual auto start() -> std::optional<connection_failure> = 0;

    /// @brief Sends the given command and waits for its textual result.
    /// @param[in] command What to send.
    /// @param[in] scripted Whether the session is running a script. This only
    ///   affects how chatty the remote's own messages are.
    virtual auto send(const remote_command& command, bool scripted)
        -> remote_result = 0;

    /// @brief Flushes any remote side cleanup and releases the connection.
    virtual auto stop() noexcept -> void = 0;
};

}

#endif /* relay_remote_peer_hpp */
