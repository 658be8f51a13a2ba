#ifndef relay_tcp_peer_hpp
#define relay_tcp_peer_hpp

#include <chrono>
#include <memory> // for std::unique_ptr
#include <optional>
#include <ostream>
#include <string>

#include "relay/descriptor_iostream.hpp"
#include "relay/owning_descriptor.hpp"
#include "relay/remote_peer.hpp"

namespace relay {

namespace tcp_protocol {

/// @brief Request line prefix for commands sent while running a script.
constexpr auto scripted_tag = 'S';

/// @brief Request line prefix for commands entered interactively.
constexpr auto interactive_tag = 'I';

/// @brief Line which ends a reply.
constexpr auto reply_terminator = ".";

/// @brief Prefix of a reply line that begins with the terminator character.
/// @note Its first character is dropped on receipt.
constexpr auto stuffed_prefix = "..";

}

struct tcp_peer_options
{
    std::string host{"localhost"};
    std::string port{"4040"};

    /// @brief Send and receive timeout. Zero for none.
    std::chrono::milliseconds timeout{};
};

/// @brief Remote peer reached over a TCP connection.
/// @details Each command is sent as one line: its mode tag, a space, and its
///   serialized form. The reply is the lines that follow up to the reply
///   terminator line.
struct tcp_peer: remote_peer
{
    tcp_peer(tcp_peer_options opts, std::ostream& diags);
    ~tcp_peer() override;

    tcp_peer(const tcp_peer&) = delete;
    auto operator=(const tcp_peer&) -> tcp_peer& = delete;

    auto start() -> std::optional<connection_failure> override;
    auto send(const remote_command& command, bool scripted)
        -> remote_result override;
    auto stop() noexcept -> void override;

    [[nodiscard]] auto connected() const noexcept -> bool
    {
        return static_cast<bool>(socket);
    }

    [[nodiscard]] auto options() const noexcept -> const tcp_peer_options&
    {
        return opts;
    }

private:
    auto endpoint() const -> std::string;
    auto drop() noexcept -> void;

    tcp_peer_options opts;
    std::ostream* diags{};
    owning_descriptor socket;
    std::unique_ptr<descriptor_iostream> stream;
};

}

#endif /* relay_tcp_peer_hpp */
