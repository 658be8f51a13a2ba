#include <gtest/gtest.h>

#include <netinet/in.h> // for sockaddr_in
#include <arpa/inet.h> // for htonl, ntohs
#include <sys/socket.h>
#include <unistd.h> // for ::read, ::write

#include <sstream> // for std::ostringstream
#include <string>
#include <thread>

#include "relay/tcp_peer.hpp"

using namespace relay;

namespace {

/// @brief Loopback listening socket.
struct listener
{
    listener()
    {
        auto addr = sockaddr_in{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(int(fd), reinterpret_cast<sockaddr*>(&addr),
                   sizeof(addr)) == -1 ||
            ::listen(int(fd), 1) == -1) {
            ADD_FAILURE() << "unable to listen: " << last_os_error();
            return;
        }
        auto len = socklen_t{sizeof(addr)};
        if (::getsockname(int(fd), reinterpret_cast<sockaddr*>(&addr),
                          &len) == -1) {
            ADD_FAILURE() << "unable to get port: " << last_os_error();
            return;
        }
        port = std::to_string(ntohs(addr.sin_port));
    }

    auto accept() const -> owning_descriptor
    {
        return owning_descriptor{::accept(int(fd), nullptr, nullptr)};
    }

    owning_descriptor fd{::socket(AF_INET, SOCK_STREAM, 0)};
    std::string port;
};

/// @brief Reads from the descriptor up to and including a newline.
auto read_request(const owning_descriptor& fd) -> std::string
{
    auto result = std::string{};
    auto c = char{};
    while (::read(int(fd), &c, 1u) == 1) {
        result += c;
        if (c == '\n') {
            break;
        }
    }
    return result;
}

auto write_all(const owning_descriptor& fd, const std::string& text) -> void
{
    auto p = text.data();
    auto n = text.size();
    while (n > 0u) {
        const auto count = ::write(int(fd), p, n);
        if (count <= 0) {
            return;
        }
        p += count;
        n -= static_cast<std::size_t>(count);
    }
}

auto options_for(const listener& server) -> tcp_peer_options
{
    return tcp_peer_options{
        .host = "127.0.0.1",
        .port = server.port,
        .timeout = std::chrono::milliseconds{5000},
    };
}

}

TEST(tcp_peer, construction)
{
    std::ostringstream diags;
    const auto peer = tcp_peer{tcp_peer_options{}, diags};
    EXPECT_FALSE(peer.connected());
    EXPECT_EQ(peer.options().host, "localhost");
    EXPECT_EQ(peer.options().port, "4040");
}

TEST(tcp_peer, send_when_not_started)
{
    std::ostringstream diags;
    auto peer = tcp_peer{tcp_peer_options{}, diags};
    const auto result = peer.send(remote_command{{"show"}}, false);
    EXPECT_TRUE(std::holds_alternative<connection_failure>(result));
}

TEST(tcp_peer, round_trip)
{
    const auto server = listener{};
    ASSERT_FALSE(server.port.empty());
    auto requests = std::vector<std::string>{};
    auto thread = std::thread{[&server, &requests]{
        const auto conn = server.accept();
        requests.push_back(read_request(conn));
        write_all(conn, "first\n..dotted\n.\n");
        requests.push_back(read_request(conn));
        write_all(conn, ".\n");
        requests.push_back(read_request(conn));
    }};

    std::ostringstream diags;
    auto peer = tcp_peer{options_for(server), diags};
    EXPECT_FALSE(peer.start());
    EXPECT_TRUE(peer.connected());
    EXPECT_EQ(peer.send(remote_command{{"remove", "42"}}, false),
              remote_result(reply{"first\n.dotted\n"}));
    EXPECT_EQ(peer.send(remote_command{{"show"}}, true),
              remote_result(reply{""}));
    peer.stop();
    EXPECT_FALSE(peer.connected());
    thread.join();

    EXPECT_EQ(requests, std::vector<std::string>({
        "I remove 42\n", "S show\n", ""
    }));
    EXPECT_EQ(diags.str(), "");
}

TEST(tcp_peer, reply_cut_short)
{
    const auto server = listener{};
    ASSERT_FALSE(server.port.empty());
    auto thread = std::thread{[&server]{
        auto conn = server.accept();
        read_request(conn);
        write_all(conn, "partial\n");
        EXPECT_EQ(conn.close(), os_error_code(0));
    }};

    std::ostringstream diags;
    auto peer = tcp_peer{options_for(server), diags};
    ASSERT_FALSE(peer.start());
    const auto result = peer.send(remote_command{{"info"}}, false);
    thread.join();
    EXPECT_TRUE(std::holds_alternative<connection_failure>(result));
    EXPECT_FALSE(peer.connected());
}

TEST(tcp_peer, nobody_listening)
{
    auto port = std::string{};
    {
        // Finds a port that was just in use and no longer is.
        const auto server = listener{};
        port = server.port;
    }
    ASSERT_FALSE(port.empty());
    std::ostringstream diags;
    auto peer = tcp_peer{tcp_peer_options{.host = "127.0.0.1", .port = port},
                         diags};
    const auto failure = peer.start();
    ASSERT_TRUE(failure);
    EXPECT_NE(failure->detail.find("unable to connect"), std::string::npos);
    EXPECT_FALSE(peer.connected());
}

TEST(tcp_peer, unresolvable_host)
{
    std::ostringstream diags;
    auto peer = tcp_peer{
        tcp_peer_options{.host = "relay.invalid", .port = "4040"}, diags
    };
    const auto failure = peer.start();
    ASSERT_TRUE(failure);
    EXPECT_FALSE(peer.connected());
}
