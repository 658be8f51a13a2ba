#include <netdb.h> // for ::getaddrinfo
#include <sys/socket.h>
#include <sys/time.h> // for struct timeval

#include <cerrno> // for errno
#include <utility> // for std::move

#include "relay/tcp_peer.hpp"

namespace relay {

namespace {

struct addrinfo_deleter
{
    void operator()(addrinfo *p) const
    {
        ::freeaddrinfo(p);
    }
};

using addrinfo_ptr = std::unique_ptr<addrinfo, addrinfo_deleter>;

auto set_timeout(const owning_descriptor& fd,
                 std::chrono::milliseconds timeout) -> os_error_code
{
    using namespace std::chrono;
    const auto secs = duration_cast<seconds>(timeout);
    const auto usecs = duration_cast<microseconds>(timeout - secs);
    auto tv = timeval{};
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(secs.count());
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>(usecs.count());
    for (const auto opt: {SO_RCVTIMEO, SO_SNDTIMEO}) {
        if (::setsockopt(int(fd), SOL_SOCKET, opt, &tv, sizeof(tv)) == -1) {
            return last_os_error();
        }
    }
    return os_error_code{};
}

auto describe(const std::string& what, os_error_code err) -> std::string
{
    if (err == os_error_code{}) {
        return what;
    }
    return what + ": " + to_string(err);
}

}

tcp_peer::tcp_peer(tcp_peer_options options, std::ostream& diags_):
    opts{std::move(options)}, diags{&diags_}
{
    // Intentionally empty.
}

tcp_peer::~tcp_peer()
{
    stop();
}

auto tcp_peer::endpoint() const -> std::string
{
    return opts.host + ":" + opts.port;
}

auto tcp_peer::start() -> std::optional<connection_failure>
{
    drop();
    auto hints = addrinfo{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    auto res = static_cast<addrinfo*>(nullptr);
    if (const auto rv = ::getaddrinfo(opts.host.c_str(), opts.port.c_str(),
                                      &hints, &res); rv != 0) {
        return connection_failure{
            "unable to resolve " + endpoint() + ": " + ::gai_strerror(rv)
        };
    }
    const auto list = addrinfo_ptr{res};
    auto err = os_error_code{};
    for (auto p = list.get(); p; p = p->ai_next) {
        auto fd = owning_descriptor{
            ::socket(p->ai_family, p->ai_socktype|SOCK_CLOEXEC, p->ai_protocol)
        };
        if (!fd) {
            err = last_os_error();
            continue;
        }
        if (opts.timeout.count() > 0) {
            if (const auto ec = set_timeout(fd, opts.timeout);
                ec != os_error_code{}) {
                *diags << "unable to set timeout for " << endpoint();
                *diags << ": " << ec << "\n";
            }
        }
        auto rc = 0;
        do {
            rc = ::connect(int(fd), p->ai_addr, p->ai_addrlen);
        } while ((rc == -1) && (errno == EINTR));
        if (rc == -1) {
            err = last_os_error();
            continue;
        }
        socket = std::move(fd);
        stream = std::make_unique<descriptor_iostream>(socket);
        return {};
    }
    return connection_failure{describe("unable to connect to " + endpoint(),
                                       err)};
}

auto tcp_peer::send(const remote_command& command, bool scripted)
    -> remote_result
{
    if (!stream) {
        return connection_failure{"not connected to " + endpoint()};
    }
    auto request = std::string(1u, scripted? tcp_protocol::scripted_tag:
                                             tcp_protocol::interactive_tag);
    request += ' ';
    request += serialize(command);
    request += '\n';
    errno = 0;
    stream->write(data(request), static_cast<std::streamsize>(size(request)));
    stream->flush();
    if (!*stream) {
        const auto err = last_os_error();
        drop();
        return connection_failure{describe("unable to send to " + endpoint(),
                                           err)};
    }
    auto text = std::string{};
    auto line = std::string{};
    for (;;) {
        errno = 0;
        if (!std::getline(*stream, line)) {
            const auto err = last_os_error();
            drop();
            return connection_failure{
                describe("reply from " + endpoint() + " cut short", err)
            };
        }
        if (!line.empty() && (line.back() == '\r')) {
            line.pop_back();
        }
        if (line == tcp_protocol::reply_terminator) {
            break;
        }
        if (line.starts_with(tcp_protocol::stuffed_prefix)) {
            line.erase(0u, 1u);
        }
        text += line;
        text += '\n';
    }
    return reply{std::move(text)};
}

auto tcp_peer::stop() noexcept -> void
{
    if (socket) {
        // Lets the server see the session's end before the close.
        if (::shutdown(int(socket), SHUT_WR) == -1) {
            *diags << "unable to shut down connection to " << endpoint();
            *diags << ": " << last_os_error() << "\n";
        }
    }
    drop();
}

auto tcp_peer::drop() noexcept -> void
{
    stream.reset();
    if (const auto err = socket.close(); err != os_error_code{}) {
        *diags << "error closing connection to " << endpoint();
        *diags << ": " << err << "\n";
    }
}

}
