#include <sys/socket.h> // for ::recv, ::send

#include <algorithm> // for std::min
#include <cerrno> // for errno, EINTR
#include <cstring> // for std::memmove

#include "relay/descriptor_iostream.hpp"

namespace relay {

namespace {

auto send_all(reference_descriptor id, const char* s, std::streamsize n)
    -> std::streamsize
{
    auto total = std::streamsize{};
    while (total < n) {
        const auto nsent = ::send(int(id), s + total,
                                  static_cast<std::size_t>(n - total),
                                  MSG_NOSIGNAL);
        if (nsent == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        total += nsent;
    }
    return total;
}

}

auto descriptor_streambuf::underflow() -> int_type
{
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    const auto nputback = (gptr() == nullptr)
        ? std::ptrdiff_t{}
        : std::min(gptr() - eback(), putback_size);
    if (nputback > 0) {
        std::memmove(buffer.data() + (putback_size - nputback),
                     gptr() - nputback, static_cast<std::size_t>(nputback));
    }
    auto nread = decltype(::recv(int(id), nullptr, 0u, 0)){};
    do {
        nread = ::recv(int(id), buffer.data() + putback_size,
                       buffer_size, 0);
    } while ((nread == -1) && (errno == EINTR));
    if (nread <= 0) {
        return traits_type::eof();
    }
    setg(buffer.data() + (putback_size - nputback),
         buffer.data() + putback_size,
         buffer.data() + putback_size + nread);
    return traits_type::to_int_type(*gptr());
}

auto descriptor_streambuf::overflow(int_type c) -> int_type
{
    if (!traits_type::eq_int_type(c, traits_type::eof()))
    {
        const auto onebuf = traits_type::to_char_type(c);
        if (send_all(id, &onebuf, 1) != 1) {
            return traits_type::eof();
        }
    }
    return traits_type::not_eof(c);
}

auto descriptor_streambuf::xsputn(const char_type* s, std::streamsize n)
    -> std::streamsize
{
    return send_all(id, s, n);
}

}
