#ifndef relay_descriptor_iostream_hpp
#define relay_descriptor_iostream_hpp

#include <array>
#include <cstddef> // for std::ptrdiff_t
#include <iostream>
#include <string> // for std::char_traits

#include "relay/owning_descriptor.hpp"

namespace relay {

/// @brief Socket descriptor stream buffer.
/// @details Input is buffered, output goes straight to the socket.
/// @note Some of this class's implementation derives from Nicolai M. Josuttis handling for
///   <code>boost::fdinbuf</code> and <code>boost::fdoutbuf</code>.
/// @see http://www.josuttis.com/cppcode/fdstream.hpp.
struct descriptor_streambuf: public std::streambuf {
public:
    using char_type = char;
    using traits_type = std::char_traits<char_type>;
    using int_type = typename traits_type::int_type;
    using pos_type = typename traits_type::pos_type;
    using off_type = typename traits_type::off_type;
    using state_type = typename traits_type::state_type;

    explicit descriptor_streambuf(reference_descriptor d): id(d)
    {
        // Intentionally empty.
    }

protected:
    int_type underflow() override;
    int_type overflow(int_type c = traits_type::eof()) override;
    std::streamsize xsputn(const char_type* s, std::streamsize n) override;

private:
    static constexpr auto buffer_size = 1024u;
    static constexpr auto putback_size = std::ptrdiff_t{8};
    reference_descriptor id{descriptors::invalid_id};
    std::array<char, buffer_size + putback_size> buffer{};
};

struct descriptor_iostream: public std::iostream {
    explicit descriptor_iostream(reference_descriptor fd)
        : std::iostream(nullptr), streambuf(fd)
    {
        rdbuf(&streambuf);
    }
private:
    descriptor_streambuf streambuf;
};

}

#endif /* relay_descriptor_iostream_hpp */
