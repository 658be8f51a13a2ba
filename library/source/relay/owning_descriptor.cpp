#include <unistd.h> // for close

#include <cerrno> // for errno
#include <type_traits> // for std::underlying_type_t
#include <utility> // for std::exchange

#include "relay/owning_descriptor.hpp"

namespace relay {

auto operator<<(std::ostream& os, reference_descriptor value) -> std::ostream&
{
    using underlying_type = std::underlying_type_t<reference_descriptor>;
    os << static_cast<underlying_type>(value);
    return os;
}

owning_descriptor::~owning_descriptor()
{
    close();
}

owning_descriptor::owning_descriptor(owning_descriptor&& other) noexcept
    : d{std::exchange(other.d, default_descriptor)} {}

auto owning_descriptor::operator=(owning_descriptor&& other) noexcept
    -> owning_descriptor&
{
    if (&other != this) {
        close();
        d = std::exchange(other.d, default_descriptor);
    }
    return *this;
}

auto owning_descriptor::close() noexcept -> os_error_code
{
    if (d != descriptors::invalid_id) {
        const auto id = std::exchange(d, descriptors::invalid_id);
        if (::close(int(id)) == -1) {
            return os_error_code{errno};
        }
    }
    return os_error_code{};
}

}
