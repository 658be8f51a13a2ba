#include "relay/remote_peer.hpp"

namespace relay {

auto operator<<(std::ostream& os, const connection_failure& value)
    -> std::ostream&
{
    os << "connection failure";
    if (!value.detail.empty()) {
        os << ": " << value.detail;
    }
    return os;
}

}
