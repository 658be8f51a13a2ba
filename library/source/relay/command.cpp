#include <stdexcept> // for std::logic_error

#include "relay/command.hpp"
#include "relay/session.hpp"

namespace relay {

auto operator<<(std::ostream& os, capability value) -> std::ostream&
{
    os << to_cstring(value);
    return os;
}

auto operator<<(std::ostream& os, const no_output&) -> std::ostream&
{
    return os;
}

auto operator<<(std::ostream& os, const text_output& value) -> std::ostream&
{
    os << value.text;
    return os;
}

auto operator<<(std::ostream& os, const outcome& value) -> std::ostream&
{
    std::visit([&os](const auto& v) { os << v; }, value);
    return os;
}

auto local_command::run(session& context) const -> outcome
{
    if (!action) {
        throw std::logic_error{"local command has no action"};
    }
    return action(context, args);
}

auto serialize(const remote_command& command) -> std::string
{
    return join(command.args);
}

}
