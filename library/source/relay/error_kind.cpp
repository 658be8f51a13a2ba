#include "relay/error_kind.hpp"

namespace relay {

auto to_message(error_kind kind) -> std::string
{
    switch (kind) {
    case error_kind::no_command:
        return "no command entered";
    case error_kind::unknown_command:
        return "no such command";
    case error_kind::argument_count_mismatch:
        return "wrong number of arguments";
    case error_kind::argument_type_mismatch:
        return "invalid argument";
    case error_kind::script_not_found:
        return "script doesn't exist or can't be read";
    case error_kind::recursive_script:
        return "script is already running";
    case error_kind::connection_failure:
        return "connection to server is unusable";
    }
    return "unknown error";
}

auto operator<<(std::ostream& os, error_kind value) -> std::ostream&
{
    os << to_cstring(value);
    return os;
}

auto operator<<(std::ostream& os, const command_error& value)
    -> std::ostream&
{
    os << to_message(value.kind);
    if (!empty(value.detail)) {
        os << ": ";
        os << value.detail;
    }
    return os;
}

}
