#include "relay/display.hpp"

namespace relay {

ostream_display::ostream_display(std::ostream& out, std::ostream& err) noexcept:
    out_os{&out}, err_os{&err}
{
    // Intentionally empty.
}

auto ostream_display::show(std::string_view text, bool suppress, bool is_error)
    -> void
{
    if (suppress) {
        return;
    }
    auto& os = is_error? *err_os: *out_os;
    os << text;
    if (text.empty() || (text.back() != '\n')) {
        os << '\n';
    }
    os.flush();
}

}
