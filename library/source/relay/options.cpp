#include <iomanip> // for std::quoted

#include "relay/options.hpp"
#include "relay/utility.hpp"

namespace relay {

namespace {

auto invalid_value(std::ostream& diags, std::string_view arg,
                   std::string_view expected) -> void
{
    diags << "invalid argument " << std::quoted(arg);
    diags << ": expected " << expected << "\n";
}

}

auto parse_options(const std::span<const std::string>& args,
                   std::ostream& diags) -> std::optional<shell_options>
{
    using namespace option_names;
    auto result = shell_options{};
    auto okay = true;
    for (auto&& arg: args.subspan(args.empty()? 0u: 1u)) {
        const auto view = std::string_view{arg};
        if (view == help_argument) {
            result.help = true;
            continue;
        }
        if (view == usage_argument) {
            result.usage = true;
            continue;
        }
        if (view == stop_on_error_argument) {
            result.stop_script_on_error = true;
            continue;
        }
        if (view.starts_with(host_prefix)) {
            const auto value = view.substr(size(host_prefix));
            if (value.empty()) {
                invalid_value(diags, arg, "a host name or address");
                okay = false;
                continue;
            }
            result.peer.host = value;
            continue;
        }
        if (view.starts_with(port_prefix)) {
            const auto value = view.substr(size(port_prefix));
            const auto number = to_int64(value);
            if (!number || (*number < 1) || (*number > 65535)) {
                invalid_value(diags, arg, "a port number from 1 to 65535");
                okay = false;
                continue;
            }
            result.peer.port = value;
            continue;
        }
        if (view.starts_with(timeout_prefix)) {
            const auto number = to_int64(view.substr(size(timeout_prefix)));
            if (!number || (*number < 0)) {
                invalid_value(diags, arg, "a non-negative number of milliseconds");
                okay = false;
                continue;
            }
            result.peer.timeout = std::chrono::milliseconds{*number};
            continue;
        }
        if (view.starts_with(file_prefix)) {
            const auto value = view.substr(size(file_prefix));
            if (value.empty()) {
                invalid_value(diags, arg, "a script file path");
                okay = false;
                continue;
            }
            result.script = std::filesystem::path{value};
            continue;
        }
        if (view.starts_with(editor_prefix)) {
            const auto value = view.substr(size(editor_prefix));
            if ((value != vi_editor_str) && (value != emacs_editor_str)) {
                invalid_value(diags, arg, "vi or emacs");
                okay = false;
                continue;
            }
            result.editor = value;
            continue;
        }
        if (view.starts_with(history_prefix)) {
            const auto number = to_int64(view.substr(size(history_prefix)));
            if (!number || (*number < 1) || (*number > 100000)) {
                invalid_value(diags, arg, "a history size from 1 to 100000");
                okay = false;
                continue;
            }
            result.history_size = static_cast<int>(*number);
            continue;
        }
        diags << std::quoted(arg) << ": unrecognized argument\n";
        okay = false;
    }
    if (!okay) {
        return {};
    }
    return {result};
}

auto write_usage(std::ostream& os, std::string_view program) -> void
{
    using namespace option_names;
    os << "usage: " << program;
    os << " [" << help_argument << "|" << usage_argument << "]";
    os << " [" << host_prefix << "<host>]";
    os << " [" << port_prefix << "<port>]";
    os << " [" << timeout_prefix << "<milliseconds>]";
    os << " [" << file_prefix << "<script>]";
    os << " [" << editor_prefix << vi_editor_str << "|" << emacs_editor_str << "]";
    os << " [" << history_prefix << "<size>]";
    os << " [" << stop_on_error_argument << "]";
    os << "\n";
}

auto write_help(std::ostream& os, std::string_view program) -> void
{
    using namespace option_names;
    write_usage(os, program);
    os << "\n";
    os << "Interactive shell for a remote collection server.\n\n";
    os << "  " << host_prefix << "<host>  server host (default localhost).\n";
    os << "  " << port_prefix << "<port>  server port (default 4040).\n";
    os << "  " << timeout_prefix << "<ms>  server I/O timeout, 0 for none.\n";
    os << "  " << file_prefix << "<script>  runs the script first.\n";
    os << "  " << editor_prefix << "<name>  line editing key bindings.\n";
    os << "  " << history_prefix << "<size>  entries of history kept.\n";
    os << "  " << stop_on_error_argument;
    os << "  abandons running scripts on their first error.\n";
    os << "\n";
    os << "Exits with failure status if the connection to the server fails\n";
    os << "while a script is running, or if a script given by ";
    os << file_prefix << " can't be run.\n";
}

}
