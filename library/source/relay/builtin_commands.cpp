#include <algorithm> // for std::max
#include <iomanip> // for std::setw, std::left, std::quoted
#include <sstream> // for std::ostringstream

#include "relay/builtin_commands.hpp"
#include "relay/session.hpp"

namespace relay {

namespace {

auto do_exit(session& context, const arguments&) -> outcome
{
    context.exit_requested = true;
    return no_output{};
}

auto do_execute(session& context, const arguments& args) -> outcome
{
    if (auto err = context.scripts.enter(args[1])) {
        return *std::move(err);
    }
    return no_output{};
}

auto do_help(session& context, const arguments& args) -> outcome
{
    if (size(args) == 1u) {
        return text_output{help_listing(context.commands)};
    }
    const auto found = context.commands.find(args[1]);
    if (!found) {
        std::ostringstream os;
        os << std::quoted(args[1]);
        return command_error{error_kind::unknown_command, os.str()};
    }
    std::ostringstream os;
    os << found->name << ": " << found->summary << "\n";
    os << usage_line(*found) << "\n";
    return text_output{os.str()};
}

}

auto add_session_commands(command_registry& registry) -> void
{
    registry.add(make_local_descriptor(builtin_names::exit,
        "closes the session.", "",
        checks::exact_count(0u), do_exit));
    registry.add(make_local_descriptor(builtin_names::execute,
        "reads and runs commands from the given script file.", "<file>",
        checks::exact_count(1u), do_execute));
    registry.add(make_local_descriptor(builtin_names::help,
        "provides help on available commands.", "[<command-name>]",
        checks::count_range(0u, 1u), do_help));
}

auto add_collection_commands(command_registry& registry) -> void
{
    registry.add(make_remote_descriptor("clear",
        "removes every element from the collection.", "",
        checks::exact_count(0u)));
    registry.add(make_remote_descriptor("count_by_birthday",
        "counts elements having the given birthday.", "<YYYY-MM-DD>",
        checks::all_of({checks::exact_count(1u), checks::date_at(1u)})));
    registry.add(make_remote_descriptor("group",
        "groups elements by height and shows the size of each group.", "",
        checks::exact_count(0u)));
    registry.add(make_remote_descriptor("info",
        "shows information about the collection.", "",
        checks::exact_count(0u)));
    registry.add(make_remote_descriptor("print_birthdays",
        "shows the birthdays of all elements in descending order.", "",
        checks::exact_count(0u)));
    registry.add(make_remote_descriptor("remove",
        "removes the element having the given id.", "<id>",
        checks::all_of({checks::exact_count(1u), checks::integer_at(1u)})));
    registry.add(make_remote_descriptor("show",
        "shows every element of the collection.", "",
        checks::exact_count(0u)));
    registry.add(make_remote_descriptor("shuffle",
        "shuffles the elements of the collection.", "",
        checks::exact_count(0u)));
}

auto make_standard_registry() -> command_registry
{
    auto registry = command_registry{};
    add_session_commands(registry);
    add_collection_commands(registry);
    return registry;
}

auto help_listing(const command_registry& registry) -> std::string
{
    auto width = std::size_t{};
    for (auto&& entry: registry) {
        width = std::max(width, size(entry.first.get()));
    }
    std::ostringstream os;
    for (auto&& entry: registry) {
        os << "  " << std::left << std::setw(static_cast<int>(width));
        os << entry.first.get();
        os << " (" << entry.second.tag << "): ";
        os << entry.second.summary << "\n";
    }
    return os.str();
}

auto usage_line(const command_descriptor& descriptor) -> std::string
{
    auto result = std::string{"usage: "};
    result += descriptor.name.get();
    if (!descriptor.synopsis.empty()) {
        result += ' ';
        result += descriptor.synopsis;
    }
    return result;
}

}
