#include <iomanip> // for std::quoted
#include <sstream> // for std::ostringstream
#include <stdexcept> // for std::invalid_argument
#include <utility> // for std::move

#include "relay/command_registry.hpp"

namespace relay {

auto command_registry::add(command_descriptor descriptor)
    -> const command_descriptor&
{
    if (empty(descriptor.name.get())) {
        throw std::invalid_argument{"command name may not be empty"};
    }
    auto name = descriptor.name;
    const auto result = descriptors.emplace(std::move(name),
                                            std::move(descriptor));
    if (!result.second) {
        std::ostringstream os;
        os << "command " << std::quoted(result.first->first.get());
        os << " already registered";
        throw std::invalid_argument{os.str()};
    }
    return result.first->second;
}

auto command_registry::find(std::string_view name) const
    -> const command_descriptor*
{
    auto normalized = normalize_command_name(name);
    if (normalized.empty() ||
        (normalized.find_first_not_of(detail::name_charset::chars) !=
         std::string::npos)) {
        return nullptr;
    }
    const auto found = descriptors.find(command_name{std::move(normalized)});
    if (found == descriptors.end()) {
        return nullptr;
    }
    return &found->second;
}

auto command_registry::resolve(const arguments& tokens) const -> resolution
{
    if (tokens.empty() || normalize_command_name(tokens[0]).empty()) {
        return command_error{error_kind::no_command, {}};
    }
    if (const auto found = find(tokens[0])) {
        return std::cref(*found);
    }
    std::ostringstream os;
    os << std::quoted(std::string{trim(tokens[0])});
    return command_error{error_kind::unknown_command, os.str()};
}

}
