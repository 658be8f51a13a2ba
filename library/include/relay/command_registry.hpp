#ifndef relay_command_registry_hpp
#define relay_command_registry_hpp

#include <functional> // for std::reference_wrapper
#include <map>
#include <string_view>
#include <variant>

#include "relay/command_descriptor.hpp"
#include "relay/command_name.hpp"
#include "relay/error_kind.hpp"
#include "relay/utility.hpp"

namespace relay {

using resolution = std::variant<
    std::reference_wrapper<const command_descriptor>,
    command_error
>;

/// @brief Mapping of normalized command names to their descriptors.
/// @note Lookups never modify the registry, so a registry that's been filled
///   in at start up can be shared freely.
struct command_registry
{
    using map_type = std::map<command_name, command_descriptor>;
    using const_iterator = map_type::const_iterator;

    /// @brief Registers the given descriptor under its name.
    /// @throws std::invalid_argument if the descriptor's name is empty or
    ///   already registered.
    auto add(command_descriptor descriptor) -> const command_descriptor&;

    /// @brief Finds the descriptor registered for the given name.
    /// @return Pointer to the descriptor or <code>nullptr</code>.
    [[nodiscard]] auto find(std::string_view name) const
        -> const command_descriptor*;

    /// @brief Resolves the descriptor for the given tokens of an input line.
    /// @return Descriptor selected by the first token, else an error with kind
    ///   <code>no_command</code> if there's no first token or it normalizes
    ///   to nothing, or kind <code>unknown_command</code>.
    [[nodiscard]] auto resolve(const arguments& tokens) const -> resolution;

    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return descriptors.size();
    }

    [[nodiscard]] auto begin() const noexcept -> const_iterator
    {
        return descriptors.begin();
    }

    [[nodiscard]] auto end() const noexcept -> const_iterator
    {
        return descriptors.end();
    }

private:
    map_type descriptors;
};

}

#endif /* relay_command_registry_hpp */
