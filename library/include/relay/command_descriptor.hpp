#ifndef relay_command_descriptor_hpp
#define relay_command_descriptor_hpp

#include <cstddef> // for std::size_t
#include <functional> // for std::function
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "relay/command.hpp"
#include "relay/command_name.hpp"
#include "relay/error_kind.hpp"
#include "relay/utility.hpp"

namespace relay {

/// @brief Checks tokens against an argument contract.
/// @return Empty optional if acceptable, else the argument error.
using argument_checker =
    std::function<auto(const arguments& tokens) -> std::optional<command_error>>;

/// @brief Definition of one command.
/// @details Holds a command's name, its argument contract, and how it's
///   executed. Built once via <code>make_local_descriptor</code> or
///   <code>make_remote_descriptor</code> and not changed afterwards.
struct command_descriptor
{
    command_name name;
    capability tag{capability::remote_forwarded};

    /// @brief One line description for help output.
    std::string summary;

    /// @brief Argument synopsis for usage output, e.g. <code>"<id>"</code>.
    std::string synopsis;

    argument_checker check;

    /// @brief What a local command does. Empty for remote commands.
    local_command::action_type action;

    /// @brief Validates the given tokens into a command ready to run.
    /// @param[in] tokens Tokens of the input line, command name first.
    /// @return Command of the alternative matching @c tag, else an error
    ///   having kind <code>argument_count_mismatch</code> or
    ///   <code>argument_type_mismatch</code>.
    /// @throws std::logic_error if this is local but has no action.
    [[nodiscard]] auto validate(const arguments& tokens) const
        -> validation_result;
};

/// @throws std::invalid_argument if @p action is empty.
auto make_local_descriptor(command_name name,
                           std::string summary,
                           std::string synopsis,
                           argument_checker check,
                           local_command::action_type action)
    -> command_descriptor;

auto make_remote_descriptor(command_name name,
                            std::string summary,
                            std::string synopsis,
                            argument_checker check)
    -> command_descriptor;

/// @brief Whether the given text is a valid calendar date of the form
///   <code>YYYY-MM-DD</code>.
auto is_date(std::string_view text) -> bool;

}

namespace relay::checks {

/// @brief Requires exactly @p n arguments following the command name.
auto exact_count(std::size_t n) -> argument_checker;

/// @brief Requires from @p min to @p max arguments following the command name.
auto count_range(std::size_t min, std::size_t max) -> argument_checker;

/// @brief Requires the argument at @p index to be an integer.
/// @note Index 1 is the first argument after the command name.
auto integer_at(std::size_t index) -> argument_checker;

/// @brief Requires the argument at @p index to be a date.
/// @see is_date.
auto date_at(std::size_t index) -> argument_checker;

/// @brief Applies each of the given checkers in order, stopping at the first
///   error.
auto all_of(std::vector<argument_checker> checkers) -> argument_checker;

}

#endif /* relay_command_descriptor_hpp */
