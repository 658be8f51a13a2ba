#ifndef relay_script_controller_hpp
#define relay_script_controller_hpp

#include <cstddef> // for std::size_t
#include <filesystem>
#include <memory> // for std::unique_ptr
#include <optional>
#include <vector>

#include "relay/error_kind.hpp"
#include "relay/line_source.hpp"

namespace relay {

/// @brief One active script.
struct script_frame
{
    /// @brief Canonical path of the script. Unique within the stack.
    std::filesystem::path path;

    std::unique_ptr<line_source> source;
};

/// @brief Tracks nested script inclusion.
/// @details A stack of script frames over a base interactive line source.
///   The session is scripted exactly while the stack is non-empty, and the
///   current source is always that of the top frame, or the interactive
///   source when there's none. The stack only ever changes through
///   <code>enter</code>, <code>exit</code>, and <code>reset</code>.
struct script_controller
{
    explicit script_controller(line_source& interactive) noexcept;

    script_controller(const script_controller&) = delete;
    auto operator=(const script_controller&) -> script_controller& = delete;

    /// @brief Enters the script at the given path.
    /// @post On success, the script's frame is on top of the stack and its
    ///   source is the current source. On failure nothing has changed.
    /// @return Empty optional on success, else an error with kind
    ///   <code>script_not_found</code> if the path can't be read as a file, or
    ///   kind <code>recursive_script</code> if the path's canonical form is
    ///   already on the stack.
    auto enter(const std::filesystem::path& path)
        -> std::optional<command_error>;

    /// @brief Exits the top script, as when its source is exhausted.
    /// @throws std::logic_error if there is no script to exit.
    auto exit() -> void;

    /// @brief Exits every script, returning to the interactive source.
    auto reset() noexcept -> void;

    [[nodiscard]] auto scripted() const noexcept -> bool
    {
        return !frames.empty();
    }

    [[nodiscard]] auto depth() const noexcept -> std::size_t
    {
        return frames.size();
    }

    /// @brief Whether a script having the given canonical path is active.
    [[nodiscard]] auto contains(const std::filesystem::path& canonical) const
        -> bool;

    [[nodiscard]] auto current_source() noexcept -> line_source&;

    [[nodiscard]] auto interactive_source() const noexcept -> line_source&
    {
        return *base;
    }

    /// @brief Canonical paths of the active scripts, outermost first.
    [[nodiscard]] auto paths() const -> std::vector<std::filesystem::path>;

private:
    line_source* base{};
    std::vector<script_frame> frames;
};

}

#endif /* relay_script_controller_hpp */
