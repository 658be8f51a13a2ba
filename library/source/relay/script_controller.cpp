#include <algorithm> // for std::any_of
#include <iomanip> // for std::quoted
#include <sstream> // for std::ostringstream
#include <stdexcept> // for std::logic_error
#include <system_error> // for std::error_code

#include "relay/script_controller.hpp"

namespace relay {

namespace {

auto script_error(error_kind kind,
                  const std::filesystem::path& path,
                  const std::string& reason = {}) -> command_error
{
    std::ostringstream os;
    os << path;
    if (!reason.empty()) {
        os << ": " << reason;
    }
    return {kind, os.str()};
}

}

script_controller::script_controller(line_source& interactive) noexcept:
    base{&interactive}
{
    // Intentionally empty.
}

auto script_controller::enter(const std::filesystem::path& path)
    -> std::optional<command_error>
{
    auto ec = std::error_code{};
    const auto canonical = std::filesystem::canonical(path, ec);
    if (ec) {
        return script_error(error_kind::script_not_found, path, ec.message());
    }
    if (!std::filesystem::is_regular_file(canonical, ec)) {
        return script_error(error_kind::script_not_found, path,
                            ec? ec.message(): "not a regular file");
    }
    if (contains(canonical)) {
        return script_error(error_kind::recursive_script, canonical);
    }
    auto source = std::make_unique<file_line_source>(canonical);
    if (!source->is_open()) {
        return script_error(error_kind::script_not_found, path,
                            "unable to open");
    }
    frames.push_back(script_frame{canonical, std::move(source)});
    return {};
}

auto script_controller::exit() -> void
{
    if (frames.empty()) {
        throw std::logic_error{"no script to exit"};
    }
    frames.pop_back();
}

auto script_controller::reset() noexcept -> void
{
    frames.clear();
}

auto script_controller::contains(const std::filesystem::path& canonical) const
    -> bool
{
    return std::any_of(begin(frames), end(frames), [&](const auto& frame){
        return frame.path == canonical;
    });
}

auto script_controller::current_source() noexcept -> line_source&
{
    return frames.empty()? *base: *frames.back().source;
}

auto script_controller::paths() const -> std::vector<std::filesystem::path>
{
    auto result = std::vector<std::filesystem::path>{};
    for (auto&& frame: frames) {
        result.push_back(frame.path);
    }
    return result;
}

}
