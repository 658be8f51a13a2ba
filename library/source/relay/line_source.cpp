#include <ostream> // for std::flush

#include "relay/line_source.hpp"

namespace relay {

namespace {

auto getline(std::istream& in, std::size_t& count)
    -> std::optional<std::string>
{
    auto line = std::string{};
    if (!std::getline(in, line)) {
        return {};
    }
    if (!line.empty() && (line.back() == '\r')) {
        line.pop_back();
    }
    ++count;
    return {std::move(line)};
}

}

stream_line_source::stream_line_source(std::istream& in_,
                                       std::string name,
                                       std::ostream* prompt_stream,
                                       std::string prompt):
    in{&in_},
    source_name{std::move(name)},
    prompt_os{prompt_stream},
    prompt_text{std::move(prompt)}
{
    // Intentionally empty.
}

auto stream_line_source::read_line() -> std::optional<std::string>
{
    if (prompt_os && !prompt_text.empty()) {
        *prompt_os << prompt_text << std::flush;
    }
    return getline(*in, count);
}

auto stream_line_source::name() const -> std::string
{
    return source_name;
}

auto stream_line_source::line_number() const noexcept -> std::size_t
{
    return count;
}

file_line_source::file_line_source(const std::filesystem::path& path):
    file_path{path}, stream{path}
{
    // Intentionally empty.
}

auto file_line_source::is_open() const -> bool
{
    return stream.is_open();
}

auto file_line_source::read_line() -> std::optional<std::string>
{
    return getline(stream, count);
}

auto file_line_source::name() const -> std::string
{
    return file_path.string();
}

auto file_line_source::line_number() const noexcept -> std::size_t
{
    return count;
}

}
