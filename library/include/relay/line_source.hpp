#ifndef relay_line_source_hpp
#define relay_line_source_hpp

#include <cstddef> // for std::size_t
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace relay {

/// @brief Source of input lines.
struct line_source
{
    virtual ~line_source() = default;

    /// @brief Reads the next line.
    /// @note Blocks until a line is available or the source is exhausted.
    /// @return Line without its terminating newline, or an empty optional if
    ///   the source is exhausted.
    virtual auto read_line() -> std::optional<std::string> = 0;

    /// @brief Name for diagnostics, like the path of a script.
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /// @brief Number of the line most recently read, counting from 1.
    [[nodiscard]] virtual auto line_number() const noexcept -> std::size_t = 0;
};

/// @brief Line source reading from a caller owned input stream.
/// @details Writes the configured prompt to the prompt stream, if any, before
///   each read.
struct stream_line_source: line_source
{
    stream_line_source(std::istream& in,
                       std::string name,
                       std::ostream* prompt_stream = nullptr,
                       std::string prompt = {});

    auto read_line() -> std::optional<std::string> override;
    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto line_number() const noexcept -> std::size_t override;

private:
    std::istream* in{};
    std::string source_name;
    std::ostream* prompt_os{};
    std::string prompt_text;
    std::size_t count{};
};

/// @brief Line source reading from a file it owns.
struct file_line_source: line_source
{
    explicit file_line_source(const std::filesystem::path& path);

    [[nodiscard]] auto is_open() const -> bool;

    auto read_line() -> std::optional<std::string> override;
    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto line_number() const noexcept -> std::size_t override;

private:
    std::filesystem::path file_path;
    std::ifstream stream;
    std::size_t count{};
};

}

#endif /* relay_line_source_hpp */
