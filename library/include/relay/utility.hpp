#ifndef relay_utility_hpp
#define relay_utility_hpp

#include <cstdint> // for std::int64_t
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error> // for std::error_code
#include <vector>

namespace relay {

namespace detail {
template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}

/// @brief Tokens of an input line, the command name being the first.
using arguments = std::vector<std::string>;

/// @brief Whitespace characters that separate tokens.
constexpr auto whitespace_chars = std::string_view{" \t\n\v\f\r"};

/// @brief Removes leading and trailing whitespace from the given view.
auto trim(std::string_view text) noexcept -> std::string_view;

/// @brief Splits the given line on runs of whitespace.
/// @note Leading and trailing whitespace never produce empty tokens, so an
///   empty or all-whitespace line results in no tokens.
auto tokenize(std::string_view line) -> arguments;

/// @brief Joins the given strings with the given separator between them.
auto join(const std::vector<std::string>& strings,
          std::string_view separator = " ") -> std::string;

/// @brief Parses the whole of the given view as a base ten integer.
/// @return Value or an empty optional if not entirely an in-range integer.
auto to_int64(std::string_view view) -> std::optional<std::int64_t>;

auto write(std::ostream& os, const std::error_code& ec)
    -> std::ostream&;

}

#endif /* relay_utility_hpp */
