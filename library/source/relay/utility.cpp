#include <cerrno> // for errno, ERANGE
#include <cstdlib> // for std::strtoll

#include "relay/utility.hpp"

namespace relay {

auto trim(std::string_view text) noexcept -> std::string_view
{
    const auto first = text.find_first_not_of(whitespace_chars);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace_chars);
    return text.substr(first, last - first + 1u);
}

auto tokenize(std::string_view line) -> arguments
{
    auto result = arguments{};
    for (;;) {
        const auto first = line.find_first_not_of(whitespace_chars);
        if (first == std::string_view::npos) {
            break;
        }
        line.remove_prefix(first);
        const auto last = line.find_first_of(whitespace_chars);
        result.emplace_back(line.substr(0u, last));
        if (last == std::string_view::npos) {
            break;
        }
        line.remove_prefix(last);
    }
    return result;
}

auto join(const std::vector<std::string>& strings,
          std::string_view separator) -> std::string
{
    auto result = std::string{};
    auto add_separator = false;
    for (auto&& string: strings) {
        if (add_separator) {
            result += separator;
        }
        result += string;
        add_separator = true;
    }
    return result;
}

auto to_int64(std::string_view view) -> std::optional<std::int64_t>
{
    if (empty(view) || (view.find_first_of(whitespace_chars) != view.npos)) {
        return {};
    }
    const auto string = std::string{view};
    char* p_end{};
    errno = 0;
    const auto n = std::strtoll(data(string), &p_end, 10);
    if ((p_end != data(string) + size(string)) || (errno == ERANGE)) {
        return {};
    }
    return {n};
}

auto write(std::ostream& os, const std::error_code& ec)
    -> std::ostream&
{
    os << ec << " (" << ec.message() << ")";
    return os;
}

}
