#include <algorithm> // for std::transform
#include <cctype> // for std::tolower

#include "relay/command_name.hpp"
#include "relay/utility.hpp"

namespace relay {

auto normalize_command_name(std::string_view text) -> std::string
{
    auto result = std::string{trim(text)};
    std::transform(begin(result), end(result), begin(result), [](char c){
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return result;
}

auto command_name_checker::operator()(std::string_view v) const -> std::string
{
    using checker = detail::allowed_chars_checker<detail::name_charset>;
    return checker{}(normalize_command_name(v));
}

auto operator<<(std::ostream& os, const command_name& name) -> std::ostream&
{
    os << name.get();
    return os;
}

}
