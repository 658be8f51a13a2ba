#ifndef relay_charset_checker_hpp
#define relay_charset_checker_hpp

#include <concepts> // for std::convertible_to
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>

namespace relay {

struct charset_validator_error: public std::invalid_argument
{
    using invalid_argument::invalid_argument;
};

}

namespace relay::detail {

/// @brief Character set validator function.
/// @param[in] v Value to validate.
/// @param[in] chars Characters which @v may only consist of.
/// @throws charset_validator_error if @v is invalid.
auto charset_validator(std::string v, std::string_view chars) -> std::string;

template <class T>
concept is_charset = requires {
    { T::chars } -> std::convertible_to<std::string_view>;
};

/// @brief Checker that only lets through values made of the given charset.
template <is_charset Charset>
struct allowed_chars_checker
{
    static constexpr auto charset = std::string_view{Charset::chars};

    auto operator()() const noexcept // NOLINT(bugprone-exception-escape)
        -> std::string
    {
        return {};
    }

    auto operator()(std::string v) const -> std::string
    {
        return charset_validator(std::move(v), charset);
    }
};

struct name_charset {
    static constexpr auto chars = "abcdefghijklmnopqrstuvwxyz0123456789_";
};

}

#endif /* relay_charset_checker_hpp */
