#ifndef relay_os_error_code_hpp
#define relay_os_error_code_hpp

#include <ostream>
#include <string>

namespace relay {

/// @brief Operating system error code, i.e. an <code>errno</code> value.
enum class os_error_code: int;

/// @brief Gets the calling thread's current <code>errno</code>.
auto last_os_error() noexcept -> os_error_code;

auto operator<<(std::ostream& os, os_error_code err)
    -> std::ostream&;

auto to_string(os_error_code err) -> std::string;

}

#endif /* relay_os_error_code_hpp */
