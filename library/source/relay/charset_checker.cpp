#include <cctype> // for std::isprint
#include <sstream> // for std::ostringstream

#include "relay/charset_checker.hpp"

namespace relay::detail {

auto charset_validator(std::string v, std::string_view chars) -> std::string
{
    const auto found = v.find_first_not_of(chars);
    if (found != std::string::npos) {
        const auto c = v[found];
        std::ostringstream os;
        os << "may not contain '";
        if (std::isprint(static_cast<unsigned char>(c))) {
            os << c;
        }
        else {
            os << "\\" << std::oct << int(c);
        }
        os << "', character not allowed";
        throw charset_validator_error{os.str()};
    }
    return v;
}

}
