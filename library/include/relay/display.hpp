#ifndef relay_display_hpp
#define relay_display_hpp

#include <ostream>
#include <string_view>

namespace relay {

/// @brief Sink for what's presented to the user.
struct display
{
    virtual ~display() = default;

    /// @brief Shows the given text.
    /// @param[in] text What to show. Need not end with a newline.
    /// @param[in] suppress Whether the text is noise in the current mode and
    ///   so should be left unshown.
    /// @param[in] is_error Whether the text reports an error.
    virtual auto show(std::string_view text, bool suppress, bool is_error)
        -> void = 0;
};

/// @brief Display writing errors to one stream and everything else to
///   another.
struct ostream_display: display
{
    ostream_display(std::ostream& out, std::ostream& err) noexcept;

    auto show(std::string_view text, bool suppress, bool is_error)
        -> void override;

private:
    std::ostream* out_os{};
    std::ostream* err_os{};
};

}

#endif /* relay_display_hpp */
