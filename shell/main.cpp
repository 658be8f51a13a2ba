#include <cerrno> // for errno, EINTR
#include <cstdlib> // for EXIT_SUCCESS, EXIT_FAILURE
#include <iomanip> // for std::setw, std::quoted
#include <iostream>
#include <memory> // for std::unique_ptr
#include <sstream> // for std::ostringstream
#include <stdexcept> // for std::logic_error
#include <string>
#include <vector>

#include <unistd.h> // for ::isatty

#include <histedit.h>

#include "relay/builtin_commands.hpp"
#include "relay/dispatcher.hpp"
#include "relay/display.hpp"
#include "relay/line_source.hpp"
#include "relay/options.hpp"
#include "relay/session.hpp"
#include "relay/tcp_peer.hpp"
#include "relay/utility.hpp"

namespace {

constexpr auto shell_name = "relay";

/// @brief Makes the stated return type from given argument count and vector.
/// @param[in] ac Argument count.
/// @param[in] av Argument vector.
/// @pre @c av is non-null if @c ac is 1 or more.
auto make_arguments(int ac, const char*av[]) -> relay::arguments
{
    auto args = relay::arguments{};
    for (auto i = 0; i < ac; ++i) {
        args.emplace_back(av[i]);
    }
    return args;
}

struct EditLineDeleter
{
    void operator()(EditLine *p)
    {
        el_end(p);
    }
};

using edit_line_ptr = std::unique_ptr<EditLine, EditLineDeleter>;

struct HistoryDeleter
{
    void operator()(History *p)
    {
        history_end(p);
    }
};

using history_ptr = std::unique_ptr<History, HistoryDeleter>;

char *prompt([[maybe_unused]] EditLine *el)
{
    static auto buf = std::string{"\1\033[7m\1"} + shell_name + "$\1\033[0m\1 ";
    return buf.data();
}

/// @brief Line source reading from the terminal through libedit.
/// @details Lines that aren't blank are entered into the history.
struct edit_line_source: relay::line_source
{
    edit_line_source(EditLine *el_, History *hist_): el{el_}, hist{hist_}
    {
        // Intentionally empty.
    }

    auto read_line() -> std::optional<std::string> override
    {
        for (;;) {
            auto count = 0;
            errno = 0;
            const auto buf = el_gets(el, &count);
            if (!buf || count <= 0) {
                if (errno == EINTR) {
                    continue;
                }
                return {};
            }
            auto line = std::string(buf, static_cast<std::size_t>(count));
            if (!line.empty() && (line.back() == '\n')) {
                line.pop_back();
            }
            if (!relay::trim(line).empty()) {
                HistEvent ev{};
                if (history(hist, &ev, H_ENTER, line.c_str()) == -1) {
                    std::cerr << "history error (" << ev.num << ") ";
                    std::cerr << ev.str << "\n";
                }
            }
            ++number;
            return {std::move(line)};
        }
    }

    [[nodiscard]] auto name() const -> std::string override
    {
        return "terminal";
    }

    [[nodiscard]] auto line_number() const noexcept -> std::size_t override
    {
        return number;
    }

private:
    EditLine *el{};
    History *hist{};
    std::size_t number{};
};

auto do_history(History *hist, int hist_size, const relay::arguments& args)
    -> relay::outcome
{
    HistEvent ev{};
    if (size(args) > 1u) {
        if (args[1] != "clear") {
            std::ostringstream os;
            os << std::quoted(args[1]) << " is not \"clear\"";
            return relay::command_error{
                relay::error_kind::argument_type_mismatch, os.str()
            };
        }
        if (history(hist, &ev, H_CLEAR) == -1) {
            return relay::text_output{"unable to clear history\n"};
        }
        return relay::no_output{};
    }
    std::ostringstream os;
    const auto width = static_cast<int>(std::to_string(hist_size).size());
    for (auto rv = history(hist, &ev, H_LAST);
         rv != -1;
         rv = history(hist, &ev, H_PREV)) {
         os << std::setw(width) << ev.num << " " << ev.str << "\n";
    }
    return relay::text_output{os.str()};
}

auto do_editor(EditLine *el, const relay::arguments& args) -> relay::outcome
{
    if (!el) {
        return relay::text_output{"line editing is not in use.\n"};
    }
    if (size(args) > 1u) {
        const auto& arg = args[1];
        if ((arg != relay::vi_editor_str) && (arg != relay::emacs_editor_str)) {
            std::ostringstream os;
            os << std::quoted(arg) << " is not ";
            os << relay::vi_editor_str << " or " << relay::emacs_editor_str;
            return relay::command_error{
                relay::error_kind::argument_type_mismatch, os.str()
            };
        }
        el_set(el, EL_EDITOR, arg.c_str());
        return relay::no_output{};
    }
    auto ptr = static_cast<const char *>(nullptr);
    if (el_get(el, EL_EDITOR, &ptr) == -1 || !ptr) {
        return relay::text_output{"unable to get current shell editor\n"};
    }
    std::ostringstream os;
    os << "shell editor is currently " << std::quoted(ptr) << "\n";
    return relay::text_output{os.str()};
}

}

auto main(int argc, const char * argv[]) -> int
{
    const auto args = make_arguments(argc, argv);
    const auto opts = relay::parse_options(args, std::cerr);
    if (!opts) {
        relay::write_usage(std::cerr, shell_name);
        return EXIT_FAILURE;
    }
    if (opts->help) {
        relay::write_help(std::cout, shell_name);
        return EXIT_SUCCESS;
    }
    if (opts->usage) {
        relay::write_usage(std::cout, shell_name);
        return EXIT_SUCCESS;
    }

    // For example of using libedit, see: https://tinyurl.com/3ez9utzc
    HistEvent ev{};
    auto hist = history_ptr{history_init()};
    history(hist.get(), &ev, H_SETSIZE, opts->history_size);

    auto el = edit_line_ptr{};
    auto interactive = std::unique_ptr<relay::line_source>{};
    if (::isatty(STDIN_FILENO)) {
        el = edit_line_ptr{el_init(argv[0], stdin, stdout, stderr)};
        el_set(el.get(), EL_SIGNAL, 1); // installs sig handlers for resizing, etc.
        el_set(el.get(), EL_HIST, history, hist.get());
        el_set(el.get(), EL_PROMPT_ESC, prompt, '\1');
        el_set(el.get(), EL_EDITOR, opts->editor.c_str());
        el_source(el.get(), NULL);
        interactive = std::make_unique<edit_line_source>(el.get(), hist.get());
    }
    else {
        interactive = std::make_unique<relay::stream_line_source>(std::cin,
                                                                  "stdin");
    }

    auto registry = relay::make_standard_registry();
    registry.add(relay::make_local_descriptor("history",
        "shows the history of commands entered, or clears it.", "[clear]",
        relay::checks::count_range(0u, 1u),
        [&hist, hist_size = opts->history_size](relay::session&,
                                                 const relay::arguments& args){
            return do_history(hist.get(), hist_size, args);
        }));
    registry.add(relay::make_local_descriptor("editor",
        "shows or sets the shell editor.", "[vi|emacs]",
        relay::checks::count_range(0u, 1u),
        [&el](relay::session&, const relay::arguments& args){
            return do_editor(el.get(), args);
        }));

    auto peer = relay::tcp_peer{opts->peer, std::cerr};
    auto display = relay::ostream_display{std::cout, std::cerr};
    auto shell = relay::dispatcher{
        std::move(registry), *interactive, peer, display,
        relay::dispatcher_options{
            .stop_script_on_error = opts->stop_script_on_error,
        }
    };
    if (opts->script) {
        if (const auto err = shell.scripts().enter(*opts->script)) {
            std::cerr << *err << "\n";
            return EXIT_FAILURE;
        }
    }
    try {
        const auto end = shell.run();
        return ((end == relay::session_end::connection_failure) &&
                (shell.abandoned_scripts() > 0u))
            ? EXIT_FAILURE
            : EXIT_SUCCESS;
    }
    catch (const std::logic_error& ex) {
        std::cerr << "internal error: " << ex.what() << "\n";
    }
    return EXIT_FAILURE;
}
