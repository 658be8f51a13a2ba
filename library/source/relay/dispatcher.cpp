#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "relay/dispatcher.hpp"
#include "relay/utility.hpp"

namespace relay {

auto operator<<(std::ostream& os, session_end value) -> std::ostream&
{
    os << to_cstring(value);
    return os;
}

dispatcher::dispatcher(command_registry commands,
                       line_source& interactive,
                       remote_peer& peer_,
                       display& sink_,
                       dispatcher_options opts):
    registry{std::move(commands)},
    controller{interactive},
    context{registry, controller},
    peer{&peer_},
    sink{&sink_},
    options{std::move(opts)}
{
    // Intentionally empty.
}

auto dispatcher::run() -> session_end
{
    if (const auto failure = peer->start()) {
        return fail(*failure);
    }
    show(options.greeting, true, false);
    for (;;) {
        if (const auto end = step()) {
            return *end;
        }
    }
}

auto dispatcher::step() -> std::optional<session_end>
{
    auto line = controller.current_source().read_line();
    if (!line) {
        if (controller.scripted()) {
            controller.exit();
            return {};
        }
        show("\nend of input, closing the session.", false, false);
        return finish(session_end::end_of_input);
    }
    return process(*line);
}

auto dispatcher::process(std::string_view line) -> std::optional<session_end>
{
    const auto tokens = tokenize(line);
    const auto resolved = registry.resolve(tokens);
    if (const auto p = std::get_if<command_error>(&resolved)) {
        report(*p);
        return {};
    }
    const auto& descriptor = std::get<0>(resolved).get();
    const auto validated = descriptor.validate(tokens);
    if (const auto p = std::get_if<command_error>(&validated)) {
        report(*p);
        return {};
    }
    return execute(std::get<command>(validated));
}

auto dispatcher::execute(const command& cmd) -> std::optional<session_end>
{
    return std::visit(detail::overloaded{
        [this](const local_command& local) -> std::optional<session_end> {
            const auto result = local.run(context);
            present(result);
            if (context.exit_requested) {
                return finish(session_end::exit_requested);
            }
            return {};
        },
        [this](const remote_command& remote) -> std::optional<session_end> {
            const auto result = peer->send(remote, scripted());
            if (const auto p = std::get_if<connection_failure>(&result)) {
                return fail(*p);
            }
            present(text_output{std::get<reply>(result).text});
            return {};
        },
    }, cmd);
}

auto dispatcher::present(const outcome& result) -> void
{
    std::visit(detail::overloaded{
        [](const no_output&){},
        [this](const text_output& output){
            if (!output.text.empty()) {
                show(output.text, false, false);
            }
        },
        [this](const command_error& err){
            report(err);
        },
    }, result);
}

auto dispatcher::report(const command_error& err) -> void
{
    std::ostringstream os;
    os << location() << err;
    show(os.str(), is_silent_when_scripted(err.kind), true);
    if (options.stop_script_on_error && scripted() &&
        !is_silent_when_scripted(err.kind)) {
        show("abandoning running scripts", false, true);
        controller.reset();
    }
}

auto dispatcher::location() -> std::string
{
    if (!scripted()) {
        return {};
    }
    const auto& source = controller.current_source();
    std::ostringstream os;
    os << source.name() << ':' << source.line_number() << ": ";
    return os.str();
}

auto dispatcher::show(std::string_view text, bool suppress_when_scripted,
                      bool is_error) -> void
{
    sink->show(text, suppress_when_scripted && scripted(), is_error);
}

auto dispatcher::fail(const connection_failure& failure) -> session_end
{
    std::ostringstream os;
    os << location() << failure;
    abandoned = controller.depth();
    if (abandoned > 0u) {
        os << "; abandoning " << abandoned << " running script(s)";
    }
    os << "; closing the session.";
    show(os.str(), false, true);
    return finish(session_end::connection_failure);
}

auto dispatcher::finish(session_end end) -> session_end
{
    controller.reset();
    peer->stop();
    return end;
}

}
