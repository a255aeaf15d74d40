#include "dispatch/engine.hpp"

#include "common/suggest.hpp"
#include "log/log.hpp"

namespace cdl::dispatch {

namespace {

/// `describe()` plus a "did you mean" hint for misspelled commands and flags.
auto format_error(const DispatchError& error) -> std::string {
    auto message = describe(error);
    if (error.kind != DispatchErrorKind::UnknownCommand &&
        error.kind != DispatchErrorKind::UnknownFlag) {
        return message;
    }

    auto similar = find_similar(error.token, error.candidates, 1);
    if (!similar.empty()) {
        message += "; did you mean '" + similar.front() + "'?";
    }
    return message;
}

} // namespace

Engine::Engine(sema::ResolvedTree tree, std::ostream& out)
    : tree_(std::move(tree)), dispatcher_(tree_), help_(tree_, out) {}

void Engine::register_handler(const std::string& path, std::unique_ptr<CommandHandler> handler) {
    CDL_LOG_DEBUG("engine", "registered handler for '" << path << "'");
    handlers_[path] = std::move(handler);
}

auto Engine::has_handler(const std::string& path) const -> bool {
    return handlers_.contains(path);
}

auto Engine::run(const std::vector<std::string>& args) -> Result<int, std::string> {
    auto result = dispatcher_.dispatch(args);
    if (is_err(result)) {
        auto message = format_error(unwrap_err(result));
        CDL_LOG_INFO("engine", message);
        return message;
    }

    auto& dispatch = unwrap(result);
    if (auto* request = std::get_if<HelpRequest>(&dispatch)) {
        help_.print(*request);
        return 0;
    }

    const auto& invocation = std::get<Invocation>(dispatch);
    auto it = handlers_.find(invocation.path);
    if (it == handlers_.end() || !it->second) {
        return "no handler registered for command: " + invocation.path;
    }

    CDL_LOG_DEBUG("engine", "executing '" << invocation.path << "'");
    return it->second->execute(invocation);
}

} // namespace cdl::dispatch
