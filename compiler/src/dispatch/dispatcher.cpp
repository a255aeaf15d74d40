//! # Dispatcher
//!
//! Global-flag extraction, command-path resolution and flag/argument
//! binding. See dispatch.hpp for the rules.
//!
//! ## Path Resolution
//!
//! | Token vs. children            | Result                                |
//! |-------------------------------|---------------------------------------|
//! | exact name                    | descend                               |
//! | prefix of exactly one name    | descend                               |
//! | prefix of several names       | AmbiguousCommand                      |
//! | no match, first token         | tree-wide search (command omission)   |
//! | no match, later token         | stop; leftover token handled by caller|
//!
//! The tree-wide search pools exact names and prefix matches into one
//! candidate set and reports full paths when it finds more than one command.

#include "dispatch/dispatch.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace cdl::dispatch {

using parser::FlagDecl;

auto is_flag_token(std::string_view token) -> bool {
    return token.size() > 1 && token.front() == '-';
}

namespace {

/// The declaration `token` names: `--name` or `-short`.
auto find_flag(const std::vector<FlagDecl>& flags, std::string_view token) -> const FlagDecl* {
    if (token.starts_with("--")) {
        auto name = token.substr(2);
        for (const auto& flag : flags) {
            if (flag.name == name)
                return &flag;
        }
        return nullptr;
    }
    if (token.starts_with("-")) {
        auto name = token.substr(1);
        for (const auto& flag : flags) {
            if (flag.has_short() && flag.short_name == name)
                return &flag;
        }
    }
    return nullptr;
}

void fill_zero_values(const std::vector<FlagDecl>& flags, ParamBundle& bundle) {
    for (const auto& flag : flags) {
        if (bundle.has_flag(flag.name))
            continue;
        if (flag.is_bool()) {
            bundle.set_flag(flag.name, false);
        } else {
            bundle.set_flag(flag.name, std::string{});
        }
    }
}

auto flag_spellings(const std::vector<FlagDecl>& flags) -> std::vector<std::string> {
    std::vector<std::string> spellings;
    for (const auto& flag : flags) {
        spellings.push_back("--" + flag.name);
        if (flag.has_short()) {
            spellings.push_back("-" + flag.short_name);
        }
    }
    return spellings;
}

auto make_error(DispatchErrorKind kind, std::string token, std::string resolved_path = {},
                std::vector<std::string> candidates = {}) -> DispatchError {
    return DispatchError{.kind = kind,
                         .token = std::move(token),
                         .candidates = std::move(candidates),
                         .resolved_path = std::move(resolved_path)};
}

} // namespace

Dispatcher::Dispatcher(const sema::ResolvedTree& tree) : tree_(tree) {}

auto Dispatcher::dispatch(const std::vector<std::string>& args) const
    -> Result<Dispatch, DispatchError> {
    ParamBundle globals;
    std::vector<std::string> tokens;
    if (auto error = extract_globals(args, globals, tokens)) {
        return std::move(*error);
    }

    bool help = globals.get_bool(sema::implicit_help_flag().name);

    // A leading "help" word acts like --help unless a command owns the name.
    if (!tokens.empty() && tokens.front() == "help" && !tree_.decl().find_child({}, "help")) {
        tokens.erase(tokens.begin());
        help = true;
        globals.set_flag(sema::implicit_help_flag().name, true);
    }

    if (tokens.empty()) {
        CDL_LOG_DEBUG("dispatch", "no command given, showing overview");
        return HelpRequest{.command = std::nullopt, .topic = std::nullopt, .globals = globals};
    }

    auto resolved = resolve_path(tokens, help);
    if (is_err(resolved)) {
        return std::move(unwrap_err(resolved));
    }
    auto state = unwrap(resolved);

    if (help) {
        HelpRequest request{.command = state.command, .topic = std::nullopt, .globals = globals};
        if (!state.command) {
            request.topic = match_topic(tokens.front());
        }
        CDL_LOG_DEBUG("dispatch", "help requested for '"
                                      << (state.command ? tree_.path(*state.command) : "")
                                      << "'");
        return request;
    }

    if (!state.command) {
        // A declaration without commands resolves nothing for any word.
        if (!is_flag_token(tokens.front())) {
            return make_error(DispatchErrorKind::UnknownCommand, tokens.front());
        }
        return make_error(DispatchErrorKind::UnknownFlag, tokens.front(), {},
                          flag_spellings(tree_.global_flags()));
    }

    NodeId command = *state.command;
    const auto& node = tree_.node(command);
    const auto& path = tree_.path(command);

    if (!node.is_leaf()) {
        if (state.consumed == tokens.size()) {
            return HelpRequest{.command = command, .topic = std::nullopt, .globals = globals};
        }
        const auto& token = tokens[state.consumed];
        if (is_flag_token(token)) {
            return make_error(DispatchErrorKind::UnknownFlag, token, path);
        }
        std::vector<std::string> children;
        for (NodeId child : node.children) {
            children.push_back(tree_.node(child).name);
        }
        return make_error(DispatchErrorKind::UnknownCommand, token, path, std::move(children));
    }

    auto bound = bind(command, tokens, state.consumed);
    if (is_err(bound)) {
        return std::move(unwrap_err(bound));
    }

    CDL_LOG_DEBUG("dispatch", "resolved '" << path << "' with " << unwrap(bound).args().size()
                                           << " arguments");
    return Invocation{
        .command = command, .path = path, .params = std::move(unwrap(bound)), .globals = globals};
}

// ============================================================================
// Global Flags
// ============================================================================

auto Dispatcher::extract_globals(const std::vector<std::string>& args, ParamBundle& globals,
                                 std::vector<std::string>& remaining) const
    -> std::optional<DispatchError> {
    const auto& flags = tree_.global_flags();

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& token = args[i];
        const FlagDecl* flag = is_flag_token(token) ? find_flag(flags, token) : nullptr;
        if (flag == nullptr) {
            remaining.push_back(token);
            continue;
        }

        if (flag->is_bool()) {
            globals.set_flag(flag->name, true);
        } else if (i + 1 < args.size()) {
            globals.set_flag(flag->name, args[++i]);
        } else {
            return make_error(DispatchErrorKind::MissingFlagValue, token);
        }
    }

    fill_zero_values(flags, globals);
    return std::nullopt;
}

// ============================================================================
// Command Path
// ============================================================================

auto Dispatcher::resolve_path(const std::vector<std::string>& tokens, bool for_help) const
    -> Result<PathState, DispatchError> {
    PathState state;

    while (state.consumed < tokens.size()) {
        const auto& token = tokens[state.consumed];
        if (tree_.decl().children_of(state.command).empty() || is_flag_token(token)) {
            break;
        }

        auto matched = match_child(state.command, token);
        if (is_err(matched)) {
            if (for_help)
                break;
            return std::move(unwrap_err(matched));
        }

        auto child = unwrap(matched);
        if (!child && state.consumed == 0) {
            auto anywhere = match_anywhere(token);
            if (is_err(anywhere)) {
                if (for_help)
                    break;
                return std::move(unwrap_err(anywhere));
            }
            child = unwrap(anywhere);
            CDL_LOG_TRACE("dispatch", "'" << token << "' resolved by omission to '"
                                          << tree_.path(*child) << "'");
        }
        if (!child) {
            break;
        }

        state.command = child;
        ++state.consumed;
    }

    return state;
}

auto Dispatcher::match_child(std::optional<NodeId> parent, const std::string& token) const
    -> Result<std::optional<NodeId>, DispatchError> {
    const auto& children = tree_.decl().children_of(parent);

    if (auto exact = tree_.decl().find_child(parent, token)) {
        return exact;
    }

    std::vector<NodeId> prefixed;
    for (NodeId child : children) {
        if (tree_.node(child).name.starts_with(token)) {
            prefixed.push_back(child);
        }
    }

    if (prefixed.size() == 1) {
        return std::optional<NodeId>{prefixed.front()};
    }
    if (prefixed.empty()) {
        return std::optional<NodeId>{};
    }

    std::vector<std::string> names;
    for (NodeId id : prefixed) {
        names.push_back(tree_.node(id).name);
    }
    std::sort(names.begin(), names.end());
    return make_error(DispatchErrorKind::AmbiguousCommand, token,
                      parent ? tree_.path(*parent) : std::string{}, std::move(names));
}

auto Dispatcher::match_anywhere(const std::string& token) const -> Result<NodeId, DispatchError> {
    std::vector<NodeId> matches;

    const auto& nodes = tree_.decl().nodes;
    for (NodeId id = 0; id < nodes.size(); ++id) {
        if (nodes[id].name.starts_with(token)) {
            matches.push_back(id);
        }
    }

    if (matches.size() == 1) {
        return matches.front();
    }
    if (matches.empty()) {
        std::vector<std::string> top_level;
        for (NodeId root : tree_.decl().roots) {
            top_level.push_back(tree_.node(root).name);
        }
        return make_error(DispatchErrorKind::UnknownCommand, token, {}, std::move(top_level));
    }

    std::vector<std::string> paths;
    for (NodeId id : matches) {
        paths.push_back(tree_.path(id));
    }
    std::sort(paths.begin(), paths.end());
    return make_error(DispatchErrorKind::AmbiguousCommand, token, {}, std::move(paths));
}

auto Dispatcher::match_topic(const std::string& token) const -> std::optional<TopicId> {
    if (auto exact = tree_.decl().find_topic(token)) {
        return exact;
    }

    std::optional<TopicId> found;
    const auto& topics = tree_.decl().topics;
    for (size_t i = 0; i < topics.size(); ++i) {
        if (topics[i].name.starts_with(token)) {
            if (found)
                return std::nullopt;
            found = static_cast<TopicId>(i);
        }
    }
    return found;
}

// ============================================================================
// Binding
// ============================================================================

auto Dispatcher::bind(NodeId command, const std::vector<std::string>& tokens, size_t first) const
    -> Result<ParamBundle, DispatchError> {
    const auto& node = tree_.node(command);
    const auto& path = tree_.path(command);

    ParamBundle params;
    size_t next_arg = 0;

    for (size_t i = first; i < tokens.size(); ++i) {
        const auto& token = tokens[i];

        if (is_flag_token(token)) {
            const auto* flag = find_flag(node.flags, token);
            if (flag == nullptr) {
                return make_error(DispatchErrorKind::UnknownFlag, token, path,
                                  flag_spellings(node.flags));
            }
            if (flag->is_bool()) {
                params.set_flag(flag->name, true);
            } else if (i + 1 < tokens.size()) {
                params.set_flag(flag->name, tokens[++i]);
            } else {
                return make_error(DispatchErrorKind::MissingFlagValue, token, path);
            }
            continue;
        }

        if (next_arg >= node.args.size()) {
            return make_error(DispatchErrorKind::SurplusArgument, token, path);
        }
        params.add_arg(node.args[next_arg++].name, token);
    }

    if (next_arg < node.args.size()) {
        return make_error(DispatchErrorKind::MissingArgument, node.args[next_arg].name, path);
    }

    fill_zero_values(node.flags, params);
    return params;
}

} // namespace cdl::dispatch
