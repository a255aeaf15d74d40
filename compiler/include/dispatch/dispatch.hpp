//! # Dispatch
//!
//! Resolves a raw argument vector against a `ResolvedTree`.
//!
//! ## Stages
//!
//! 1. **Global flags**: one left-to-right scan removes every `--name` or
//!    `-x` token naming a global flag (plus the value of a string flag),
//!    wherever it appears.
//! 2. **Command path**: remaining tokens are matched depth by depth. An
//!    exact child name wins, otherwise a unique prefix is accepted. The first
//!    token may also name a command anywhere in the tree, skipping its
//!    ancestors, when that name is unique tree-wide.
//! 3. **Binding**: on the leaf, tokens starting with `-` are local flags and
//!    the rest fill positional arguments in declaration order.
//!
//! With `--help`/`-h`, or a leading `help` word, stage 3 is skipped and path
//! failures are not reported: the result is a help request for the deepest
//! command reached, or for a topic when no command matched.
//!
//! ## Example
//!
//! ```cpp
//! Dispatcher dispatcher(resolved);
//! auto result = dispatcher.dispatch({"rem", "add", "origin", "--force"});
//! // Invocation{path = "remote/add", params = {force: true, name: "origin"}}
//! ```

#ifndef CDL_DISPATCH_DISPATCH_HPP
#define CDL_DISPATCH_DISPATCH_HPP

#include "common.hpp"
#include "sema/resolver.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cdl::dispatch {

using parser::NodeId;
using parser::TopicId;

/// Value bound to a flag. Bool flags hold `bool`, string flags `std::string`.
using FlagValue = std::variant<bool, std::string>;

/// Flag and argument values handed to a command handler.
///
/// Every declared flag has a value; flags absent from the input hold their
/// kind's zero value. Arguments keep declaration order.
class ParamBundle {
public:
    void set_flag(const std::string& name, FlagValue value);
    void add_arg(std::string name, std::string value);

    [[nodiscard]] auto has_flag(std::string_view name) const -> bool;

    /// Bool value of a flag; false when absent or not a bool flag.
    [[nodiscard]] auto get_bool(std::string_view name) const -> bool;

    /// String value of a flag; empty when absent or not a string flag.
    [[nodiscard]] auto get_string(std::string_view name) const -> std::string;

    /// First positional argument called `name`.
    [[nodiscard]] auto arg(std::string_view name) const -> std::optional<std::string>;

    [[nodiscard]] auto flags() const -> const std::vector<std::pair<std::string, FlagValue>>& {
        return flags_;
    }

    [[nodiscard]] auto args() const -> const std::vector<std::pair<std::string, std::string>>& {
        return args_;
    }

private:
    std::vector<std::pair<std::string, FlagValue>> flags_;
    std::vector<std::pair<std::string, std::string>> args_;
};

/// A leaf command with fully bound parameters.
struct Invocation {
    NodeId command;
    std::string path;
    ParamBundle params;
    ParamBundle globals; ///< Global flags, including `help`.
};

/// Help for the root (no command, no topic), a command, or a topic.
struct HelpRequest {
    std::optional<NodeId> command;
    std::optional<TopicId> topic;
    ParamBundle globals;
};

using Dispatch = std::variant<Invocation, HelpRequest>;

// ============================================================================
// Errors
// ============================================================================

enum class DispatchErrorKind : uint8_t {
    UnknownCommand,
    AmbiguousCommand,
    UnknownFlag,
    MissingFlagValue,
    MissingArgument,
    SurplusArgument,
};

[[nodiscard]] auto error_kind_name(DispatchErrorKind kind) -> std::string_view;

/// Usage error. Never accompanied by a partially bound bundle.
struct DispatchError {
    DispatchErrorKind kind;
    std::string token;                   ///< Offending token, or the missing argument's name.
    std::vector<std::string> candidates; ///< Ambiguous matches, or the valid choices.
    std::string resolved_path;           ///< Command path resolved before the failure.
};

/// One-line English description, e.g. "ambiguous command 're' (candidates: ...)".
[[nodiscard]] auto describe(const DispatchError& error) -> std::string;

// ============================================================================
// Dispatcher
// ============================================================================

class Dispatcher {
public:
    /// `tree` must outlive the dispatcher.
    explicit Dispatcher(const sema::ResolvedTree& tree);

    /// Resolves `args` (program name excluded). Safe to call concurrently.
    [[nodiscard]] auto dispatch(const std::vector<std::string>& args) const
        -> Result<Dispatch, DispatchError>;

    [[nodiscard]] auto tree() const -> const sema::ResolvedTree& {
        return tree_;
    }

private:
    const sema::ResolvedTree& tree_;

    /// Where command-path resolution stopped.
    struct PathState {
        std::optional<NodeId> command;
        size_t consumed = 0; ///< Tokens used as path segments.
    };

    [[nodiscard]] auto extract_globals(const std::vector<std::string>& args,
                                       ParamBundle& globals,
                                       std::vector<std::string>& remaining) const
        -> std::optional<DispatchError>;

    [[nodiscard]] auto resolve_path(const std::vector<std::string>& tokens, bool for_help) const
        -> Result<PathState, DispatchError>;

    [[nodiscard]] auto match_child(std::optional<NodeId> parent, const std::string& token) const
        -> Result<std::optional<NodeId>, DispatchError>;

    [[nodiscard]] auto match_anywhere(const std::string& token) const
        -> Result<NodeId, DispatchError>;

    [[nodiscard]] auto match_topic(const std::string& token) const -> std::optional<TopicId>;

    [[nodiscard]] auto bind(NodeId command, const std::vector<std::string>& tokens,
                            size_t first) const -> Result<ParamBundle, DispatchError>;
};

/// True for tokens treated as flags: a leading '-' and more than one character.
[[nodiscard]] auto is_flag_token(std::string_view token) -> bool;

} // namespace cdl::dispatch

#endif // CDL_DISPATCH_DISPATCH_HPP
