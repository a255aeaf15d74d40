//! # Semantic Resolver
//!
//! Runs the name, flag and attribute checks over the declaration tree, then
//! fills the derived tables of `ResolvedTree`. Canonical names are checked
//! for collisions once the paths are known.
//!
//! ## Traversal Order
//!
//! Commands are visited depth-first in declaration order. The attribute
//! check records the first kind seen for each name (global attributes come
//! first), so a conflict names the earlier kind first.

#include "log/log.hpp"
#include "sema/resolver.hpp"

#include <algorithm>
#include <map>

namespace cdl::sema {

using parser::CommandNode;
using parser::DeclTree;
using parser::FlagDecl;

auto describe(const SemanticError& error) -> std::string {
    return "line " + std::to_string(error.line()) + ": " + error.message;
}

auto implicit_help_flag() -> const FlagDecl& {
    static const FlagDecl help{.name = "help",
                               .short_name = "h",
                               .type_name = "bool",
                               .description = "Show help information",
                               .span = {}};
    return help;
}

auto zero_value(AttrKind kind) -> AttrValue {
    switch (kind) {
    case AttrKind::Bool:
        return AttrValue{false};
    case AttrKind::String:
        return AttrValue{std::string{}};
    case AttrKind::Int:
        return AttrValue{int64_t{0}};
    }
    return AttrValue{false};
}

namespace {

/// Visits every command depth-first, parents before children.
template <typename F> void walk(const DeclTree& tree, const std::vector<NodeId>& ids, F&& fn) {
    for (NodeId id : ids) {
        fn(id, tree.node(id));
        walk(tree, tree.node(id).children, fn);
    }
}

auto semantic_error(std::string message, SourceSpan span, std::string code) -> SemanticError {
    return SemanticError{
        .message = std::move(message), .span = span, .code = std::move(code), .notes = {}};
}

auto line_note(const std::string& what, const SourceSpan& span) -> std::string {
    return what + " on line " + std::to_string(span.start.line);
}

/// Rejects unsupported types and duplicate names/aliases within one scope.
///
/// `reserved` holds flags that are visible to the scope without belonging to
/// it (the global flags, for a command scope).
auto check_flag_scope(const std::vector<FlagDecl>& flags, const std::vector<FlagDecl>& reserved,
                      const std::string& scope_name) -> std::optional<SemanticError> {
    std::map<std::string, const FlagDecl*> names;
    std::map<std::string, const FlagDecl*> shorts;

    for (const auto& flag : reserved) {
        names.emplace(flag.name, &flag);
        if (flag.has_short()) {
            shorts.emplace(flag.short_name, &flag);
        }
    }

    for (const auto& flag : flags) {
        if (flag.type_name != "bool" && flag.type_name != "string") {
            auto error = semantic_error("flag '--" + flag.name + "' has unsupported type '" +
                                            flag.type_name + "'",
                                        flag.span, "S002");
            error.notes.push_back("flag types are 'bool' and 'string'");
            return error;
        }

        if (auto [it, inserted] = names.emplace(flag.name, &flag); !inserted) {
            auto error = semantic_error("duplicate flag '--" + flag.name + "' in " + scope_name,
                                        flag.span, "S003");
            if (it->second->span.start.line > 0) {
                error.notes.push_back(line_note("first declared", it->second->span));
            } else {
                error.notes.push_back("'--" + flag.name + "' is a built-in flag");
            }
            return error;
        }

        if (!flag.has_short())
            continue;
        if (auto [it, inserted] = shorts.emplace(flag.short_name, &flag); !inserted) {
            auto error = semantic_error("duplicate short flag '-" + flag.short_name + "' in " +
                                            scope_name,
                                        flag.span, "S003");
            error.notes.push_back("'-" + flag.short_name + "' already belongs to '--" +
                                  it->second->name + "'");
            return error;
        }
    }

    return std::nullopt;
}

auto compute_path(const DeclTree& tree, NodeId id) -> std::string {
    std::vector<std::string_view> segments;
    for (std::optional<NodeId> cur = id; cur; cur = tree.node(*cur).parent) {
        segments.push_back(tree.node(*cur).name);
    }

    std::string path;
    for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
        if (!path.empty())
            path += '/';
        path += *it;
    }
    return path;
}

} // namespace

auto resolve(DeclTree tree) -> Result<ResolvedTree, SemanticError> {
    ResolvedTree resolved;

    // Flags
    resolved.global_flags_.push_back(implicit_help_flag());
    if (auto error = check_flag_scope(tree.global_flags, resolved.global_flags_, "global scope")) {
        return std::move(*error);
    }
    resolved.global_flags_.insert(resolved.global_flags_.end(), tree.global_flags.begin(),
                                  tree.global_flags.end());

    std::optional<SemanticError> failure;
    walk(tree, tree.roots, [&](NodeId id, const CommandNode& node) {
        if (!failure && node.name.find('/') != std::string::npos) {
            auto words = compute_path(tree, id);
            std::replace(words.begin(), words.end(), '/', ' ');
            failure = semantic_error("command name '" + node.name + "' contains '/'", node.span,
                                     "S004");
            failure->notes.push_back("nested commands are separate words: 'cmd " + words + "'");
        }
        if (!failure) {
            failure = check_flag_scope(node.flags, resolved.global_flags_,
                                       "command '" + compute_path(tree, id) + "'");
        }
    });
    if (failure) {
        return std::move(*failure);
    }

    // Attribute kinds
    std::map<std::string, const parser::Attribute*> first_seen;
    auto record = [&](const parser::Attribute& attr) -> std::optional<SemanticError> {
        auto [it, inserted] = first_seen.emplace(attr.name, &attr);
        if (inserted) {
            return std::nullopt;
        }
        auto first_kind = parser::attr_kind(it->second->value);
        auto kind = parser::attr_kind(attr.value);
        if (first_kind == kind) {
            return std::nullopt;
        }
        auto error = semantic_error("attribute '" + attr.name + "' has conflicting kinds: " +
                                        std::string(parser::attr_kind_name(first_kind)) + " vs " +
                                        std::string(parser::attr_kind_name(kind)),
                                    attr.span, "S001");
        error.notes.push_back(line_note("first declared", it->second->span));
        return error;
    };

    for (const auto& attr : tree.global_attrs) {
        if (auto error = record(attr)) {
            return std::move(*error);
        }
    }
    walk(tree, tree.roots, [&](NodeId, const CommandNode& node) {
        for (const auto& attr : node.attrs) {
            if (!failure) {
                failure = record(attr);
            }
        }
    });
    if (failure) {
        return std::move(*failure);
    }

    for (const auto& [name, attr] : first_seen) {
        resolved.attr_kinds_.push_back(
            AttrKindEntry{.name = name, .kind = parser::attr_kind(attr->value)});
    }

    // Paths, canonical names and leaves
    resolved.paths_.reserve(tree.nodes.size());
    resolved.canonical_names_.reserve(tree.nodes.size());
    for (NodeId id = 0; id < tree.nodes.size(); ++id) {
        resolved.paths_.push_back(compute_path(tree, id));
        resolved.canonical_names_.push_back(canonical_identifier(resolved.paths_.back()));
        if (tree.node(id).is_leaf()) {
            resolved.leaves_.push_back(id);
        }
    }
    std::map<std::string_view, NodeId> canonical_owner;
    for (NodeId id = 0; id < tree.nodes.size(); ++id) {
        auto [it, inserted] = canonical_owner.emplace(resolved.canonical_names_[id], id);
        if (inserted)
            continue;
        auto error = semantic_error("commands '" + resolved.paths_[it->second] + "' and '" +
                                        resolved.paths_[id] + "' share the canonical name '" +
                                        resolved.canonical_names_[id] + "'",
                                    tree.node(id).span, "S005");
        error.notes.push_back(line_note("'" + resolved.paths_[it->second] + "' declared",
                                        tree.node(it->second).span));
        return error;
    }

    std::sort(resolved.leaves_.begin(), resolved.leaves_.end(), [&](NodeId a, NodeId b) {
        return resolved.paths_[a] < resolved.paths_[b];
    });

    CDL_LOG_DEBUG("sema", "resolved " << tree.nodes.size() << " commands, "
                                      << resolved.leaves_.size() << " leaves, "
                                      << resolved.attr_kinds_.size() << " attributes");

    resolved.tree_ = std::move(tree);
    return resolved;
}

// ============================================================================
// ResolvedTree Queries
// ============================================================================

auto ResolvedTree::find_by_path(std::string_view path) const -> std::optional<NodeId> {
    for (NodeId id = 0; id < paths_.size(); ++id) {
        if (paths_[id] == path) {
            return id;
        }
    }
    return std::nullopt;
}

auto ResolvedTree::find_attr_kind(std::string_view name) const -> const AttrKindEntry* {
    auto it = std::lower_bound(attr_kinds_.begin(), attr_kinds_.end(), name,
                               [](const AttrKindEntry& entry, std::string_view key) {
                                   return entry.name < key;
                               });
    if (it != attr_kinds_.end() && it->name == name) {
        return &*it;
    }
    return nullptr;
}

auto ResolvedTree::resolve_attr(NodeId id, std::string_view name) const
    -> std::optional<AttrValue> {
    if (const auto* local = parser::find_attr(node(id).attrs, name)) {
        return local->value;
    }
    if (const auto* global = parser::find_attr(tree_.global_attrs, name)) {
        return global->value;
    }
    return std::nullopt;
}

auto ResolvedTree::attr_or_zero(NodeId id, const AttrKindEntry& attr) const -> AttrValue {
    auto value = resolve_attr(id, attr.name);
    if (value && parser::attr_kind(*value) == attr.kind) {
        return *value;
    }
    return zero_value(attr.kind);
}

} // namespace cdl::sema
