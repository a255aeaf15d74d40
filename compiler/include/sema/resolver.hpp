//! # Semantic Resolver
//!
//! Validates a parsed declaration tree and derives the tables that the
//! dispatcher and emitters read.
//!
//! ## Checks
//!
//! | Code   | Rule                                                        |
//! |--------|-------------------------------------------------------------|
//! | `S001` | an attribute name has one kind everywhere it is declared    |
//! | `S002` | flag types are `bool` or `string`                           |
//! | `S003` | flag names and short aliases are unique within their scope  |
//! | `S004` | command names do not contain the path separator `/`         |
//! | `S005` | no two commands share a canonical name                      |
//!
//! The global scope contains the implicit `--help`/`-h` flag, and a command
//! flag may not reuse a global flag's name or alias since global flags are
//! extracted before command flags are bound.
//!
//! ## Derived Data
//!
//! - Attribute kind table, sorted by name
//! - Leaf commands, sorted by full path
//! - Full path (`remote/add`) and canonical name (`RemoteAdd`) per command
//!
//! A `ResolvedTree` is immutable; any number of threads may read it.

#ifndef CDL_SEMA_RESOLVER_HPP
#define CDL_SEMA_RESOLVER_HPP

#include "common.hpp"
#include "parser/ast.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cdl::sema {

using parser::AttrKind;
using parser::AttrValue;
using parser::NodeId;

/// A semantic error. Compilation stops at the first one.
struct SemanticError {
    std::string message;
    SourceSpan span;
    std::string code;
    std::vector<std::string> notes;

    [[nodiscard]] auto line() const -> uint32_t {
        return span.start.line;
    }
};

/// "line N: message"
[[nodiscard]] auto describe(const SemanticError& error) -> std::string;

/// One row of the attribute kind table.
struct AttrKindEntry {
    std::string name;
    AttrKind kind;

    [[nodiscard]] auto operator==(const AttrKindEntry& other) const -> bool = default;
};

/// The `--help`/`-h` flag every CLI gets.
[[nodiscard]] auto implicit_help_flag() -> const parser::FlagDecl&;

/// `false`, `""` or `0`.
[[nodiscard]] auto zero_value(AttrKind kind) -> AttrValue;

class ResolvedTree {
public:
    [[nodiscard]] auto decl() const -> const parser::DeclTree& {
        return tree_;
    }

    [[nodiscard]] auto node(NodeId id) const -> const parser::CommandNode& {
        return tree_.node(id);
    }

    /// Declared global flags, preceded by the implicit help flag.
    [[nodiscard]] auto global_flags() const -> const std::vector<parser::FlagDecl>& {
        return global_flags_;
    }

    [[nodiscard]] auto attr_kinds() const -> const std::vector<AttrKindEntry>& {
        return attr_kinds_;
    }

    [[nodiscard]] auto leaves() const -> const std::vector<NodeId>& {
        return leaves_;
    }

    /// Segment names joined with '/'.
    [[nodiscard]] auto path(NodeId id) const -> const std::string& {
        return paths_.at(id);
    }

    [[nodiscard]] auto canonical_name(NodeId id) const -> const std::string& {
        return canonical_names_.at(id);
    }

    [[nodiscard]] auto find_by_path(std::string_view path) const -> std::optional<NodeId>;

    [[nodiscard]] auto find_attr_kind(std::string_view name) const -> const AttrKindEntry*;

    /// Local override, else global default, else nothing.
    [[nodiscard]] auto resolve_attr(NodeId id, std::string_view name) const
        -> std::optional<AttrValue>;

    /// `resolve_attr()` with absent values replaced by the kind's zero value.
    /// This is the only place that decides what "absent" means.
    [[nodiscard]] auto attr_or_zero(NodeId id, const AttrKindEntry& attr) const -> AttrValue;

private:
    friend auto resolve(parser::DeclTree tree) -> Result<ResolvedTree, SemanticError>;

    parser::DeclTree tree_;
    std::vector<parser::FlagDecl> global_flags_;
    std::vector<AttrKindEntry> attr_kinds_;
    std::vector<NodeId> leaves_;
    std::vector<std::string> paths_;
    std::vector<std::string> canonical_names_;
};

/// Validates `tree` and builds its derived tables.
[[nodiscard]] auto resolve(parser::DeclTree tree) -> Result<ResolvedTree, SemanticError>;

// ============================================================================
// Naming (naming.cpp)
// ============================================================================

/// Concatenates the capitalized parts of `name`, split on `- _ . :` and `/`.
///
/// An empty result becomes `X`; a result starting with a digit is prefixed
/// with `X`. `remote/add-url` becomes `RemoteAddUrl`.
[[nodiscard]] auto canonical_identifier(std::string_view name) -> std::string;

/// `RemoteAdd` becomes `remoteAdd`.
[[nodiscard]] auto lower_first(std::string_view name) -> std::string;

/// `[A-Za-z_][A-Za-z0-9_]*`
[[nodiscard]] auto is_valid_identifier(std::string_view name) -> bool;

} // namespace cdl::sema

#endif // CDL_SEMA_RESOLVER_HPP
