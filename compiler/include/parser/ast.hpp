//! # Declaration Tree
//!
//! The in-memory form of one `.cdl` file: global flags and attributes, the
//! command tree and the help topics.
//!
//! ## Representation
//!
//! Commands live in a single arena (`DeclTree::nodes`) and refer to each
//! other by `NodeId`. Every node stores its parent index, so walking up to
//! build a path never needs back pointers, and the whole tree is owned and
//! dropped as one value.
//!
//! ```text
//! nodes[0] remote        parent = none   children = {1, 2}
//! nodes[1] remote/add    parent = 0
//! nodes[2] remote/remove parent = 0
//! ```

#ifndef CDL_PARSER_AST_HPP
#define CDL_PARSER_AST_HPP

#include "common.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cdl::parser {

/// Index of a command in `DeclTree::nodes`.
using NodeId = uint32_t;

/// Index of a topic in `DeclTree::topics`.
using TopicId = uint32_t;

// ============================================================================
// Attributes
// ============================================================================

/// Kind of an attribute value.
enum class AttrKind : uint8_t { Bool, String, Int };

/// A typed attribute value.
using AttrValue = std::variant<bool, std::string, int64_t>;

[[nodiscard]] auto attr_kind(const AttrValue& value) -> AttrKind;

/// "bool", "string" or "int".
[[nodiscard]] auto attr_kind_name(AttrKind kind) -> std::string_view;

/// Renders a value the way it is written in a declaration file.
[[nodiscard]] auto format_attr_value(const AttrValue& value) -> std::string;

/// `attr name = value` attached to the global section or to a command.
struct Attribute {
    std::string name;
    AttrValue value;
    SourceSpan span;

    [[nodiscard]] auto operator==(const Attribute& other) const -> bool = default;
};

// ============================================================================
// Flags and Arguments
// ============================================================================

/// `flag name type "description" [short]`.
///
/// `type_name` is kept as written; the resolver rejects anything other than
/// `bool` or `string`.
struct FlagDecl {
    std::string name;
    std::string short_name; ///< Empty when no alias was declared.
    std::string type_name;
    std::string description;
    SourceSpan span;

    [[nodiscard]] auto is_bool() const -> bool {
        return type_name == "bool";
    }

    [[nodiscard]] auto has_short() const -> bool {
        return !short_name.empty();
    }

    [[nodiscard]] auto operator==(const FlagDecl& other) const -> bool = default;
};

/// `arg name type "description"`. The type is advisory.
struct ArgDecl {
    std::string name;
    std::string type_name;
    std::string description;
    SourceSpan span;

    [[nodiscard]] auto operator==(const ArgDecl& other) const -> bool = default;
};

// ============================================================================
// Commands and Topics
// ============================================================================

/// One path segment of the command tree.
struct CommandNode {
    std::string name;
    std::string description;
    std::vector<FlagDecl> flags;
    std::vector<ArgDecl> args;
    std::vector<std::string> examples;
    std::vector<Attribute> attrs; ///< Local overrides, in declaration order.
    std::vector<NodeId> children;
    std::optional<NodeId> parent;
    SourceSpan span; ///< First `cmd` statement that mentioned this node.

    [[nodiscard]] auto is_leaf() const -> bool {
        return children.empty();
    }

    [[nodiscard]] auto operator==(const CommandNode& other) const -> bool = default;
};

/// `topic name "description"` plus an optional `text` body.
struct Topic {
    std::string name;
    std::string description;
    std::string text;
    SourceSpan span;

    [[nodiscard]] auto operator==(const Topic& other) const -> bool = default;
};

/// Result of parsing one declaration file.
struct DeclTree {
    std::optional<std::string> app_name;
    std::optional<std::string> tagline;
    std::vector<FlagDecl> global_flags;
    std::vector<Attribute> global_attrs;
    std::vector<NodeId> roots; ///< Top-level commands in declaration order.
    std::vector<CommandNode> nodes;
    std::vector<Topic> topics;

    [[nodiscard]] auto node(NodeId id) const -> const CommandNode& {
        return nodes.at(id);
    }

    [[nodiscard]] auto node(NodeId id) -> CommandNode& {
        return nodes.at(id);
    }

    /// Children of `parent`, or the top-level commands when `parent` is empty.
    [[nodiscard]] auto children_of(std::optional<NodeId> parent) const
        -> const std::vector<NodeId>&;

    /// Child of `parent` named exactly `name`.
    [[nodiscard]] auto find_child(std::optional<NodeId> parent, std::string_view name) const
        -> std::optional<NodeId>;

    /// Appends a new node under `parent` and returns its id.
    auto add_node(std::optional<NodeId> parent, std::string name, SourceSpan span) -> NodeId;

    [[nodiscard]] auto find_topic(std::string_view name) const -> std::optional<TopicId>;

    [[nodiscard]] auto operator==(const DeclTree& other) const -> bool = default;
};

/// Finds an attribute by name in a list.
[[nodiscard]] auto find_attr(const std::vector<Attribute>& attrs, std::string_view name)
    -> const Attribute*;

/// Inserts an attribute or replaces the value of an existing one.
void set_attr(std::vector<Attribute>& attrs, Attribute attr);

/// Writes an indented, human-readable rendering of the tree.
void dump_tree(const DeclTree& tree, std::ostream& out);

} // namespace cdl::parser

#endif // CDL_PARSER_AST_HPP
