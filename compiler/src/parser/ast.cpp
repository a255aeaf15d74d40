//! # Declaration Tree Helpers
//!
//! Attribute value helpers, arena navigation and the `dump_tree()` printer
//! used by `cdlc parse`.

#include "parser/ast.hpp"

#include <ostream>
#include <type_traits>

namespace cdl::parser {

auto attr_kind(const AttrValue& value) -> AttrKind {
    return std::visit(
        [](const auto& v) -> AttrKind {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return AttrKind::Bool;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return AttrKind::String;
            } else {
                return AttrKind::Int;
            }
        },
        value);
}

auto attr_kind_name(AttrKind kind) -> std::string_view {
    switch (kind) {
    case AttrKind::Bool:
        return "bool";
    case AttrKind::String:
        return "string";
    case AttrKind::Int:
        return "int";
    }
    return "unknown";
}

auto format_attr_value(const AttrValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "\"" + v + "\"";
            } else {
                return std::to_string(v);
            }
        },
        value);
}

auto find_attr(const std::vector<Attribute>& attrs, std::string_view name) -> const Attribute* {
    for (const auto& attr : attrs) {
        if (attr.name == name) {
            return &attr;
        }
    }
    return nullptr;
}

void set_attr(std::vector<Attribute>& attrs, Attribute attr) {
    for (auto& existing : attrs) {
        if (existing.name == attr.name) {
            existing = std::move(attr);
            return;
        }
    }
    attrs.push_back(std::move(attr));
}

// ============================================================================
// DeclTree
// ============================================================================

auto DeclTree::children_of(std::optional<NodeId> parent) const -> const std::vector<NodeId>& {
    return parent ? node(*parent).children : roots;
}

auto DeclTree::find_child(std::optional<NodeId> parent, std::string_view name) const
    -> std::optional<NodeId> {
    for (NodeId id : children_of(parent)) {
        if (node(id).name == name) {
            return id;
        }
    }
    return std::nullopt;
}

auto DeclTree::add_node(std::optional<NodeId> parent, std::string name, SourceSpan span)
    -> NodeId {
    auto id = static_cast<NodeId>(nodes.size());

    CommandNode created;
    created.name = std::move(name);
    created.parent = parent;
    created.span = span;
    nodes.push_back(std::move(created));

    if (parent) {
        node(*parent).children.push_back(id);
    } else {
        roots.push_back(id);
    }
    return id;
}

auto DeclTree::find_topic(std::string_view name) const -> std::optional<TopicId> {
    for (size_t i = 0; i < topics.size(); ++i) {
        if (topics[i].name == name) {
            return static_cast<TopicId>(i);
        }
    }
    return std::nullopt;
}

// ============================================================================
// Dump
// ============================================================================

namespace {

void dump_flags(const std::vector<FlagDecl>& flags, const std::string& indent, std::ostream& out) {
    for (const auto& flag : flags) {
        out << indent << "flag --" << flag.name;
        if (flag.has_short()) {
            out << " (-" << flag.short_name << ")";
        }
        out << " : " << flag.type_name << "  \"" << flag.description << "\"\n";
    }
}

void dump_attrs(const std::vector<Attribute>& attrs, const std::string& indent,
                std::ostream& out) {
    for (const auto& attr : attrs) {
        out << indent << "attr " << attr.name << " = " << format_attr_value(attr.value) << "\n";
    }
}

void dump_node(const DeclTree& tree, NodeId id, int depth, std::ostream& out) {
    const auto& node = tree.node(id);
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    std::string inner = indent + "  ";

    out << indent << "cmd " << node.name;
    if (!node.description.empty()) {
        out << "  \"" << node.description << "\"";
    }
    out << "\n";

    dump_flags(node.flags, inner, out);
    for (const auto& arg : node.args) {
        out << inner << "arg <" << arg.name << "> : " << arg.type_name << "  \""
            << arg.description << "\"\n";
    }
    dump_attrs(node.attrs, inner, out);
    for (const auto& example : node.examples) {
        out << inner << "example \"" << example << "\"\n";
    }
    for (NodeId child : node.children) {
        dump_node(tree, child, depth + 1, out);
    }
}

} // namespace

void dump_tree(const DeclTree& tree, std::ostream& out) {
    if (tree.app_name) {
        out << "name \"" << *tree.app_name << "\" \"" << tree.tagline.value_or("") << "\"\n";
    }

    out << "global\n";
    dump_flags(tree.global_flags, "  ", out);
    dump_attrs(tree.global_attrs, "  ", out);

    for (NodeId root : tree.roots) {
        dump_node(tree, root, 0, out);
    }

    for (const auto& topic : tree.topics) {
        out << "topic " << topic.name << "  \"" << topic.description << "\"";
        if (!topic.text.empty()) {
            out << "  (" << topic.text.size() << " bytes of text)";
        }
        out << "\n";
    }
}

} // namespace cdl::parser
