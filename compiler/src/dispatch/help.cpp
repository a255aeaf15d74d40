//! # Help Printer
//!
//! Column widths: flag and argument names are padded to 15, subcommand
//! names to 12. Tree rows are dotted out to column 30, topic rows to 20.

#include "dispatch/help.hpp"

namespace cdl::dispatch {

namespace {

constexpr const char* BOX_TREE = "├──";
constexpr const char* BOX_LAST = "└──";
constexpr const char* BOX_ITEM = "│";

constexpr size_t TREE_COLUMN = 30;
constexpr size_t TOPIC_COLUMN = 20;
constexpr size_t NAME_WIDTH = 15;
constexpr size_t SUBCOMMAND_WIDTH = 12;

auto pad_right(std::string text, size_t width) -> std::string {
    if (text.size() < width) {
        text.append(width - text.size(), ' ');
    }
    return text;
}

auto flag_label(const parser::FlagDecl& flag) -> std::string {
    std::string label = "--" + flag.name;
    if (flag.has_short()) {
        label += ", -" + flag.short_name;
    }
    return label;
}

} // namespace

auto dot_leader(size_t name_width, size_t target) -> std::string {
    size_t dots = name_width + 2 > target ? 2 : target - name_width;
    return std::string(dots, '.');
}

HelpPrinter::HelpPrinter(const sema::ResolvedTree& tree, std::ostream& out, bool color)
    : tree_(tree), out_(out), use_colors_(color) {}

auto HelpPrinter::styled(const char* code, std::string_view text) const -> std::string {
    if (!use_colors_) {
        return std::string(text);
    }
    return std::string(code) + std::string(text) + Colors::Reset;
}

void HelpPrinter::print(const HelpRequest& request) {
    if (request.command) {
        print_command(*request.command);
    } else if (request.topic) {
        print_topic(*request.topic);
    } else {
        print_overview();
    }
}

// ============================================================================
// Overview
// ============================================================================

void HelpPrinter::print_overview() {
    const auto& decl = tree_.decl();
    std::string app = decl.app_name.value_or("app");

    std::string title = app;
    if (decl.tagline && !decl.tagline->empty()) {
        title += " - " + *decl.tagline;
    }
    out_ << styled(Colors::Bold, title) << "\n";

    out_ << "\n" << styled(Colors::Bold, "Usage:") << "\n";
    out_ << "  " << app << " " << styled(Colors::Yellow, "[flags] <command>") << "\n";

    out_ << "\n" << styled(Colors::Bold, "Global Flags:") << "\n";
    print_flag_rows(tree_.global_flags(), NAME_WIDTH);

    if (!decl.roots.empty()) {
        out_ << "\n" << styled(Colors::Bold, "Commands:") << "\n";
        for (size_t i = 0; i < decl.roots.size(); ++i) {
            print_tree(decl.roots[i], "", i + 1 == decl.roots.size());
        }
    }

    if (!decl.topics.empty()) {
        out_ << "\n" << styled(Colors::Bold, "Topics:") << "\n";
        for (const auto& topic : decl.topics) {
            out_ << "  " << styled(Colors::Cyan, topic.name) << " "
                 << styled(Colors::Dim, dot_leader(topic.name.size(), TOPIC_COLUMN)) << " "
                 << styled(Colors::Dim, topic.description) << "\n";
        }
    }

    out_ << "\nType '" << styled(Colors::Yellow, app + " help <command>")
         << "' for more details.\n";
}

void HelpPrinter::print_tree(NodeId id, const std::string& indent, bool is_last) {
    const auto& node = tree_.node(id);

    // Box characters are multi-byte; count columns, not bytes.
    size_t depth_columns = 0;
    for (auto parent = node.parent; parent; parent = tree_.node(*parent).parent) {
        depth_columns += 4;
    }
    size_t visual = depth_columns + 4 + node.name.size();

    out_ << indent << (is_last ? BOX_LAST : BOX_TREE) << " " << styled(Colors::Cyan, node.name)
         << " " << styled(Colors::Dim, dot_leader(visual, TREE_COLUMN)) << " "
         << styled(Colors::Dim, node.description) << "\n";

    std::string child_indent = indent + (is_last ? "    " : std::string(BOX_ITEM) + "   ");
    for (size_t i = 0; i < node.children.size(); ++i) {
        print_tree(node.children[i], child_indent, i + 1 == node.children.size());
    }
}

void HelpPrinter::print_flag_rows(const std::vector<parser::FlagDecl>& flags, size_t width) {
    for (const auto& flag : flags) {
        out_ << "  " << styled(Colors::Cyan, pad_right(flag_label(flag), width)) << " "
             << styled(Colors::Dim, flag.description) << "\n";
    }
}

// ============================================================================
// Command and Topic Help
// ============================================================================

void HelpPrinter::print_command(NodeId id) {
    const auto& node = tree_.node(id);

    out_ << "\n" << styled(Colors::Bold, "Command:") << " " << styled(Colors::Cyan, tree_.path(id))
         << "\n";
    out_ << styled(Colors::Bold, "Description:") << " " << styled(Colors::Dim, node.description)
         << "\n\n";

    if (!node.children.empty()) {
        out_ << styled(Colors::Bold, "Subcommands:") << "\n";
        for (size_t i = 0; i < node.children.size(); ++i) {
            const auto& child = tree_.node(node.children[i]);
            out_ << "  " << (i + 1 == node.children.size() ? BOX_LAST : BOX_TREE) << " "
                 << styled(Colors::Cyan, pad_right(child.name, SUBCOMMAND_WIDTH)) << " "
                 << styled(Colors::Dim, child.description) << "\n";
        }
        out_ << "\n";
    }

    if (!node.args.empty()) {
        out_ << styled(Colors::Bold, "Arguments:") << "\n";
        for (const auto& arg : node.args) {
            out_ << "  " << styled(Colors::Yellow, pad_right("<" + arg.name + ">", NAME_WIDTH))
                 << " " << styled(Colors::Dim, arg.description) << "\n";
        }
        out_ << "\n";
    }

    if (!node.flags.empty()) {
        out_ << styled(Colors::Bold, "Flags:") << "\n";
        print_flag_rows(node.flags, NAME_WIDTH);
        out_ << "\n";
    }

    if (!node.examples.empty()) {
        out_ << styled(Colors::Bold, "Examples:") << "\n";
        for (const auto& example : node.examples) {
            out_ << "  " << styled(Colors::Green, "$") << " " << example << "\n";
        }
        out_ << "\n";
    }
}

void HelpPrinter::print_topic(TopicId id) {
    const auto& topic = tree_.decl().topics.at(id);

    out_ << "\n" << styled(Colors::Bold, "Topic:") << " " << styled(Colors::Cyan, topic.name)
         << "\n";
    out_ << styled(Colors::Bold, "Description:") << " " << styled(Colors::Dim, topic.description)
         << "\n\n";
    out_ << topic.text << "\n\n";
}

} // namespace cdl::dispatch
