//! # Help Printer
//!
//! Renders the help screens of a declared CLI.
//!
//! ## Screens
//!
//! | Request                 | Output                                          |
//! |-------------------------|-------------------------------------------------|
//! | no command, no topic    | usage, global flags, command tree, topics       |
//! | command                 | path, description, subcommands, args, flags     |
//! | topic                   | name, description, body text                    |
//!
//! The overview draws the command tree with box characters and dotted
//! leaders:
//!
//! ```text
//! ├── remote ....................... Manage remotes
//! │   ├── add ...................... Add a remote
//! │   └── remove ................... Remove a remote
//! └── status ....................... Show the working tree status
//! ```

#ifndef CDL_DISPATCH_HELP_HPP
#define CDL_DISPATCH_HELP_HPP

#include "dispatch/dispatch.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace cdl::dispatch {

class HelpPrinter {
public:
    /// `tree` must outlive the printer.
    HelpPrinter(const sema::ResolvedTree& tree, std::ostream& out, bool color = false);

    void print(const HelpRequest& request);

    void print_overview();
    void print_command(NodeId id);
    void print_topic(TopicId id);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }

private:
    const sema::ResolvedTree& tree_;
    std::ostream& out_;
    bool use_colors_;

    [[nodiscard]] auto styled(const char* code, std::string_view text) const -> std::string;

    void print_tree(NodeId id, const std::string& indent, bool is_last);
    void print_flag_rows(const std::vector<parser::FlagDecl>& flags, size_t width);
};

/// Dots filling `name` up to `target` columns, at least two.
[[nodiscard]] auto dot_leader(size_t name_width, size_t target) -> std::string;

} // namespace cdl::dispatch

#endif // CDL_DISPATCH_HELP_HPP
