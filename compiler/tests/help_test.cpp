#include "dispatch/help.hpp"
#include "lexer/source.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <sstream>

using namespace cdl;
using namespace cdl::dispatch;

class HelpTest : public ::testing::Test {
protected:
    std::unique_ptr<lexer::Source> source_;
    std::unique_ptr<sema::ResolvedTree> tree_;
    std::ostringstream out_;

    void SetUp() override {
        load(R"(
name "gitlite" "Tiny git"
flag verbose bool "Print more detail" v
cmd remote "Manage remotes"
cmd remote add "Add a remote"
  flag force bool "Overwrite" f
  arg name string "Remote name"
  example "gitlite remote add origin"
cmd status "Show status"
topic env "Environment variables"
text "HOME is read."
)");
    }

    void load(const std::string& code) {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code, "help.cdl"));
        auto parsed = parser::parse_source(*source_);
        ASSERT_TRUE(is_ok(parsed)) << parser::describe(unwrap_err(parsed));
        auto resolved = sema::resolve(std::move(unwrap(parsed)));
        ASSERT_TRUE(is_ok(resolved)) << sema::describe(unwrap_err(resolved));
        tree_ = std::make_unique<sema::ResolvedTree>(std::move(unwrap(resolved)));
        out_.str("");
    }

    static auto dots(size_t count) -> std::string {
        return std::string(count, '.');
    }
};

TEST_F(HelpTest, Overview) {
    HelpPrinter printer(*tree_, out_);
    printer.print_overview();

    std::string expected = "gitlite - Tiny git\n"
                           "\n"
                           "Usage:\n"
                           "  gitlite [flags] <command>\n"
                           "\n"
                           "Global Flags:\n"
                           "  --help, -h      Show help information\n"
                           "  --verbose, -v   Print more detail\n"
                           "\n"
                           "Commands:\n"
                           "├── remote " +
                           dots(20) +
                           " Manage remotes\n"
                           "│   └── add " +
                           dots(19) +
                           " Add a remote\n"
                           "└── status " +
                           dots(20) +
                           " Show status\n"
                           "\n"
                           "Topics:\n"
                           "  env " +
                           dots(17) +
                           " Environment variables\n"
                           "\n"
                           "Type 'gitlite help <command>' for more details.\n";
    EXPECT_EQ(out_.str(), expected);
}

TEST_F(HelpTest, OverviewWithoutName) {
    load("cmd status \"Show status\"");
    HelpPrinter printer(*tree_, out_);
    printer.print_overview();

    auto text = out_.str();
    EXPECT_EQ(text.rfind("app\n", 0), 0u);
    EXPECT_NE(text.find("  app [flags] <command>\n"), std::string::npos);
    EXPECT_EQ(text.find("Topics:"), std::string::npos);
    EXPECT_NE(text.find("Type 'app help <command>'"), std::string::npos);
}

TEST_F(HelpTest, LeafCommand) {
    HelpPrinter printer(*tree_, out_);
    printer.print_command(*tree_->find_by_path("remote/add"));

    EXPECT_EQ(out_.str(), "\n"
                          "Command: remote/add\n"
                          "Description: Add a remote\n"
                          "\n"
                          "Arguments:\n"
                          "  <name>          Remote name\n"
                          "\n"
                          "Flags:\n"
                          "  --force, -f     Overwrite\n"
                          "\n"
                          "Examples:\n"
                          "  $ gitlite remote add origin\n"
                          "\n");
}

TEST_F(HelpTest, GroupCommandListsSubcommands) {
    HelpPrinter printer(*tree_, out_);
    printer.print_command(*tree_->find_by_path("remote"));

    EXPECT_EQ(out_.str(), "\n"
                          "Command: remote\n"
                          "Description: Manage remotes\n"
                          "\n"
                          "Subcommands:\n"
                          "  └── add          Add a remote\n"
                          "\n");
}

TEST_F(HelpTest, Topic) {
    HelpPrinter printer(*tree_, out_);
    printer.print_topic(0);

    EXPECT_EQ(out_.str(), "\n"
                          "Topic: env\n"
                          "Description: Environment variables\n"
                          "\n"
                          "HOME is read.\n"
                          "\n");
}

TEST_F(HelpTest, PrintRoutesRequests) {
    HelpPrinter printer(*tree_, out_);

    printer.print(HelpRequest{.command = tree_->find_by_path("status"), .topic = 0, .globals = {}});
    EXPECT_NE(out_.str().find("Command: status"), std::string::npos);
    EXPECT_EQ(out_.str().find("Topic:"), std::string::npos);

    out_.str("");
    printer.print(HelpRequest{.command = std::nullopt, .topic = 0, .globals = {}});
    EXPECT_NE(out_.str().find("Topic: env"), std::string::npos);

    out_.str("");
    printer.print(HelpRequest{});
    EXPECT_NE(out_.str().find("Commands:"), std::string::npos);
}

TEST_F(HelpTest, ColorOnlyWhenEnabled) {
    HelpPrinter printer(*tree_, out_);
    printer.print_overview();
    EXPECT_EQ(out_.str().find("\033["), std::string::npos);

    out_.str("");
    printer.set_color_enabled(true);
    printer.print_overview();
    EXPECT_NE(out_.str().find(std::string(Colors::Bold) + "Usage:" + Colors::Reset),
              std::string::npos);
}

TEST(DotLeaderTest, FillsToColumn) {
    EXPECT_EQ(dot_leader(10, 30), std::string(20, '.'));
    EXPECT_EQ(dot_leader(28, 30), "..");
    EXPECT_EQ(dot_leader(29, 30), "..");
    EXPECT_EQ(dot_leader(45, 30), "..");
}
