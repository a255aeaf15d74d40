//! # Resolver Tests
//!
//! Flag and attribute checks, derived tables, canonical naming and the emit
//! plan.

#include "lexer/source.hpp"
#include "parser/parser.hpp"
#include "sema/emit_plan.hpp"
#include "sema/resolver.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <sstream>

using namespace cdl;
using namespace cdl::sema;

class ResolverTest : public ::testing::Test {
protected:
    std::vector<std::unique_ptr<lexer::Source>> sources_;

    auto compile(const std::string& code) -> Result<ResolvedTree, SemanticError> {
        sources_.push_back(
            std::make_unique<lexer::Source>(lexer::Source::from_string(code, "test.cdl")));
        auto parsed = parser::parse_source(*sources_.back());
        if (is_err(parsed)) {
            ADD_FAILURE() << parser::describe(unwrap_err(parsed));
            return SemanticError{.message = "parse failed", .span = {}, .code = "P001", .notes = {}};
        }
        return resolve(std::move(unwrap(parsed)));
    }

    auto compile_ok(const std::string& code) -> ResolvedTree {
        auto result = compile(code);
        if (is_err(result)) {
            ADD_FAILURE() << describe(unwrap_err(result));
            return ResolvedTree{};
        }
        return std::move(unwrap(result));
    }

    auto compile_err(const std::string& code) -> SemanticError {
        auto result = compile(code);
        if (is_ok(result)) {
            ADD_FAILURE() << "expected a semantic error";
            return SemanticError{};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Flag Checks
// ============================================================================

TEST_F(ResolverTest, ImplicitHelpFlagComesFirst) {
    auto tree = compile_ok("flag verbose bool \"V\" v");
    ASSERT_EQ(tree.global_flags().size(), 2u);
    EXPECT_EQ(tree.global_flags()[0].name, "help");
    EXPECT_EQ(tree.global_flags()[0].short_name, "h");
    EXPECT_TRUE(tree.global_flags()[0].is_bool());
    EXPECT_EQ(tree.global_flags()[1].name, "verbose");
}

TEST_F(ResolverTest, UnsupportedFlagType) {
    auto error = compile_err("cmd x\n  flag level int \"Level\"");
    EXPECT_EQ(error.code, "S002");
    EXPECT_EQ(error.message, "flag '--level' has unsupported type 'int'");
    EXPECT_EQ(error.line(), 2u);
    ASSERT_EQ(error.notes.size(), 1u);
    EXPECT_EQ(error.notes[0], "flag types are 'bool' and 'string'");
}

TEST_F(ResolverTest, DuplicateFlagInCommand) {
    auto error = compile_err("cmd remote add\n  flag force bool \"F\"\n  flag force bool \"G\"");
    EXPECT_EQ(error.code, "S003");
    EXPECT_EQ(error.message, "duplicate flag '--force' in command 'remote/add'");
    EXPECT_EQ(error.line(), 3u);
    ASSERT_EQ(error.notes.size(), 1u);
    EXPECT_EQ(error.notes[0], "first declared on line 2");
}

TEST_F(ResolverTest, DuplicateShortFlag) {
    auto error = compile_err("flag verbose bool \"V\" v\nflag version bool \"Ver\" v");
    EXPECT_EQ(error.code, "S003");
    EXPECT_EQ(error.message, "duplicate short flag '-v' in global scope");
    ASSERT_EQ(error.notes.size(), 1u);
    EXPECT_EQ(error.notes[0], "'-v' already belongs to '--verbose'");
}

TEST_F(ResolverTest, HelpFlagIsReserved) {
    auto error = compile_err("flag help bool \"Mine\"");
    EXPECT_EQ(error.code, "S003");
    EXPECT_EQ(error.message, "duplicate flag '--help' in global scope");
    ASSERT_EQ(error.notes.size(), 1u);
    EXPECT_EQ(error.notes[0], "'--help' is a built-in flag");

    auto short_error = compile_err("cmd x\n  flag host string \"Host\" h");
    EXPECT_EQ(short_error.message, "duplicate short flag '-h' in command 'x'");
}

TEST_F(ResolverTest, CommandFlagMayNotShadowGlobal) {
    auto error = compile_err("flag verbose bool \"V\"\ncmd x\n  flag verbose bool \"Again\"");
    EXPECT_EQ(error.message, "duplicate flag '--verbose' in command 'x'");
    EXPECT_EQ(error.notes[0], "first declared on line 1");
}

TEST_F(ResolverTest, SameFlagInSiblingCommands) {
    auto tree = compile_ok("cmd a\n  flag force bool \"F\" f\ncmd b\n  flag force bool \"F\" f");
    EXPECT_EQ(tree.leaves().size(), 2u);
}

// ============================================================================
// Attributes
// ============================================================================

TEST_F(ResolverTest, ConflictingAttributeKinds) {
    auto error = compile_err("attr safe = true\ncmd deploy\n  attr safe = \"yes\"");
    EXPECT_EQ(error.code, "S001");
    EXPECT_EQ(error.message, "attribute 'safe' has conflicting kinds: bool vs string");
    EXPECT_EQ(error.line(), 3u);
    ASSERT_EQ(error.notes.size(), 1u);
    EXPECT_EQ(error.notes[0], "first declared on line 1");
    EXPECT_EQ(describe(error), "line 3: attribute 'safe' has conflicting kinds: bool vs string");
}

TEST_F(ResolverTest, ConflictBetweenCommands) {
    auto error = compile_err("cmd a\n  attr tier = 1\ncmd b\n  attr tier = false");
    EXPECT_EQ(error.message, "attribute 'tier' has conflicting kinds: int vs bool");
}

TEST_F(ResolverTest, GlobalStringVersusCommandInt) {
    auto error = compile_err("attr level = \"x\"\ncmd a\ncmd b c\n  attr level = 1");
    EXPECT_EQ(error.message, "attribute 'level' has conflicting kinds: string vs int");
    EXPECT_EQ(error.line(), 4u);
}

TEST_F(ResolverTest, ConsistentKindsCompile) {
    auto tree = compile_ok(R"(
attr safe = true
attr owner = "core"
cmd deploy
  attr safe = false
  attr retries = 2
cmd status
)");

    ASSERT_EQ(tree.attr_kinds().size(), 3u);
    EXPECT_EQ(tree.attr_kinds()[0], (AttrKindEntry{"owner", AttrKind::String}));
    EXPECT_EQ(tree.attr_kinds()[1], (AttrKindEntry{"retries", AttrKind::Int}));
    EXPECT_EQ(tree.attr_kinds()[2], (AttrKindEntry{"safe", AttrKind::Bool}));
    ASSERT_NE(tree.find_attr_kind("safe"), nullptr);
    EXPECT_EQ(tree.find_attr_kind("missing"), nullptr);
}

TEST_F(ResolverTest, LocalOverrideBeatsGlobalDefault) {
    auto tree = compile_ok(R"(
attr safe = true
cmd deploy
  attr safe = false
  attr retries = 2
cmd status
)");

    auto deploy = tree.find_by_path("deploy");
    auto status = tree.find_by_path("status");
    ASSERT_TRUE(deploy);
    ASSERT_TRUE(status);

    EXPECT_EQ(tree.resolve_attr(*deploy, "safe"), AttrValue{false});
    EXPECT_EQ(tree.resolve_attr(*status, "safe"), AttrValue{true});
    EXPECT_FALSE(tree.resolve_attr(*status, "retries").has_value());

    const auto* retries = tree.find_attr_kind("retries");
    ASSERT_NE(retries, nullptr);
    EXPECT_EQ(tree.attr_or_zero(*status, *retries), AttrValue{int64_t{0}});
    EXPECT_EQ(tree.attr_or_zero(*deploy, *retries), AttrValue{int64_t{2}});
}

TEST_F(ResolverTest, ZeroValues) {
    EXPECT_EQ(zero_value(AttrKind::Bool), AttrValue{false});
    EXPECT_EQ(zero_value(AttrKind::String), AttrValue{std::string{}});
    EXPECT_EQ(zero_value(AttrKind::Int), AttrValue{int64_t{0}});
}

// ============================================================================
// Derived Tables
// ============================================================================

TEST_F(ResolverTest, LeavesSortedByPath) {
    auto tree = compile_ok("cmd status\ncmd remote remove\ncmd remote add\ncmd init");

    std::vector<std::string> paths;
    for (NodeId id : tree.leaves()) {
        paths.push_back(tree.path(id));
    }
    EXPECT_EQ(paths, (std::vector<std::string>{"init", "remote/add", "remote/remove", "status"}));
}

TEST_F(ResolverTest, PathsAndCanonicalNames) {
    auto tree = compile_ok("cmd remote add-url\ncmd dry-run");
    auto add = tree.find_by_path("remote/add-url");
    ASSERT_TRUE(add);
    EXPECT_EQ(tree.canonical_name(*add), "RemoteAddUrl");
    EXPECT_EQ(tree.canonical_name(*tree.find_by_path("remote")), "Remote");
    EXPECT_EQ(tree.canonical_name(*tree.find_by_path("dry-run")), "DryRun");
    EXPECT_FALSE(tree.find_by_path("remote/add").has_value());
}

TEST_F(ResolverTest, SlashInCommandName) {
    auto error = compile_err("cmd a/b \"one\"\ncmd a b \"two\"");
    EXPECT_EQ(error.code, "S004");
    EXPECT_EQ(error.line(), 1u);
    EXPECT_EQ(error.message, "command name 'a/b' contains '/'");
    ASSERT_EQ(error.notes.size(), 1u);
    EXPECT_EQ(error.notes[0], "nested commands are separate words: 'cmd a b'");

    auto nested = compile_err("cmd tools x/y");
    EXPECT_EQ(nested.code, "S004");
    EXPECT_EQ(nested.notes[0], "nested commands are separate words: 'cmd tools x y'");
}

TEST_F(ResolverTest, CanonicalNameCollision) {
    auto error = compile_err("cmd remote add \"Add\"\ncmd remote-add \"Add again\"");
    EXPECT_EQ(error.code, "S005");
    EXPECT_EQ(error.line(), 2u);
    EXPECT_EQ(error.message,
              "commands 'remote/add' and 'remote-add' share the canonical name 'RemoteAdd'");
    ASSERT_EQ(error.notes.size(), 1u);
    EXPECT_EQ(error.notes[0], "'remote/add' declared on line 1");

    EXPECT_EQ(compile_err("cmd dry-run\ncmd dry_run").code, "S005");
}

TEST(NamingTest, CanonicalIdentifier) {
    EXPECT_EQ(canonical_identifier("remote/add"), "RemoteAdd");
    EXPECT_EQ(canonical_identifier("dry-run"), "DryRun");
    EXPECT_EQ(canonical_identifier("v2.config:set"), "V2ConfigSet");
    EXPECT_EQ(canonical_identifier("snake_case_name"), "SnakeCaseName");
    EXPECT_EQ(canonical_identifier("2fa"), "X2fa");
    EXPECT_EQ(canonical_identifier("--"), "X");
    EXPECT_EQ(canonical_identifier(""), "X");
}

TEST(NamingTest, LowerFirstAndValidity) {
    EXPECT_EQ(lower_first("RemoteAdd"), "remoteAdd");
    EXPECT_EQ(lower_first(""), "");
    EXPECT_TRUE(is_valid_identifier("RemoteAdd"));
    EXPECT_TRUE(is_valid_identifier("_x1"));
    EXPECT_FALSE(is_valid_identifier("1x"));
    EXPECT_FALSE(is_valid_identifier("dry-run"));
    EXPECT_FALSE(is_valid_identifier(""));
}

// ============================================================================
// Emit Plan
// ============================================================================

TEST_F(ResolverTest, EmitPlanBundleShape) {
    auto tree = compile_ok(R"(
flag verbose bool "V" v
attr safe = true
cmd remote add "Add"
  flag force bool "F" f
  flag fetch string "Fetch"
  arg name string "N"
  attr safe = false
cmd status
)");
    auto plan = build_emit_plan(tree);

    ASSERT_EQ(plan.leaves.size(), 2u);
    const auto& add = plan.leaves[0];
    EXPECT_EQ(add.path, "remote/add");
    EXPECT_EQ(add.bundle_name, "RemoteAddParams");
    EXPECT_EQ(add.handler_name, "RunRemoteAdd");

    std::vector<std::string> fields;
    for (const auto& field : add.fields) {
        fields.push_back(field.field_name + ":" + std::string(field_origin_name(field.origin)));
    }
    EXPECT_EQ(fields, (std::vector<std::string>{"Force:flag", "Fetch:flag", "Name:argument",
                                                "Help:global flag", "Verbose:global flag"}));
    EXPECT_EQ(add.fields[1].kind, FieldKind::String);

    ASSERT_EQ(add.attrs.size(), 1u);
    EXPECT_EQ(add.attrs[0].value, AttrValue{false});
    EXPECT_EQ(plan.leaves[1].attrs[0].value, AttrValue{true});

    ASSERT_EQ(plan.canonical_names.size(), 3u);
    EXPECT_EQ(plan.canonical_names[0].path, "remote");
    EXPECT_EQ(plan.canonical_names[1].name, "RemoteAdd");
}

TEST_F(ResolverTest, PrintEmitPlan) {
    auto tree = compile_ok("attr safe = true\ncmd status\n  flag short bool \"S\"");
    std::ostringstream out;
    print_emit_plan(build_emit_plan(tree), out);

    auto text = out.str();
    EXPECT_NE(text.find("attributes:\n  safe"), std::string::npos);
    EXPECT_NE(text.find("  RunStatus(StatusParams)\n"), std::string::npos);
    EXPECT_NE(text.find("(global flag)"), std::string::npos);
    EXPECT_NE(text.find("@safe"), std::string::npos);
    EXPECT_NE(text.find("  Help(args)\n"), std::string::npos);
}

TEST_F(ResolverTest, DataFileCompiles) {
    auto loaded = lexer::Source::from_file(std::string(CDL_TEST_DATA_DIR) + "/git.cdl");
    ASSERT_TRUE(is_ok(loaded));
    auto source = std::make_unique<lexer::Source>(std::move(unwrap(loaded)));

    auto parsed = parser::parse_source(*source);
    ASSERT_TRUE(is_ok(parsed)) << parser::describe(unwrap_err(parsed));
    auto resolved = resolve(std::move(unwrap(parsed)));
    ASSERT_TRUE(is_ok(resolved)) << describe(unwrap_err(resolved));

    const auto& tree = unwrap(resolved);
    EXPECT_TRUE(tree.find_by_path("remote/add").has_value());
    EXPECT_EQ(tree.leaves().size(), 4u);
}
