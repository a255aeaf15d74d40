//! # Emit Plan
//!
//! Language-neutral description of what a code generator has to produce for
//! a resolved tree. Generators are outside this repository; `cdlc check`
//! prints the plan so it can be inspected.
//!
//! ## Contents
//!
//! - The sorted attribute kind table
//! - The path-ordered leaf list, each with its parameter bundle shape
//! - A canonical name for every command
//! - The global flags, implicit help flag first
//!
//! ## Bundle Shape
//!
//! One per leaf. Fields are the leaf's own flags, then its positional
//! arguments, then the global flags. Arguments are always strings.
//!
//! ```text
//! RemoteAddParams
//!   force      bool    (flag)
//!   name       string  (argument)
//!   help       bool    (global flag)
//! ```

#ifndef CDL_SEMA_EMIT_PLAN_HPP
#define CDL_SEMA_EMIT_PLAN_HPP

#include "sema/resolver.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace cdl::sema {

enum class FieldKind : uint8_t { Bool, String, Int };

enum class FieldOrigin : uint8_t { Flag, Argument, GlobalFlag };

[[nodiscard]] auto field_kind_name(FieldKind kind) -> std::string_view;
[[nodiscard]] auto field_origin_name(FieldOrigin origin) -> std::string_view;

struct BundleField {
    std::string name;       ///< Name as declared (`dry-run`).
    std::string field_name; ///< Canonical form (`DryRun`).
    FieldKind kind;
    FieldOrigin origin;
    std::string description;
};

struct ResolvedAttr {
    std::string name;
    AttrValue value; ///< Zero value when neither the leaf nor the globals set it.
};

struct BundleShape {
    NodeId node;
    std::string path;
    std::string canonical_name; ///< `RemoteAdd`
    std::string bundle_name;    ///< `RemoteAddParams`
    std::string handler_name;   ///< `RunRemoteAdd`
    std::vector<BundleField> fields;
    std::vector<ResolvedAttr> attrs;
};

struct CanonicalName {
    std::string path;
    std::string name;
};

struct EmitPlan {
    std::vector<AttrKindEntry> attr_kinds;
    std::vector<CanonicalName> canonical_names; ///< Every command, in path order.
    std::vector<parser::FlagDecl> global_flags;
    std::vector<BundleShape> leaves; ///< Path order.
};

[[nodiscard]] auto build_emit_plan(const ResolvedTree& tree) -> EmitPlan;

/// Human-readable dump used by `cdlc check`.
void print_emit_plan(const EmitPlan& plan, std::ostream& out);

} // namespace cdl::sema

#endif // CDL_SEMA_EMIT_PLAN_HPP
