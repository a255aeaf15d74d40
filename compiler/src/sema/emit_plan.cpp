#include "sema/emit_plan.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>

namespace cdl::sema {

auto field_kind_name(FieldKind kind) -> std::string_view {
    switch (kind) {
    case FieldKind::Bool:
        return "bool";
    case FieldKind::String:
        return "string";
    case FieldKind::Int:
        return "int";
    }
    return "unknown";
}

auto field_origin_name(FieldOrigin origin) -> std::string_view {
    switch (origin) {
    case FieldOrigin::Flag:
        return "flag";
    case FieldOrigin::Argument:
        return "argument";
    case FieldOrigin::GlobalFlag:
        return "global flag";
    }
    return "unknown";
}

namespace {

auto flag_field(const parser::FlagDecl& flag, FieldOrigin origin) -> BundleField {
    return BundleField{.name = flag.name,
                       .field_name = canonical_identifier(flag.name),
                       .kind = flag.is_bool() ? FieldKind::Bool : FieldKind::String,
                       .origin = origin,
                       .description = flag.description};
}

} // namespace

auto build_emit_plan(const ResolvedTree& tree) -> EmitPlan {
    EmitPlan plan;
    plan.attr_kinds = tree.attr_kinds();
    plan.global_flags = tree.global_flags();

    for (NodeId id = 0; id < tree.decl().nodes.size(); ++id) {
        plan.canonical_names.push_back(
            CanonicalName{.path = tree.path(id), .name = tree.canonical_name(id)});
    }
    std::sort(plan.canonical_names.begin(), plan.canonical_names.end(),
              [](const CanonicalName& a, const CanonicalName& b) { return a.path < b.path; });

    for (NodeId id : tree.leaves()) {
        const auto& node = tree.node(id);

        BundleShape shape{.node = id,
                          .path = tree.path(id),
                          .canonical_name = tree.canonical_name(id),
                          .bundle_name = tree.canonical_name(id) + "Params",
                          .handler_name = "Run" + tree.canonical_name(id),
                          .fields = {},
                          .attrs = {}};

        for (const auto& flag : node.flags) {
            shape.fields.push_back(flag_field(flag, FieldOrigin::Flag));
        }
        for (const auto& arg : node.args) {
            shape.fields.push_back(BundleField{.name = arg.name,
                                               .field_name = canonical_identifier(arg.name),
                                               .kind = FieldKind::String,
                                               .origin = FieldOrigin::Argument,
                                               .description = arg.description});
        }
        for (const auto& flag : tree.global_flags()) {
            shape.fields.push_back(flag_field(flag, FieldOrigin::GlobalFlag));
        }
        for (const auto& attr : tree.attr_kinds()) {
            shape.attrs.push_back(
                ResolvedAttr{.name = attr.name, .value = tree.attr_or_zero(id, attr)});
        }

        plan.leaves.push_back(std::move(shape));
    }

    return plan;
}

void print_emit_plan(const EmitPlan& plan, std::ostream& out) {
    out << "attributes:\n";
    for (const auto& attr : plan.attr_kinds) {
        out << "  " << std::left << std::setw(20) << attr.name << parser::attr_kind_name(attr.kind)
            << "\n";
    }

    out << "global flags:\n";
    for (const auto& flag : plan.global_flags) {
        out << "  --" << std::left << std::setw(18) << flag.name << flag.type_name << "\n";
    }

    out << "commands:\n";
    for (const auto& name : plan.canonical_names) {
        out << "  " << std::left << std::setw(20) << name.path << name.name << "\n";
    }

    out << "handlers:\n";
    for (const auto& leaf : plan.leaves) {
        out << "  " << leaf.handler_name << "(" << leaf.bundle_name << ")\n";
        for (const auto& field : leaf.fields) {
            out << "    " << std::left << std::setw(18) << field.field_name << std::setw(8)
                << field_kind_name(field.kind) << "(" << field_origin_name(field.origin) << ")\n";
        }
        for (const auto& attr : leaf.attrs) {
            out << "    @" << std::left << std::setw(17) << attr.name
                << parser::format_attr_value(attr.value) << "\n";
        }
    }
    out << "  Help(args)\n";
}

} // namespace cdl::sema
