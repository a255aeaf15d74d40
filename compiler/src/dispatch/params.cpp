//! # Parameter Bundles and Dispatch Errors
//!
//! `ParamBundle` storage and the English rendering of `DispatchError`.

#include "dispatch/dispatch.hpp"

namespace cdl::dispatch {

void ParamBundle::set_flag(const std::string& name, FlagValue value) {
    for (auto& [existing, current] : flags_) {
        if (existing == name) {
            current = std::move(value);
            return;
        }
    }
    flags_.emplace_back(name, std::move(value));
}

void ParamBundle::add_arg(std::string name, std::string value) {
    args_.emplace_back(std::move(name), std::move(value));
}

auto ParamBundle::has_flag(std::string_view name) const -> bool {
    for (const auto& [existing, _] : flags_) {
        if (existing == name)
            return true;
    }
    return false;
}

auto ParamBundle::get_bool(std::string_view name) const -> bool {
    for (const auto& [existing, value] : flags_) {
        if (existing == name) {
            const auto* b = std::get_if<bool>(&value);
            return b != nullptr && *b;
        }
    }
    return false;
}

auto ParamBundle::get_string(std::string_view name) const -> std::string {
    for (const auto& [existing, value] : flags_) {
        if (existing == name) {
            const auto* s = std::get_if<std::string>(&value);
            return s ? *s : std::string{};
        }
    }
    return {};
}

auto ParamBundle::arg(std::string_view name) const -> std::optional<std::string> {
    for (const auto& [existing, value] : args_) {
        if (existing == name)
            return value;
    }
    return std::nullopt;
}

// ============================================================================
// Errors
// ============================================================================

auto error_kind_name(DispatchErrorKind kind) -> std::string_view {
    switch (kind) {
    case DispatchErrorKind::UnknownCommand:
        return "unknown command";
    case DispatchErrorKind::AmbiguousCommand:
        return "ambiguous command";
    case DispatchErrorKind::UnknownFlag:
        return "unknown flag";
    case DispatchErrorKind::MissingFlagValue:
        return "missing flag value";
    case DispatchErrorKind::MissingArgument:
        return "missing argument";
    case DispatchErrorKind::SurplusArgument:
        return "unexpected argument";
    }
    return "dispatch error";
}

namespace {

auto join(const std::vector<std::string>& items) -> std::string {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty())
            out += ", ";
        out += item;
    }
    return out;
}

} // namespace

auto describe(const DispatchError& error) -> std::string {
    std::string where = error.resolved_path.empty() ? "" : " for '" + error.resolved_path + "'";

    switch (error.kind) {
    case DispatchErrorKind::UnknownCommand:
        return "unknown command '" + error.token + "'" + where;
    case DispatchErrorKind::AmbiguousCommand:
        return "ambiguous command '" + error.token + "' (candidates: " + join(error.candidates) +
               ")";
    case DispatchErrorKind::UnknownFlag:
        return "unknown flag '" + error.token + "'" + where;
    case DispatchErrorKind::MissingFlagValue:
        return "flag '" + error.token + "' requires a value";
    case DispatchErrorKind::MissingArgument:
        return "argument '" + error.token + "' is missing" + where;
    case DispatchErrorKind::SurplusArgument:
        return "unexpected argument '" + error.token + "'" + where;
    }
    return std::string(error_kind_name(error.kind));
}

} // namespace cdl::dispatch
