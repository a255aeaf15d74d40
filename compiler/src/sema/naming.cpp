//! # Canonical Names
//!
//! | Input            | canonical_identifier | lower_first   |
//! |------------------|----------------------|---------------|
//! | `remote/add`     | `RemoteAdd`          | `remoteAdd`   |
//! | `dry-run`        | `DryRun`             | `dryRun`      |
//! | `v2.config:set`  | `V2ConfigSet`        | `v2ConfigSet` |
//! | `2fa`            | `X2fa`               | `x2fa`        |
//! | `--`             | `X`                  | `x`           |

#include "sema/resolver.hpp"

#include <cctype>

namespace cdl::sema {

namespace {

auto is_ascii_alpha(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

auto is_ascii_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto is_separator(char c) -> bool {
    return c == '-' || c == '_' || c == '.' || c == ':' || c == '/';
}

} // namespace

auto canonical_identifier(std::string_view name) -> std::string {
    std::string out;
    bool start_of_part = true;

    for (char c : name) {
        if (is_separator(c)) {
            start_of_part = true;
            continue;
        }
        if (start_of_part) {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            start_of_part = false;
        } else {
            out += c;
        }
    }

    if (out.empty()) {
        return "X";
    }
    if (is_ascii_digit(out.front())) {
        return "X" + out;
    }
    return out;
}

auto lower_first(std::string_view name) -> std::string {
    std::string out(name);
    if (!out.empty()) {
        out.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(out.front())));
    }
    return out;
}

auto is_valid_identifier(std::string_view name) -> bool {
    if (name.empty() || is_ascii_digit(name.front())) {
        return false;
    }
    for (char c : name) {
        if (!is_ascii_alpha(c) && !is_ascii_digit(c) && c != '_') {
            return false;
        }
    }
    return true;
}

} // namespace cdl::sema
