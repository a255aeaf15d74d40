//! # Common Definitions
//!
//! Types and utilities shared by every stage of the CDL toolchain: the
//! lexer, parser, semantic resolver, dispatch engine and the `cdlc` driver.
//!
//! ## Overview
//!
//! - **Version Information**: Toolchain version constants
//! - **Compiler Options**: Process-wide switches set by the driver
//! - **Source Locations**: Positions inside a declaration file
//! - **Result Type**: Error handling without exceptions
//!
//! ## Conventions
//!
//! Every fallible operation in the library returns `Result<T, E>`. Stages
//! never throw; only the file utilities of the CLI layer do, and the driver
//! catches them at the command boundary.

#ifndef CDL_COMMON_HPP
#define CDL_COMMON_HPP

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cdl {

// ============================================================================
// Version Information
// ============================================================================

/// The toolchain version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

/// File extension required for declaration sources.
constexpr std::string_view SOURCE_EXTENSION = ".cdl";

// ============================================================================
// Compiler Configuration
// ============================================================================

/// Process-wide options, set once by the driver from the command line.
///
/// # Example
///
/// ```cpp
/// CompilerOptions::verbose = true;
/// CompilerOptions::color = false;
/// ```
struct CompilerOptions {
    /// Print extra detail (token dumps include spans, plans include origins).
    static inline bool verbose = false;

    /// Allow ANSI styling in diagnostics and help output.
    static inline bool color = true;
};

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* Dim = "\033[2m";

    static constexpr const char* Red = "\033[31m";
    static constexpr const char* Green = "\033[32m";
    static constexpr const char* Yellow = "\033[33m";
    static constexpr const char* Blue = "\033[34m";
    static constexpr const char* Cyan = "\033[36m";
};

// ============================================================================
// Source Location Types
// ============================================================================

/// A position in a declaration file.
///
/// - `file`: Path of the source (or `<input>` for in-memory text)
/// - `line`: 1-based line number
/// - `column`: 1-based column number
/// - `offset`: 0-based byte offset from the start of the source
/// - `length`: Length of the element in bytes
struct SourceLocation {
    std::string_view file;
    uint32_t line;
    uint32_t column;
    uint32_t offset;
    uint32_t length;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A contiguous region of a declaration file.
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;

    /// Returns a span from the start of `a` to the end of `b`.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }

    [[nodiscard]] auto operator==(const SourceSpan& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = sema::resolve(std::move(tree));
/// if (is_err(result)) {
///     report(unwrap_err(result));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace cdl

#endif // CDL_COMMON_HPP
