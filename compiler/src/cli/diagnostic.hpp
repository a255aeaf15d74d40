//! # Diagnostic System Interface
//!
//! Formatting of compiler errors for `cdlc`.
//!
//! ## Error Codes
//!
//! | Prefix | Category    | Example                         |
//! |--------|-------------|---------------------------------|
//! | L      | Lexer       | L001 - Unexpected character     |
//! | P      | Parser      | P001 - Unexpected token         |
//! | S      | Semantic    | S003 - Duplicate flag           |
//! | E      | General     | E001 - File not found           |
//!
//! ## Output
//!
//! ```text
//! error[S003]: duplicate flag '--force' in command 'remote/add'
//!   --> git.cdl:7:6
//!      |
//!    7 | flag force f bool "Force"
//!      |      ^^^^^
//!      |
//!   = note: first declared on line 6
//! ```

#pragma once

#include "common.hpp"

#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace cdl::cli {

namespace ErrorCodes {
// Lexer errors
constexpr const char* LEX_INVALID_CHAR = "L001";
constexpr const char* LEX_UNTERMINATED_STRING = "L002";
constexpr const char* LEX_UNTERMINATED_MULTILINE = "L003";

// Parser errors
constexpr const char* PARSE_UNEXPECTED_TOKEN = "P001";
constexpr const char* PARSE_CONTEXT = "P002";

// Semantic errors
constexpr const char* ATTR_KIND_CONFLICT = "S001";
constexpr const char* FLAG_UNSUPPORTED_TYPE = "S002";
constexpr const char* FLAG_DUPLICATE = "S003";
constexpr const char* COMMAND_NAME_SEPARATOR = "S004";
constexpr const char* CANONICAL_NAME_CLASH = "S005";

// General errors
constexpr const char* FILE_NOT_FOUND = "E001";
constexpr const char* INVALID_NAMESPACE = "E002";
} // namespace ErrorCodes

enum class DiagnosticSeverity {
    Error,
    Warning,
    Note,
    Help,
};

struct Diagnostic {
    DiagnosticSeverity severity;
    std::string code;    // Error code (e.g., "P001")
    std::string message; // Main error message
    SourceSpan primary_span;
    std::vector<std::string> notes;
    std::vector<std::string> help; // "did you mean" suggestions
};

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }
    void set_source_content(const std::string& path, const std::string& content);

    void emit(const Diagnostic& diag);

    void error(const std::string& code, const std::string& message, const SourceSpan& span,
               const std::vector<std::string>& notes = {});

    // Error without a source location (file and namespace errors)
    void error(const std::string& code, const std::string& message);

    void note(const std::string& message, const SourceSpan& span);

    size_t error_count() const {
        return error_count_;
    }
    void reset_counts() {
        error_count_ = 0;
    }

private:
    std::ostream& out_;
    bool use_colors_ = true;
    std::unordered_map<std::string, std::string> source_files_; // path -> content
    size_t error_count_ = 0;

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    void emit_header(const Diagnostic& diag);
    void emit_source_snippet(const SourceSpan& span);
    void emit_notes(const std::vector<std::string>& notes);
    void emit_help(const std::vector<std::string>& help);

    std::string get_source_line(const std::string& path, uint32_t line) const;
    std::string severity_string(DiagnosticSeverity sev) const;
    const char* severity_color(DiagnosticSeverity sev) const;
};

// Process-wide emitter writing to stderr
DiagnosticEmitter& get_diagnostic_emitter();

// Check if terminal supports colors
bool terminal_supports_colors();

} // namespace cdl::cli
