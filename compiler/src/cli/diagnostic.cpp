#include "diagnostic.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iomanip>

#include <unistd.h>

namespace cdl::cli {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
    if (!CompilerOptions::color)
        return false;
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

// ============================================================================
// Global Emitter
// ============================================================================

DiagnosticEmitter& get_diagnostic_emitter() {
    static DiagnosticEmitter emitter(std::cerr);
    return emitter;
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = terminal_supports_colors();
}

void DiagnosticEmitter::set_source_content(const std::string& path, const std::string& content) {
    source_files_[path] = content;
}

std::string DiagnosticEmitter::get_source_line(const std::string& path, uint32_t line) const {
    auto it = source_files_.find(path);
    if (it == source_files_.end() || line == 0)
        return "";

    const std::string& content = it->second;
    size_t line_start = 0;
    for (uint32_t current = 1; current < line; ++current) {
        line_start = content.find('\n', line_start);
        if (line_start == std::string::npos)
            return "";
        ++line_start;
    }

    size_t line_end = content.find('\n', line_start);
    if (line_end == std::string::npos)
        line_end = content.size();
    std::string result = content.substr(line_start, line_end - line_start);
    if (!result.empty() && result.back() == '\r')
        result.pop_back();
    return result;
}

std::string DiagnosticEmitter::severity_string(DiagnosticSeverity sev) const {
    switch (sev) {
    case DiagnosticSeverity::Error:
        return "error";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Note:
        return "note";
    case DiagnosticSeverity::Help:
        return "help";
    }
    return "unknown";
}

const char* DiagnosticEmitter::severity_color(DiagnosticSeverity sev) const {
    switch (sev) {
    case DiagnosticSeverity::Error:
        return Colors::Red;
    case DiagnosticSeverity::Warning:
        return Colors::Yellow;
    case DiagnosticSeverity::Note:
        return Colors::Cyan;
    case DiagnosticSeverity::Help:
        return Colors::Green;
    }
    return Colors::Reset;
}

void DiagnosticEmitter::emit_header(const Diagnostic& diag) {
    // Format: error[P001]: message
    out_ << color(Colors::Bold) << color(severity_color(diag.severity))
         << severity_string(diag.severity);

    if (!diag.code.empty()) {
        out_ << "[" << diag.code << "]";
    }

    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << diag.message
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_source_snippet(const SourceSpan& span) {
    if (span.start.line == 0) {
        return;
    }

    std::string file_path(span.start.file);
    out_ << color(Colors::Blue) << "  --> " << color(Colors::Reset) << file_path << ":"
         << span.start.line << ":" << span.start.column << "\n";

    std::string source_line = get_source_line(file_path, span.start.line);
    if (source_line.empty()) {
        return;
    }

    int line_width = std::max(static_cast<int>(std::to_string(span.start.line).length()), 4);

    out_ << color(Colors::Blue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
    out_ << color(Colors::Blue) << std::setw(line_width) << span.start.line << " | "
         << color(Colors::Reset) << source_line << "\n";

    // Span ends are inclusive; underline the first line of the span
    size_t start_col = span.start.column > 0 ? span.start.column - 1 : 0;
    size_t end_col = start_col + 1;
    if (span.end.line == span.start.line && span.end.column > span.start.column) {
        end_col = span.end.column;
    } else if (span.end.line != span.start.line) {
        end_col = std::max(end_col, source_line.length());
    }

    out_ << color(Colors::Blue) << std::setw(line_width) << "" << " | " << color(Colors::Reset)
         << std::string(std::min(start_col, source_line.length()), ' ') << color(Colors::Red)
         << std::string(end_col > start_col ? end_col - start_col : 1, '^')
         << color(Colors::Reset) << "\n";

    out_ << color(Colors::Blue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
}

void DiagnosticEmitter::emit_notes(const std::vector<std::string>& notes) {
    for (const auto& note : notes) {
        out_ << color(Colors::Cyan) << "  = note" << color(Colors::Reset) << ": " << note << "\n";
    }
}

void DiagnosticEmitter::emit_help(const std::vector<std::string>& help) {
    for (const auto& h : help) {
        out_ << color(Colors::Green) << "  = help" << color(Colors::Reset) << ": " << h << "\n";
    }
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    if (diag.severity == DiagnosticSeverity::Error) {
        error_count_++;
    }

    emit_header(diag);
    emit_source_snippet(diag.primary_span);
    emit_notes(diag.notes);
    emit_help(diag.help);
}

void DiagnosticEmitter::error(const std::string& code, const std::string& message,
                              const SourceSpan& span, const std::vector<std::string>& notes) {
    Diagnostic diag;
    diag.severity = DiagnosticSeverity::Error;
    diag.code = code;
    diag.message = message;
    diag.primary_span = span;
    diag.notes = notes;
    emit(diag);
}

void DiagnosticEmitter::error(const std::string& code, const std::string& message) {
    error(code, message, SourceSpan{});
}

void DiagnosticEmitter::note(const std::string& message, const SourceSpan& span) {
    Diagnostic diag;
    diag.severity = DiagnosticSeverity::Note;
    diag.message = message;
    diag.primary_span = span;
    emit(diag);
}

} // namespace cdl::cli
