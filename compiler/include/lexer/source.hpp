//! # Declaration Source
//!
//! Owns the text of one `.cdl` file and maps byte offsets to line/column
//! positions for tokens and diagnostics.
//!
//! ## Example
//!
//! ```cpp
//! auto loaded = Source::from_file("git.cdl");
//! if (is_err(loaded)) {
//!     std::cerr << unwrap_err(loaded) << "\n";
//!     return 1;
//! }
//! const Source& source = unwrap(loaded);
//! SourceLocation loc = source.location(4);
//! ```

#ifndef CDL_LEXER_SOURCE_HPP
#define CDL_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cdl::lexer {

/// A declaration file with a line-start index.
///
/// Views returned by `content()`, `slice()`, `line()` and the `file` field of
/// every `SourceLocation` point into this object and stay valid while it is
/// alive and not moved.
class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Byte at `offset`, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Text in `[start, end)`, clamped to the source.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// 1-based line and column of a byte offset (binary search on the index).
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Text of a 1-based line without its line terminator.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Reads a file from disk. Returns an error string if it cannot be read.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace cdl::lexer

#endif // CDL_LEXER_SOURCE_HPP
