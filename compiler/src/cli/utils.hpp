//! # CLI Utilities Interface
//!
//! Shared helpers for the `cdlc` commands.
//!
//! ## Functions
//!
//! | Function                 | Description                        |
//! |--------------------------|------------------------------------|
//! | `read_file()`            | Read entire file to string         |
//! | `has_source_extension()` | Check for the `.cdl` extension     |
//! | `print_usage()`          | Print CLI help text                |
//! | `print_version()`        | Print compiler version             |

#pragma once
#include <string>

namespace cdl::cli {

// File I/O; throws std::runtime_error when the file cannot be opened
std::string read_file(const std::string& path);

bool has_source_extension(const std::string& path);

// Help text
void print_usage();
void print_version();

} // namespace cdl::cli
