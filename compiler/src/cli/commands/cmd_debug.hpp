//! # Compile Commands Interface
//!
//! The compilation pipeline and the commands that expose its stages.
//!
//! ## Commands
//!
//! | Function        | Command                  | Output                       |
//! |-----------------|--------------------------|------------------------------|
//! | `run_compile()` | `cdlc <file> <ns>`       | Nothing on success           |
//! | `run_lex()`     | `cdlc lex <file>`        | Token stream                 |
//! | `run_parse()`   | `cdlc parse <file>`      | Declaration tree             |
//! | `run_check()`   | `cdlc check <file> <ns>` | Emit plan                    |

#pragma once
#include "lexer/source.hpp"
#include "sema/resolver.hpp"

#include <optional>
#include <string>

namespace cdl::cli {

class DiagnosticEmitter;

/// Parses and resolves `source`, reporting the first failure to `diag`.
/// The returned tree holds views into `source`.
std::optional<sema::ResolvedTree> compile_source(const lexer::Source& source,
                                                 DiagnosticEmitter& diag);

int run_compile(const std::string& path, const std::string& ns);
int run_lex(const std::string& path);
int run_parse(const std::string& path);
int run_check(const std::string& path, const std::string& ns);

} // namespace cdl::cli
