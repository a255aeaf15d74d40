//! # Run Command Interface
//!
//! `cdlc run <file.cdl> [--] <args...>` compiles a declaration file and
//! dispatches `args` against it, as a generated CLI would. Every leaf is
//! bound to a handler that prints the bound parameters.

#pragma once
#include "dispatch/dispatch.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace cdl::cli {

/// Prints the command path, then its flags, arguments and global flags.
void print_invocation(const dispatch::Invocation& invocation, std::ostream& out);

int run_run(const std::string& path, const std::vector<std::string>& args);

} // namespace cdl::cli
