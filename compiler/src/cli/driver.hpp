//! # Compiler Driver Interface
//!
//! `cdl_main()` is the entry point of `cdlc`. It configures logging and
//! routes argv to a command handler.

#pragma once

int cdl_main(int argc, char* argv[]);
