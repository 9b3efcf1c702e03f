//! # CLI Driver Interface
//!
//! `stylebook_main()` dispatches to the command handler selected by argv.

#pragma once

/// Entry point of the `stylebook` binary. Returns the process exit code.
int stylebook_main(int argc, char* argv[]);
