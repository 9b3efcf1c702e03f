//! # stylebook Entry Point
//!
//! Delegates to the CLI driver, which parses arguments and dispatches to the
//! `init` or build command.
//!
//! ```bash
//! stylebook init                    # Scaffold a new style guide
//! stylebook                         # Build from ./stylebook_config.json
//! stylebook other_config.json -v    # Build with debug logging
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return stylebook_main(argc, argv);
}
