//! # CLI Utilities Interface
//!
//! | Function                | Description                              |
//! |-------------------------|------------------------------------------|
//! | `print_usage()`         | Print CLI help text                      |
//! | `print_version()`       | Print tool version                       |
//! | `print_errors()`        | Print validation errors, one per line    |
//! | `split_arguments()`     | Separate positional and flag arguments   |

#pragma once

#include <string>
#include <vector>

namespace stylebook::cli {

// Help text
void print_usage();
void print_version();

void print_errors(const std::vector<std::string>& errors);

/// Arguments left after logging options are removed.
struct CommandLine {
    std::vector<std::string> positional;
    std::vector<std::string> flags; ///< `--x` style arguments, forwarded to plugins
};

CommandLine split_arguments(int argc, char* argv[], int first);

} // namespace stylebook::cli
