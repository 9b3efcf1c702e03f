//! # Build Command Interface
//!
//! `stylebook [config.json] [--plugin ...]` builds the style guide.

#ifndef STYLEBOOK_CLI_CMD_BUILD_HPP
#define STYLEBOOK_CLI_CMD_BUILD_HPP

#include <string>
#include <vector>

namespace stylebook::cli {

/**
 * Build the style guide described by a config file
 *
 * @param config_path Config file, relative to the working directory or absolute
 * @param extra_args `--name` arguments forwarded to the plugin system
 * @return 0 on success, 1 on configuration, validation or build failure
 */
int run_build(const std::string& config_path, const std::vector<std::string>& extra_args);

} // namespace stylebook::cli

#endif // STYLEBOOK_CLI_CMD_BUILD_HPP
