//! # Init Command Interface
//!
//! `stylebook init` writes a starter project into the current directory.

#ifndef STYLEBOOK_CLI_CMD_INIT_HPP
#define STYLEBOOK_CLI_CMD_INIT_HPP

#include <filesystem>

namespace stylebook::cli {

/**
 * Create the starter config, header, footer and example templates
 *
 * @param target_dir Directory receiving the files
 * @return 0 on success (including when a config already exists), 1 on I/O failure
 */
int run_init(const std::filesystem::path& target_dir);

} // namespace stylebook::cli

#endif // STYLEBOOK_CLI_CMD_INIT_HPP
