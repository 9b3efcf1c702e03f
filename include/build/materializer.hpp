//! # Output Materialization
//!
//! Writes rendered pages and copies static trees into the destination.
//!
//! | Operation | Failure |
//! |-----------|---------|
//! | `write_page` | fatal `Io` error |
//! | `copy_assets` | fatal `Io` error |
//! | `copy_dependencies` | warning per dependency, never fatal |
//!
//! Copies replace a same-named destination entry instead of merging into it.

#ifndef STYLEBOOK_BUILD_MATERIALIZER_HPP
#define STYLEBOOK_BUILD_MATERIALIZER_HPP

#include "build/config.hpp"
#include "build/diagnostics.hpp"
#include "build/errors.hpp"
#include "common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace stylebook::build {

/// Writes `content` to `output_dir/file_name`, truncating an existing file.
[[nodiscard]] auto write_page(const std::filesystem::path& output_dir, const std::string& file_name,
                              std::string_view content) -> Result<Unit, BuildError>;

/// Removes `dst` if present, then recursively copies `src` to it.
[[nodiscard]] auto replace_with_copy(const std::filesystem::path& src,
                                     const std::filesystem::path& dst)
    -> Result<Unit, std::error_code>;

/// Copies every entry of `assets_dir` except names starting with `_`
/// (header, footer and partials). Returns the number of entries copied; an
/// absent `assets_dir` copies nothing.
[[nodiscard]] auto copy_assets(const std::optional<std::filesystem::path>& assets_dir,
                               const std::filesystem::path& output_dir)
    -> Result<size_t, BuildError>;

/// Copies each configured dependency directory to `output_dir/<basename>`.
/// Returns the number copied; failures are reported as warnings.
auto copy_dependencies(const BuildConfig& config, const std::filesystem::path& output_dir,
                       DiagnosticSink& diagnostics) -> size_t;

} // namespace stylebook::build

#endif // STYLEBOOK_BUILD_MATERIALIZER_HPP
