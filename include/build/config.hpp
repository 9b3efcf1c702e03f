//! # Build Configuration
//!
//! Resolved settings of one build, produced from the JSON configuration
//! document.
//!
//! ## Configuration Keys
//!
//! | Key | Type | Default |
//! |-----|------|---------|
//! | `source` | string or array | required |
//! | `destination` | string | required |
//! | `documentation_assets` | string | required |
//! | `dependencies` | array or null | `[]` |
//! | `index` | string | none |
//! | `nav_level` | `page` \| `section` \| `all` | `page` |
//! | `custom_extensions` | string or array | `[]` |
//! | `ignore_paths` | array | `[]` |
//! | `code_example_templates` | string | none |
//! | `code_example_renderers` | string | none |
//! | `custom_markdown` | string | `default` |
//! | `exit_on_warnings` | bool | `false` |
//! | `plugins` | array | `[]` |
//!
//! Relative paths are resolved against `base_path`, the directory of the
//! configuration file. The process working directory is never consulted.

#ifndef STYLEBOOK_BUILD_CONFIG_HPP
#define STYLEBOOK_BUILD_CONFIG_HPP

#include "build/errors.hpp"
#include "common.hpp"
#include "json/json_value.hpp"
#include "markdown/renderer.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylebook::build {

/// Granularity of the `blocks` list exposed to page templates.
enum class NavLevel {
    Page,    ///< Top-level blocks only
    Section, ///< Top-level blocks with their children
    All,     ///< Every block, flattened in document order
};

[[nodiscard]] auto nav_level_name(NavLevel level) -> std::string_view;

[[nodiscard]] auto parse_nav_level(std::string_view name) -> std::optional<NavLevel>;

/// Default configuration file name.
inline constexpr const char* CONFIG_FILE_NAME = "stylebook_config.json";

struct BuildConfig {
    std::filesystem::path base_path;

    std::vector<std::string> source; ///< Always a list, even if written as one path
    std::optional<std::string> destination;
    std::optional<std::string> documentation_assets;
    std::vector<std::string> dependencies;
    std::optional<std::string> index;
    NavLevel nav_level = NavLevel::Page;
    std::vector<std::string> custom_extensions; ///< Each starts with '.'
    std::vector<std::string> ignore_paths;
    std::optional<std::string> code_example_templates;
    std::optional<std::string> code_example_renderers;
    std::string markdown_renderer = markdown::MarkdownRendererRegistry::DEFAULT_RENDERER;
    markdown::MarkdownRendererFactory renderer_factory;
    bool exit_on_warnings = false;
    std::vector<std::string> plugins;

    /// The configuration document as written, exposed to templates as `config`.
    Rc<const json::JsonValue> raw;

    // Resolved directories, recomputed by resolve_dirs()
    std::optional<std::filesystem::path> output_dir;
    std::optional<std::filesystem::path> doc_assets_dir;
    std::vector<std::filesystem::path> input_dirs;

    /// Canonical absolute path of `path` (relative to `base_path`) when it
    /// names an existing directory.
    [[nodiscard]] auto resolve(const std::string& path) const
        -> std::optional<std::filesystem::path>;

    /// `path` made absolute against `base_path`, without existence checks.
    [[nodiscard]] auto absolute(const std::string& path) const -> std::filesystem::path;

    /// Recomputes `output_dir`, `doc_assets_dir` and `input_dirs`.
    /// Unresolvable sources are left out of `input_dirs`.
    void resolve_dirs();
};

/// Builds a `BuildConfig` from a parsed configuration document.
[[nodiscard]] auto resolve_config(const json::JsonValue& options,
                                  const std::filesystem::path& base_path,
                                  const markdown::MarkdownRendererRegistry& registry)
    -> Result<BuildConfig, ConfigError>;

/// Reads and resolves a configuration file; `base_path` is its directory.
[[nodiscard]] auto load_config_file(const std::filesystem::path& path,
                                    const markdown::MarkdownRendererRegistry& registry)
    -> Result<BuildConfig, ConfigError>;

} // namespace stylebook::build

#endif // STYLEBOOK_BUILD_CONFIG_HPP
