//! # Project Scaffold
//!
//! Creates a starter project for `stylebook init`:
//!
//! ```text
//! target/
//!   ├─ stylebook_config.json
//!   ├─ doc_assets/
//!   │    ├─ _header.html
//!   │    └─ _footer.html
//!   └─ code_example_templates/
//!        ├─ markdown_example_template.html
//!        ├─ markdown_table_template.html
//!        ├─ js_example_template.html
//!        └─ jsx_example_template.html
//! ```

#ifndef STYLEBOOK_BUILD_SCAFFOLD_HPP
#define STYLEBOOK_BUILD_SCAFFOLD_HPP

#include "build/diagnostics.hpp"
#include "build/errors.hpp"
#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace stylebook::build {

/// Contents of the generated `stylebook_config.json`.
[[nodiscard]] auto default_config_document() -> std::string_view;

/// Writes the starter files into `target_dir` and returns their paths
/// relative to it. Nothing is written when a config file already exists.
[[nodiscard]] auto setup_dir(const std::filesystem::path& target_dir, DiagnosticSink& diagnostics)
    -> Result<std::vector<std::string>, BuildError>;

} // namespace stylebook::build

#endif // STYLEBOOK_BUILD_SCAFFOLD_HPP
