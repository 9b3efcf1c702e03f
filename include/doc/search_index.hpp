//! # Search Index Plugin
//!
//! Built-in plugin `search_index`: adds `search_index.json` to the output,
//! listing every documented component with its page and anchor:
//!
//! ```json
//! [{"name": "buttons", "title": "Buttons", "page": "base_css.html",
//!   "url": "base_css.html#buttons", "source": "buttons.css"}]
//! ```

#ifndef STYLEBOOK_DOC_SEARCH_INDEX_HPP
#define STYLEBOOK_DOC_SEARCH_INDEX_HPP

#include "doc/plugin.hpp"

#include <map>
#include <string>

namespace stylebook::doc {

class SearchIndexPlugin : public Plugin {
public:
    static constexpr const char* NAME = "search_index";
    static constexpr const char* OUTPUT_FILE = "search_index.json";

    [[nodiscard]] auto name() const -> std::string_view override {
        return NAME;
    }

    auto on_block(const build::ContentBlock& block, const std::filesystem::path& file)
        -> Result<Unit, std::string> override;

    auto finalize(build::PageMap& pages) -> Result<Unit, std::string> override;

private:
    std::map<std::string, std::string> sources_; ///< component name -> source file name
};

} // namespace stylebook::doc

#endif // STYLEBOOK_DOC_SEARCH_INDEX_HPP
