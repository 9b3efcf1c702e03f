#include "doc/search_index.hpp"

#include "json/json_value.hpp"

namespace stylebook::doc {

namespace {

/// Encodes `{` inside JSON strings as `\u007b` so the document contains no
/// template tag openers when it is written as a template page.
auto escape_template_openers(const std::string& json) -> std::string {
    std::string out;
    out.reserve(json.size());
    bool in_string = false;
    bool escaped = false;
    for (char c : json) {
        if (in_string && c == '{') {
            out += "\\u007b";
            escaped = false;
            continue;
        }
        out += c;
        if (escaped) {
            escaped = false;
        } else if (c == '\\') {
            escaped = in_string;
        } else if (c == '"') {
            in_string = !in_string;
        }
    }
    return out;
}

void add_entries(json::JsonArray& entries, const std::vector<build::ContentBlock>& blocks,
                 const std::string& page, const std::map<std::string, std::string>& sources) {
    for (const auto& block : blocks) {
        json::JsonObject entry;
        entry.emplace("name", json::JsonValue(block.name));
        entry.emplace("title", json::JsonValue(block.title));
        entry.emplace("page", json::JsonValue(page));
        entry.emplace("url", json::JsonValue(page + "#" + block.name));
        auto source = sources.find(block.name);
        entry.emplace("source", source == sources.end() ? json::JsonValue()
                                                        : json::JsonValue(source->second));
        entries.emplace_back(std::move(entry));
        add_entries(entries, block.children, page, sources);
    }
}

} // namespace

auto SearchIndexPlugin::on_block(const build::ContentBlock& block, const std::filesystem::path& file)
    -> Result<Unit, std::string> {
    sources_.try_emplace(block.name, file.filename().string());
    return Unit{};
}

auto SearchIndexPlugin::finalize(build::PageMap& pages) -> Result<Unit, std::string> {
    if (pages.count(OUTPUT_FILE) > 0) {
        return std::string("a page named ") + OUTPUT_FILE + " already exists";
    }

    json::JsonArray entries;
    for (const auto& [file_name, page] : pages) {
        if (const auto* blocks = build::page_blocks(page)) {
            add_entries(entries, *blocks, file_name, sources_);
        }
    }

    std::string json = json::JsonValue(std::move(entries)).to_string();
    pages.emplace(OUTPUT_FILE, build::TemplatePage{escape_template_openers(json)});
    return Unit{};
}

} // namespace stylebook::doc
