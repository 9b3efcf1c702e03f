//! # Documentation Comment Parser Implementation
//!
//! Parsing runs in three passes:
//!
//! 1. Collect files from every input directory (sorted, ignore paths skipped)
//! 2. Extract blocks from each file, reporting each to the plugins
//! 3. Link children to parents by name and assemble one page per category

#include "doc/doc_parser.hpp"

#include "build/file_io.hpp"
#include "build/template.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace stylebook::doc {

namespace fs = std::filesystem;

namespace {

auto trim(std::string_view s) -> std::string_view {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        pos = end + 1;
    }
    return lines;
}

/// Joins `lines` after removing their common leading whitespace.
auto dedent(const std::vector<std::string_view>& lines) -> std::string {
    size_t common = std::string_view::npos;
    for (auto line : lines) {
        size_t indent = line.find_first_not_of(" \t");
        if (indent != std::string_view::npos) {
            common = std::min(common, indent);
        }
    }
    if (common == std::string_view::npos) {
        common = 0;
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        if (lines[i].size() > common) {
            out += lines[i].substr(common);
        }
    }
    return out;
}

auto unquote(std::string_view value) -> std::string_view {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

/// True when `rel` (relative to its input directory) is covered by an
/// ignore entry: equal to it, below it, or containing it as a component.
auto is_ignored(const fs::path& rel, const std::vector<std::string>& ignore_paths) -> bool {
    std::string rel_str = rel.generic_string();
    for (const auto& entry : ignore_paths) {
        std::string pattern = fs::path(entry).lexically_normal().generic_string();
        while (!pattern.empty() && pattern.back() == '/') {
            pattern.pop_back();
        }
        if (pattern.starts_with("./")) {
            pattern.erase(0, 2);
        }
        if (pattern.empty() || pattern == ".") {
            continue;
        }
        if (rel_str == pattern || rel_str.starts_with(pattern + "/")) {
            return true;
        }
        for (const auto& component : rel) {
            if (component.generic_string() == pattern) {
                return true;
            }
        }
    }
    return false;
}

struct BlockRecord {
    build::ContentBlock block;
    fs::path file;
    std::optional<size_t> parent;
    std::vector<size_t> children;
};

auto heading(const build::ContentBlock& block, int depth) -> std::string {
    std::string level = std::to_string(std::min(depth, 6));
    return "<h" + level + " id=\"" + build::escape_html(block.name) + "\" class=\"styleguide\">" +
           build::escape_html(block.title) + "</h" + level + ">";
}

void append_markdown(const std::vector<BlockRecord>& records, size_t index, int depth,
                     std::string& out) {
    const auto& record = records[index];
    out += heading(record.block, depth);
    out += "\n\n";
    if (!record.block.markdown.empty()) {
        out += record.block.markdown;
        out += "\n\n";
    }
    for (size_t child : record.children) {
        append_markdown(records, child, depth + 1, out);
    }
}

auto block_tree(const std::vector<BlockRecord>& records, size_t index) -> build::ContentBlock {
    build::ContentBlock block = records[index].block;
    for (size_t child : records[index].children) {
        block.children.push_back(block_tree(records, child));
    }
    return block;
}

void flatten(const std::vector<BlockRecord>& records, size_t index,
             std::vector<build::ContentBlock>& out) {
    out.push_back(records[index].block);
    for (size_t child : records[index].children) {
        flatten(records, child, out);
    }
}

/// True when following parents from `start` reaches `target`.
auto reaches(const std::vector<BlockRecord>& records, size_t start, size_t target) -> bool {
    std::optional<size_t> current = start;
    for (size_t steps = 0; current && steps <= records.size(); ++steps) {
        if (*current == target) {
            return true;
        }
        current = records[*current].parent;
    }
    return false;
}

} // namespace

// ============================================================================
// Comment Extraction
// ============================================================================

auto extract_doc_comments(std::string_view source, bool& unterminated) -> std::vector<std::string> {
    constexpr std::string_view OPEN = "/*doc";
    constexpr std::string_view CLOSE = "*/";

    std::vector<std::string> bodies;
    unterminated = false;
    size_t pos = 0;
    while ((pos = source.find(OPEN, pos)) != std::string_view::npos) {
        size_t start = pos + OPEN.size();
        size_t end = source.find(CLOSE, start);
        if (end == std::string_view::npos) {
            unterminated = true;
            break;
        }
        bodies.emplace_back(source.substr(start, end - start));
        pos = end + CLOSE.size();
    }
    return bodies;
}

auto parse_doc_comment(std::string_view body, std::vector<std::string>& bad_lines) -> ParsedComment {
    ParsedComment comment;
    auto lines = split_lines(body);

    size_t i = 0;
    while (i < lines.size() && trim(lines[i]).empty()) {
        ++i;
    }

    if (i < lines.size() && trim(lines[i]) == "---") {
        size_t close = i + 1;
        while (close < lines.size() && trim(lines[close]) != "---") {
            ++close;
        }
        if (close < lines.size()) {
            comment.has_header = true;
            for (size_t h = i + 1; h < close; ++h) {
                std::string_view line = trim(lines[h]);
                if (line.empty()) {
                    continue;
                }
                size_t colon = line.find(':');
                if (colon == std::string_view::npos) {
                    bad_lines.emplace_back(line);
                    continue;
                }
                std::string key = to_lower(trim(line.substr(0, colon)));
                std::string_view value = unquote(trim(line.substr(colon + 1)));

                if (key == "title") {
                    comment.title = std::string(value);
                } else if (key == "name") {
                    comment.name = std::string(value);
                } else if (key == "parent") {
                    comment.parent = std::string(value);
                } else if (key == "category" || key == "categories") {
                    size_t start = 0;
                    while (start <= value.size()) {
                        size_t comma = value.find(',', start);
                        auto part = trim(value.substr(start, comma == std::string_view::npos
                                                                 ? std::string_view::npos
                                                                 : comma - start));
                        if (!part.empty()) {
                            comment.categories.emplace_back(unquote(part));
                        }
                        if (comma == std::string_view::npos) {
                            break;
                        }
                        start = comma + 1;
                    }
                } else {
                    STYLEBOOK_LOG_TRACE("parse", "Ignoring header key '" << key << "'");
                }
            }
            i = close + 1;
        }
    }

    std::vector<std::string_view> rest(lines.begin() + static_cast<long>(i), lines.end());
    comment.markdown = std::string(trim(dedent(rest)));
    return comment;
}

auto category_file_name(std::string_view category) -> std::string {
    return default_block_name(category) + ".html";
}

auto default_block_name(std::string_view title) -> std::string {
    std::string name = to_lower(trim(title));
    std::replace(name.begin(), name.end(), ' ', '_');
    return name;
}

// ============================================================================
// DocParser
// ============================================================================

auto DocParser::comment_extensions() -> const std::vector<std::string>& {
    static const std::vector<std::string> extensions = {".css",  ".scss", ".sass", ".less",
                                                        ".styl", ".js",   ".jsx"};
    return extensions;
}

auto DocParser::parse(const std::vector<fs::path>& input_dirs,
                      const std::optional<std::string>& index_name, Plugins& plugins,
                      const ParseOptions& options, build::DiagnosticSink& diagnostics) const
    -> Result<build::ParseResult, build::BuildError> {
    std::vector<std::string> scanned = comment_extensions();
    for (const auto& ext : options.custom_extensions) {
        scanned.push_back(to_lower(ext));
    }

    // Pass 1: files
    std::vector<fs::path> files;
    for (const auto& dir : input_dirs) {
        std::vector<fs::path> dir_files;
        std::error_code ec;
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (is_ignored(it->path().lexically_relative(dir), options.ignore_paths)) {
                if (it->is_directory(type_ec)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (it->is_regular_file(type_ec)) {
                dir_files.push_back(it->path());
            }
        }
        if (ec) {
            return build::BuildError{build::BuildErrorKind::Parse,
                                     "Could not read source directory " + dir.string() + ": " +
                                         ec.message()};
        }
        std::sort(dir_files.begin(), dir_files.end());
        files.insert(files.end(), dir_files.begin(), dir_files.end());
    }

    build::ParseResult result;
    std::vector<BlockRecord> records;

    // Pass 2: blocks and stand-alone pages
    for (const auto& file : files) {
        std::string ext = to_lower(file.extension().string());
        bool is_markdown = ext == ".md";
        bool is_template = ext == ".html";
        if (!is_markdown && !is_template &&
            std::find(scanned.begin(), scanned.end(), ext) == scanned.end()) {
            continue;
        }

        auto content = build::read_file(file);
        if (is_err(content)) {
            return build::BuildError{build::BuildErrorKind::Parse, unwrap_err(content).message};
        }

        if (is_markdown || is_template) {
            std::string page_name;
            build::Page page;
            if (is_markdown) {
                std::string stem = file.stem().string();
                page_name = index_name && stem == *index_name ? "index.html" : stem + ".html";
                page = build::MarkdownPage{{}, std::move(unwrap(content))};
            } else {
                page_name = file.filename().string();
                page = build::TemplatePage{std::move(unwrap(content))};
            }
            if (!result.pages.emplace(page_name, std::move(page)).second) {
                diagnostics.warning("parse", "Duplicate page " + page_name + " from " +
                                                 file.string() + ", keeping the first");
            }
            continue;
        }

        bool unterminated = false;
        auto bodies = extract_doc_comments(unwrap(content), unterminated);
        if (unterminated) {
            diagnostics.warning("parse",
                                "Unterminated documentation comment in " + file.string());
        }

        for (const auto& body : bodies) {
            std::vector<std::string> bad_lines;
            ParsedComment comment = parse_doc_comment(body, bad_lines);
            for (const auto& line : bad_lines) {
                diagnostics.warning("parse", "Ignoring malformed header line '" + line + "' in " +
                                                 file.string());
            }
            if (comment.name.empty() && comment.title.empty()) {
                diagnostics.warning("parse", "Skipping documentation block without name or "
                                             "title in " +
                                                 file.string());
                continue;
            }

            BlockRecord record;
            record.file = file;
            record.block.name =
                comment.name.empty() ? default_block_name(comment.title) : comment.name;
            record.block.title = comment.title.empty() ? record.block.name : comment.title;
            record.block.categories = std::move(comment.categories);
            record.block.parent = std::move(comment.parent);
            record.block.markdown = std::move(comment.markdown);

            auto hooked = plugins.on_block(record.block, file);
            if (is_err(hooked)) {
                return unwrap_err(hooked);
            }
            records.push_back(std::move(record));
        }
    }

    // Pass 3: nesting
    std::map<std::string, size_t> by_name;
    for (size_t i = 0; i < records.size(); ++i) {
        if (!by_name.emplace(records[i].block.name, i).second) {
            diagnostics.warning("parse", "Duplicate component name " + records[i].block.name +
                                             " in " + records[i].file.string());
        }
    }
    for (size_t i = 0; i < records.size(); ++i) {
        const std::string& parent = records[i].block.parent;
        if (parent.empty()) {
            continue;
        }
        auto it = by_name.find(parent);
        if (it == by_name.end() || reaches(records, it->second, i)) {
            diagnostics.warning("parse", "Could not find parent component " + parent + " for " +
                                             records[i].block.name);
            continue;
        }
        records[i].parent = it->second;
        records[it->second].children.push_back(i);
    }

    // Pages, one per category of each top-level block
    std::map<std::string, std::vector<size_t>> page_roots;
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        if (record.parent) {
            continue;
        }
        if (record.block.categories.empty()) {
            diagnostics.warning("parse", "Component " + record.block.name + " in " +
                                             record.file.string() +
                                             " has no category and will not be rendered");
            continue;
        }
        for (const auto& category : record.block.categories) {
            std::string file = category_file_name(category);
            result.categories.add(category, file);
            auto& roots = page_roots[file];
            if (std::find(roots.begin(), roots.end(), i) == roots.end()) {
                roots.push_back(i);
            }
        }
    }

    for (const auto& [file, roots] : page_roots) {
        build::MarkdownPage page;
        for (size_t root : roots) {
            append_markdown(records, root, 1, page.markdown);
            switch (options.nav_level) {
            case build::NavLevel::Page:
                page.blocks.push_back(records[root].block);
                break;
            case build::NavLevel::Section:
                page.blocks.push_back(block_tree(records, root));
                break;
            case build::NavLevel::All:
                flatten(records, root, page.blocks);
                break;
            }
        }
        if (!result.pages.emplace(file, std::move(page)).second) {
            diagnostics.warning("parse", "Category page " + file +
                                             " conflicts with a page of the same name, keeping "
                                             "the page");
        }
    }

    if (index_name && !index_name->empty() && result.pages.count("index.html") == 0) {
        std::string wanted = to_lower(*index_name);
        for (const auto& [label, file] : result.categories.entries()) {
            if (to_lower(label) != wanted && file != category_file_name(*index_name)) {
                continue;
            }
            auto page = result.pages.find(file);
            if (page != result.pages.end()) {
                build::Page copy = page->second;
                result.pages.emplace("index.html", std::move(copy));
            }
            break;
        }
    }

    auto finalized = plugins.finalize(result.pages);
    if (is_err(finalized)) {
        return unwrap_err(finalized);
    }

    STYLEBOOK_LOG_INFO("parse", "Parsed " << records.size() << " component(s) from " << files.size()
                                          << " file(s) into " << result.pages.size()
                                          << " page(s)");
    return result;
}

} // namespace stylebook::doc
