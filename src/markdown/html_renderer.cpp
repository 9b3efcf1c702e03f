//! # Built-in Markdown Renderer
//!
//! Line-oriented block parser with a recursive span renderer. Block
//! constructs are recognised in this order: fenced code, ATX heading,
//! horizontal rule, raw HTML block, blockquote, pipe table, list,
//! paragraph. Fenced blocks go through the `CodeExampleRenderer`.

#include "markdown/renderer.hpp"

#include "build/template.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace stylebook::markdown {

using build::escape_html;

namespace {

// ============================================================================
// Line Classification
// ============================================================================

auto is_blank(std::string_view line) -> bool {
    return line.find_first_not_of(" \t") == std::string_view::npos;
}

auto leading_spaces(std::string_view line) -> size_t {
    size_t n = 0;
    while (n < line.size() && line[n] == ' ') {
        ++n;
    }
    return n;
}

auto trim(std::string_view s) -> std::string_view {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

/// Splits into lines, dropping `\r` and expanding leading tabs to 4 spaces.
auto split_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view raw = text.substr(pos, end - pos);
        if (!raw.empty() && raw.back() == '\r') {
            raw.remove_suffix(1);
        }

        std::string line;
        size_t i = 0;
        for (; i < raw.size() && (raw[i] == ' ' || raw[i] == '\t'); ++i) {
            line += raw[i] == '\t' ? std::string(4, ' ') : std::string(1, ' ');
        }
        line += raw.substr(i);
        lines.push_back(std::move(line));
        pos = end + 1;
    }
    while (!lines.empty() && is_blank(lines.back())) {
        lines.pop_back();
    }
    return lines;
}

struct Fence {
    char marker;
    size_t length;
    std::string info;
};

auto fence_open(std::string_view line) -> std::optional<Fence> {
    size_t indent = leading_spaces(line);
    if (indent > 3 || indent >= line.size()) {
        return std::nullopt;
    }
    char marker = line[indent];
    if (marker != '`' && marker != '~') {
        return std::nullopt;
    }
    size_t n = 0;
    while (indent + n < line.size() && line[indent + n] == marker) {
        ++n;
    }
    if (n < 3) {
        return std::nullopt;
    }
    std::string_view info = trim(line.substr(indent + n));
    if (marker == '`' && info.find('`') != std::string_view::npos) {
        return std::nullopt;
    }
    size_t space = info.find(' ');
    return Fence{marker, n, std::string(info.substr(0, space))};
}

auto fence_closes(std::string_view line, const Fence& fence) -> bool {
    std::string_view t = trim(line);
    if (t.size() < fence.length) {
        return false;
    }
    for (char c : t) {
        if (c != fence.marker) {
            return false;
        }
    }
    return true;
}

auto atx_heading(std::string_view line) -> std::optional<std::pair<int, std::string_view>> {
    size_t indent = leading_spaces(line);
    if (indent > 3) {
        return std::nullopt;
    }
    size_t level = 0;
    while (indent + level < line.size() && line[indent + level] == '#') {
        ++level;
    }
    if (level == 0 || level > 6) {
        return std::nullopt;
    }
    size_t rest = indent + level;
    if (rest < line.size() && line[rest] != ' ' && line[rest] != '\t') {
        return std::nullopt;
    }
    std::string_view text = trim(line.substr(rest));
    // Optional closing sequence: "## Title ##"
    size_t end = text.find_last_not_of('#');
    if (end == std::string_view::npos) {
        text = {};
    } else if (end + 1 < text.size() && (text[end] == ' ' || text[end] == '\t')) {
        text = trim(text.substr(0, end + 1));
    }
    return std::make_pair(static_cast<int>(level), text);
}

auto is_hr(std::string_view line) -> bool {
    if (leading_spaces(line) > 3) {
        return false;
    }
    char marker = 0;
    size_t count = 0;
    for (char c : line) {
        if (c == ' ' || c == '\t') {
            continue;
        }
        if (c != '-' && c != '*' && c != '_') {
            return false;
        }
        if (marker != 0 && c != marker) {
            return false;
        }
        marker = c;
        ++count;
    }
    return count >= 3;
}

auto is_html_block_start(std::string_view line) -> bool {
    size_t indent = leading_spaces(line);
    if (indent > 3 || indent + 1 >= line.size() || line[indent] != '<') {
        return false;
    }
    char next = line[indent + 1];
    return std::isalpha(static_cast<unsigned char>(next)) || next == '/' || next == '!';
}

auto is_blockquote(std::string_view line) -> bool {
    size_t indent = leading_spaces(line);
    return indent <= 3 && indent < line.size() && line[indent] == '>';
}

struct ListMarker {
    bool ordered;
    size_t indent;         ///< Spaces before the marker
    size_t content_offset; ///< Column where the item text starts
    int start;             ///< Number of an ordered marker
};

auto list_marker(std::string_view line) -> std::optional<ListMarker> {
    size_t indent = leading_spaces(line);
    if (indent >= line.size()) {
        return std::nullopt;
    }

    size_t pos = indent;
    bool ordered = false;
    int start = 1;
    char c = line[pos];
    if (c == '-' || c == '*' || c == '+') {
        ++pos;
    } else if (std::isdigit(static_cast<unsigned char>(c))) {
        size_t digits = 0;
        while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos])) &&
               digits < 9) {
            ++pos;
            ++digits;
        }
        if (pos >= line.size() || (line[pos] != '.' && line[pos] != ')')) {
            return std::nullopt;
        }
        start = std::stoi(std::string(line.substr(indent, digits)));
        ++pos;
        ordered = true;
    } else {
        return std::nullopt;
    }

    if (pos < line.size() && line[pos] != ' ') {
        return std::nullopt;
    }
    size_t spaces = 0;
    while (pos + spaces < line.size() && line[pos + spaces] == ' ' && spaces < 4) {
        ++spaces;
    }
    if (pos + spaces >= line.size()) {
        spaces = 1; // empty item
    }
    return ListMarker{ordered, indent, pos + std::max<size_t>(spaces, 1), start};
}

auto split_table_row(std::string_view line) -> std::vector<std::string> {
    std::string_view t = trim(line);
    if (!t.empty() && t.front() == '|') {
        t.remove_prefix(1);
    }
    if (!t.empty() && t.back() == '|' && (t.size() < 2 || t[t.size() - 2] != '\\')) {
        t.remove_suffix(1);
    }

    std::vector<std::string> cells;
    std::string cell;
    bool in_code = false;
    for (size_t i = 0; i < t.size(); ++i) {
        char c = t[i];
        if (c == '\\' && i + 1 < t.size() && t[i + 1] == '|') {
            cell += '|';
            ++i;
        } else if (c == '`') {
            in_code = !in_code;
            cell += c;
        } else if (c == '|' && !in_code) {
            cells.emplace_back(trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    cells.emplace_back(trim(cell));
    return cells;
}

auto is_table_delimiter(std::string_view line) -> bool {
    if (line.find('-') == std::string_view::npos) {
        return false;
    }
    auto cells = split_table_row(line);
    for (const auto& cell : cells) {
        std::string_view c = cell;
        if (!c.empty() && c.front() == ':') {
            c.remove_prefix(1);
        }
        if (!c.empty() && c.back() == ':') {
            c.remove_suffix(1);
        }
        if (c.empty() || c.find_first_not_of('-') != std::string_view::npos) {
            return false;
        }
    }
    return !cells.empty();
}

/// A header row and a delimiter row, both containing a pipe.
auto starts_table(const std::vector<std::string>& lines, size_t i) -> bool {
    return lines[i].find('|') != std::string::npos && i + 1 < lines.size() &&
           lines[i + 1].find('|') != std::string::npos && is_table_delimiter(lines[i + 1]);
}

/// True for lines that end a paragraph without a blank line.
auto interrupts_paragraph(std::string_view line) -> bool {
    return fence_open(line) || atx_heading(line) || is_hr(line) || is_html_block_start(line) ||
           is_blockquote(line) || list_marker(line);
}

auto strip_indent(std::string_view line, size_t n) -> std::string {
    size_t strip = std::min(n, leading_spaces(line));
    return std::string(line.substr(strip));
}

auto join(const std::vector<std::string>& lines, size_t from, size_t to) -> std::string {
    std::string out;
    for (size_t i = from; i < to; ++i) {
        if (i > from) {
            out += '\n';
        }
        out += lines[i];
    }
    return out;
}

auto is_word_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

} // namespace

// ============================================================================
// Block Rendering
// ============================================================================

auto HtmlRenderer::render(std::string_view markdown) const
    -> Result<std::string, build::TemplateError> {
    return render_lines(split_lines(markdown));
}

auto HtmlRenderer::render_lines(const std::vector<std::string>& lines) const
    -> Result<std::string, build::TemplateError> {
    std::string out;
    size_t i = 0;
    const size_t n = lines.size();

    while (i < n) {
        const std::string& line = lines[i];

        if (is_blank(line)) {
            ++i;
            continue;
        }

        // Fenced code
        if (auto fence = fence_open(line)) {
            size_t indent = leading_spaces(line);
            size_t j = i + 1;
            std::vector<std::string> code;
            while (j < n && !fence_closes(lines[j], *fence)) {
                code.push_back(strip_indent(lines[j], indent));
                ++j;
            }
            i = j < n ? j + 1 : j;

            std::string source = join(code, 0, code.size());
            if (!code.empty()) {
                source += '\n';
            }
            auto html = examples_.render(fence->info, source, *this);
            if (is_err(html)) {
                return html;
            }
            out += unwrap(html);
            if (!out.empty() && out.back() != '\n') {
                out += '\n';
            }
            continue;
        }

        if (auto heading = atx_heading(line)) {
            auto level = std::to_string(heading->first);
            out += "<h" + level + ">" + render_inline(heading->second) + "</h" + level + ">\n";
            ++i;
            continue;
        }

        if (is_hr(line)) {
            out += "<hr>\n";
            ++i;
            continue;
        }

        // Raw HTML passes through up to the next blank line
        if (is_html_block_start(line)) {
            size_t j = i;
            while (j < n && !is_blank(lines[j])) {
                ++j;
            }
            out += join(lines, i, j) + "\n";
            i = j;
            continue;
        }

        if (is_blockquote(line)) {
            std::vector<std::string> inner;
            size_t j = i;
            while (j < n && !is_blank(lines[j])) {
                std::string_view l = lines[j];
                size_t indent = leading_spaces(l);
                if (indent < l.size() && l[indent] == '>') {
                    l.remove_prefix(indent + 1);
                    if (!l.empty() && l.front() == ' ') {
                        l.remove_prefix(1);
                    }
                }
                inner.emplace_back(l);
                ++j;
            }
            auto body = render_lines(inner);
            if (is_err(body)) {
                return body;
            }
            out += "<blockquote>\n" + unwrap(body) + "</blockquote>\n";
            i = j;
            continue;
        }

        if (starts_table(lines, i)) {
            size_t j = i;
            while (j < n && !is_blank(lines[j]) && lines[j].find('|') != std::string::npos) {
                ++j;
            }
            out += render_table(std::vector<std::string>(lines.begin() + static_cast<long>(i),
                                                         lines.begin() + static_cast<long>(j)));
            i = j;
            continue;
        }

        if (auto marker = list_marker(line)) {
            std::vector<std::string> items;
            size_t j = i;
            while (j < n) {
                const std::string& l = lines[j];
                if (is_blank(l)) {
                    size_t k = j + 1;
                    while (k < n && is_blank(lines[k])) {
                        ++k;
                    }
                    if (k >= n) {
                        break;
                    }
                    auto next = list_marker(lines[k]);
                    bool same_list = next && next->ordered == marker->ordered &&
                                     next->indent <= marker->indent + 3;
                    if (!same_list && leading_spaces(lines[k]) < marker->content_offset) {
                        break;
                    }
                    items.push_back(l);
                    ++j;
                    continue;
                }

                auto next = list_marker(l);
                if (next && next->indent < marker->content_offset) {
                    if (next->ordered != marker->ordered) {
                        break;
                    }
                } else if (leading_spaces(l) < marker->content_offset) {
                    // Lazy continuation of the previous item's paragraph
                    if (j == i || is_blank(lines[j - 1]) || interrupts_paragraph(l)) {
                        break;
                    }
                }
                items.push_back(l);
                ++j;
            }
            auto list = render_list(items, marker->ordered);
            if (is_err(list)) {
                return list;
            }
            out += unwrap(list);
            i = j;
            continue;
        }

        // Paragraph
        size_t j = i;
        std::string text;
        while (j < n && !is_blank(lines[j])) {
            if (j > i && (interrupts_paragraph(lines[j]) || starts_table(lines, j))) {
                break;
            }
            if (j > i) {
                text += '\n';
            }
            text += trim(lines[j]);
            ++j;
        }
        out += "<p>" + render_inline(text) + "</p>\n";
        i = j;
    }

    return out;
}

auto HtmlRenderer::render_list(const std::vector<std::string>& lines, bool ordered) const
    -> Result<std::string, build::TemplateError> {
    auto first = list_marker(lines.front());
    size_t base_offset = first->content_offset;

    std::vector<std::vector<std::string>> items;
    bool loose = false;
    bool pending_blank = false;
    for (const auto& line : lines) {
        if (is_blank(line)) {
            pending_blank = true;
            if (!items.empty()) {
                items.back().emplace_back();
            }
            continue;
        }
        auto marker = list_marker(line);
        if (marker && marker->indent < base_offset && marker->ordered == ordered) {
            if (pending_blank && !items.empty()) {
                loose = true;
            }
            items.emplace_back();
            items.back().push_back(line.substr(std::min(marker->content_offset, line.size())));
            base_offset = marker->content_offset;
        } else if (!items.empty()) {
            items.back().push_back(strip_indent(line, base_offset));
        }
        pending_blank = false;
    }

    std::string out;
    if (ordered) {
        out += first->start == 1 ? "<ol>\n" : "<ol start=\"" + std::to_string(first->start) + "\">\n";
    } else {
        out += "<ul>\n";
    }

    for (auto& item : items) {
        while (!item.empty() && is_blank(item.back())) {
            item.pop_back();
        }
        auto body = render_lines(item);
        if (is_err(body)) {
            return body;
        }
        std::string html = std::move(unwrap(body));
        if (!loose && html.starts_with("<p>")) {
            size_t close = html.find("</p>\n");
            if (close != std::string::npos) {
                html = html.substr(3, close - 3) + "\n" + html.substr(close + 5);
            }
        }
        while (!html.empty() && html.back() == '\n') {
            html.pop_back();
        }
        out += "<li>" + html + "</li>\n";
    }

    out += ordered ? "</ol>\n" : "</ul>\n";
    return out;
}

auto HtmlRenderer::render_table(const std::vector<std::string>& rows) const -> std::string {
    if (rows.size() < 2) {
        return "";
    }
    auto header = split_table_row(rows[0]);
    auto delimiters = split_table_row(rows[1]);

    std::vector<std::string> align(header.size());
    for (size_t c = 0; c < header.size() && c < delimiters.size(); ++c) {
        const auto& d = delimiters[c];
        bool left = d.starts_with(":");
        bool right = d.ends_with(":");
        if (left && right) {
            align[c] = " style=\"text-align: center\"";
        } else if (right) {
            align[c] = " style=\"text-align: right\"";
        } else if (left) {
            align[c] = " style=\"text-align: left\"";
        }
    }

    std::string out = "<table>\n<thead>\n<tr>\n";
    for (size_t c = 0; c < header.size(); ++c) {
        out += "<th" + align[c] + ">" + render_inline(header[c]) + "</th>\n";
    }
    out += "</tr>\n</thead>\n<tbody>\n";
    for (size_t r = 2; r < rows.size(); ++r) {
        auto cells = split_table_row(rows[r]);
        out += "<tr>\n";
        for (size_t c = 0; c < header.size(); ++c) {
            std::string content = c < cells.size() ? render_inline(cells[c]) : "";
            out += "<td" + align[c] + ">" + content + "</td>\n";
        }
        out += "</tr>\n";
    }
    out += "</tbody>\n</table>\n";
    return out;
}

// ============================================================================
// Span Rendering
// ============================================================================

auto HtmlRenderer::render_component_link(std::string_view reference) const -> std::string {
    std::string_view text = reference;
    std::string_view component = reference;
    size_t bar = reference.find('|');
    if (bar != std::string_view::npos) {
        text = trim(reference.substr(0, bar));
        component = trim(reference.substr(bar + 1));
    } else {
        text = component = trim(reference);
    }

    auto url = links_.resolve(component);
    if (!url) {
        return "[[" + escape_html(reference) + "]]";
    }
    return "<a href=\"" + escape_html(*url) + "\">" + escape_html(text) + "</a>";
}

auto HtmlRenderer::render_inline(std::string_view text) const -> std::string {
    std::string out;
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        char c = text[i];

        // Backslash escapes
        if (c == '\\' && i + 1 < n && std::ispunct(static_cast<unsigned char>(text[i + 1]))) {
            out += escape_html(text.substr(i + 1, 1));
            i += 2;
            continue;
        }

        // Code spans
        if (c == '`') {
            size_t run = 0;
            while (i + run < n && text[i + run] == '`') {
                ++run;
            }
            std::string delim(run, '`');
            size_t close = text.find(delim, i + run);
            while (close != std::string_view::npos && close + run < n && text[close + run] == '`') {
                close = text.find(delim, close + run + 1);
            }
            if (close == std::string_view::npos) {
                out += delim;
                i += run;
                continue;
            }
            std::string_view code = text.substr(i + run, close - i - run);
            if (code.size() >= 2 && code.front() == ' ' && code.back() == ' ') {
                code = code.substr(1, code.size() - 2);
            }
            out += "<code>" + escape_html(code) + "</code>";
            i = close + run;
            continue;
        }

        // Component references
        if (c == '[' && i + 1 < n && text[i + 1] == '[') {
            size_t close = text.find("]]", i + 2);
            if (close != std::string_view::npos) {
                out += render_component_link(text.substr(i + 2, close - i - 2));
                i = close + 2;
                continue;
            }
        }

        // Links and images
        if (c == '[' || (c == '!' && i + 1 < n && text[i + 1] == '[')) {
            bool image = c == '!';
            size_t open = image ? i + 1 : i;
            size_t depth = 0;
            size_t close = std::string_view::npos;
            for (size_t k = open; k < n; ++k) {
                if (text[k] == '\\') {
                    ++k;
                } else if (text[k] == '[') {
                    ++depth;
                } else if (text[k] == ']' && --depth == 0) {
                    close = k;
                    break;
                }
            }
            if (close != std::string_view::npos && close + 1 < n && text[close + 1] == '(') {
                size_t end = text.find(')', close + 2);
                if (end != std::string_view::npos) {
                    std::string_view label = text.substr(open + 1, close - open - 1);
                    std::string_view target = trim(text.substr(close + 2, end - close - 2));
                    std::string_view title;
                    size_t space = target.find(' ');
                    if (space != std::string_view::npos) {
                        title = trim(target.substr(space + 1));
                        target = target.substr(0, space);
                        if (title.size() >= 2 && (title.front() == '"' || title.front() == '\'')) {
                            title = title.substr(1, title.size() - 2);
                        }
                    }
                    if (target.size() >= 2 && target.front() == '<' && target.back() == '>') {
                        target = target.substr(1, target.size() - 2);
                    }

                    std::string title_attr =
                        title.empty() ? "" : " title=\"" + escape_html(title) + "\"";
                    if (image) {
                        out += "<img src=\"" + escape_html(target) + "\" alt=\"" +
                               escape_html(label) + "\"" + title_attr + ">";
                    } else {
                        out += "<a href=\"" + escape_html(target) + "\"" + title_attr + ">" +
                               render_inline(label) + "</a>";
                    }
                    i = end + 1;
                    continue;
                }
            }
        }

        // Emphasis
        if (c == '*' || c == '_') {
            size_t run = 0;
            while (i + run < n && text[i + run] == c) {
                ++run;
            }
            bool intraword = c == '_' && i > 0 && is_word_char(text[i - 1]);
            bool opens = i + run < n && !std::isspace(static_cast<unsigned char>(text[i + run]));

            if (!intraword && opens) {
                size_t width = std::min<size_t>(run, 3);
                std::string delim(width, c);
                size_t close = text.find(delim, i + width);
                while (close != std::string_view::npos) {
                    size_t close_run = 0;
                    while (close + close_run < n && text[close + close_run] == c) {
                        ++close_run;
                    }
                    bool valid = close_run == width &&
                                 !std::isspace(static_cast<unsigned char>(text[close - 1]));
                    if (c == '_' && close + width < n && is_word_char(text[close + width])) {
                        valid = false;
                    }
                    if (valid) {
                        break;
                    }
                    close = text.find(delim, close + close_run);
                }
                if (close != std::string_view::npos && close > i + width) {
                    std::string inner = render_inline(text.substr(i + width, close - i - width));
                    if (width == 1) {
                        out += "<em>" + inner + "</em>";
                    } else if (width == 2) {
                        out += "<strong>" + inner + "</strong>";
                    } else {
                        out += "<strong><em>" + inner + "</em></strong>";
                    }
                    i = close + width;
                    continue;
                }
            }
            out += std::string(run, c);
            i += run;
            continue;
        }

        // Inline HTML tags pass through
        if (c == '<' && i + 1 < n &&
            (std::isalpha(static_cast<unsigned char>(text[i + 1])) || text[i + 1] == '/' ||
             text[i + 1] == '!')) {
            size_t close = text.find('>', i);
            if (close != std::string_view::npos) {
                out += text.substr(i, close - i + 1);
                i = close + 1;
                continue;
            }
        }

        // Entities pass through, a bare '&' is escaped
        if (c == '&') {
            size_t k = i + 1;
            if (k < n && text[k] == '#') {
                ++k;
            }
            size_t start = k;
            while (k < n && std::isalnum(static_cast<unsigned char>(text[k]))) {
                ++k;
            }
            if (k > start && k < n && text[k] == ';') {
                out += text.substr(i, k - i + 1);
                i = k + 1;
                continue;
            }
            out += "&amp;";
            ++i;
            continue;
        }

        if (c == '<') {
            out += "&lt;";
        } else if (c == '>') {
            out += "&gt;";
        } else if (c == '"') {
            out += "&quot;";
        } else {
            out += c;
        }
        ++i;
    }

    return out;
}

} // namespace stylebook::markdown
