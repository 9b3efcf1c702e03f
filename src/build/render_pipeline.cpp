//! # Render Pipeline Implementation

#include "build/render_pipeline.hpp"

#include "build/materializer.hpp"
#include "log/log.hpp"

namespace stylebook::build {

namespace {

void collect_names(const std::vector<ContentBlock>& blocks, std::vector<std::string>& out) {
    for (const auto& block : blocks) {
        out.push_back(block.name);
        collect_names(block.children, out);
    }
}

} // namespace

auto page_title(const std::string& file_name, const Page& page, const CategoryIndex& categories)
    -> std::string {
    if (const auto* blocks = page_blocks(page); blocks && blocks->empty()) {
        return "";
    }
    return categories.category_for(file_name).value_or("");
}

auto build_link_helper(const PageMap& pages) -> markdown::LinkHelper {
    std::vector<markdown::PageComponents> index;
    index.reserve(pages.size());
    for (const auto& [file_name, page] : pages) {
        markdown::PageComponents entry;
        entry.name = file_name;
        if (const auto* blocks = page_blocks(page)) {
            collect_names(*blocks, entry.component_names);
        }
        index.push_back(std::move(entry));
    }
    return markdown::LinkHelper(index);
}

auto RenderContext::bindings() const -> TemplateContext {
    TemplateContext ctx(shared ? *shared : TemplateData::object());
    ctx.bind("title", title);
    ctx.bind("file_name", file_name);
    ctx.bind("blocks", blocks);
    return ctx;
}

TemplateVariables::TemplateVariables(const PageMap& pages, const CategoryIndex& categories,
                                     const json::JsonValue& config)
    : shared_(TemplateData::object()) {
    shared_["categories"] = to_template_data(categories.to_json());
    shared_["pages"] = to_template_data(pages_to_json(pages));
    shared_["config"] = to_template_data(config);
}

auto TemplateVariables::for_page(std::string title, const std::string& file_name,
                                 const Page& page) const -> RenderContext {
    RenderContext ctx;
    ctx.title = std::move(title);
    ctx.file_name = file_name;
    if (const auto* blocks = page_blocks(page)) {
        for (const auto& block : *blocks) {
            ctx.blocks.push_back(to_template_data(block.to_json()));
        }
    }
    ctx.shared = &shared_;
    return ctx;
}

auto render_page(const std::string& file_name, const Page& page, const RenderContext& context,
                 const HeaderFooter& layout, const markdown::MarkdownRenderer& renderer)
    -> Result<std::string, BuildError> {
    TemplateContext bindings = context.bindings();

    if (const auto* tpl_page = std::get_if<TemplatePage>(&page)) {
        auto tpl = Template::compile(tpl_page->source, file_name);
        if (is_err(tpl)) {
            return BuildError::from_template(unwrap_err(tpl));
        }
        auto html = unwrap(tpl).render(bindings);
        if (is_err(html)) {
            return BuildError::from_template(unwrap_err(html));
        }
        return std::move(unwrap(html));
    }

    const auto& md_page = std::get<MarkdownPage>(page);
    auto body = renderer.render(md_page.markdown);
    if (is_err(body)) {
        return BuildError::from_template(unwrap_err(body));
    }

    std::string out;
    if (layout.header) {
        auto header = layout.header->render(bindings);
        if (is_err(header)) {
            return BuildError::from_template(unwrap_err(header));
        }
        out += unwrap(header);
    }
    out += unwrap(body);
    if (layout.footer) {
        auto footer = layout.footer->render(bindings);
        if (is_err(footer)) {
            return BuildError::from_template(unwrap_err(footer));
        }
        out += unwrap(footer);
    }
    return out;
}

auto render_all(const PageMap& pages, const CategoryIndex& categories,
                const json::JsonValue& config, const HeaderFooter& layout,
                const markdown::MarkdownRenderer& renderer, const std::filesystem::path& output_dir)
    -> Result<size_t, BuildError> {
    TemplateVariables variables(pages, categories, config);

    size_t written = 0;
    for (const auto& [file_name, page] : pages) {
        if (file_name.empty()) {
            return BuildError{BuildErrorKind::ParserContract,
                              "The source parser produced a page without a file name"};
        }

        RenderContext context =
            variables.for_page(page_title(file_name, page, categories), file_name, page);
        auto html = render_page(file_name, page, context, layout, renderer);
        if (is_err(html)) {
            return unwrap_err(html);
        }

        auto result = write_page(output_dir, file_name, unwrap(html));
        if (is_err(result)) {
            return unwrap_err(result);
        }
        STYLEBOOK_LOG_DEBUG("render", "Rendered " << file_name << " (" << page_kind_name(page)
                                                  << ")");
        ++written;
    }
    return written;
}

} // namespace stylebook::build
