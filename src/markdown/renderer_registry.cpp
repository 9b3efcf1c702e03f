#include "markdown/renderer.hpp"

namespace stylebook::markdown {

MarkdownRendererRegistry::MarkdownRendererRegistry() {
    register_renderer(DEFAULT_RENDERER,
                      [](const LinkResolver& links, const CodeExampleRenderer& examples) {
                          return Box<MarkdownRenderer>(make_box<HtmlRenderer>(links, examples));
                      });
}

void MarkdownRendererRegistry::register_renderer(std::string name, MarkdownRendererFactory factory) {
    factories_.insert_or_assign(std::move(name), std::move(factory));
}

auto MarkdownRendererRegistry::find(const std::string& name) const
    -> const MarkdownRendererFactory* {
    auto it = factories_.find(name);
    return it == factories_.end() ? nullptr : &it->second;
}

auto MarkdownRendererRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        result.push_back(name);
    }
    return result;
}

} // namespace stylebook::markdown
