#include "markdown/link_resolver.hpp"

namespace stylebook::markdown {

LinkHelper::LinkHelper(const std::vector<PageComponents>& pages) {
    for (const auto& page : pages) {
        for (const auto& component : page.component_names) {
            if (component.empty()) {
                continue;
            }
            links_.try_emplace(component, page.name + "#" + component);
        }
    }
}

auto LinkHelper::resolve(std::string_view component) const -> std::optional<std::string> {
    auto it = links_.find(component);
    if (it == links_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace stylebook::markdown
