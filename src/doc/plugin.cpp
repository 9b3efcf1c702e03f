#include "doc/plugin.hpp"

#include "doc/search_index.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace stylebook::doc {

auto PluginRegistry::with_builtins() -> PluginRegistry {
    PluginRegistry registry;
    registry.register_plugin(SearchIndexPlugin::NAME,
                             [] { return Box<Plugin>(make_box<SearchIndexPlugin>()); });
    return registry;
}

void PluginRegistry::register_plugin(std::string name, PluginFactory factory) {
    factories_.insert_or_assign(std::move(name), std::move(factory));
}

auto PluginRegistry::create(const std::string& name) const -> Box<Plugin> {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        return nullptr;
    }
    return it->second();
}

auto PluginRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& entry : factories_) {
        result.push_back(entry.first);
    }
    return result;
}

Plugins::Plugins(const PluginRegistry& registry, const std::vector<std::string>& configured,
                 const std::vector<std::string>& args, build::DiagnosticSink& diagnostics) {
    std::vector<std::string> wanted;
    for (const auto& name : configured) {
        if (!registry.contains(name)) {
            diagnostics.warning("plugin", "Unknown plugin " + name + " in config");
            continue;
        }
        wanted.push_back(name);
    }
    for (const auto& arg : args) {
        if (!arg.starts_with("--")) {
            continue;
        }
        std::string name = arg.substr(2);
        if (registry.contains(name)) {
            wanted.push_back(name);
        } else {
            STYLEBOOK_LOG_DEBUG("plugin", "No plugin for argument " << arg);
        }
    }

    for (const auto& name : wanted) {
        bool already_active = std::any_of(active_.begin(), active_.end(),
                                          [&name](const Box<Plugin>& p) { return p->name() == name; });
        if (already_active) {
            continue;
        }
        if (auto plugin = registry.create(name)) {
            STYLEBOOK_LOG_INFO("plugin", "Activated plugin " << name);
            active_.push_back(std::move(plugin));
        }
    }
}

auto Plugins::active_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& plugin : active_) {
        names.emplace_back(plugin->name());
    }
    return names;
}

auto Plugins::on_block(const build::ContentBlock& block, const std::filesystem::path& file)
    -> Result<Unit, build::BuildError> {
    for (auto& plugin : active_) {
        auto result = plugin->on_block(block, file);
        if (is_err(result)) {
            return build::BuildError{build::BuildErrorKind::Plugin,
                                     "Plugin " + std::string(plugin->name()) + " failed on block " +
                                         block.name + ": " + unwrap_err(result)};
        }
    }
    return Unit{};
}

auto Plugins::finalize(build::PageMap& pages) -> Result<Unit, build::BuildError> {
    for (auto& plugin : active_) {
        auto result = plugin->finalize(pages);
        if (is_err(result)) {
            return build::BuildError{build::BuildErrorKind::Plugin,
                                     "Plugin " + std::string(plugin->name()) +
                                         " failed: " + unwrap_err(result)};
        }
    }
    return Unit{};
}

} // namespace stylebook::doc
