//! # Build Configuration Implementation

#include "build/config.hpp"

#include "build/file_io.hpp"
#include "json/json.hpp"
#include "log/log.hpp"

namespace stylebook::build {

namespace fs = std::filesystem;

auto nav_level_name(NavLevel level) -> std::string_view {
    switch (level) {
    case NavLevel::Page:
        return "page";
    case NavLevel::Section:
        return "section";
    case NavLevel::All:
        return "all";
    }
    return "page";
}

auto parse_nav_level(std::string_view name) -> std::optional<NavLevel> {
    if (name == "page") {
        return NavLevel::Page;
    }
    if (name == "section") {
        return NavLevel::Section;
    }
    if (name == "all") {
        return NavLevel::All;
    }
    return std::nullopt;
}

auto BuildConfig::absolute(const std::string& path) const -> fs::path {
    fs::path p(path);
    if (p.is_relative()) {
        p = base_path / p;
    }
    return p.lexically_normal();
}

auto BuildConfig::resolve(const std::string& path) const -> std::optional<fs::path> {
    if (path.empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    fs::path p = absolute(path);
    if (!fs::is_directory(p, ec)) {
        return std::nullopt;
    }
    fs::path canonical = fs::canonical(p, ec);
    if (ec) {
        return std::nullopt;
    }
    return canonical;
}

void BuildConfig::resolve_dirs() {
    output_dir = destination ? resolve(*destination) : std::nullopt;
    doc_assets_dir = documentation_assets ? resolve(*documentation_assets) : std::nullopt;
    input_dirs.clear();
    for (const auto& dir : source) {
        if (auto resolved = resolve(dir)) {
            input_dirs.push_back(*resolved);
        }
    }
}

namespace {

auto invalid(std::string_view key, std::string_view expected) -> ConfigError {
    return ConfigError{"Invalid value for '" + std::string(key) + "' in config: expected " +
                       std::string(expected)};
}

/// Absent, null, a string, or an array of strings.
auto string_list(const json::JsonValue& options, std::string_view key)
    -> Result<std::vector<std::string>, ConfigError> {
    std::vector<std::string> result;
    const json::JsonValue* value = options.get(std::string(key));
    if (!value || value->is_null()) {
        return result;
    }
    if (value->is_string()) {
        result.push_back(value->as_string());
        return result;
    }
    if (!value->is_array()) {
        return invalid(key, "a string or an array of strings");
    }
    for (const auto& item : value->as_array()) {
        if (!item.is_string()) {
            return invalid(key, "a string or an array of strings");
        }
        result.push_back(item.as_string());
    }
    return result;
}

auto optional_string(const json::JsonValue& options, std::string_view key)
    -> Result<std::optional<std::string>, ConfigError> {
    const json::JsonValue* value = options.get(std::string(key));
    if (!value || value->is_null()) {
        return std::optional<std::string>();
    }
    if (!value->is_string()) {
        return invalid(key, "a string");
    }
    return std::optional<std::string>(value->as_string());
}

} // namespace

auto resolve_config(const json::JsonValue& options, const fs::path& base_path,
                    const markdown::MarkdownRendererRegistry& registry)
    -> Result<BuildConfig, ConfigError> {
    if (!options.is_object()) {
        return ConfigError{std::string(CONFIG_LOAD_ERROR)};
    }

    BuildConfig config;
    std::error_code ec;
    config.base_path = fs::absolute(base_path, ec).lexically_normal();
    if (ec) {
        config.base_path = base_path;
    }

    struct ListField {
        std::string_view key;
        std::vector<std::string>* target;
    };
    for (auto [key, target] : {ListField{"source", &config.source},
                               ListField{"dependencies", &config.dependencies},
                               ListField{"custom_extensions", &config.custom_extensions},
                               ListField{"ignore_paths", &config.ignore_paths},
                               ListField{"plugins", &config.plugins}}) {
        auto list = string_list(options, key);
        if (is_err(list)) {
            return unwrap_err(list);
        }
        *target = std::move(unwrap(list));
    }

    for (auto& ext : config.custom_extensions) {
        if (!ext.starts_with(".")) {
            ext.insert(ext.begin(), '.');
        }
    }

    struct StringField {
        std::string_view key;
        std::optional<std::string>* target;
    };
    for (auto [key, target] :
         {StringField{"destination", &config.destination},
          StringField{"documentation_assets", &config.documentation_assets},
          StringField{"index", &config.index},
          StringField{"code_example_templates", &config.code_example_templates},
          StringField{"code_example_renderers", &config.code_example_renderers}}) {
        auto value = optional_string(options, key);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        *target = std::move(unwrap(value));
    }

    auto nav_level = optional_string(options, "nav_level");
    if (is_err(nav_level)) {
        return unwrap_err(nav_level);
    }
    if (unwrap(nav_level)) {
        auto level = parse_nav_level(*unwrap(nav_level));
        if (!level) {
            return ConfigError{"Invalid nav_level '" + *unwrap(nav_level) +
                               "' in config: expected one of page, section, all"};
        }
        config.nav_level = *level;
    }

    auto custom_markdown = optional_string(options, "custom_markdown");
    if (is_err(custom_markdown)) {
        return unwrap_err(custom_markdown);
    }
    if (unwrap(custom_markdown)) {
        config.markdown_renderer = *unwrap(custom_markdown);
    }
    const auto* factory = registry.find(config.markdown_renderer);
    if (!factory) {
        return ConfigError{"Could not find custom markdown renderer " + config.markdown_renderer};
    }
    config.renderer_factory = *factory;

    if (const auto* exit_on_warnings = options.get("exit_on_warnings")) {
        if (exit_on_warnings->is_bool()) {
            config.exit_on_warnings = exit_on_warnings->as_bool();
        } else if (!exit_on_warnings->is_null()) {
            return invalid("exit_on_warnings", "true or false");
        }
    }

    config.raw = make_rc<const json::JsonValue>(options.clone());
    config.resolve_dirs();

    STYLEBOOK_LOG_DEBUG("config", "Resolved config: " << config.source.size() << " source dir(s), "
                                                      << config.dependencies.size()
                                                      << " dependencies, nav_level "
                                                      << nav_level_name(config.nav_level));
    return config;
}

auto load_config_file(const fs::path& path, const markdown::MarkdownRendererRegistry& registry)
    -> Result<BuildConfig, ConfigError> {
    auto content = read_file(path);
    if (is_err(content)) {
        STYLEBOOK_LOG_ERROR("config", unwrap_err(content).message);
        return ConfigError{std::string(CONFIG_LOAD_ERROR)};
    }

    auto doc = json::parse_json(unwrap(content));
    if (is_err(doc)) {
        STYLEBOOK_LOG_ERROR("config", path.string() << ":" << unwrap_err(doc).to_string());
        return ConfigError{std::string(CONFIG_LOAD_ERROR)};
    }
    if (!unwrap(doc).is_object()) {
        STYLEBOOK_LOG_ERROR("config", path.string() << ": top-level value is not an object");
        return ConfigError{std::string(CONFIG_LOAD_ERROR)};
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    return resolve_config(unwrap(doc), absolute.parent_path(), registry);
}

} // namespace stylebook::build
