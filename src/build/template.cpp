//! # Page Template Implementation
//!
//! Every template owns its inja environment so the `escape` callback is
//! registered once per parse. inja reports failures by throwing; both entry
//! points turn those exceptions into `TemplateError` values.

#include "build/template.hpp"

namespace stylebook::build {

auto escape_html(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            result += "&amp;";
            break;
        case '<':
            result += "&lt;";
            break;
        case '>':
            result += "&gt;";
            break;
        case '"':
            result += "&quot;";
            break;
        case '\'':
            result += "&#39;";
            break;
        default:
            result += c;
        }
    }
    return result;
}

auto to_template_data(const json::JsonValue& value) -> TemplateData {
    if (value.is_bool()) {
        return value.as_bool();
    }
    if (value.is_number()) {
        const auto& number = value.as_number();
        if (number.is_integer()) {
            return number.i64;
        }
        return number.f64;
    }
    if (value.is_string()) {
        return value.as_string();
    }
    if (value.is_array()) {
        auto array = TemplateData::array();
        for (const auto& item : value.as_array()) {
            array.push_back(to_template_data(item));
        }
        return array;
    }
    if (value.is_object()) {
        auto object = TemplateData::object();
        for (const auto& [key, item] : value.as_object()) {
            object[key] = to_template_data(item);
        }
        return object;
    }
    return nullptr;
}

namespace {

auto escape_callback(inja::Arguments& args) -> TemplateData {
    const TemplateData& value = *args.at(0);
    if (value.is_null()) {
        return "";
    }
    if (value.is_string()) {
        return escape_html(value.get_ref<const std::string&>());
    }
    return escape_html(value.dump());
}

auto make_environment() -> Rc<inja::Environment> {
    auto env = make_rc<inja::Environment>();
    env->add_callback("escape", 1, escape_callback);
    return env;
}

} // namespace

auto Template::compile(std::string_view source, std::string name)
    -> Result<Template, TemplateError> {
    Template tpl;
    tpl.name_ = std::move(name);
    tpl.env_ = make_environment();
    try {
        tpl.parsed_ = tpl.env_->parse(source);
    } catch (const inja::InjaError& e) {
        return TemplateError{e.message, e.location.line, tpl.name_};
    } catch (const nlohmann::json::exception& e) {
        return TemplateError{e.what(), 0, tpl.name_};
    }
    return tpl;
}

auto Template::render(const TemplateContext& context) const -> Result<std::string, TemplateError> {
    if (!env_) {
        return std::string();
    }
    try {
        return env_->render(parsed_, context.data());
    } catch (const inja::InjaError& e) {
        return TemplateError{e.message, e.location.line, name_};
    } catch (const nlohmann::json::exception& e) {
        return TemplateError{e.what(), 0, name_};
    }
}

} // namespace stylebook::build
