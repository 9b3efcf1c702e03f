#include "build/page.hpp"

#include <algorithm>

namespace stylebook::build {

auto ContentBlock::to_json() const -> json::JsonValue {
    json::JsonArray category_list;
    for (const auto& category : categories) {
        category_list.emplace_back(category);
    }
    json::JsonArray child_list;
    for (const auto& child : children) {
        child_list.push_back(child.to_json());
    }

    json::JsonObject obj;
    obj.emplace("name", json::JsonValue(name));
    obj.emplace("title", json::JsonValue(title));
    obj.emplace("categories", json::JsonValue(std::move(category_list)));
    obj.emplace("parent", json::JsonValue(parent));
    obj.emplace("markdown", json::JsonValue(markdown));
    obj.emplace("children", json::JsonValue(std::move(child_list)));
    return json::JsonValue(std::move(obj));
}

void CategoryIndex::add(std::string label, std::string file) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&label](const Entry& e) { return e.first == label; });
    if (it != entries_.end()) {
        return;
    }
    entries_.emplace_back(std::move(label), std::move(file));
}

auto CategoryIndex::category_for(const std::string& file_name) const -> std::optional<std::string> {
    for (const auto& [label, file] : entries_) {
        if (file == file_name) {
            return label;
        }
    }
    return std::nullopt;
}

auto CategoryIndex::file_for(const std::string& label) const -> std::optional<std::string> {
    for (const auto& [name, file] : entries_) {
        if (name == label) {
            return file;
        }
    }
    return std::nullopt;
}

auto CategoryIndex::to_json() const -> json::JsonValue {
    json::JsonArray arr;
    for (const auto& [label, file] : entries_) {
        json::JsonObject entry;
        entry.emplace("name", json::JsonValue(label));
        entry.emplace("file", json::JsonValue(file));
        arr.emplace_back(std::move(entry));
    }
    return json::JsonValue(std::move(arr));
}

auto pages_to_json(const PageMap& pages) -> json::JsonValue {
    json::JsonArray arr;
    for (const auto& [file_name, page] : pages) {
        json::JsonArray components;
        if (const auto* blocks = page_blocks(page)) {
            for (const auto& block : *blocks) {
                components.emplace_back(block.name);
            }
        }
        json::JsonObject entry;
        entry.emplace("file_name", json::JsonValue(file_name));
        entry.emplace("kind", json::JsonValue(page_kind_name(page)));
        entry.emplace("components", json::JsonValue(std::move(components)));
        arr.emplace_back(std::move(entry));
    }
    return json::JsonValue(std::move(arr));
}

} // namespace stylebook::build
