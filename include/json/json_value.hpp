//! # JSON Value Types
//!
//! Core value type of the stylebook JSON library. Configuration documents are
//! parsed into `JsonValue` trees and the same type carries template data.
//!
//! ## Number Handling
//!
//! | JSON Input | Storage Type | Reason |
//! |------------|--------------|--------|
//! | `42` | `Int64` | No decimal point |
//! | `3.14` | `Double` | Has decimal point |
//! | `1e10` | `Double` | Has exponent |
//!
//! ## Example
//!
//! ```cpp
//! JsonValue page(JsonObject{{"file_name", JsonValue("base_css.html")}});
//! if (auto* name = page.get("file_name"); name && name->is_string()) {
//!     std::cout << name->as_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stylebook::json {

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// A JSON object containing key-value pairs (ordered by key).
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// A JSON number that keeps integers exact.
struct JsonNumber {
    enum class Kind : uint8_t {
        Int64,
        Double
    };

    Kind kind;

    union {
        int64_t i64;
        double f64;
    };

    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}

    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}

    JsonNumber() : kind(Kind::Int64), i64(0) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind == Kind::Int64;
    }

    [[nodiscard]] auto as_f64() const -> double {
        return kind == Kind::Int64 ? static_cast<double>(i64) : f64;
    }

    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind == Kind::Int64 && other.kind == Kind::Int64) {
            return i64 == other.i64;
        }
        return as_f64() == other.as_f64();
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// A JSON value: null, boolean, number, string, array or object.
///
/// Arrays and objects are boxed, so `JsonValue` is move-only; use `clone()`
/// for an explicit deep copy.
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant =
        std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    JsonValue() : data(Null{}) {}

    explicit JsonValue(std::nullptr_t) : data(Null{}) {}

    explicit JsonValue(bool value) : data(value) {}

    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}

    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}

    explicit JsonValue(double value) : data(JsonNumber(value)) {}

    explicit JsonValue(const char* value) : data(std::string(value)) {}

    explicit JsonValue(std::string value) : data(std::move(value)) {}

    explicit JsonValue(std::string_view value) : data(std::string(value)) {}

    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}

    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    explicit JsonValue(JsonNumber value) : data(value) {}

    // Type queries

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // Accessors (throw std::bad_variant_access on a type mismatch)

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Looks up an object member. Returns nullptr for non-objects and missing keys.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    /// Element count of an array or object, 0 for scalars.
    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }

    void push(JsonValue value) {
        std::get<Box<JsonArray>>(data)->push_back(std::move(value));
    }

    void set(const std::string& key, JsonValue value) {
        as_object_mut()[key] = std::move(value);
    }

    /// Compact serialization: `{"a":1,"b":[true,null]}`.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Indented serialization, one member per line.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    auto write_to(std::ostream& os) const -> std::ostream&;

    [[nodiscard]] auto clone() const -> JsonValue;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

/// Returns `value` as a string when it holds one.
[[nodiscard]] auto string_of(const JsonValue* value) -> std::optional<std::string>;

} // namespace stylebook::json
