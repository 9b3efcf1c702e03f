//! # JSON Value Implementation
//!
//! Serialization, deep copy and equality for `JsonValue`.

#include "json/json_value.hpp"

#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace stylebook::json {

namespace {

void write_escaped(std::ostream& os, const std::string& str) {
    os << '"';
    for (char c : str) {
        switch (c) {
        case '"':
            os << "\\\"";
            break;
        case '\\':
            os << "\\\\";
            break;
        case '\b':
            os << "\\b";
            break;
        case '\f':
            os << "\\f";
            break;
        case '\n':
            os << "\\n";
            break;
        case '\r':
            os << "\\r";
            break;
        case '\t':
            os << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                   << static_cast<int>(static_cast<unsigned char>(c)) << std::dec
                   << std::setfill(' ');
            } else {
                os << c;
            }
        }
    }
    os << '"';
}

void write_number(std::ostream& os, const JsonNumber& num) {
    if (num.is_integer()) {
        os << num.i64;
        return;
    }
    if (!std::isfinite(num.f64)) {
        // JSON has no representation for NaN or infinity.
        os << "null";
        return;
    }
    std::ostringstream tmp;
    tmp << std::setprecision(17) << num.f64;
    os << tmp.str();
}

void write_value(std::ostream& os, const JsonValue& value, int indent, int depth) {
    const bool pretty = indent > 0;
    auto newline = [&](int level) {
        if (pretty) {
            os << '\n' << std::string(static_cast<size_t>(level * indent), ' ');
        }
    };

    if (value.is_null()) {
        os << "null";
    } else if (value.is_bool()) {
        os << (value.as_bool() ? "true" : "false");
    } else if (value.is_number()) {
        write_number(os, value.as_number());
    } else if (value.is_string()) {
        write_escaped(os, value.as_string());
    } else if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            os << "[]";
            return;
        }
        os << '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                os << ',';
            }
            newline(depth + 1);
            write_value(os, arr[i], indent, depth + 1);
        }
        newline(depth);
        os << ']';
    } else if (value.is_object()) {
        const auto& obj = value.as_object();
        if (obj.empty()) {
            os << "{}";
            return;
        }
        os << '{';
        bool first = true;
        for (const auto& [key, member] : obj) {
            if (!first) {
                os << ',';
            }
            first = false;
            newline(depth + 1);
            write_escaped(os, key);
            os << (pretty ? ": " : ":");
            write_value(os, member, indent, depth + 1);
        }
        newline(depth);
        os << '}';
    }
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::ostringstream oss;
    write_value(oss, *this, 0, 0);
    return oss.str();
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::ostringstream oss;
    write_value(oss, *this, indent, 0);
    return oss.str();
}

auto JsonValue::write_to(std::ostream& os) const -> std::ostream& {
    write_value(os, *this, 0, 0);
    return os;
}

auto JsonValue::clone() const -> JsonValue {
    if (is_array()) {
        JsonArray arr;
        arr.reserve(as_array().size());
        for (const auto& elem : as_array()) {
            arr.push_back(elem.clone());
        }
        return JsonValue(std::move(arr));
    }
    if (is_object()) {
        JsonObject obj;
        for (const auto& [key, val] : as_object()) {
            obj.emplace(key, val.clone());
        }
        return JsonValue(std::move(obj));
    }
    if (is_bool()) {
        return JsonValue(as_bool());
    }
    if (is_number()) {
        return JsonValue(as_number());
    }
    if (is_string()) {
        return JsonValue(as_string());
    }
    return JsonValue();
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_number()) {
        return as_number() == other.as_number();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        return as_array() == other.as_array();
    }
    return as_object() == other.as_object();
}

auto string_of(const JsonValue* value) -> std::optional<std::string> {
    if (value && value->is_string()) {
        return value->as_string();
    }
    return std::nullopt;
}

} // namespace stylebook::json
