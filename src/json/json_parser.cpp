//! # JSON Parser Implementation
//!
//! Single-pass recursive descent over the input characters. Location tracking
//! follows every consumed character so errors point at the offending token.

#include "json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace stylebook::json {

JsonParser::JsonParser(std::string_view input) : input_(input) {}

auto JsonParser::advance() -> char {
    if (at_end()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonParser::skip_whitespace() {
    while (!at_end()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonParser::error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    skip_whitespace();
    if (!at_end()) {
        return error("Unexpected content after JSON value");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    if (depth_ >= MAX_DEPTH) {
        return error("Maximum nesting depth exceeded");
    }

    switch (peek()) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return JsonValue(std::move(unwrap(str)));
    }
    case 't':
    case 'f':
    case 'n':
        return parse_keyword();
    case '\0':
        if (at_end()) {
            return error("Unexpected end of input");
        }
        return error("Unexpected character");
    default:
        if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) {
            return parse_number();
        }
        return error(std::string("Unexpected character: ") + peek());
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '{'
    skip_whitespace();

    JsonObject obj;
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return error("Expected string key in object");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (peek() != ':') {
            return error("Expected ':' after object key");
        }
        advance();
        skip_whitespace();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj.insert_or_assign(std::move(unwrap(key)), std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == '}') {
            --depth_;
            return JsonValue(std::move(obj));
        }
        if (c != ',') {
            return error("Expected ',' or '}' in object");
        }
        skip_whitespace();
        if (peek() == '}') {
            return error("Trailing comma in object");
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '['
    skip_whitespace();

    JsonArray arr;
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        skip_whitespace();
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == ']') {
            --depth_;
            return JsonValue(std::move(arr));
        }
        if (c != ',') {
            return error("Expected ',' or ']' in array");
        }
        skip_whitespace();
        if (peek() == ']') {
            return error("Trailing comma in array");
        }
    }
}

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    advance(); // opening quote
    std::string value;

    while (!at_end()) {
        char c = advance();
        if (c == '"') {
            return value;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return error("Control character in string");
        }
        if (c != '\\') {
            value += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
        case '\\':
        case '/':
            value += escaped;
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            if (pos_ + 4 > input_.size()) {
                return error("Incomplete unicode escape sequence");
            }
            unsigned int codepoint = 0;
            const char* first = input_.data() + pos_;
            auto [ptr, ec] = std::from_chars(first, first + 4, codepoint, 16);
            if (ec != std::errc{} || ptr != first + 4) {
                return error("Invalid unicode escape sequence");
            }
            for (int i = 0; i < 4; ++i) {
                advance();
            }
            if (codepoint < 0x80) {
                value += static_cast<char>(codepoint);
            } else if (codepoint < 0x800) {
                value += static_cast<char>(0xC0 | (codepoint >> 6));
                value += static_cast<char>(0x80 | (codepoint & 0x3F));
            } else {
                value += static_cast<char>(0xE0 | (codepoint >> 12));
                value += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
                value += static_cast<char>(0x80 | (codepoint & 0x3F));
            }
            break;
        }
        default:
            return error(std::string("Invalid escape sequence: \\") + escaped);
        }
    }

    return error("Unterminated string");
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    bool is_float = false;

    auto digits = [this]() {
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    };

    if (peek() == '-') {
        advance();
    }
    if (peek() == '0') {
        advance();
    } else if (std::isdigit(static_cast<unsigned char>(peek()))) {
        digits();
    } else {
        return error("Invalid number");
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return error("Expected digit after decimal point");
        }
        digits();
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return error("Expected digit in exponent");
        }
        digits();
    }

    std::string_view text = input_.substr(start, pos_ - start);
    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{}) {
            return JsonValue(value);
        }
        // Out of int64 range: keep the magnitude as a double.
    }
    return JsonValue(std::strtod(std::string(text).c_str(), nullptr));
}

auto JsonParser::parse_keyword() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    while (std::isalpha(static_cast<unsigned char>(peek()))) {
        advance();
    }
    std::string_view word = input_.substr(start, pos_ - start);

    if (word == "true") {
        return JsonValue(true);
    }
    if (word == "false") {
        return JsonValue(false);
    }
    if (word == "null") {
        return JsonValue();
    }
    return error("Unknown keyword: " + std::string(word));
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace stylebook::json
