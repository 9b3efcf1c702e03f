//! # JSON Parser
//!
//! Recursive descent parser that builds `JsonValue` trees from text. Used to
//! read `stylebook_config.json` and custom code-example renderer definitions.
//!
//! - Strict RFC 8259 input: no comments, no trailing commas
//! - Numbers without decimal point or exponent stay integers
//! - Errors carry 1-based line and column
//! - Nesting depth is limited to keep recursion bounded
//!
//! ```cpp
//! auto result = parse_json(R"({"source": ["../components"], "index": "basics"})");
//! if (is_ok(result)) {
//!     auto& config = unwrap(result);
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace stylebook::json {

class JsonParser {
public:
    explicit JsonParser(std::string_view input);

    /// Parses the whole input as one JSON value.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;
    static constexpr size_t MAX_DEPTH = 512;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }
    [[nodiscard]] auto peek() const -> char {
        return at_end() ? '\0' : input_[pos_];
    }
    auto advance() -> char;
    void skip_whitespace();
    [[nodiscard]] auto error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_keyword() -> Result<JsonValue, JsonError>;
};

/// Parses a JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace stylebook::json
