//! # JSON Error Types
//!
//! Error type for JSON document parsing, with source location for diagnostics.
//!
//! ```cpp
//! auto error = JsonError::make("Unexpected token", 5, 12);
//! std::cerr << error.to_string() << std::endl;
//! // Output: "line 5, column 12: Unexpected token"
//! ```

#pragma once

#include <cstddef>
#include <string>

namespace stylebook::json {

/// An error encountered while parsing a JSON document.
struct JsonError {
    std::string message;

    /// Line number where the error occurred (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number where the error occurred (1-based, 0 if unknown).
    size_t column = 0;

    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0};
    }

    static auto make(std::string msg, size_t line, size_t column) -> JsonError {
        return JsonError{std::move(msg), line, column};
    }

    /// Formats the error as "line L, column C: message" when the location is known.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line == 0) {
            return message;
        }
        return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
               message;
    }
};

} // namespace stylebook::json
