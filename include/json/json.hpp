//! # stylebook JSON Library
//!
//! Umbrella header for the JSON value type and parser.
//!
//! | Header | Contents |
//! |--------|----------|
//! | `json/json_value.hpp` | `JsonValue`, `JsonNumber`, `JsonArray`, `JsonObject` |
//! | `json/json_error.hpp` | `JsonError` with line/column |
//! | `json/json_parser.hpp` | `JsonParser`, `parse_json()` |

#pragma once

#include "json/json_error.hpp"
#include "json/json_parser.hpp"
#include "json/json_value.hpp"
