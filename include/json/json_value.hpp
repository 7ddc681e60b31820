//! # JSON Value Types
//!
//! A compact JSON value model used wherever tfwheels emits JSON text: quoted
//! flag values in generated configuration files and structured log lines.
//!
//! ## Types
//!
//! | Type         | Description                                |
//! |--------------|--------------------------------------------|
//! | `JsonValue`  | Null, integer, string or object            |
//! | `JsonObject` | Key-value map ordered by key               |
//!
//! `JsonValue` is move-only.
//!
//! ## Example
//!
//! ```cpp
//! JsonObject obj;
//! obj["name"] = JsonValue("dcos");
//! obj["masters"] = JsonValue(3);
//! JsonValue(std::move(obj)).to_string(); // {"masters":3,"name":"dcos"}
//!
//! quote("a \"b\"");                       // "a \"b\""
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace wheels::json {

struct JsonValue;

/// A JSON object containing key-value pairs (ordered by key).
using JsonObject = std::map<std::string, JsonValue>;

/// A JSON value.
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant = std::variant<Null,             // null
                                      int64_t,          // integer
                                      std::string,      // string
                                      Box<JsonObject>>; // object (boxed)

    ValueVariant data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(int value) : data(static_cast<int64_t>(value)) {}
    explicit JsonValue(int64_t value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data(std::string(value)) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<int64_t>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto as_integer() const -> int64_t {
        return std::get<int64_t>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Serializes to compact JSON (no whitespace).
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Escapes a string for JSON output, without surrounding quotes (RFC 8259).
auto escape_string(std::string_view s) -> std::string;

/// Returns `s` as a JSON string literal, quotes included.
auto quote(std::string_view s) -> std::string;

} // namespace wheels::json
