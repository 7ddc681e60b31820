//! # JSON Serializer
//!
//! Converts `JsonValue` trees to compact JSON text.
//!
//! ## String Escaping
//!
//! | Character           | Escape Sequence |
//! |---------------------|-----------------|
//! | `"`                 | `\"`            |
//! | `\`                 | `\\`            |
//! | Backspace           | `\b`            |
//! | Form feed           | `\f`            |
//! | Line feed           | `\n`            |
//! | Carriage return     | `\r`            |
//! | Tab                 | `\t`            |
//! | Control (0x00-0x1F) | `\uXXXX`        |
//!
//! Bytes >= 0x80 are passed through unchanged, so UTF-8 input stays UTF-8.

#include "json/json_value.hpp"

#include <iomanip>
#include <sstream>

namespace wheels::json {

namespace {

void serialize_compact(const JsonValue& value, std::string& out) {
    if (value.is_null()) {
        out += "null";
        return;
    }

    if (value.is_integer()) {
        out += std::to_string(value.as_integer());
        return;
    }

    if (value.is_string()) {
        out += '"';
        out += escape_string(value.as_string());
        out += '"';
        return;
    }

    if (value.is_object()) {
        out += '{';
        bool first = true;
        for (const auto& [key, val] : value.as_object()) {
            if (!first) {
                out += ',';
            }
            first = false;
            out += '"';
            out += escape_string(key);
            out += "\":";
            serialize_compact(val, out);
        }
        out += '}';
    }
}

} // namespace

auto escape_string(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size() + 2);

    for (char c : s) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                // Control character - escape as \u00XX
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                result += oss.str();
            } else {
                result += c;
            }
            break;
        }
    }

    return result;
}

auto quote(std::string_view s) -> std::string {
    return "\"" + escape_string(s) + "\"";
}

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize_compact(*this, out);
    return out;
}

} // namespace wheels::json
