//! # JSON Library Tests
//!
//! Value construction, compact serialization, and string escaping.

#include "json/json_value.hpp"

#include <gtest/gtest.h>

using namespace wheels::json;

// ============================================================================
// Value Construction
// ============================================================================

TEST(JsonValueTest, TypeQueries) {
    EXPECT_TRUE(JsonValue().is_null());
    EXPECT_TRUE(JsonValue(3).is_integer());
    EXPECT_TRUE(JsonValue("dcos").is_string());
    EXPECT_TRUE(JsonValue(JsonObject{}).is_object());
}

TEST(JsonValueTest, IntegerKeepsFullWidth) {
    EXPECT_EQ(JsonValue(static_cast<int64_t>(1700000000123)).as_integer(), 1700000000123);
    EXPECT_EQ(JsonValue(static_cast<int64_t>(-7)).to_string(), "-7");
}

// ============================================================================
// Serializer
// ============================================================================

TEST(JsonSerializerTest, CompactObjectSortsKeys) {
    JsonObject obj;
    obj["name"] = JsonValue("dcos");
    obj["masters"] = JsonValue(3);
    obj["extra"] = JsonValue();

    EXPECT_EQ(JsonValue(std::move(obj)).to_string(),
              "{\"extra\":null,\"masters\":3,\"name\":\"dcos\"}");
}

TEST(JsonSerializerTest, ObjectKeysAreEscaped) {
    JsonObject obj;
    obj["msg"] = JsonValue("line\nbreak");
    obj["a\"b"] = JsonValue(1);

    EXPECT_EQ(JsonValue(std::move(obj)).to_string(),
              "{\"a\\\"b\":1,\"msg\":\"line\\nbreak\"}");
}

// ============================================================================
// Escaping
// ============================================================================

TEST(JsonEscapeTest, EscapesQuotesAndBackslashes) {
    EXPECT_EQ(escape_string("say \"hi\""), "say \\\"hi\\\"");
    EXPECT_EQ(escape_string("C:\\keys"), "C:\\\\keys");
}

TEST(JsonEscapeTest, EscapesControlCharacters) {
    EXPECT_EQ(escape_string("a\nb\tc\rd"), "a\\nb\\tc\\rd");
    EXPECT_EQ(escape_string(std::string("\x01", 1)), "\\u0001");
}

TEST(JsonEscapeTest, KeepsUtf8) {
    EXPECT_EQ(escape_string("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST(JsonEscapeTest, QuoteWrapsEscapedText) {
    EXPECT_EQ(quote("~/.ssh/id_rsa.pub"), "\"~/.ssh/id_rsa.pub\"");
    EXPECT_EQ(quote(""), "\"\"");
    EXPECT_EQ(quote("${var.x}"), "\"${var.x}\"");
}
