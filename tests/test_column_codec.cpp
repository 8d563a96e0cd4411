/**
 * test_column_codec.cpp - Tests for JSON value <-> storage value conversion
 */

#include <gtest/gtest.h>
#include <tabsql/column_codec.hpp>
#include <limits>
#include <string>

using tabsql::ColumnCodec;
using tabsql::ColumnType;
using tabsql::ErrorCode;
using tabsql::Value;
using tabsql::json;

TEST(ColumnCodecTest, BooleanMapsToInteger) {
    auto t = ColumnCodec::encode(true, ColumnType::Boolean);
    ASSERT_TRUE(t.ok());
    EXPECT_EQ(std::get<int64_t>(t.value), 1);
    auto f = ColumnCodec::encode(false, ColumnType::Boolean);
    EXPECT_EQ(std::get<int64_t>(f.value), 0);

    auto back = ColumnCodec::decode(Value{int64_t(1)}, ColumnType::Boolean);
    ASSERT_TRUE(back.ok());
    ASSERT_TRUE(back.value.has_value());
    EXPECT_EQ(*back.value, json(true));
    EXPECT_EQ(*ColumnCodec::decode(Value{int64_t(0)}, ColumnType::Boolean).value, json(false));
}

TEST(ColumnCodecTest, JsonMapsToText) {
    json obj = {{"b", 2}, {"a", {1, 2, 3}}};
    auto encoded = ColumnCodec::encode(obj, ColumnType::Json);
    ASSERT_TRUE(encoded.ok());
    EXPECT_EQ(std::get<std::string>(encoded.value), R"({"a":[1,2,3],"b":2})");

    auto decoded = ColumnCodec::decode(encoded.value, ColumnType::Json);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded.value, obj);
}

TEST(ColumnCodecTest, JsonArrayMapsToText) {
    json arr = json::array({1, "two", {{"three", 3}}});
    auto encoded = ColumnCodec::encode(arr, ColumnType::JsonArray);
    ASSERT_TRUE(encoded.ok());
    auto decoded = ColumnCodec::decode(encoded.value, ColumnType::JsonArray);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded.value, arr);
}

TEST(ColumnCodecTest, StringAndNumberPassThrough) {
    EXPECT_EQ(std::get<std::string>(ColumnCodec::encode("hello", ColumnType::String).value), "hello");
    EXPECT_EQ(std::get<int64_t>(ColumnCodec::encode(42, ColumnType::Number).value), 42);
    EXPECT_DOUBLE_EQ(std::get<double>(ColumnCodec::encode(1.25, ColumnType::Number).value), 1.25);

    EXPECT_EQ(*ColumnCodec::decode(Value{std::string("hello")}, ColumnType::String).value, json("hello"));
    EXPECT_EQ(*ColumnCodec::decode(Value{int64_t(42)}, ColumnType::Number).value, json(42));
    EXPECT_EQ(*ColumnCodec::decode(Value{42.0}, ColumnType::Number).value, json(42));
}

TEST(ColumnCodecTest, NullIsAbsent) {
    auto encoded = ColumnCodec::encode(json(), ColumnType::String);
    ASSERT_TRUE(encoded.ok());
    EXPECT_TRUE(tabsql::is_null(encoded.value));

    for (auto type : {ColumnType::String, ColumnType::Number, ColumnType::Boolean,
                      ColumnType::Json, ColumnType::JsonArray}) {
        auto decoded = ColumnCodec::decode(Value{}, type);
        ASSERT_TRUE(decoded.ok());
        EXPECT_FALSE(decoded.value.has_value());
    }
}

TEST(ColumnCodecTest, KindMismatchIsUnsupportedValue) {
    EXPECT_EQ(ColumnCodec::encode(42, ColumnType::String).code(), ErrorCode::UnsupportedValue);
    EXPECT_EQ(ColumnCodec::encode("42", ColumnType::Number).code(), ErrorCode::UnsupportedValue);
    EXPECT_EQ(ColumnCodec::encode(1, ColumnType::Boolean).code(), ErrorCode::UnsupportedValue);
    EXPECT_EQ(ColumnCodec::encode(json::array(), ColumnType::Json).code(), ErrorCode::UnsupportedValue);
    EXPECT_EQ(ColumnCodec::encode(json::object(), ColumnType::JsonArray).code(),
              ErrorCode::UnsupportedValue);
}

TEST(ColumnCodecTest, UnserializableValueIsUnsupported) {
    // Invalid UTF-8 cannot be dumped
    json bad = {{"text", std::string("\xff\xfe")}};
    EXPECT_EQ(ColumnCodec::encode(bad, ColumnType::Json).code(), ErrorCode::UnsupportedValue);
    EXPECT_EQ(ColumnCodec::encode(std::numeric_limits<double>::infinity(), ColumnType::Number).code(),
              ErrorCode::UnsupportedValue);
}

TEST(ColumnCodecTest, CorruptStoredJsonIsUnsupported) {
    auto decoded = ColumnCodec::decode(Value{std::string("{not json")}, ColumnType::Json);
    EXPECT_EQ(decoded.code(), ErrorCode::UnsupportedValue);
}

TEST(ColumnCodecTest, StoredKindMismatchIsUnsupported) {
    EXPECT_EQ(ColumnCodec::decode(Value{std::string("x")}, ColumnType::Number).code(),
              ErrorCode::UnsupportedValue);
    EXPECT_EQ(ColumnCodec::decode(Value{int64_t(1)}, ColumnType::Json).code(),
              ErrorCode::UnsupportedValue);
}

TEST(ColumnCodecTest, UnknownTypeNameIsUnsupportedColumnType) {
    EXPECT_EQ(tabsql::parse_column_type("date").code(), ErrorCode::UnsupportedColumnType);
    auto ok = tabsql::parse_column_type("jsonArray");
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.value, ColumnType::JsonArray);
}
