/**
 * @file test_value_coercion.cpp
 * @brief Type classification and string-to-native coercion
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <core/value_coercion.hpp>

using namespace Omnidb;

TEST(ValueCoercionTest, ClassifiesEngineTypeNames) {
    EXPECT_EQ(classify_column_type("int4"), TypeCategory::Integer);
    EXPECT_EQ(classify_column_type("BIGINT UNSIGNED"), TypeCategory::Integer);
    EXPECT_EQ(classify_column_type("Nullable(UInt64)"), TypeCategory::Integer);
    EXPECT_EQ(classify_column_type("LowCardinality(Nullable(String))"), TypeCategory::Text);
    EXPECT_EQ(classify_column_type("numeric(10,2)"), TypeCategory::Decimal);
    EXPECT_EQ(classify_column_type("double precision"), TypeCategory::Float);
    EXPECT_EQ(classify_column_type("timestamp with time zone"), TypeCategory::Timestamp);
    EXPECT_EQ(classify_column_type("DateTime64(3)"), TypeCategory::Timestamp);
    EXPECT_EQ(classify_column_type("jsonb"), TypeCategory::Json);
    EXPECT_EQ(classify_column_type("int4[]"), TypeCategory::Text);
    EXPECT_EQ(classify_column_type("geometry"), TypeCategory::Text);
    EXPECT_EQ(classify_column_type(""), TypeCategory::Text);
}

TEST(ValueCoercionTest, IntegersAreParsedAndRangeChecked) {
    Value v = coerce_value(" 42 ", "integer");
    EXPECT_EQ(std::get<int64_t>(v.native), 42);
    EXPECT_EQ(v.text, "42");

    EXPECT_THROW(coerce_value("4x", "int"), CoercionError);
    EXPECT_THROW(coerce_value("99999999999999999999999", "bigint"), CoercionError);
    // UInt64 above INT64_MAX is kept textual.
    EXPECT_EQ(coerce_value("18446744073709551615", "UInt64").text, "18446744073709551615");
}

TEST(ValueCoercionTest, BooleansAcceptCommonSpellings) {
    for (const char* t : {"true", "T", "1", "yes", "y", "on"}) {
        EXPECT_EQ(coerce_value(t, "boolean").text, "true") << t;
    }
    for (const char* f : {"false", "f", "0", "NO", "n", "off"}) {
        EXPECT_EQ(coerce_value(f, "bool").text, "false") << f;
    }
    EXPECT_THROW(coerce_value("maybe", "boolean"), CoercionError);
}

TEST(ValueCoercionTest, DatesTimesAndTimestamps) {
    EXPECT_NO_THROW(coerce_value("2024-02-29", "date"));
    EXPECT_THROW(coerce_value("2023-02-29", "date"), CoercionError);
    EXPECT_NO_THROW(coerce_value("23:59:60.5", "time"));
    EXPECT_THROW(coerce_value("24:00", "time"), CoercionError);
    EXPECT_NO_THROW(coerce_value("2024-01-02T03:04:05Z", "timestamptz"));
    EXPECT_NO_THROW(coerce_value("2024-01-02 03:04:05+05:30", "timestamp"));
    EXPECT_THROW(coerce_value("yesterday", "timestamp"), CoercionError);
}

TEST(ValueCoercionTest, UuidsAndJson) {
    EXPECT_EQ(coerce_value("A0EEBC99-9C0B-4EF8-BB6D-6BB9BD380A11", "uuid").text,
              "a0eebc99-9c0b-4ef8-bb6d-6bb9bd380a11");
    EXPECT_THROW(coerce_value("not-a-uuid", "uuid"), CoercionError);
    EXPECT_EQ(coerce_value(R"({ "a" : 1 })", "json").text, R"({"a":1})");
    EXPECT_THROW(coerce_value("{", "jsonb"), CoercionError);
}

TEST(ValueCoercionTest, EmptyWriteValueIsNullExceptForText) {
    EXPECT_TRUE(coerce_for_write("", "integer").is_null());
    EXPECT_TRUE(coerce_for_write("", "timestamp").is_null());
    EXPECT_FALSE(coerce_for_write("", "text").is_null());
    EXPECT_EQ(coerce_for_write("", "varchar(20)").text, "");
}

TEST(ValueCoercionTest, UnknownTypesPassThroughAsText) {
    Value v = coerce_value("POINT(1 2)", "geometry");
    EXPECT_EQ(v.category, TypeCategory::Text);
    EXPECT_EQ(v.text, "POINT(1 2)");
}
