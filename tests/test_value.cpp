// ---------------------------------------------------------------------------
// test_value.cpp
//
// Value 단위 테스트.
//
// [테스트 범위]
// - kind 판정 (bool 은 integer 가 아님)
// - 엄격 비교 (1 != 1.0 != true != "1")
// - compact JSON 직렬화 (키 정렬, 이스케이프, NaN → null)
// - find / as_number
// ---------------------------------------------------------------------------

#include "common/value.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <string>

TEST(Value, KindOfEachAlternative) {
    EXPECT_EQ(Value().kind(), ValueKind::kNull);
    EXPECT_EQ(Value(nullptr).kind(), ValueKind::kNull);
    EXPECT_EQ(Value(true).kind(), ValueKind::kBool);
    EXPECT_EQ(Value(42).kind(), ValueKind::kInteger);
    EXPECT_EQ(Value(std::int64_t{-7}).kind(), ValueKind::kInteger);
    EXPECT_EQ(Value(1.5).kind(), ValueKind::kDouble);
    EXPECT_EQ(Value("abc").kind(), ValueKind::kString);
    EXPECT_EQ(Value(Value::Array{1, 2}).kind(), ValueKind::kArray);
    EXPECT_EQ(Value(ValueMap{{"a", 1}}).kind(), ValueKind::kObject);
}

TEST(Value, StrictEqualityAcrossTypes) {
    EXPECT_EQ(Value(1), Value(1));
    EXPECT_EQ(Value("x"), Value(std::string("x")));

    // 타입이 다르면 값이 "같아 보여도" 다르다
    EXPECT_FALSE(Value(1) == Value(1.0));
    EXPECT_FALSE(Value(1) == Value(true));
    EXPECT_FALSE(Value(1) == Value("1"));
    EXPECT_FALSE(Value() == Value(false));
}

TEST(Value, NestedEquality) {
    const Value a(ValueMap{{"k", Value::Array{1, "two", ValueMap{{"x", true}}}}});
    const Value b(ValueMap{{"k", Value::Array{1, "two", ValueMap{{"x", true}}}}});
    const Value c(ValueMap{{"k", Value::Array{1, "two", ValueMap{{"x", false}}}}});
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
}

TEST(Value, CompactJsonSortsKeys) {
    const Value v(ValueMap{{"zeta", 1}, {"alpha", "a"}, {"mid", Value::Array{true, nullptr}}});
    EXPECT_EQ(v.to_json(), R"({"alpha":"a","mid":[true,null],"zeta":1})");
}

TEST(Value, JsonEscaping) {
    const Value v(std::string("quote\" back\\ nl\n tab\t ctl\x01"));
    EXPECT_EQ(v.to_json(), R"("quote\" back\\ nl\n tab\t ctl\u0001")");
}

TEST(Value, NonFiniteDoubleSerializesAsNull) {
    EXPECT_EQ(Value(std::numeric_limits<double>::quiet_NaN()).to_json(), "null");
    EXPECT_EQ(Value(std::numeric_limits<double>::infinity()).to_json(), "null");
    EXPECT_EQ(Value(2.5).to_json(), "2.5");
}

TEST(Value, FindOnObjectOnly) {
    const Value obj(ValueMap{{"user_id", "EMP123456"}});
    ASSERT_NE(obj.find("user_id"), nullptr);
    EXPECT_EQ(obj.find("user_id")->as_string(), "EMP123456");
    EXPECT_EQ(obj.find("missing"), nullptr);
    EXPECT_EQ(Value("not an object").find("user_id"), nullptr);
}

TEST(Value, AsNumberWidensInteger) {
    EXPECT_DOUBLE_EQ(Value(3).as_number(), 3.0);
    EXPECT_DOUBLE_EQ(Value(3.25).as_number(), 3.25);
    EXPECT_THROW((void)Value("3").as_number(), std::bad_variant_access);
}

TEST(Value, DisplayStringUnquotesStrings) {
    EXPECT_EQ(Value("../etc/passwd").to_display_string(), "../etc/passwd");
    EXPECT_EQ(Value(12).to_display_string(), "12");
}
