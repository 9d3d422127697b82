// ---------------------------------------------------------------------------
// test_constraint_matcher.cpp
//
// ConstraintMatcher 단위 테스트.
//
// [테스트 범위]
// - required / type / pattern / enum / range 각각의 실패 사유
// - 평가 순서 고정: 여러 위반이 있어도 첫 번째 위반만 보고
// - pattern 은 전체 일치만 허용
// - integer 타입: 소수부 없는 double 허용, bool 거부
// - number 타입: 정수/실수 모두 허용, 경계 포함
// - match_all: 인자 이름이 포함된 사유, 문서 순서
// - literal_equals: integer 와 소수부 없는 double 은 같은 수
// ---------------------------------------------------------------------------

#include "policy/constraint_matcher.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <regex>
#include <string>

namespace {

Constraint string_constraint(std::optional<std::string> pattern = std::nullopt, bool required = false) {
    Constraint c{};
    c.type     = ConstraintType::kString;
    c.pattern  = pattern;
    c.required = required;
    return c;
}

Constraint integer_constraint(std::optional<double> min = std::nullopt,
                              std::optional<double> max = std::nullopt) {
    Constraint c{};
    c.type = ConstraintType::kInteger;
    c.min  = min;
    c.max  = max;
    return c;
}

}  // namespace

// ---------------------------------------------------------------------------
// required
// ---------------------------------------------------------------------------
TEST(ConstraintMatcher, MissingRequiredArgumentFails) {
    const auto outcome = ConstraintMatcher::match(nullptr, string_constraint(std::nullopt, true));
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.reason, "missing required argument");
}

TEST(ConstraintMatcher, MissingOptionalArgumentPasses) {
    const auto outcome = ConstraintMatcher::match(nullptr, integer_constraint(1, 10));
    EXPECT_TRUE(outcome.ok);
}

// ---------------------------------------------------------------------------
// type
// ---------------------------------------------------------------------------
TEST(ConstraintMatcher, TypeMismatch) {
    const Value v(42);
    const auto  outcome = ConstraintMatcher::match(&v, string_constraint());
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.reason, "type mismatch");
}

TEST(ConstraintMatcher, IntegerAcceptsIntegralDoubleRejectsBool) {
    const Value integral(5.0);
    const Value fractional(5.5);
    const Value boolean(true);
    EXPECT_TRUE(ConstraintMatcher::match(&integral, integer_constraint()).ok);
    EXPECT_FALSE(ConstraintMatcher::match(&fractional, integer_constraint()).ok);
    EXPECT_FALSE(ConstraintMatcher::match(&boolean, integer_constraint()).ok);
}

TEST(ConstraintMatcher, ExplicitNullIsTypeMismatch) {
    const Value null_value;
    const auto  outcome = ConstraintMatcher::match(&null_value, string_constraint());
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.reason, "type mismatch");
}

TEST(ConstraintMatcher, NumberAcceptsIntegerAndDouble) {
    Constraint c{};
    c.type = ConstraintType::kNumber;
    c.min  = 0.0;
    c.max  = 30.5;

    const Value i(30);
    const Value d(30.5);
    const Value over(30.6);
    EXPECT_TRUE(ConstraintMatcher::match(&i, c).ok);
    EXPECT_TRUE(ConstraintMatcher::match(&d, c).ok);
    EXPECT_FALSE(ConstraintMatcher::match(&over, c).ok);
}

TEST(ConstraintMatcher, BooleanType) {
    Constraint c{};
    c.type = ConstraintType::kBoolean;
    const Value t(true);
    const Value s("true");
    EXPECT_TRUE(ConstraintMatcher::match(&t, c).ok);
    EXPECT_FALSE(ConstraintMatcher::match(&s, c).ok);
}

// ---------------------------------------------------------------------------
// pattern
// ---------------------------------------------------------------------------
TEST(ConstraintMatcher, PatternRequiresFullMatch) {
    const auto c = string_constraint("EMP[0-9]{6}");

    const Value exact("EMP123456");
    const Value partial("xxEMP123456yy");
    EXPECT_TRUE(ConstraintMatcher::match(&exact, c).ok);

    const auto outcome = ConstraintMatcher::match(&partial, c);
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.reason, "pattern mismatch");
}

TEST(ConstraintMatcher, PrecompiledPatternIsUsed) {
    auto c             = string_constraint("^[a-z]+$");
    c.compiled_pattern = std::make_shared<const std::regex>("^[a-z]+$");
    const Value ok("abc");
    const Value bad("ABC");
    EXPECT_TRUE(ConstraintMatcher::match(&ok, c).ok);
    EXPECT_FALSE(ConstraintMatcher::match(&bad, c).ok);
}

TEST(ConstraintMatcher, InvalidPatternFailsClosed) {
    const auto  c = string_constraint("([unclosed");
    const Value v("anything");
    const auto  outcome = ConstraintMatcher::match(&v, c);
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.reason, "pattern mismatch");
}

// ---------------------------------------------------------------------------
// enum
// ---------------------------------------------------------------------------
TEST(ConstraintMatcher, EnumStrictEquality) {
    Constraint c{};
    c.type        = ConstraintType::kInteger;
    c.enum_values = std::vector<Value>{Value(1), Value(2)};

    const Value one(1);
    const Value three(3);
    EXPECT_TRUE(ConstraintMatcher::match(&one, c).ok);

    const auto outcome = ConstraintMatcher::match(&three, c);
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.reason, "not in enum");
}

TEST(ConstraintMatcher, EnumDoesNotCoerceStrings) {
    Constraint c{};
    c.type        = ConstraintType::kString;
    c.enum_values = std::vector<Value>{Value("open"), Value("closed")};
    const Value open("open");
    const Value upper("OPEN");
    EXPECT_TRUE(ConstraintMatcher::match(&open, c).ok);
    EXPECT_FALSE(ConstraintMatcher::match(&upper, c).ok);
}

// integer 제약이 5.0 을 받아들이므로 enum 도 같은 수로 본다.
TEST(ConstraintMatcher, EnumMatchesIntegralDoubleByValue) {
    Constraint c{};
    c.type        = ConstraintType::kInteger;
    c.enum_values = std::vector<Value>{Value(1), Value(2)};

    const Value two(2.0);
    const Value fraction(2.5);
    EXPECT_TRUE(ConstraintMatcher::match(&two, c).ok);
    EXPECT_EQ(ConstraintMatcher::match(&fraction, c).reason, "type mismatch");
}

TEST(LiteralEquals, NumbersCompareByValueOthersStrictly) {
    EXPECT_TRUE(literal_equals(Value(5), Value(5.0)));
    EXPECT_TRUE(literal_equals(Value(-3.0), Value(-3)));
    EXPECT_FALSE(literal_equals(Value(5), Value(5.5)));
    EXPECT_FALSE(literal_equals(Value(1), Value(true)));
    EXPECT_FALSE(literal_equals(Value(1), Value("1")));
    EXPECT_FALSE(literal_equals(Value(0), Value(std::nan(""))));
    // int64 범위 밖의 double 은 어떤 정수와도 같지 않다
    EXPECT_FALSE(literal_equals(Value(std::numeric_limits<std::int64_t>::max()), Value(9.3e18)));
    EXPECT_TRUE(literal_equals(Value("a"), Value("a")));
}

// ---------------------------------------------------------------------------
// range
// ---------------------------------------------------------------------------
TEST(ConstraintMatcher, RangeIsInclusive) {
    const auto  c = integer_constraint(1, 100);
    const Value lo(1);
    const Value hi(100);
    EXPECT_TRUE(ConstraintMatcher::match(&lo, c).ok);
    EXPECT_TRUE(ConstraintMatcher::match(&hi, c).ok);
}

TEST(ConstraintMatcher, RangeReportsViolatedBound) {
    const auto  c = integer_constraint(1, 100);
    const Value below(0);
    const Value above(101);

    const auto below_outcome = ConstraintMatcher::match(&below, c);
    EXPECT_FALSE(below_outcome.ok);
    EXPECT_EQ(below_outcome.reason, "below minimum 1");

    const auto above_outcome = ConstraintMatcher::match(&above, c);
    EXPECT_FALSE(above_outcome.ok);
    EXPECT_EQ(above_outcome.reason, "above maximum 100");
}

// ---------------------------------------------------------------------------
// 평가 순서
// ---------------------------------------------------------------------------
TEST(ConstraintMatcher, FirstViolationInFixedOrder) {
    // pattern 과 enum 을 모두 위반 → pattern 이 먼저
    auto c        = string_constraint("^[0-9]+$");
    c.enum_values = std::vector<Value>{Value("1"), Value("2")};
    const Value v("abc");
    EXPECT_EQ(ConstraintMatcher::match(&v, c).reason, "pattern mismatch");

    // 같은 입력 → 같은 사유 (결정성)
    EXPECT_EQ(ConstraintMatcher::match(&v, c).reason, ConstraintMatcher::match(&v, c).reason);
}

TEST(ConstraintMatcher, MatchAllNamesArgumentInDocumentOrder) {
    std::vector<ConstraintEntry> constraints{
        {"user_id", string_constraint("^EMP[0-9]{6}$", true)},
        {"limit", integer_constraint(1, 10)},
    };

    const ValueMap both_bad{{"user_id", "INVALID"}, {"limit", 99}};
    const auto     outcome = ConstraintMatcher::match_all(constraints, both_bad);
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.reason, "argument 'user_id': pattern mismatch");

    const ValueMap good{{"user_id", "EMP000001"}, {"limit", 5}};
    EXPECT_TRUE(ConstraintMatcher::match_all(constraints, good).ok);
}
