// ---------------------------------------------------------------------------
// constraint_matcher.cpp
//
// [타입 판정]
// - string  : Value::kString 만
// - integer : Value::kInteger, 또는 유한하고 소수부가 없는 kDouble (예: 5.0)
//             bool 은 정수가 아니다.
// - number  : kInteger / kDouble
// - boolean : kBool 만
// - null 값이 명시적으로 전달되면 어떤 타입이든 type mismatch.
//
// [enum]
// literal_equals 로 비교한다. integer 5 와 5.0 은 같고, 1 / true / "1" 은 다르다.
//
// [pattern]
// std::regex_match 로 전체 일치만 허용한다. 부분 일치는 실패.
// 로더가 컴파일해 둔 regex 가 없으면 여기서 컴파일하며, 컴파일 실패 시
// fail-close (매칭 실패) 로 처리한다.
// ---------------------------------------------------------------------------

#include "policy/constraint_matcher.hpp"

#include <cmath>
#include <cstdint>
#include <regex>
#include <string>

#include <spdlog/spdlog.h>

namespace {

bool type_matches(const Value& value, ConstraintType type) {
    switch (type) {
        case ConstraintType::kString:
            return value.is_string();
        case ConstraintType::kInteger:
            if (value.is_integer()) {
                return true;
            }
            if (value.is_double()) {
                const double d = value.as_double();
                return std::isfinite(d) && std::trunc(d) == d;
            }
            return false;
        case ConstraintType::kNumber:
            return value.is_number();
        case ConstraintType::kBoolean:
            return value.is_bool();
        default:
            return false;
    }
}

bool pattern_matches(const std::string& text, const Constraint& constraint) {
    if (constraint.compiled_pattern) {
        return std::regex_match(text, *constraint.compiled_pattern);
    }
    try {
        const std::regex re(*constraint.pattern, std::regex_constants::ECMAScript);
        return std::regex_match(text, re);
    } catch (const std::regex_error& e) {
        spdlog::warn("constraint_matcher: invalid pattern '{}', failing match (fail-close): {}",
                     *constraint.pattern, e.what());
        return false;
    }
}

bool is_numeric_type(ConstraintType type) {
    return type == ConstraintType::kInteger || type == ConstraintType::kNumber;
}

bool integer_equals_double(std::int64_t i, double d) {
    // 2^63 은 double 로 정확히 표현된다. [-2^63, 2^63) 밖이면 int64 가 될 수 없다.
    constexpr double kTwoPow63 = 9223372036854775808.0;
    if (!std::isfinite(d) || std::trunc(d) != d || d < -kTwoPow63 || d >= kTwoPow63) {
        return false;
    }
    return static_cast<std::int64_t>(d) == i;
}

}  // namespace

bool literal_equals(const Value& lhs, const Value& rhs) {
    if (lhs.is_integer() && rhs.is_double()) {
        return integer_equals_double(lhs.as_integer(), rhs.as_double());
    }
    if (lhs.is_double() && rhs.is_integer()) {
        return integer_equals_double(rhs.as_integer(), lhs.as_double());
    }
    return lhs == rhs;
}

MatchOutcome ConstraintMatcher::match(const Value* value, const Constraint& constraint) {
    // 1. required
    if (value == nullptr) {
        if (constraint.required) {
            return MatchOutcome{false, "missing required argument"};
        }
        return MatchOutcome{true, ""};
    }

    // 2. type
    if (!type_matches(*value, constraint.type)) {
        return MatchOutcome{false, "type mismatch"};
    }

    // 3. pattern (string 전용)
    if (constraint.type == ConstraintType::kString && constraint.pattern.has_value()) {
        if (!pattern_matches(value->as_string(), constraint)) {
            return MatchOutcome{false, "pattern mismatch"};
        }
    }

    // 4. enum
    if (constraint.enum_values.has_value()) {
        bool found = false;
        for (const auto& candidate : *constraint.enum_values) {
            if (literal_equals(candidate, *value)) {
                found = true;
                break;
            }
        }
        if (!found) {
            return MatchOutcome{false, "not in enum"};
        }
    }

    // 5. range (integer/number 전용, 경계 포함)
    if (is_numeric_type(constraint.type)) {
        const double num = value->as_number();
        if (constraint.min.has_value() && num < *constraint.min) {
            return MatchOutcome{false, fmt::format("below minimum {}", *constraint.min)};
        }
        if (constraint.max.has_value() && num > *constraint.max) {
            return MatchOutcome{false, fmt::format("above maximum {}", *constraint.max)};
        }
    }

    return MatchOutcome{true, ""};
}

MatchOutcome ConstraintMatcher::match_all(const std::vector<ConstraintEntry>& constraints,
                                          const ValueMap&                     arguments) {
    for (const auto& entry : constraints) {
        const auto  it    = arguments.find(entry.argument);
        const Value* value = (it == arguments.end()) ? nullptr : &it->second;

        const auto outcome = match(value, entry.constraint);
        if (!outcome.ok) {
            return MatchOutcome{
                false,
                fmt::format("argument '{}': {}", entry.argument, outcome.reason)
            };
        }
    }
    return MatchOutcome{true, ""};
}
