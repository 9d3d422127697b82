#pragma once

// ---------------------------------------------------------------------------
// constraint_matcher.hpp
//
// 인자 하나를 Constraint 하나에 대해 평가한다.
//
// [평가 순서: 고정]
//   required → type → pattern → enum → range
// 여러 위반이 있어도 항상 첫 번째 위반만 보고하므로 같은 입력은 항상
// 같은 reason 을 만든다.
//
// [순수 함수]
// 상태 없음. 동시 호출 안전. Constraint 를 수정하지 않는다.
// ---------------------------------------------------------------------------

#include <string>

#include "common/value.hpp"
#include "policy/rule.hpp"

// ---------------------------------------------------------------------------
// MatchOutcome
//   ok=false 이면 reason 에 위반 내용 (인자 이름 미포함).
// ---------------------------------------------------------------------------
struct MatchOutcome {
    bool        ok{false};
    std::string reason{};
};

// ---------------------------------------------------------------------------
// literal_equals
//   enum 과 deny 규칙 condition 이 쓰는 값 비교. 타입이 다르면 다르다.
//   단, integer 와 소수부 없는 유한 double 은 같은 수이면 같다
//   (integer 제약이 5.0 을 통과시키므로 condition {id: 5} 도 5.0 에 일치해야 한다).
//   bool 은 숫자가 아니다.
// ---------------------------------------------------------------------------
[[nodiscard]] bool literal_equals(const Value& lhs, const Value& rhs);

class ConstraintMatcher {
public:
    // match
    //   value == nullptr 은 인자 부재를 뜻한다.
    //   부재 + required=false → ok (제약 없음).
    [[nodiscard]] static MatchOutcome match(const Value* value, const Constraint& constraint);

    // match_all
    //   constraints 를 문서 순서대로 평가하고 첫 번째 실패를
    //   "argument '<name>': <reason>" 형식으로 반환한다. 모두 통과하면 ok.
    [[nodiscard]] static MatchOutcome match_all(const std::vector<ConstraintEntry>& constraints,
                                                const ValueMap&                     arguments);
};
