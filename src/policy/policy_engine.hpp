#pragma once

// ---------------------------------------------------------------------------
// policy_engine.hpp
//
// ToolCall 을 받아 allow/deny 규칙으로 허용/차단 판정을 내리는 엔진.
//
// [fail-close 원칙: 절대 위반 금지]
// 1. policy == nullptr → 반드시 allowed=false
// 2. deny 규칙 일치 → 반드시 allowed=false (allow 규칙보다 항상 우선)
// 3. allow 규칙 불일치 + default: deny → allowed=false
// 4. allowed=true 는 allow 규칙 통과 또는 명시적 default: allow 일 때만
//
// [결정성]
// evaluate() 는 부작용이 없고 Policy 를 변경하지 않는다.
// 같은 ToolCall + 같은 Policy → 항상 같은 Decision.
//
// [Hot Reload]
// reload() 는 std::atomic<std::shared_ptr<const Policy>> 교체로 수행된다.
// 진행 중인 evaluate() 는 시작 시점에 얻은 스냅샷으로 완료된다.
//
// [순환 의존성: 무순환 구조]
// policy_engine.hpp → constraint_matcher.hpp → rule.hpp → common/value.hpp
// policy_engine.hpp → common/types.hpp
// ---------------------------------------------------------------------------

#include <atomic>
#include <memory>

#include "common/types.hpp"
#include "policy/rule.hpp"

// ---------------------------------------------------------------------------
// PolicyEngine
//
//   [스레드 안전성]
//   - evaluate / snapshot: 읽기 전용, concurrent 호출 안전.
//   - reload: atomic 교체.
// ---------------------------------------------------------------------------
class PolicyEngine {
public:
    // 생성자: 정책을 주입받는다.
    // policy 가 nullptr 이면 모든 evaluate() 가 차단을 반환한다 (fail-close).
    explicit PolicyEngine(std::shared_ptr<const Policy> policy);

    ~PolicyEngine() = default;

    // 복사/이동 금지 (atomic 멤버)
    PolicyEngine(const PolicyEngine&)            = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;
    PolicyEngine(PolicyEngine&&)                 = delete;
    PolicyEngine& operator=(PolicyEngine&&)      = delete;

    // evaluate
    //   현재 정책 스냅샷으로 평가한다.
    //
    //   [평가 순서 (반드시 준수)]
    //   1. deny 규칙 (문서 순서). 첫 번째 일치 규칙의 reason 으로 차단.
    //   2. allow 규칙 (문서 순서). tool 일치 + roles 교집합 + 선언된 모든 제약 통과
    //      → 허용. 제약/역할 실패 시 다음 allow 규칙으로 계속 (fall-through).
    //   3. default. deny 이면 차단 (앞서 실패한 allow 규칙이 있으면 그 사유를 보고).
    //
    //   [참고]
    //   reject_unknown_args 는 Validator 가 파이프라인 앞단에서 처리한다.
    //   이 엔진은 선언된 제약만 평가한다.
    [[nodiscard]] Decision evaluate(const ToolCall& call) const;

    // evaluate (정적)
    //   주어진 정책으로 평가한다. Pipeline 이 한 호출 동안 같은 스냅샷을
    //   모든 레이어에 사용하기 위해 이 오버로드를 쓴다.
    [[nodiscard]] static Decision evaluate(const Policy& policy, const ToolCall& call);

    // snapshot
    //   현재 정책 포인터 (nullptr 가능).
    [[nodiscard]] std::shared_ptr<const Policy> snapshot() const;

    // reload
    //   Hot Reload: 새 정책으로 원자적 교체.
    //   new_policy 가 nullptr 이면 이후 모든 evaluate() 가 차단을 반환한다.
    void reload(std::shared_ptr<const Policy> new_policy);

private:
    std::atomic<std::shared_ptr<const Policy>> policy_;
};
