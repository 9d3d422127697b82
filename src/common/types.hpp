#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/value.hpp"

// ---------------------------------------------------------------------------
// ToolCall
//   툴 호출 요청 하나를 표현하는 불변 컨텍스트.
//   호출자가 생성하고 pipeline/policy/audit 레이어에 const-ref 로 전달한다.
//   roles/actor 는 identity 콜라보레이터가 이미 해석한 값이다 (자격 증명 검증 없음).
// ---------------------------------------------------------------------------
struct ToolCall {
    std::string                tool_name{};   // 비어있지 않은 툴 식별자
    ValueMap                   arguments{};   // 인자 이름 → 값 (키 유일)
    std::vector<std::string>   roles{};       // 호출자 역할 집합 (비어있을 수 있음)
    std::optional<std::string> actor{};       // 호출 주체 식별자
    std::optional<std::string> request_id{};  // 요청 상관관계 ID
};

// ---------------------------------------------------------------------------
// DecisionLayer
//   Decision 을 만든 파이프라인 단계.
// ---------------------------------------------------------------------------
enum class DecisionLayer : std::uint8_t {
    kNone          = 0,
    kRateLimit     = 1,
    kValidate      = 2,
    kAuthorize     = 3,
    kDetectAttacks = 4,
    kExecute       = 5,
    kRedact        = 6,
};

[[nodiscard]] std::string_view layer_to_string(DecisionLayer layer) noexcept;

// ---------------------------------------------------------------------------
// Decision
//   한 레이어의 판정 결과. allowed=false 는 종결 상태이며 이후 레이어가
//   뒤집을 수 없다 (Pipeline 이 즉시 kDenied 로 전이).
//   기본값은 차단 (fail-close).
// ---------------------------------------------------------------------------
struct Decision {
    bool                       allowed{false};
    std::string                reason{};
    std::string                policy_id{};
    std::optional<std::string> remediation{};  // 호출자용 조치 힌트
    DecisionLayer              layer{DecisionLayer::kNone};

    friend bool operator==(const Decision&, const Decision&) = default;
};

// ---------------------------------------------------------------------------
// ToolError
//   툴 콜러블 실행 실패. std::expected<Value, ToolError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ToolError {
    std::string message{};
};

// ---------------------------------------------------------------------------
// EnforceErrorCode / EnforceError
//   Enforcer::enforce 실패 분류.
//   kDenied      : 어떤 레이어든 allowed=false (PolicyDenied)
//   kToolFailure : 실행 단계에서 툴이 실패 (ToolExecutionFailure)
//   두 경우 모두 감사 이벤트가 정확히 한 번 기록된 뒤 반환된다.
// ---------------------------------------------------------------------------
enum class EnforceErrorCode : std::uint8_t {
    kDenied      = 0,
    kToolFailure = 1,
};

struct EnforceError {
    EnforceErrorCode           code{EnforceErrorCode::kDenied};
    std::string                reason{};
    std::string                policy_id{};
    DecisionLayer              layer{DecisionLayer::kNone};
    std::optional<std::string> remediation{};
};
