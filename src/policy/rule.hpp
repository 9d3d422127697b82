#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 정책 문서 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 policy.yaml / policy.json 에서 로드되거나 호출자가 직접 구성한다.
//
// [설계 원칙]
// - 이 헤더는 common/value.hpp 외의 프로젝트 헤더에 의존하지 않는다.
// - 모든 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - Policy 는 로드 후 불변. 재로드는 새 인스턴스를 만들고
//   PolicyEngine::reload 로 shared_ptr 를 교체한다 (변경 금지).
// - 판정 로직은 포함하지 않는다 (ConstraintMatcher / PolicyEngine 소관).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "common/value.hpp"

// ---------------------------------------------------------------------------
// ConstraintType
//   인자 제약의 타입 집합 (닫힌 집합).
//   kNumber 는 정수/실수 모두 허용한다.
// ---------------------------------------------------------------------------
enum class ConstraintType : std::uint8_t {
    kString  = 0,
    kInteger = 1,
    kNumber  = 2,
    kBoolean = 3,
};

// ---------------------------------------------------------------------------
// Constraint
//   인자 하나의 허용 조건.
//
//   pattern : string 타입에만 적용. 전체 일치(regex_match) 필요.
//   enum    : 모든 타입에 적용. 엄격 비교 (타입 + 값).
//   min/max : integer/number 타입에만 적용. 경계 포함.
//   description 은 문서용이며 런타임 영향 없음.
//
//   [compiled_pattern]
//   로더가 로드 시점에 컴파일해 둔다. nullptr 이면 ConstraintMatcher 가
//   평가 시점에 컴파일하고, 실패 시 매칭 실패로 처리한다 (fail-close).
// ---------------------------------------------------------------------------
struct Constraint {
    ConstraintType                     type{ConstraintType::kString};
    std::optional<std::string>         pattern{};
    std::shared_ptr<const std::regex>  compiled_pattern{};
    std::optional<std::vector<Value>>  enum_values{};
    std::optional<double>              min{};
    std::optional<double>              max{};
    bool                               required{false};
    std::optional<std::string>         description{};
};

// ---------------------------------------------------------------------------
// ConstraintEntry
//   인자 이름 + 제약. 문서 순서를 보존하기 위해 map 대신 vector 로 보관한다.
// ---------------------------------------------------------------------------
struct ConstraintEntry {
    std::string argument{};
    Constraint  constraint{};
};

// ---------------------------------------------------------------------------
// AllowRule
//   tool = "*" 이면 모든 툴에 적용.
//   roles 가 nullopt 이거나 비어 있으면 모든 역할 허용. 그 외에는 호출자 역할과 교집합 필요.
// ---------------------------------------------------------------------------
struct AllowRule {
    std::string                              tool{};
    std::optional<std::vector<std::string>>  roles{};
    std::vector<ConstraintEntry>             constraints{};
};

// ---------------------------------------------------------------------------
// DenyRule
//   condition 의 모든 (인자, 리터럴) 쌍이 엄격 일치해야 발동한다.
//   condition 이 nullopt 이면 tool 일치만으로 발동.
// ---------------------------------------------------------------------------
struct DenyRule {
    std::string                             tool{};
    std::optional<ValueMap>                 condition{};
    std::string                             reason{"Denied by policy"};
};

// ---------------------------------------------------------------------------
// ValidateConfig
//   max_arg_bytes = 0 이면 크기 제한 없음.
// ---------------------------------------------------------------------------
struct ValidateConfig {
    bool          reject_unknown_args{false};
    std::uint64_t max_arg_bytes{0};
};

// ---------------------------------------------------------------------------
// RateLimitScope
//   토큰 버킷 키를 만드는 기준.
//   kActorTool: actor 와 tool 조합별 버킷.
// ---------------------------------------------------------------------------
enum class RateLimitScope : std::uint8_t {
    kActor     = 0,
    kTool      = 1,
    kActorTool = 2,
    kGlobal    = 3,
};

// ---------------------------------------------------------------------------
// RateLimitConfig
//   limit_per_minute : 정상 상태 보충 속도 (분당 토큰)
//   burst            : 버킷 용량. 0 이면 max(1, limit_per_minute)
//   limit_per_minute = 0 이면 enabled 여도 비활성으로 취급한다.
// ---------------------------------------------------------------------------
struct RateLimitConfig {
    bool           enabled{false};
    std::uint32_t  limit_per_minute{0};
    std::uint32_t  burst{0};
    RateLimitScope scope{RateLimitScope::kActor};
};

// ---------------------------------------------------------------------------
// OnDetect
//   kDeny : 탐지 시 차단 (기본값)
//   kFlag : 허용하되 감사 이벤트에 표시. 신호를 조용히 버리지 않는다.
// ---------------------------------------------------------------------------
enum class OnDetect : std::uint8_t {
    kDeny = 0,
    kFlag = 1,
};

struct DetectAttacksConfig {
    bool                     enabled{false};
    OnDetect                 on_detect{OnDetect::kDeny};
    std::vector<std::string> fields{"query", "sql", "where", "url", "path"};
};

// 결과/감사 레코드에서 기본으로 가리는 키 목록
inline const std::vector<std::string> kDefaultDenyKeys = {
    "password", "token", "secret", "api_key", "authorization",
};

// ---------------------------------------------------------------------------
// RedactConfig
//   deny_keys      : 대소문자 무관 키 일치 시 값을 "[REDACTED]" 로 마스킹
//   pii_emails     : 문자열 값의 이메일 → "[REDACTED_EMAIL]"
//   pii_phones     : 문자열 값의 전화번호 → "[REDACTED_PHONE]"
//   max_string_len : 문자열 최대 길이 (0 = 제한 없음). PII 치환 후 적용.
// ---------------------------------------------------------------------------
struct RedactConfig {
    bool                     enabled{false};
    std::vector<std::string> deny_keys{kDefaultDenyKeys};
    bool                     pii_emails{true};
    bool                     pii_phones{false};
    std::uint32_t            max_string_len{2048};
};

// ---------------------------------------------------------------------------
// AuditConfig
//   AuditEmitter 에 주입되는 "무엇을 기록하지 않는가" 설정.
//   기본값은 인자 값/결과 값을 기록하지 않는다 (키 목록과 개수만).
//   값을 포함하도록 올려도 deny_keys 와 이메일은 가려진 뒤 기록된다.
// ---------------------------------------------------------------------------
struct AuditConfig {
    bool                     include_argument_values{false};
    bool                     include_result{false};
    std::vector<std::string> deny_keys{kDefaultDenyKeys};
};

// ---------------------------------------------------------------------------
// DefaultAction
// ---------------------------------------------------------------------------
enum class DefaultAction : std::uint8_t {
    kDeny  = 0,
    kAllow = 1,
};

// ---------------------------------------------------------------------------
// Policy
//   정책 문서 루트. PolicyLoader::load 가 반환하는 최종 결과물.
//   PolicyEngine / Pipeline 이 shared_ptr<const Policy> 스냅샷으로 참조한다.
// ---------------------------------------------------------------------------
struct Policy {
    std::string              policy_id{};
    std::string              version{};
    DefaultAction            default_action{DefaultAction::kDeny};
    std::vector<AllowRule>   allow_rules{};
    std::vector<DenyRule>    deny_rules{};

    ValidateConfig           validate{};
    RateLimitConfig          rate_limit{};
    DetectAttacksConfig      detect_attacks{};
    RedactConfig             redact{};
    AuditConfig              audit{};
};

// tool_matches: 규칙의 tool 이 "*" 이거나 정확히 일치
[[nodiscard]] inline bool tool_matches(const std::string& rule_tool, const std::string& tool_name) {
    return rule_tool == "*" || rule_tool == tool_name;
}
