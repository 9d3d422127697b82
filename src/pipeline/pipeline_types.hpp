#pragma once

// ---------------------------------------------------------------------------
// pipeline_types.hpp
//
// Pipeline 상태/결과 타입. audit/ 과 enforcer/ 가 pipeline.hpp 전체를
// include 하지 않도록 분리한다.
//
// [순환 의존성 방지]
// pipeline.hpp → audit/audit_emitter.hpp → pipeline_types.hpp (단방향)
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "common/value.hpp"

// ---------------------------------------------------------------------------
// PipelineStage
//   START → RATE_LIMIT → VALIDATE → AUTHORIZE → DETECT → EXECUTE → REDACT → AUDITED
//   DENIED 는 EXECUTE 를 제외한 모든 단계에서 도달 가능한 종결 상태.
//   EXECUTE 에서 툴이 실패하면 REDACT 를 건너뛰고 AUDITED 로 간다.
// ---------------------------------------------------------------------------
enum class PipelineStage : std::uint8_t {
    kStart     = 0,
    kRateLimit = 1,
    kValidate  = 2,
    kAuthorize = 3,
    kDetect    = 4,
    kExecute   = 5,
    kRedact    = 6,
    kAudited   = 7,
    kDenied    = 8,
};

[[nodiscard]] std::string_view stage_to_string(PipelineStage stage) noexcept;

// ---------------------------------------------------------------------------
// ToolFunction
//   불투명 툴 콜러블. 인자 맵을 받아 결과 값 또는 ToolError 를 반환한다.
//   std::exception 을 던지면 Pipeline 이 ToolError 로 변환한다.
// ---------------------------------------------------------------------------
using ToolResult   = std::expected<Value, ToolError>;
using ToolFunction = std::function<ToolResult(const ValueMap&)>;

// ---------------------------------------------------------------------------
// OutcomeStatus
//   감사 이벤트의 status 필드. kToolError 는 정책상 허용되었으나 툴이 실패한 경우.
// ---------------------------------------------------------------------------
enum class OutcomeStatus : std::uint8_t {
    kOk        = 0,
    kDenied    = 1,
    kToolError = 2,
};

[[nodiscard]] std::string_view status_to_string(OutcomeStatus status) noexcept;

// ---------------------------------------------------------------------------
// PipelineOutcome
//   한 ToolCall 의 최종 결과.
//
//   decision     : 종결 레이어의 Decision. 허용 경로에서는 authorize 결정.
//   result       : kOk 일 때만 값 (redact 적용 후)
//   tool_error   : kToolError 일 때만 값
//   tool_invoked : 툴 콜러블이 실제로 호출되었는지
//   flags        : on_detect=flag 로 허용된 탐지 주석 ("sql_injection:query" 등)
//   audit_ok     : 감사 sink 전달 성공 여부 (emitter 가 없으면 false)
// ---------------------------------------------------------------------------
struct PipelineOutcome {
    PipelineStage             final_stage{PipelineStage::kDenied};
    OutcomeStatus             status{OutcomeStatus::kDenied};
    Decision                  decision{};
    std::optional<Value>      result{};
    std::optional<ToolError>  tool_error{};
    bool                      tool_invoked{false};
    std::vector<std::string>  flags{};
    std::chrono::microseconds duration{0};
    bool                      audit_ok{false};
};
