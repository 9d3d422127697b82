#pragma once

// ---------------------------------------------------------------------------
// audit_event.hpp
//
// ToolCall 하나당 정확히 한 번 생성되는 감사 이벤트 (write-once).
//
// [민감정보 취급]
// - 기본적으로 인자 키 목록과 개수만 기록한다 (arguments_summary).
// - arguments / result 는 AuditConfig 로 verbosity 를 올린 경우에만 채워지며,
//   채워질 때도 deny_keys 와 이메일은 이미 가려진 상태다.
// - reason 에는 인자 값이 들어가지 않는다 (각 레이어의 reason 규약).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "common/value.hpp"

struct AuditEvent {
    std::chrono::system_clock::time_point timestamp{};
    std::string                           action{"tool_call"};
    std::string                           tool_name{};
    std::string                           decision{};      // "allow" | "deny"
    std::string                           reason{};
    std::string                           policy_id{};
    std::optional<std::string>            actor{};
    std::optional<std::string>            request_id{};
    DecisionLayer                         layer{DecisionLayer::kNone};
    std::string                           status{};        // "ok" | "denied" | "tool_error"
    double                                latency_ms{0.0};
    std::vector<std::string>              argument_keys{}; // 정렬됨
    std::size_t                           argument_count{0};
    std::vector<std::string>              flags{};
    std::optional<std::string>            remediation{};
    std::optional<Value>                  arguments{};     // raised verbosity 전용
    std::optional<Value>                  result{};        // raised verbosity 전용

    // to_json: compact JSON 한 줄. 값이 없는 optional 필드는 생략한다.
    [[nodiscard]] std::string to_json() const;
};

// format_iso8601: UTC, 밀리초 정밀도 ("2026-01-02T03:04:05.678Z")
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
