#pragma once

// ---------------------------------------------------------------------------
// enforcer.hpp
//
// 공개 진입점. ToolCall + 툴 콜러블을 받아 Pipeline 을 실행하고,
// 감사 이벤트를 정확히 한 번 기록한 뒤 (redaction 된) 결과 또는
// 구조화된 거부를 반환한다.
//
// [오류 분류]
// - PolicyDenied         : EnforceError{kDenied, reason, policy_id, layer, remediation}
// - ToolExecutionFailure : EnforceError{kToolFailure, tool 오류 메시지, ...}
// - ConfigurationError   : 로드 시점에만 발생 (PolicyLoader). enforce() 에서는 발생하지 않는다.
//
// [사용 예]
//   auto policy   = PolicyLoader::load("config/policy.yaml");
//   auto engine   = std::make_shared<PolicyEngine>(std::make_shared<const Policy>(*policy));
//   auto emitter  = std::make_shared<AuditEmitter>(policy->audit, sink);
//   Enforcer enforcer(engine, emitter);
//   auto result = enforcer.enforce(call, tool);
//
// [Hot Reload]
// engine->reload() 후 다음 호출부터 새 정책의 모든 블록(audit 포함)이 적용된다.
// emitter 에 준 AuditConfig 는 정책 스냅샷이 없을 때만 쓰인다.
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>

#include "audit/audit_emitter.hpp"
#include "common/types.hpp"
#include "guard/rate_limiter.hpp"
#include "pipeline/pipeline.hpp"
#include "policy/policy_engine.hpp"
#include "stats/stats_collector.hpp"

class Enforcer {
public:
    // emitter 는 필수 (nullptr 이면 std::invalid_argument).
    // limiter 가 nullptr 이면 InMemoryRateLimiter, stats 가 nullptr 이면 내부 StatsCollector.
    Enforcer(std::shared_ptr<PolicyEngine>     engine,
             std::shared_ptr<AuditEmitter>     emitter,
             std::shared_ptr<RateLimitBackend> limiter = nullptr,
             std::shared_ptr<StatsCollector>   stats   = nullptr);

    ~Enforcer() = default;

    Enforcer(const Enforcer&)            = delete;
    Enforcer& operator=(const Enforcer&) = delete;

    // enforce
    //   성공 시 툴 결과 (redact.enabled 이면 redaction 적용 후).
    [[nodiscard]] std::expected<Value, EnforceError> enforce(const ToolCall&     call,
                                                             const ToolFunction& tool) const;

    // run: enforce 와 같지만 PipelineOutcome 전체를 반환한다 (flags, duration 등).
    [[nodiscard]] PipelineOutcome run(const ToolCall& call, const ToolFunction& tool) const;

    [[nodiscard]] const StatsCollector& stats() const noexcept { return *stats_; }

private:
    std::shared_ptr<StatsCollector> stats_;
    Pipeline                        pipeline_;
};
