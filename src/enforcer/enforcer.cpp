// ---------------------------------------------------------------------------
// enforcer.cpp
// ---------------------------------------------------------------------------

#include "enforcer/enforcer.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

std::shared_ptr<AuditEmitter> require_emitter(std::shared_ptr<AuditEmitter> emitter) {
    if (!emitter) {
        throw std::invalid_argument("Enforcer: audit emitter must not be null");
    }
    return emitter;
}

}  // namespace

Enforcer::Enforcer(std::shared_ptr<PolicyEngine>     engine,
                   std::shared_ptr<AuditEmitter>     emitter,
                   std::shared_ptr<RateLimitBackend> limiter,
                   std::shared_ptr<StatsCollector>   stats)
    : stats_(stats ? std::move(stats) : std::make_shared<StatsCollector>())
    , pipeline_(std::move(engine), std::move(limiter), require_emitter(std::move(emitter))) {}

PipelineOutcome Enforcer::run(const ToolCall& call, const ToolFunction& tool) const {
    PipelineOutcome outcome = pipeline_.run(call, tool);
    stats_->on_call(outcome);
    if (!outcome.audit_ok) {
        stats_->on_audit_failure();
    }
    return outcome;
}

std::expected<Value, EnforceError> Enforcer::enforce(const ToolCall& call, const ToolFunction& tool) const {
    PipelineOutcome outcome = run(call, tool);

    switch (outcome.status) {
        case OutcomeStatus::kOk:
            if (outcome.result.has_value()) {
                return std::move(*outcome.result);
            }
            // kOk 인데 결과가 없으면 내부 불변식 위반. 결과를 만들어내지 않고 차단으로 보고한다.
            spdlog::error("enforcer: tool '{}' completed without result", call.tool_name);
            return std::unexpected(EnforceError{
                EnforceErrorCode::kDenied, "result unavailable", outcome.decision.policy_id,
                DecisionLayer::kRedact, std::nullopt});

        case OutcomeStatus::kToolError:
            return std::unexpected(EnforceError{
                EnforceErrorCode::kToolFailure,
                outcome.tool_error ? outcome.tool_error->message : "tool execution failed",
                outcome.decision.policy_id,
                DecisionLayer::kExecute,
                std::nullopt});

        case OutcomeStatus::kDenied:
        default:
            return std::unexpected(EnforceError{
                EnforceErrorCode::kDenied,
                outcome.decision.reason,
                outcome.decision.policy_id,
                outcome.decision.layer,
                outcome.decision.remediation});
    }
}
