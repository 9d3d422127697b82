// ---------------------------------------------------------------------------
// pipeline.cpp
//
// [레이어 예외 처리]
// 각 레이어 호출은 guarded() 로 감싼다. 예외(std::exception 이 아닌 것 포함)가
// 나오면 해당 레이어의 fail-close 차단 Decision 으로 바꾼다. 예외 메시지는 로그에만 남기고
// reason 에는 넣지 않는다 (내부 정보 노출 방지).
//
// [툴 실패]
// ToolError 반환 또는 툴이 던진 예외는 ToolExecutionFailure 로 처리한다.
// std::exception 이 아닌 예외는 "unknown exception" 메시지로 바꾼다.
// 정책 차단과 구분되며 (status=tool_error), 감사 이벤트는 그대로 한 번 기록된다.
// ---------------------------------------------------------------------------

#include "pipeline/pipeline.hpp"

#include <exception>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "guard/validator.hpp"

std::string_view stage_to_string(PipelineStage stage) noexcept {
    switch (stage) {
        case PipelineStage::kStart:     return "START";
        case PipelineStage::kRateLimit: return "RATE_LIMIT";
        case PipelineStage::kValidate:  return "VALIDATE";
        case PipelineStage::kAuthorize: return "AUTHORIZE";
        case PipelineStage::kDetect:    return "DETECT";
        case PipelineStage::kExecute:   return "EXECUTE";
        case PipelineStage::kRedact:    return "REDACT";
        case PipelineStage::kAudited:   return "AUDITED";
        case PipelineStage::kDenied:    return "DENIED";
        default:                        return "UNKNOWN";
    }
}

std::string_view status_to_string(OutcomeStatus status) noexcept {
    switch (status) {
        case OutcomeStatus::kOk:        return "ok";
        case OutcomeStatus::kDenied:    return "denied";
        case OutcomeStatus::kToolError: return "tool_error";
        default:                        return "unknown";
    }
}

namespace {

template <typename LayerFn>
Decision guarded(DecisionLayer layer, std::string_view failure_reason,
                 const Policy& policy, const ToolCall& call, LayerFn&& fn) {
    try {
        return std::forward<LayerFn>(fn)();
    } catch (const std::exception& e) {
        spdlog::error("pipeline: {} layer failed for tool '{}', denying (fail-close): {}",
                      layer_to_string(layer), call.tool_name, e.what());
        return Decision{false, std::string(failure_reason), policy.policy_id, std::nullopt, layer};
    } catch (...) {
        spdlog::error("pipeline: {} layer threw a non-standard exception for tool '{}', "
                      "denying (fail-close)", layer_to_string(layer), call.tool_name);
        return Decision{false, std::string(failure_reason), policy.policy_id, std::nullopt, layer};
    }
}

}  // namespace

Pipeline::Pipeline(std::shared_ptr<PolicyEngine>     engine,
                   std::shared_ptr<RateLimitBackend> limiter,
                   std::shared_ptr<AuditEmitter>     emitter)
    : engine_(std::move(engine))
    , limiter_(std::move(limiter))
    , emitter_(std::move(emitter)) {
    if (!limiter_) {
        limiter_ = std::make_shared<InMemoryRateLimiter>();
    }
    if (!engine_) {
        spdlog::warn("pipeline: constructed without policy engine: all tool calls will be denied (fail-close)");
    }
}

void Pipeline::finish(const ToolCall& call, PipelineOutcome& outcome,
                      std::chrono::steady_clock::time_point started,
                      const Policy* policy) const {
    outcome.duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (outcome.status != OutcomeStatus::kDenied) {
        outcome.final_stage = PipelineStage::kAudited;
    }

    if (emitter_) {
        // 정책 스냅샷이 있으면 그 audit 블록을 따른다 (reload 반영).
        outcome.audit_ok = policy ? emitter_->emit(call, outcome, policy->audit)
                                  : emitter_->emit(call, outcome);
    }

    spdlog::debug("pipeline: tool '{}' finished at {} ({}), layer={}, {}us",
                  call.tool_name, stage_to_string(outcome.final_stage),
                  status_to_string(outcome.status), layer_to_string(outcome.decision.layer),
                  outcome.duration.count());
}

PipelineOutcome Pipeline::run(const ToolCall& call, const ToolFunction& tool) const {
    const auto started = std::chrono::steady_clock::now();

    PipelineOutcome outcome{};
    outcome.final_stage = PipelineStage::kStart;

    // 한 호출 동안 같은 정책 스냅샷을 사용한다.
    const auto policy = engine_ ? engine_->snapshot() : nullptr;

    auto deny = [&](Decision decision) {
        outcome.final_stage = PipelineStage::kDenied;
        outcome.status      = OutcomeStatus::kDenied;
        outcome.decision    = std::move(decision);
        outcome.result.reset();
        finish(call, outcome, started, policy.get());
        return outcome;
    };

    if (!policy) {
        spdlog::error("pipeline: no policy loaded, denying tool '{}' (fail-close)", call.tool_name);
        return deny(Decision{false, "policy unavailable", "", std::nullopt, DecisionLayer::kNone});
    }

    // RATE_LIMIT
    outcome.final_stage = PipelineStage::kRateLimit;
    Decision decision = guarded(DecisionLayer::kRateLimit, "rate limit backend unavailable",
                                *policy, call,
                                [&] { return check_rate_limit(*limiter_, call, *policy); });
    if (!decision.allowed) {
        return deny(std::move(decision));
    }

    // VALIDATE
    outcome.final_stage = PipelineStage::kValidate;
    decision = guarded(DecisionLayer::kValidate, "argument validation failed", *policy, call,
                       [&] { return Validator::validate(call, *policy); });
    if (!decision.allowed) {
        return deny(std::move(decision));
    }

    // AUTHORIZE
    outcome.final_stage = PipelineStage::kAuthorize;
    Decision authorization = guarded(DecisionLayer::kAuthorize, "policy evaluation failed",
                                     *policy, call,
                                     [&] { return PolicyEngine::evaluate(*policy, call); });
    if (!authorization.allowed) {
        return deny(std::move(authorization));
    }

    // DETECT
    outcome.final_stage = PipelineStage::kDetect;
    const auto& detect_cfg = policy->detect_attacks;
    if (detect_cfg.enabled) {
        decision = guarded(DecisionLayer::kDetectAttacks, "attack detection failed", *policy, call, [&] {
            const auto scan = detector_.scan(call, detect_cfg);
            if (!scan.detected) {
                return Decision{true, "no attack pattern detected", policy->policy_id,
                                std::nullopt, DecisionLayer::kDetectAttacks};
            }
            if (detect_cfg.on_detect == OnDetect::kFlag) {
                // 허용하되 신호는 감사 이벤트로 남긴다.
                outcome.flags.push_back(
                    fmt::format("{}:{}", category_to_string(scan.category), scan.field));
                return Decision{true, scan.reason(), policy->policy_id,
                                std::nullopt, DecisionLayer::kDetectAttacks};
            }
            return Decision{false, scan.reason(), policy->policy_id,
                            "Remove suspicious patterns from arguments.",
                            DecisionLayer::kDetectAttacks};
        });
        if (!decision.allowed) {
            return deny(std::move(decision));
        }
    }

    // EXECUTE (lock 을 잡지 않은 상태)
    outcome.final_stage = PipelineStage::kExecute;
    ToolResult tool_result = std::unexpected(ToolError{"tool callable is empty"});
    if (tool) {
        outcome.tool_invoked = true;
        try {
            tool_result = tool(call.arguments);
        } catch (const std::exception& e) {
            tool_result = std::unexpected(ToolError{e.what()});
        } catch (...) {
            tool_result = std::unexpected(ToolError{"unknown exception"});
        }
    }

    if (!tool_result) {
        spdlog::warn("pipeline: tool '{}' execution failed: {}",
                     call.tool_name, tool_result.error().message);
        outcome.status     = OutcomeStatus::kToolError;
        outcome.tool_error = tool_result.error();
        outcome.decision   = Decision{true, "tool execution failed", policy->policy_id,
                                      std::nullopt, DecisionLayer::kExecute};
        finish(call, outcome, started, policy.get());
        return outcome;
    }

    // REDACT
    outcome.final_stage = PipelineStage::kRedact;
    if (policy->redact.enabled) {
        try {
            outcome.result = redactor_.redact(*tool_result, policy->redact);
        } catch (const std::exception& e) {
            spdlog::error("pipeline: redaction failed for tool '{}', withholding result (fail-close): {}",
                          call.tool_name, e.what());
            return deny(Decision{false, "result redaction failed", policy->policy_id,
                                 std::nullopt, DecisionLayer::kRedact});
        } catch (...) {
            spdlog::error("pipeline: redaction threw a non-standard exception for tool '{}', "
                          "withholding result (fail-close)", call.tool_name);
            return deny(Decision{false, "result redaction failed", policy->policy_id,
                                 std::nullopt, DecisionLayer::kRedact});
        }
    } else {
        outcome.result = std::move(*tool_result);
    }

    outcome.status   = OutcomeStatus::kOk;
    outcome.decision = std::move(authorization);
    finish(call, outcome, started, policy.get());
    return outcome;
}
