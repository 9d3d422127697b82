// ---------------------------------------------------------------------------
// audit_emitter.cpp
// ---------------------------------------------------------------------------

#include "audit/audit_emitter.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

AuditEmitter::AuditEmitter(AuditConfig config, std::shared_ptr<AuditSink> sink)
    : config_(std::move(config))
    , sink_(std::move(sink)) {
    if (!sink_) {
        throw std::invalid_argument("AuditEmitter: sink must not be null");
    }
}

AuditEvent AuditEmitter::build_event(const ToolCall& call, const PipelineOutcome& outcome) const {
    return build_event(call, outcome, config_);
}

AuditEvent AuditEmitter::build_event(const ToolCall& call, const PipelineOutcome& outcome,
                                     const AuditConfig& config) const {
    AuditEvent event{};
    event.timestamp   = std::chrono::system_clock::now();
    event.tool_name   = call.tool_name;
    event.decision    = outcome.decision.allowed ? "allow" : "deny";
    event.reason      = outcome.decision.reason;
    event.policy_id   = outcome.decision.policy_id;
    event.actor       = call.actor;
    event.request_id  = call.request_id;
    event.layer       = outcome.decision.layer;
    event.status      = std::string(status_to_string(outcome.status));
    event.latency_ms  = std::chrono::duration<double, std::milli>(outcome.duration).count();
    event.flags       = outcome.flags;
    event.remediation = outcome.decision.remediation;

    // ValueMap 은 키 정렬 → argument_keys 도 정렬됨
    event.argument_keys.reserve(call.arguments.size());
    for (const auto& [key, value] : call.arguments) {
        event.argument_keys.push_back(key);
    }
    event.argument_count = call.arguments.size();

    if (!config.include_argument_values && !config.include_result) {
        return event;
    }

    // 감사 레코드용 값 redaction: deny_keys + 이메일. 길이 제한은 기본값.
    RedactConfig value_redaction{};
    value_redaction.enabled    = true;
    value_redaction.deny_keys  = config.deny_keys;
    value_redaction.pii_emails = true;

    if (config.include_argument_values) {
        event.arguments = redactor_.redact(Value(call.arguments), value_redaction);
    }
    if (config.include_result && outcome.result.has_value()) {
        event.result = redactor_.redact(*outcome.result, value_redaction);
    }
    return event;
}

bool AuditEmitter::emit(const ToolCall& call, const PipelineOutcome& outcome) const {
    return emit(call, outcome, config_);
}

bool AuditEmitter::emit(const ToolCall& call, const PipelineOutcome& outcome,
                        const AuditConfig& config) const {
    try {
        sink_->write(build_event(call, outcome, config));
        return true;
    } catch (const std::exception& e) {
        spdlog::error("audit_emitter: failed to emit audit event for tool '{}': {}",
                      call.tool_name, e.what());
        return false;
    } catch (...) {
        spdlog::error("audit_emitter: failed to emit audit event for tool '{}': non-standard exception",
                      call.tool_name);
        return false;
    }
}
