#pragma once

// ---------------------------------------------------------------------------
// audit_emitter.hpp
//
// PipelineOutcome 을 안전한 기본값의 AuditEvent 로 변환하여 sink 에 전달한다.
//
// [설계 원칙]
// - "무엇을 기록하지 않는가" 는 AuditConfig 로만 결정한다.
//   전역 기본값에 의존하지 않는다.
// - Pipeline 은 호출마다 정책 스냅샷의 audit 블록을 넘긴다. 따라서 reload 후
//   새 정책의 verbosity/deny_keys 가 다음 호출부터 적용된다. 생성자에 준
//   config 는 스냅샷이 없을 때(정책 미로드 차단)와 단독 사용 시의 기본값이다.
// - verbosity 를 올려도 값은 deny_keys + 이메일 redaction 을 거친 뒤 기록된다.
// - sink 실패는 툴 호출 결과를 바꾸지 않는다. emit() 이 false 를 반환하고
//   오류를 로깅한다 (통계에서 audit_failures 로 집계).
// ---------------------------------------------------------------------------

#include <memory>

#include "audit/audit_event.hpp"
#include "audit/audit_sink.hpp"
#include "common/types.hpp"
#include "guard/redactor.hpp"
#include "pipeline/pipeline_types.hpp"
#include "policy/rule.hpp"

class AuditEmitter {
public:
    AuditEmitter(AuditConfig config, std::shared_ptr<AuditSink> sink);

    ~AuditEmitter() = default;

    AuditEmitter(const AuditEmitter&)            = delete;
    AuditEmitter& operator=(const AuditEmitter&) = delete;

    // build_event: 전달 없이 이벤트만 구성한다. config 를 생략하면 config() 사용.
    [[nodiscard]] AuditEvent build_event(const ToolCall& call, const PipelineOutcome& outcome) const;
    [[nodiscard]] AuditEvent build_event(const ToolCall& call, const PipelineOutcome& outcome,
                                         const AuditConfig& config) const;

    // emit: build_event + sink 전달. sink 가 예외를 던지면 false.
    [[nodiscard]] bool emit(const ToolCall& call, const PipelineOutcome& outcome) const;
    [[nodiscard]] bool emit(const ToolCall& call, const PipelineOutcome& outcome,
                            const AuditConfig& config) const;

    [[nodiscard]] const AuditConfig& config() const noexcept { return config_; }

private:
    AuditConfig                config_;
    std::shared_ptr<AuditSink> sink_;
    Redactor                   redactor_;
};
