#pragma once

// ---------------------------------------------------------------------------
// pipeline.hpp
//
// 레이어 순서를 강제하는 상태 기계.
//   RATE_LIMIT → VALIDATE → AUTHORIZE → DETECT → EXECUTE → REDACT → AUDITED
//
// [Fail-close 원칙: 절대 위반 금지]
// 1. 어느 레이어든 allowed=false 이면 즉시 DENIED. 이후 레이어와 툴 호출은 건너뛴다.
// 2. 인가(AUTHORIZE) 성공 전에는 어떤 부작용(툴 호출 포함)도 발생하지 않는다.
// 3. 정책 스냅샷이 없거나, rate limit backend 나 레이어가 예외를 던지면 차단.
// 4. redaction 이 실패하면 결과를 돌려주지 않고 차단한다.
//
// [스냅샷]
// run() 은 시작 시 정책 스냅샷을 한 번 잡고 모든 레이어에 같은 스냅샷을 쓴다.
// 진행 중 reload 가 일어나도 한 호출 안에서 정책이 섞이지 않는다.
//
// [잠금]
// 툴 실행 중에는 어떤 lock 도 잡지 않는다. rate limiter 의 키 lock 은
// consume() 안에서만 유지된다.
// ---------------------------------------------------------------------------

#include <memory>

#include "audit/audit_emitter.hpp"
#include "common/types.hpp"
#include "guard/attack_detector.hpp"
#include "guard/rate_limiter.hpp"
#include "guard/redactor.hpp"
#include "pipeline/pipeline_types.hpp"
#include "policy/policy_engine.hpp"

class Pipeline {
public:
    // limiter 가 nullptr 이면 InMemoryRateLimiter 를 생성한다.
    // emitter 가 nullptr 이면 감사 이벤트를 전달하지 않는다 (audit_ok=false).
    Pipeline(std::shared_ptr<PolicyEngine>     engine,
             std::shared_ptr<RateLimitBackend> limiter = nullptr,
             std::shared_ptr<AuditEmitter>     emitter = nullptr);

    ~Pipeline() = default;

    Pipeline(const Pipeline&)            = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // run
    //   ToolCall 을 모든 레이어에 통과시키고, 종결 상태에서 감사 이벤트를
    //   정확히 한 번 전달한다.
    //   툴 콜러블이 던진 예외는 종류와 무관하게 ToolError 로 변환한다.
    [[nodiscard]] PipelineOutcome run(const ToolCall& call, const ToolFunction& tool) const;

private:
    // policy 가 nullptr 이면 emitter 의 기본 AuditConfig 로 기록한다.
    void finish(const ToolCall& call, PipelineOutcome& outcome,
                std::chrono::steady_clock::time_point started,
                const Policy* policy) const;

    std::shared_ptr<PolicyEngine>     engine_;
    std::shared_ptr<RateLimitBackend> limiter_;
    std::shared_ptr<AuditEmitter>     emitter_;
    AttackDetector                    detector_;
    Redactor                          redactor_;
};
