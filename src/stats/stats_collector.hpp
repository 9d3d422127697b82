#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 집행(enforcement) 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_call: 툴 호출 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 조회 경로. 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 수집 실패가 툴 호출 실패로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
//
// [일관성]
// - 카운터마다 개별 relaxed 로드이므로 snapshot 사이의 합계가
//   순간적으로 어긋날 수 있다 (모니터링 용도로 충분).
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

#include "pipeline/pipeline_types.hpp"

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   deny_rate: denied_calls / total_calls (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                         total_calls{0};
    std::uint64_t                         allowed_calls{0};
    std::uint64_t                         denied_calls{0};
    std::uint64_t                         tool_failures{0};
    std::uint64_t                         flagged_calls{0};
    std::uint64_t                         audit_failures{0};
    double                                deny_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

// ---------------------------------------------------------------------------
// StatsCollector
// ---------------------------------------------------------------------------
class StatsCollector {
public:
    StatsCollector() noexcept = default;

    ~StatsCollector() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    // on_call
    //   파이프라인 종결 시 호출.
    //   allowed_calls 는 툴 실행까지 도달한 호출 (툴 실패 포함).
    void on_call(const PipelineOutcome& outcome) noexcept {
        total_calls_.fetch_add(1, std::memory_order_relaxed);
        switch (outcome.status) {
            case OutcomeStatus::kDenied:
                denied_calls_.fetch_add(1, std::memory_order_relaxed);
                break;
            case OutcomeStatus::kToolError:
                allowed_calls_.fetch_add(1, std::memory_order_relaxed);
                tool_failures_.fetch_add(1, std::memory_order_relaxed);
                break;
            case OutcomeStatus::kOk:
            default:
                allowed_calls_.fetch_add(1, std::memory_order_relaxed);
                break;
        }
        if (!outcome.flags.empty()) {
            flagged_calls_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // on_audit_failure: 감사 sink 전달 실패
    void on_audit_failure() noexcept {
        audit_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto total   = total_calls_.load(std::memory_order_relaxed);
        const auto denied  = denied_calls_.load(std::memory_order_relaxed);

        double deny_rate = 0.0;
        if (total > 0) {
            deny_rate = static_cast<double>(denied) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_calls    = total,
            .allowed_calls  = allowed_calls_.load(std::memory_order_relaxed),
            .denied_calls   = denied,
            .tool_failures  = tool_failures_.load(std::memory_order_relaxed),
            .flagged_calls  = flagged_calls_.load(std::memory_order_relaxed),
            .audit_failures = audit_failures_.load(std::memory_order_relaxed),
            .deny_rate      = deny_rate,
            .captured_at    = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_calls_{0};
    std::atomic<std::uint64_t> allowed_calls_{0};
    std::atomic<std::uint64_t> denied_calls_{0};
    std::atomic<std::uint64_t> tool_failures_{0};
    std::atomic<std::uint64_t> flagged_calls_{0};
    std::atomic<std::uint64_t> audit_failures_{0};
};
