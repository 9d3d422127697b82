// ---------------------------------------------------------------------------
// test_stats_collector.cpp
//
// StatsCollector 단위 테스트.
//
// [테스트 범위]
// - 초기 상태 검증 (all-zero)
// - on_call: status 별 카운터 (ok / denied / tool_error)
// - flags 가 있는 호출은 flagged_calls 증가
// - on_audit_failure
// - snapshot(): deny_rate 계산, total == 0 시 0.0 (div-by-zero 방지)
// - ConcurrentAccess: 멀티스레드 동시성 (data race 미발생 확인)
//
// [스레드 안전성]
// StatsCollector 는 atomic 기반 헤더-온리 구현이므로 TSan 빌드에서
// 모든 동시성 테스트가 클린해야 한다.
// ---------------------------------------------------------------------------

#include "stats/stats_collector.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace {

PipelineOutcome outcome_with(OutcomeStatus status, std::vector<std::string> flags = {}) {
    PipelineOutcome outcome{};
    outcome.status = status;
    outcome.flags  = std::move(flags);
    return outcome;
}

}  // namespace

// ---------------------------------------------------------------------------
// InitialState_AllZero
// ---------------------------------------------------------------------------
TEST(StatsCollector, InitialState_AllZero) {
    StatsCollector stats;
    const auto snap = stats.snapshot();

    EXPECT_EQ(snap.total_calls,    0u);
    EXPECT_EQ(snap.allowed_calls,  0u);
    EXPECT_EQ(snap.denied_calls,   0u);
    EXPECT_EQ(snap.tool_failures,  0u);
    EXPECT_EQ(snap.flagged_calls,  0u);
    EXPECT_EQ(snap.audit_failures, 0u);
    EXPECT_NEAR(snap.deny_rate, 0.0, 1e-9) << "deny_rate must be 0.0 at init";
}

// ---------------------------------------------------------------------------
// OnCall_CountsByStatus
//   tool_error 는 정책상 허용된 호출이므로 allowed_calls 에도 포함된다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnCall_CountsByStatus) {
    StatsCollector stats;

    stats.on_call(outcome_with(OutcomeStatus::kOk));
    stats.on_call(outcome_with(OutcomeStatus::kOk));
    stats.on_call(outcome_with(OutcomeStatus::kDenied));
    stats.on_call(outcome_with(OutcomeStatus::kToolError));

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_calls,   4u);
    EXPECT_EQ(snap.allowed_calls, 3u);
    EXPECT_EQ(snap.denied_calls,  1u);
    EXPECT_EQ(snap.tool_failures, 1u);
}

TEST(StatsCollector, FlaggedCallsCounted) {
    StatsCollector stats;
    stats.on_call(outcome_with(OutcomeStatus::kOk, {"sql_injection:query"}));
    stats.on_call(outcome_with(OutcomeStatus::kOk));

    EXPECT_EQ(stats.snapshot().flagged_calls, 1u);
}

TEST(StatsCollector, AuditFailuresCounted) {
    StatsCollector stats;
    stats.on_audit_failure();
    stats.on_audit_failure();
    EXPECT_EQ(stats.snapshot().audit_failures, 2u);
    EXPECT_EQ(stats.snapshot().total_calls, 0u);
}

// ---------------------------------------------------------------------------
// Snapshot_DenyRate
//   4회 중 1회 차단 → 0.25
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_DenyRate) {
    StatsCollector stats;
    for (int i = 0; i < 3; ++i) {
        stats.on_call(outcome_with(OutcomeStatus::kOk));
    }
    stats.on_call(outcome_with(OutcomeStatus::kDenied));

    const auto snap = stats.snapshot();
    EXPECT_NEAR(snap.deny_rate, 0.25, 1e-9);
    EXPECT_NE(snap.captured_at.time_since_epoch().count(), 0);
}

// ---------------------------------------------------------------------------
// ConcurrentAccess
//   8 스레드 × 1000 회 on_call. 합계가 정확해야 한다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, ConcurrentAccess) {
    StatsCollector stats;

    constexpr int kThreads = 8;
    constexpr int kIters   = 1000;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&stats, t] {
            const auto status = (t % 2 == 0) ? OutcomeStatus::kOk : OutcomeStatus::kDenied;
            for (int i = 0; i < kIters; ++i) {
                stats.on_call(outcome_with(status));
                (void)stats.snapshot();
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_calls,   static_cast<std::uint64_t>(kThreads * kIters));
    EXPECT_EQ(snap.allowed_calls, static_cast<std::uint64_t>(kThreads / 2 * kIters));
    EXPECT_EQ(snap.denied_calls,  static_cast<std::uint64_t>(kThreads / 2 * kIters));
    EXPECT_NEAR(snap.deny_rate, 0.5, 1e-9);
}
