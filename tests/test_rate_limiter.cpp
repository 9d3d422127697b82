// ---------------------------------------------------------------------------
// test_rate_limiter.cpp
//
// InMemoryRateLimiter / check_rate_limit 단위 테스트.
//
// [테스트 범위]
// - limit_per_minute=60, burst=10: 10회 즉시 허용, 11번째 거부
// - 1초 후 토큰 약 1개 보충
// - burst=0 → capacity = limit_per_minute
// - 키 독립성, scope 키 생성 (actor 없음 → "unknown")
// - 거부 Decision: reason / remediation / layer
// - 비활성 또는 limit 0 → 통과
// - 동시 호출에서 토큰 초과 소비 없음
//
// 시계는 가짜 시계를 주입하여 실행 환경과 무관하게 결정적으로 테스트한다.
// ---------------------------------------------------------------------------

#include "guard/rate_limiter.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

class FakeClock {
public:
    InMemoryRateLimiter::Clock::time_point now() const { return now_; }
    void advance(std::chrono::milliseconds d) { now_ += d; }

private:
    InMemoryRateLimiter::Clock::time_point now_{InMemoryRateLimiter::Clock::time_point{} + 1h};
};

RateLimitConfig make_config(std::uint32_t limit, std::uint32_t burst,
                            RateLimitScope scope = RateLimitScope::kActor) {
    RateLimitConfig cfg{};
    cfg.enabled          = true;
    cfg.limit_per_minute = limit;
    cfg.burst            = burst;
    cfg.scope            = scope;
    return cfg;
}

ToolCall make_call(std::optional<std::string> actor, std::string tool = "get_user") {
    ToolCall call{};
    call.tool_name = std::move(tool);
    call.actor     = std::move(actor);
    return call;
}

}  // namespace

class RateLimiterTest : public ::testing::Test {
protected:
    FakeClock           clock_;
    InMemoryRateLimiter limiter_{[this] { return clock_.now(); }};
};

TEST_F(RateLimiterTest, BurstThenDeny) {
    const auto cfg = make_config(60, 10);
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(limiter_.consume("actor:a", cfg).allowed) << "call " << i;
    }
    const auto eleventh = limiter_.consume("actor:a", cfg);
    EXPECT_FALSE(eleventh.allowed);
    EXPECT_GT(eleventh.retry_after.count(), 0.0);
    EXPECT_LE(eleventh.retry_after.count(), 1.0);
}

TEST_F(RateLimiterTest, RefillAfterOneSecond) {
    const auto cfg = make_config(60, 10);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(limiter_.consume("actor:a", cfg).allowed);
    }
    ASSERT_FALSE(limiter_.consume("actor:a", cfg).allowed);

    clock_.advance(1000ms);
    EXPECT_TRUE(limiter_.consume("actor:a", cfg).allowed);
    EXPECT_FALSE(limiter_.consume("actor:a", cfg).allowed);
}

TEST_F(RateLimiterTest, RefillIsCappedAtBurst) {
    const auto cfg = make_config(60, 3);
    clock_.advance(10min);
    int allowed = 0;
    for (int i = 0; i < 10; ++i) {
        if (limiter_.consume("actor:a", cfg).allowed) {
            ++allowed;
        }
    }
    EXPECT_EQ(allowed, 3);
}

TEST_F(RateLimiterTest, ZeroBurstUsesLimitAsCapacity) {
    const auto cfg = make_config(5, 0);
    int allowed = 0;
    for (int i = 0; i < 10; ++i) {
        if (limiter_.consume("k", cfg).allowed) {
            ++allowed;
        }
    }
    EXPECT_EQ(allowed, 5);
}

TEST_F(RateLimiterTest, RemainingCountsDown) {
    const auto cfg = make_config(60, 3);
    EXPECT_EQ(limiter_.consume("k", cfg).remaining, 2u);
    EXPECT_EQ(limiter_.consume("k", cfg).remaining, 1u);
    EXPECT_EQ(limiter_.consume("k", cfg).remaining, 0u);
}

TEST_F(RateLimiterTest, KeysAreIndependent) {
    const auto cfg = make_config(60, 1);
    EXPECT_TRUE(limiter_.consume("actor:a", cfg).allowed);
    EXPECT_FALSE(limiter_.consume("actor:a", cfg).allowed);
    EXPECT_TRUE(limiter_.consume("actor:b", cfg).allowed);
    EXPECT_EQ(limiter_.bucket_count(), 2u);
}

TEST(RateLimiterScopeKey, AllScopes) {
    const auto call = make_call("alice", "search");
    EXPECT_EQ(make_scope_key(call, make_config(1, 1, RateLimitScope::kActor)), "actor:alice");
    EXPECT_EQ(make_scope_key(call, make_config(1, 1, RateLimitScope::kTool)), "tool:search");
    EXPECT_EQ(make_scope_key(call, make_config(1, 1, RateLimitScope::kActorTool)),
              "actor:alice:tool:search");
    EXPECT_EQ(make_scope_key(call, make_config(1, 1, RateLimitScope::kGlobal)), "global");
    EXPECT_EQ(make_scope_key(make_call(std::nullopt), make_config(1, 1)), "actor:unknown");
}

TEST_F(RateLimiterTest, CheckRateLimitDecision) {
    Policy policy{};
    policy.policy_id  = "p";
    policy.rate_limit = make_config(60, 1);

    const auto call = make_call("alice");
    EXPECT_TRUE(check_rate_limit(limiter_, call, policy).allowed);

    const auto denied = check_rate_limit(limiter_, call, policy);
    EXPECT_FALSE(denied.allowed);
    EXPECT_EQ(denied.reason, "rate limit exceeded");
    EXPECT_EQ(denied.layer, DecisionLayer::kRateLimit);
    EXPECT_EQ(denied.policy_id, "p");
    ASSERT_TRUE(denied.remediation.has_value());
    EXPECT_NE(denied.remediation->find("retry"), std::string::npos);
}

TEST_F(RateLimiterTest, DisabledOrZeroLimitPasses) {
    Policy policy{};
    policy.rate_limit         = make_config(0, 1);
    const auto call           = make_call("alice");
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(check_rate_limit(limiter_, call, policy).allowed);
    }

    policy.rate_limit         = make_config(60, 1);
    policy.rate_limit.enabled = false;
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(check_rate_limit(limiter_, call, policy).allowed);
    }
    EXPECT_EQ(limiter_.bucket_count(), 0u);
}

TEST(RateLimiterConcurrency, NoOverConsumptionUnderContention) {
    // 시계를 고정하여 보충이 일어나지 않게 한다
    const auto          fixed = InMemoryRateLimiter::Clock::now();
    InMemoryRateLimiter limiter([fixed] { return fixed; });
    const auto          cfg = make_config(60, 50);

    std::atomic<int>         allowed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                if (limiter.consume("shared", cfg).allowed) {
                    allowed.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(allowed.load(), 50);
}
