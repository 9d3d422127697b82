// ---------------------------------------------------------------------------
// rate_limiter.cpp
//
// [토큰 버킷 갱신]
//   elapsed = now - last_refill (음수면 0)
//   tokens  = min(capacity, tokens + elapsed * refill_rate)
//   tokens >= 1 이면 1 소비 후 허용, 아니면 거부.
//   거부 시 retry_after = (1 - tokens) / refill_rate.
//
// [키 조회]
//   기존 키: shared lock 으로 조회 후 버킷 mutex 만 잡는다.
//   새 키  : unique lock 으로 삽입 (double-checked).
//   unique_ptr<Bucket> 이므로 rehash 되어도 버킷 주소는 안정적이다.
// ---------------------------------------------------------------------------

#include "guard/rate_limiter.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace {

constexpr double kMinRefillPerSec = 0.1;

double bucket_capacity(const RateLimitConfig& cfg) {
    if (cfg.burst > 0) {
        return static_cast<double>(cfg.burst);
    }
    return static_cast<double>(std::max<std::uint32_t>(1, cfg.limit_per_minute));
}

double refill_per_sec(const RateLimitConfig& cfg) {
    return std::max(kMinRefillPerSec, static_cast<double>(cfg.limit_per_minute) / 60.0);
}

}  // namespace

InMemoryRateLimiter::InMemoryRateLimiter()
    : clock_([] { return Clock::now(); }) {}

InMemoryRateLimiter::InMemoryRateLimiter(ClockFunc clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
}

InMemoryRateLimiter::Bucket&
InMemoryRateLimiter::bucket_for(std::string_view scope_key, double capacity) {
    const std::string key(scope_key);
    {
        std::shared_lock lock(buckets_mutex_);
        const auto it = buckets_.find(key);
        if (it != buckets_.end()) {
            return *it->second;
        }
    }

    std::unique_lock lock(buckets_mutex_);
    auto [it, inserted] = buckets_.try_emplace(key, nullptr);
    if (inserted) {
        it->second              = std::make_unique<Bucket>();
        it->second->tokens      = capacity;
        it->second->last_refill = clock_();
        spdlog::debug("rate_limiter: new bucket '{}' capacity={}", key, capacity);
    }
    return *it->second;
}

RateLimitResult InMemoryRateLimiter::consume(std::string_view       scope_key,
                                             const RateLimitConfig& cfg) {
    const double capacity = bucket_capacity(cfg);
    const double rate     = refill_per_sec(cfg);

    Bucket& bucket = bucket_for(scope_key, capacity);

    std::lock_guard lock(bucket.mutex);

    const auto   now     = clock_();
    const double elapsed = std::max(
        0.0, std::chrono::duration<double>(now - bucket.last_refill).count());
    bucket.last_refill = now;
    bucket.tokens      = std::min(capacity, bucket.tokens + elapsed * rate);

    if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        return RateLimitResult{
            true,
            static_cast<std::uint64_t>(std::floor(bucket.tokens)),
            std::chrono::duration<double>{0.0}
        };
    }

    return RateLimitResult{
        false,
        0,
        std::chrono::duration<double>{(1.0 - bucket.tokens) / rate}
    };
}

std::size_t InMemoryRateLimiter::bucket_count() const {
    std::shared_lock lock(buckets_mutex_);
    return buckets_.size();
}

std::string make_scope_key(const ToolCall& call, const RateLimitConfig& cfg) {
    const std::string actor = call.actor.value_or("unknown");
    switch (cfg.scope) {
        case RateLimitScope::kActor:
            return "actor:" + actor;
        case RateLimitScope::kTool:
            return "tool:" + call.tool_name;
        case RateLimitScope::kActorTool:
            return "actor:" + actor + ":tool:" + call.tool_name;
        case RateLimitScope::kGlobal:
        default:
            return "global";
    }
}

Decision check_rate_limit(RateLimitBackend& backend, const ToolCall& call, const Policy& policy) {
    const auto& cfg = policy.rate_limit;
    if (!cfg.enabled || cfg.limit_per_minute == 0) {
        return Decision{true, "rate limit not enforced", policy.policy_id, std::nullopt,
                        DecisionLayer::kRateLimit};
    }

    const auto key    = make_scope_key(call, cfg);
    const auto result = backend.consume(key, cfg);
    if (result.allowed) {
        return Decision{true, "within rate limit", policy.policy_id, std::nullopt,
                        DecisionLayer::kRateLimit};
    }

    spdlog::info("rate_limiter: '{}' exceeded {} calls/min for tool '{}'",
                 key, cfg.limit_per_minute, call.tool_name);
    return Decision{
        false,
        "rate limit exceeded",
        policy.policy_id,
        fmt::format("Wait and retry after {:.2f}s.", result.retry_after.count()),
        DecisionLayer::kRateLimit
    };
}
