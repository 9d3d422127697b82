#pragma once

// ---------------------------------------------------------------------------
// rate_limiter.hpp
//
// scope 키별 토큰 버킷 호출 제한.
//
// [설계 원칙]
// - RateLimitBackend 는 교체 가능한 인터페이스다. 분산 백엔드는 외부에서
//   구현하여 Pipeline 에 주입한다. 코어는 인터페이스에만 의존한다.
// - InMemoryRateLimiter 는 단일 프로세스용 기본 구현이다.
// - 버킷은 처음 보는 키에서 지연 생성되며 명시적으로 만료되지 않는다.
//
// [스레드 안전성]
// - 키별 mutex 로 refill + consume 을 보호한다.
//   서로 다른 키 사이에는 contention 이 없다 (버킷 맵 조회는 shared lock).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "common/types.hpp"
#include "policy/rule.hpp"

// ---------------------------------------------------------------------------
// RateLimitResult
//   remaining   : consume 이후 남은 토큰 (내림)
//   retry_after : 거부 시 토큰 1개가 찰 때까지의 예상 시간. 허용 시 0.
// ---------------------------------------------------------------------------
struct RateLimitResult {
    bool                          allowed{false};
    std::uint64_t                 remaining{0};
    std::chrono::duration<double> retry_after{0.0};
};

// ---------------------------------------------------------------------------
// RateLimitBackend
//   consume(scope_key, cfg): 토큰 하나를 소비할 수 있으면 allowed=true.
//   구현체는 concurrent 호출에 안전해야 한다.
//   예외를 던지면 Pipeline 이 fail-close 로 차단한다.
// ---------------------------------------------------------------------------
class RateLimitBackend {
public:
    virtual ~RateLimitBackend() = default;

    [[nodiscard]] virtual RateLimitResult consume(std::string_view       scope_key,
                                                  const RateLimitConfig& cfg) = 0;
};

// ---------------------------------------------------------------------------
// InMemoryRateLimiter
//   capacity    = burst (0 이면 max(1, limit_per_minute))
//   refill_rate = max(0.1, limit_per_minute / 60) tokens/sec
//   새 버킷은 가득 찬 상태로 시작한다.
//
//   clock 은 테스트에서 가짜 시계를 주입하기 위한 것이다.
// ---------------------------------------------------------------------------
class InMemoryRateLimiter final : public RateLimitBackend {
public:
    using Clock     = std::chrono::steady_clock;
    using ClockFunc = std::function<Clock::time_point()>;

    InMemoryRateLimiter();
    explicit InMemoryRateLimiter(ClockFunc clock);

    ~InMemoryRateLimiter() override = default;

    InMemoryRateLimiter(const InMemoryRateLimiter&)            = delete;
    InMemoryRateLimiter& operator=(const InMemoryRateLimiter&) = delete;
    InMemoryRateLimiter(InMemoryRateLimiter&&)                 = delete;
    InMemoryRateLimiter& operator=(InMemoryRateLimiter&&)      = delete;

    [[nodiscard]] RateLimitResult consume(std::string_view       scope_key,
                                          const RateLimitConfig& cfg) override;

    // bucket_count: 지금까지 생성된 버킷 수 (진단용)
    [[nodiscard]] std::size_t bucket_count() const;

private:
    struct Bucket {
        std::mutex        mutex;
        double            tokens{0.0};
        Clock::time_point last_refill{};
    };

    Bucket& bucket_for(std::string_view scope_key, double capacity);

    ClockFunc                                                clock_;
    mutable std::shared_mutex                                buckets_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Bucket>> buckets_;
};

// ---------------------------------------------------------------------------
// make_scope_key
//   kActor     → "actor:<actor>"
//   kTool      → "tool:<tool_name>"
//   kActorTool → "actor:<actor>:tool:<tool_name>"
//   kGlobal    → "global"
//   actor 가 없으면 "unknown" 으로 대체한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string make_scope_key(const ToolCall& call, const RateLimitConfig& cfg);

// ---------------------------------------------------------------------------
// check_rate_limit
//   Pipeline 의 RATE_LIMIT 단계. 비활성 또는 limit_per_minute == 0 이면 통과.
//   거부 시 reason "rate limit exceeded", remediation 에 retry-after 추정치.
//   backend 예외는 그대로 전파한다 (Pipeline 이 fail-close 처리).
// ---------------------------------------------------------------------------
[[nodiscard]] Decision check_rate_limit(RateLimitBackend& backend,
                                        const ToolCall&   call,
                                        const Policy&     policy);
