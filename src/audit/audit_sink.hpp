#pragma once

// ---------------------------------------------------------------------------
// audit_sink.hpp
//
// 감사 이벤트 전달 대상 (외부 콜라보레이터 인터페이스).
// 코어의 계약은 "호출당 이벤트 하나를 전달한다" 이며,
// 전송/저장 방식은 sink 구현의 책임이다.
//
// [제공 구현]
// - LoggerAuditSink : StructuredLogger 로 JSON 라인 기록
// - AsyncAuditSink  : Boost.Asio thread_pool 에서 내부 sink 로 전달.
//                     느린 sink 가 툴 호출 경로를 막지 않게 한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include <boost/asio/thread_pool.hpp>

#include "audit/audit_event.hpp"

class StructuredLogger;

// ---------------------------------------------------------------------------
// AuditSink
//   write() 는 실패 시 예외를 던질 수 있다. AuditEmitter 가 잡아서 기록한다.
//   구현체는 concurrent 호출에 안전해야 한다.
// ---------------------------------------------------------------------------
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void write(const AuditEvent& event) = 0;
};

// ---------------------------------------------------------------------------
// LoggerAuditSink
// ---------------------------------------------------------------------------
class LoggerAuditSink final : public AuditSink {
public:
    explicit LoggerAuditSink(std::shared_ptr<StructuredLogger> logger);

    void write(const AuditEvent& event) override;

private:
    std::shared_ptr<StructuredLogger> logger_;
};

// ---------------------------------------------------------------------------
// AsyncAuditSink
//   write() 는 이벤트를 복사해 post 하고 즉시 반환한다.
//   내부 sink 예외는 워커에서 잡아 spdlog::error 로 기록하고 failed_count 를 올린다.
//
//   [순서]
//   워커 스레드 1개이므로 이벤트 순서가 보존된다.
//
//   [종료]
//   shutdown() / 소멸자는 대기 중인 이벤트를 모두 전달한 뒤 반환한다.
//   shutdown 이후 write() 는 호출 스레드에서 동기 전달한다.
// ---------------------------------------------------------------------------
class AsyncAuditSink final : public AuditSink {
public:
    explicit AsyncAuditSink(std::shared_ptr<AuditSink> inner);

    ~AsyncAuditSink() override;

    AsyncAuditSink(const AsyncAuditSink&)            = delete;
    AsyncAuditSink& operator=(const AsyncAuditSink&) = delete;
    AsyncAuditSink(AsyncAuditSink&&)                 = delete;
    AsyncAuditSink& operator=(AsyncAuditSink&&)      = delete;

    void write(const AuditEvent& event) override;

    // shutdown: 대기 중인 이벤트를 flush 하고 워커를 종료한다. 멱등.
    void shutdown();

    [[nodiscard]] std::uint64_t delivered_count() const noexcept {
        return delivered_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] std::uint64_t failed_count() const noexcept {
        return failed_.load(std::memory_order_relaxed);
    }

private:
    void deliver(const AuditEvent& event);

    std::shared_ptr<AuditSink>  inner_;
    boost::asio::thread_pool    pool_{1};
    std::mutex                  state_mutex_;   // stopped_ 확인과 post 를 원자적으로
    bool                        stopped_{false};
    std::atomic<std::uint64_t>  delivered_{0};
    std::atomic<std::uint64_t>  failed_{0};
};
