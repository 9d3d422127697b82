// ---------------------------------------------------------------------------
// audit_sink.cpp
// ---------------------------------------------------------------------------

#include "audit/audit_sink.hpp"

#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include "logger/structured_logger.hpp"

// ---------------------------------------------------------------------------
// LoggerAuditSink
// ---------------------------------------------------------------------------
LoggerAuditSink::LoggerAuditSink(std::shared_ptr<StructuredLogger> logger)
    : logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("LoggerAuditSink: logger must not be null");
    }
}

void LoggerAuditSink::write(const AuditEvent& event) {
    logger_->log_audit(event);
}

// ---------------------------------------------------------------------------
// AsyncAuditSink
// ---------------------------------------------------------------------------
AsyncAuditSink::AsyncAuditSink(std::shared_ptr<AuditSink> inner)
    : inner_(std::move(inner)) {
    if (!inner_) {
        throw std::invalid_argument("AsyncAuditSink: inner sink must not be null");
    }
}

AsyncAuditSink::~AsyncAuditSink() {
    shutdown();
}

void AsyncAuditSink::deliver(const AuditEvent& event) {
    try {
        inner_->write(event);
        delivered_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("audit_sink: async delivery failed for tool '{}': {}",
                      event.tool_name, e.what());
    }
}

void AsyncAuditSink::write(const AuditEvent& event) {
    {
        std::lock_guard lock(state_mutex_);
        if (!stopped_) {
            boost::asio::post(pool_, [this, copy = event]() { deliver(copy); });
            return;
        }
    }
    // 종료 후에는 호출 스레드에서 동기 전달. 이벤트를 버리지 않는다.
    inner_->write(event);
    delivered_.fetch_add(1, std::memory_order_relaxed);
}

void AsyncAuditSink::shutdown() {
    {
        std::lock_guard lock(state_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    // join() 은 이미 post 된 작업이 모두 끝난 뒤 반환한다.
    pool_.join();
    spdlog::debug("audit_sink: async sink stopped, delivered={}, failed={}",
                  delivered_count(), failed_count());
}
