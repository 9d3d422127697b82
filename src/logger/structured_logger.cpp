// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "audit/audit_event.hpp"

namespace {

// 레지스트리에 등록하지 않지만 진단 출력에서 인스턴스를 구분하기 위해 번호를 붙인다.
std::atomic<std::uint64_t> g_logger_seq{0};

}  // namespace

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
int StructuredLogger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return static_cast<int>(spdlog::level::debug);
        case LogLevel::kInfo:
            return static_cast<int>(spdlog::level::info);
        case LogLevel::kWarn:
            return static_cast<int>(spdlog::level::warn);
        case LogLevel::kError:
            return static_cast<int>(spdlog::level::err);
        default:
            return static_cast<int>(spdlog::level::info);
    }
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path,
                                   bool console)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        // 로그 디렉터리 생성
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;

        if (console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;  // 100MB
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        const auto name = fmt::format("toolgate-audit-{}", g_logger_seq.fetch_add(1));
        logger_ = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger_->set_level(static_cast<spdlog::level::level_enum>(to_spdlog_level(min_level)));

        // 감사 라인은 JSON 자체에 timestamp 가 있으므로 prefix 는 최소화한다.
        logger_->set_pattern("%v");

        // 감사 기록 유실 방지: 매 로그마다 플러시
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_audit: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_audit(const AuditEvent& event) {
    if (!logger_) {
        return;
    }

    const bool denied = event.decision == "deny";
    const auto needed = denied ? LogLevel::kWarn : LogLevel::kInfo;
    if (static_cast<int>(min_level_) > static_cast<int>(needed)) {
        return;
    }

    const std::string json = event.to_json();
    if (denied) {
        logger_->warn(json);
    } else {
        logger_->info(json);
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
