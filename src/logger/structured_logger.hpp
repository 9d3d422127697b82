#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
//   spdlog 전역 레지스트리에 등록하지 않으므로 인스턴스를 여러 개 만들어도 충돌하지 않는다.
// - 감사 이벤트 하나를 JSON 한 줄로 기록한다 (log_audit).
// - 이벤트에 담긴 값은 AuditEmitter 가 이미 redaction 한 상태다.
//   로거는 추가 가공 없이 직렬화만 한다.
//
// [레벨]
// - 허용/툴 실패 이벤트 → info, 차단 이벤트 → warn.
//   min_level 미만은 기록하지 않는다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}

struct AuditEvent;

// ---------------------------------------------------------------------------
// StructuredLogger
//   AuditEvent 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   console   : true 이면 stdout sink 도 추가한다.
    //   spdlog 초기화 실패 시 std::runtime_error.
    StructuredLogger(LogLevel min_level,
                     const std::filesystem::path& log_path,
                     bool console = true);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_audit
    //   감사 이벤트를 JSON 한 줄로 기록한다.
    //   [고빈도 호출 경로] 툴 호출마다 한 번 호출된다.
    void log_audit(const AuditEvent& event);

    // 내부 진단용 spdlog 래퍼
    //   툴 인자/결과 값을 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // flush: 파일 sink 를 즉시 비운다.
    void flush();

private:
    [[nodiscard]] static int to_spdlog_level(LogLevel level);

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
