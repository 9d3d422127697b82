#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템 공통 타입.
//
// [순환 의존성 방지 설계]
// - 감사 이벤트 구조체(AuditEvent)는 audit/ 에 있으며 로거는 전방 선언만 한다.
// ---------------------------------------------------------------------------

#include <cstdint>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. 설정에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};
