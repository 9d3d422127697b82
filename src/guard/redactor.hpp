#pragma once

// ---------------------------------------------------------------------------
// redactor.hpp
//
// 툴 결과 값의 민감 정보 제거. 결과가 호출자에게 돌아가기 전 마지막 레이어.
// AuditEmitter 도 raised verbosity 에서 인자/결과를 기록하기 전에 사용한다.
//
// [처리 순서]
// 1. 키 기반: object 의 키가 deny_keys 와 대소문자 무관 일치하면 값을 "[REDACTED]" 로 교체
// 2. 패턴 기반: 문자열 leaf 의 이메일 → "[REDACTED_EMAIL]",
//    전화번호 → "[REDACTED_PHONE]" (pii_phones 일 때만)
// 3. 길이 제한: max_string_len 바이트 초과 문자열을 자르고 "…" 를 붙인다.
//    PII 치환 이후에 적용하므로 잘린 조각으로 이메일 일부가 노출되지 않는다.
//
// [구조 보존]
// container 형태와 일치하지 않는 값은 그대로 유지한다. 키를 제거하지 않는다.
// ---------------------------------------------------------------------------

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "common/value.hpp"
#include "policy/rule.hpp"

inline constexpr std::string_view kRedactedPlaceholder      = "[REDACTED]";
inline constexpr std::string_view kRedactedEmailPlaceholder = "[REDACTED_EMAIL]";
inline constexpr std::string_view kRedactedPhonePlaceholder = "[REDACTED_PHONE]";

class Redactor {
public:
    // 생성자에서 PII 정규식을 컴파일한다. 인스턴스를 재사용할 것.
    Redactor();

    ~Redactor() = default;

    Redactor(const Redactor&)            = delete;
    Redactor& operator=(const Redactor&) = delete;

    // redact
    //   cfg.enabled 는 보지 않는다 (호출자가 판단).
    //   std::regex 내부 오류(std::regex_error) 는 전파한다. Pipeline 은 이를
    //   fail-close 로 처리하여 결과를 돌려주지 않는다.
    [[nodiscard]] Value redact(const Value& value, const RedactConfig& cfg) const;

    // redact_string: 단일 문자열에 패턴 치환 + 길이 제한 적용
    [[nodiscard]] std::string redact_string(std::string_view text, const RedactConfig& cfg) const;

    // is_denied_key: 대소문자 무관 비교
    [[nodiscard]] static bool is_denied_key(std::string_view key,
                                            const std::vector<std::string>& deny_keys);

private:
    // 공백 단위 토큰에만 email 정규식을 적용한다.
    [[nodiscard]] std::string redact_emails(std::string_view text) const;

    std::regex email_re_;
    std::regex phone_re_;
};

// truncate_utf8
//   max_bytes 이하로 자르되 UTF-8 멀티바이트 문자 중간에서 자르지 않는다.
//   잘렸으면 "…" 를 붙인다. max_bytes == 0 이면 원문 그대로.
[[nodiscard]] std::string truncate_utf8(std::string_view text, std::size_t max_bytes);
