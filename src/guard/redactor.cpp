// ---------------------------------------------------------------------------
// redactor.cpp
//
// [PII 패턴]
// - email : \b[A-Z0-9._%+-]+@[A-Z0-9.-]+\.[A-Z]{2,}\b (icase)
// - phone : 국가번호(선택) + 3-3-4 자리. 구분자 '-', '.', 공백 허용.
//
// [입력 길이와 std::regex]
// libstdc++ regex 는 무제한 반복자('+')가 소비하는 문자마다 재귀한다.
// 수십 KB 문자열 하나로 스택이 넘칠 수 있으므로 email 패턴은 전체 문자열이
// 아니라 공백으로 나눈 토큰 단위로만 적용한다 (email 패턴은 공백을 포함하지
// 않으므로 결과는 동일하다).
// - '@' 가 없는 토큰은 정규식을 돌리지 않는다.
// - kMaxEmailTokenBytes 를 넘는 토큰에 '@' 가 있으면 토큰 전체를
//   [REDACTED_EMAIL] 로 바꾼다 (fail-close, 과잉 마스킹).
// phone 패턴은 반복 횟수가 모두 유한하므로 재귀 깊이가 입력 길이와 무관하다.
//
// [오탐/미탐 트레이드오프]
// - phone 패턴은 10자리 숫자 ID (주문번호 등) 도 가린다. 기본값이 off 인 이유.
// - 국제 형식 다양성(+44 20 ...)은 일부만 탐지한다.
// ---------------------------------------------------------------------------

#include "guard/redactor.hpp"

#include <algorithm>
#include <cctype>

namespace {

constexpr std::string_view kEllipsis = "\xE2\x80\xA6";  // U+2026

// RFC 5321 주소 최대 길이(254)에 앞뒤 구두점 여유를 더한 값
constexpr std::size_t kMaxEmailTokenBytes = 512;

bool is_token_space(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool is_utf8_continuation(unsigned char ch) {
    return (ch & 0xC0) == 0x80;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace

Redactor::Redactor()
    : email_re_(R"re(\b[A-Z0-9._%+-]+@[A-Z0-9.-]+\.[A-Z]{2,}\b)re",
                std::regex_constants::icase | std::regex_constants::ECMAScript)
    , phone_re_(R"re(\b(?:\+?\d{1,3}[-.\s]?)?(?:\(?\d{3}\)?[-.\s]?)\d{3}[-.\s]?\d{4}\b)re",
                std::regex_constants::ECMAScript) {}

bool Redactor::is_denied_key(std::string_view key, const std::vector<std::string>& deny_keys) {
    return std::any_of(deny_keys.begin(), deny_keys.end(),
                       [key](const std::string& dk) { return iequals(key, dk); });
}

std::string Redactor::redact_emails(std::string_view text) const {
    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        if (is_token_space(text[pos])) {
            out += text[pos++];
            continue;
        }
        std::size_t end = pos;
        while (end < text.size() && !is_token_space(text[end])) {
            ++end;
        }
        const std::string_view token = text.substr(pos, end - pos);
        if (token.find('@') == std::string_view::npos) {
            out += token;
        } else if (token.size() > kMaxEmailTokenBytes) {
            out += kRedactedEmailPlaceholder;
        } else {
            out += std::regex_replace(std::string(token), email_re_,
                                      std::string(kRedactedEmailPlaceholder));
        }
        pos = end;
    }
    return out;
}

std::string Redactor::redact_string(std::string_view text, const RedactConfig& cfg) const {
    std::string s = cfg.pii_emails ? redact_emails(text) : std::string(text);
    if (cfg.pii_phones) {
        s = std::regex_replace(s, phone_re_, std::string(kRedactedPhonePlaceholder));
    }
    return truncate_utf8(s, cfg.max_string_len);
}

Value Redactor::redact(const Value& value, const RedactConfig& cfg) const {
    switch (value.kind()) {
        case ValueKind::kString:
            return Value(redact_string(value.as_string(), cfg));

        case ValueKind::kArray: {
            Value::Array out;
            out.reserve(value.as_array().size());
            for (const auto& item : value.as_array()) {
                out.push_back(redact(item, cfg));
            }
            return Value(std::move(out));
        }

        case ValueKind::kObject: {
            Value::Object out;
            for (const auto& [key, child] : value.as_object()) {
                if (is_denied_key(key, cfg.deny_keys)) {
                    out.emplace(key, Value(kRedactedPlaceholder));
                } else {
                    out.emplace(key, redact(child, cfg));
                }
            }
            return Value(std::move(out));
        }

        case ValueKind::kNull:
        case ValueKind::kBool:
        case ValueKind::kInteger:
        case ValueKind::kDouble:
        default:
            return value;
    }
}

std::string truncate_utf8(std::string_view text, std::size_t max_bytes) {
    if (max_bytes == 0 || text.size() <= max_bytes) {
        return std::string(text);
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && is_utf8_continuation(static_cast<unsigned char>(text[cut]))) {
        --cut;
    }
    std::string out(text.substr(0, cut));
    out += kEllipsis;
    return out;
}
