#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML/JSON 정책 문서를 로드하여 불변 Policy 로 파싱하는 로더.
// (yaml-cpp 는 JSON 문서도 YAML flow 스타일로 파싱한다.)
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환 (ConfigurationError).
//   호출자는 실패 시 반드시 기존 정책을 유지하거나 모든 호출을 차단해야 한다.
// - 설정 오류는 로드 시점에만 발생한다. 호출 시점에는 발생하지 않는다.
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp (단방향만)
//
// [보안 고려사항]
// - 파싱 실패 원인은 로깅하되, 문서 전체를 로그에 출력하지 말 것
//   (정책 문서에 민감 리터럴이 있을 수 있음).
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "policy/rule.hpp"

// ---------------------------------------------------------------------------
// PolicyLoader
// ---------------------------------------------------------------------------
class PolicyLoader {
public:
    PolicyLoader()  = delete;

    // load
    //   지정된 경로의 YAML/JSON 파일을 읽어 Policy 로 파싱한다.
    //
    //   [all-or-nothing]
    //   파일 없음, 파싱 오류, 스키마 불일치 모두 실패로 처리한다.
    //   부분적으로 파싱된 정책을 반환하지 않는다.
    //
    //   [로드 시 검증 항목]
    //   - policy_id / version 필수, default 는 allow|deny
    //   - 규칙의 tool 필수
    //   - constraint type 은 string|integer|number|boolean
    //   - pattern 은 컴파일 가능해야 함 (로드 시점에 컴파일하여 보관)
    //   - min <= max, enum 항목은 스칼라
    //   - rate_limit.scope 는 actor|tool|actor+tool|global
    //   - detect_attacks.on_detect 는 deny|flag (allow 는 flag 의 별칭)
    [[nodiscard]] static std::expected<Policy, std::string>
    load(const std::filesystem::path& policy_path);

    // load_from_string
    //   메모리상의 YAML/JSON 텍스트를 파싱한다. 검증 규칙은 load() 와 같다.
    [[nodiscard]] static std::expected<Policy, std::string>
    load_from_string(std::string_view text);
};
