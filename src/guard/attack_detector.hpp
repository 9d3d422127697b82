#pragma once

// ---------------------------------------------------------------------------
// attack_detector.hpp
//
// 정규식 패턴 기반 인자 공격 탐지기.
// detect_attacks.fields 에 나열된 키의 문자열 값을 스캔한다.
//
// [탐지 범주]
// - SQL Injection : 따옴표 tautology, UNION SELECT, 주석, piggyback, time-based
// - Path Traversal: ../ 시퀀스, 인코딩된 .., 시스템 디렉터리 절대 경로
// - SSRF          : loopback / link-local / 클라우드 메타데이터 호스트
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 주석 분할: UN/**/ION SEL/**/ECT 는 인라인 주석 패턴으로만 잡힌다.
// 2. 인코딩 우회: 이중 URL 인코딩, 10진수 IP (2130706433) 는 탐지 불가.
// 3. DNS rebinding: 외부 도메인이 내부 IP 로 해석되는 경우는 탐지 불가
//    (네트워크 레이어 책임).
// 4. 파서가 아니다. 휴리스틱 패턴 매칭만 수행한다.
//
// [오탐/미탐 트레이드오프]
// - fields 를 넓힐수록 자유 텍스트 인자에서 false positive 증가.
// - on_detect: flag 로 운영하면서 오탐률을 관찰한 뒤 deny 로 전환 권장.
//
// [보안 원칙]
// - 탐지 reason 에는 범주와 인자 이름만 담는다. 인자 값은 절대 포함하지 않는다.
// - matched_pattern 은 감사/디버그용이며 호출자에게 노출하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "policy/rule.hpp"

// ---------------------------------------------------------------------------
// AttackCategory
//   kUnavailable: 유효한 패턴이 하나도 없어 fail-close 상태
// ---------------------------------------------------------------------------
enum class AttackCategory : std::uint8_t {
    kSqlInjection  = 0,
    kPathTraversal = 1,
    kSsrf          = 2,
    kUnavailable   = 3,
};

[[nodiscard]] std::string_view category_to_string(AttackCategory category) noexcept;

// ---------------------------------------------------------------------------
// AttackPattern
//   생성자 입력. pattern 은 ECMAScript regex (case-insensitive 로 컴파일).
// ---------------------------------------------------------------------------
struct AttackPattern {
    AttackCategory category{AttackCategory::kSqlInjection};
    std::string    pattern{};
};

// default_attack_patterns: 기본 패턴 battery
[[nodiscard]] std::vector<AttackPattern> default_attack_patterns();

// ---------------------------------------------------------------------------
// AttackScanResult
//   field : 탐지된 인자 경로 (예: "query", "filter.where", "urls[1]")
// ---------------------------------------------------------------------------
struct AttackScanResult {
    bool           detected{false};
    AttackCategory category{AttackCategory::kSqlInjection};
    std::string    field{};
    std::string    matched_pattern{};

    // 호출자/감사 로그용 사유. 값은 포함하지 않는다.
    [[nodiscard]] std::string reason() const;
};

// ---------------------------------------------------------------------------
// AttackDetector
//   생성 시 패턴을 컴파일하고, scan() 에서 매칭한다.
//
//   [성능 고려사항]
//   - 생성자에서 std::regex 컴파일 비용이 발생하므로 인스턴스를 재사용할 것.
//   - 스캔 비용은 O(P * N). 큰 payload 는 Validator 의 max_arg_bytes 로 먼저 걸러진다.
// ---------------------------------------------------------------------------
class AttackDetector {
public:
    AttackDetector();

    // 잘못된 패턴은 로깅 후 건너뛴다. 유효한 패턴이 없으면 fail-close.
    explicit AttackDetector(std::vector<AttackPattern> patterns);

    ~AttackDetector();

    AttackDetector(const AttackDetector&)            = delete;
    AttackDetector& operator=(const AttackDetector&) = delete;
    // CompiledPattern 이 불완전 타입이므로 이동 연산은 cpp 에서 default 정의한다.
    AttackDetector(AttackDetector&&) noexcept;
    AttackDetector& operator=(AttackDetector&&) noexcept;

    // check
    //   단일 문자열 검사. 첫 번째 매칭 패턴에서 반환한다 (field 는 비어있음).
    [[nodiscard]] AttackScanResult check(std::string_view text) const;

    // scan
    //   arguments 를 재귀적으로 순회한다. 키가 cfg.fields 에 있으면
    //   그 값의 모든 문자열 leaf 를 검사한다. 첫 번째 탐지에서 반환한다.
    //   cfg.enabled 는 호출자(Pipeline)가 확인한다.
    [[nodiscard]] AttackScanResult scan(const ToolCall& call, const DetectAttacksConfig& cfg) const;

    [[nodiscard]] bool fail_close_active() const noexcept { return fail_close_active_; }

private:
    struct CompiledPattern;
    std::vector<CompiledPattern> compiled_patterns_;
    bool                         fail_close_active_{false};
};
