// ---------------------------------------------------------------------------
// attack_detector.cpp
//
// [기본 패턴]
// SQL Injection
//  1. '\s*(OR|AND)\s+['"\d]    : tautology (' OR 1=1, ' AND 'a'='a)
//  2. UNION\s+(ALL\s+)?SELECT  : UNION 기반
//  3. --(\s|$)                  : 주석 꼬리 무력화
//  4. /\*.*\*/                  : 인라인 주석 우회
//  5. ;\s*(DROP|DELETE|...)     : piggyback
//  6. (SLEEP|BENCHMARK)\s*\(    : time-based blind
//  7. LOAD_FILE\s*\( / INTO OUTFILE|DUMPFILE: 파일 읽기/쓰기
// Path Traversal
//  8. \.\./  \.\.\\  %2e%2e     : 상위 디렉터리 이동 (인코딩 포함)
//  9. ^/(etc|proc|sys|root|var|dev|boot)(/|$): 시스템 디렉터리 절대 경로
// 10. ^[A-Z]:\\                 : Windows 드라이브 절대 경로
// SSRF
// 11. localhost, 127.x.x.x, 0.0.0.0, [::1]         : loopback
// 12. 169.254.x.x                                  : link-local (AWS/Azure 메타데이터 포함)
// 13. metadata.google.internal, 100.100.100.200    : GCP/Alibaba 메타데이터
//
// [오탐/미탐 트레이드오프]
// - 패턴 3 (--): 자유 텍스트 필드에서 false positive 가능. fields 로 범위를 좁힐 것.
// - 패턴 9: 정상적인 /var/... 경로를 다루는 툴에서 false positive.
//   그런 툴은 fields 에서 path 를 제외하거나 on_detect: flag 로 운영한다.
//
// [긴 문자열 스캔]
// libstdc++ std::regex 는 '*', '+' 가 소비하는 문자마다 재귀한다.
// "'" + 공백 100KB 같은 인자 하나로 스택이 넘치므로, kScanWindowBytes 를 넘는
// 문자열은 kScanOverlapBytes 만큼 겹치는 창으로 나눠 검사한다.
// - 창 앞에 문자가 있으면 match_prev_avail | match_not_bol: '^' 와 \b 가
//   창 경계를 문자열 시작으로 오인하지 않는다.
// - 창 뒤에 문자가 남아 있으면 match_not_eol | match_not_eow.
// - 겹침보다 긴 매칭(예: 수 KB 에 걸친 /* ... */)은 창 경계에서 놓칠 수 있다.
//   필요하면 validate.max_arg_bytes 로 인자 크기 자체를 제한할 것.
//
// [CompiledPattern]
// 헤더에서 전방 선언만 하므로 std::regex 를 shared_ptr 로 보관한다.
// ---------------------------------------------------------------------------

#include "guard/attack_detector.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kScanWindowBytes  = 2048;
constexpr std::size_t kScanOverlapBytes = 256;

bool search_windowed(const std::string& text, const std::regex& re) {
    if (text.size() <= kScanWindowBytes) {
        return std::regex_search(text, re);
    }

    constexpr std::size_t kStep = kScanWindowBytes - kScanOverlapBytes;
    for (std::size_t begin = 0; begin < text.size(); begin += kStep) {
        const std::size_t end = std::min(begin + kScanWindowBytes, text.size());

        std::regex_constants::match_flag_type flags = std::regex_constants::match_default;
        if (begin > 0) {
            flags |= std::regex_constants::match_prev_avail | std::regex_constants::match_not_bol;
        }
        if (end < text.size()) {
            flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;
        }

        const auto first = text.begin() + static_cast<std::ptrdiff_t>(begin);
        const auto last  = text.begin() + static_cast<std::ptrdiff_t>(end);
        if (std::regex_search(first, last, re, flags)) {
            return true;
        }
        if (end == text.size()) {
            break;
        }
    }
    return false;
}

}  // namespace

struct AttackDetector::CompiledPattern {
    AttackCategory              category{AttackCategory::kSqlInjection};
    std::string                 source_pattern;
    std::shared_ptr<std::regex> compiled;
};

std::string_view category_to_string(AttackCategory category) noexcept {
    switch (category) {
        case AttackCategory::kSqlInjection:  return "sql_injection";
        case AttackCategory::kPathTraversal: return "path_traversal";
        case AttackCategory::kSsrf:          return "ssrf";
        case AttackCategory::kUnavailable:   return "detector_unavailable";
        default:                             return "unknown";
    }
}

std::string AttackScanResult::reason() const {
    if (!detected) {
        return "";
    }
    if (category == AttackCategory::kUnavailable) {
        return "attack detector unavailable (no valid patterns loaded)";
    }
    return fmt::format("potential {} detected in argument '{}'", category_to_string(category), field);
}

std::vector<AttackPattern> default_attack_patterns() {
    return {
        // SQL Injection
        {AttackCategory::kSqlInjection,  R"re('\s*(or|and)\s+['"\d])re"},
        {AttackCategory::kSqlInjection,  R"re(union\s+(all\s+)?select)re"},
        {AttackCategory::kSqlInjection,  R"re(--(\s|$))re"},
        {AttackCategory::kSqlInjection,  R"re(/\*.*\*/)re"},
        {AttackCategory::kSqlInjection,  R"re(;\s*(drop|delete|update|insert|alter|create|truncate)\b)re"},
        {AttackCategory::kSqlInjection,  R"re(\b(sleep|benchmark)\s*\()re"},
        {AttackCategory::kSqlInjection,  R"re(\bload_file\s*\()re"},
        {AttackCategory::kSqlInjection,  R"re(into\s+(outfile|dumpfile)\b)re"},
        // Path Traversal
        {AttackCategory::kPathTraversal, R"re(\.\./)re"},
        {AttackCategory::kPathTraversal, R"re(\.\.\\)re"},
        {AttackCategory::kPathTraversal, R"re(%2e%2e)re"},
        {AttackCategory::kPathTraversal, R"re(^/(etc|proc|sys|root|var|dev|boot)(/|$))re"},
        {AttackCategory::kPathTraversal, R"re(^[a-z]:\\)re"},
        // SSRF
        {AttackCategory::kSsrf,          R"re(\blocalhost\b)re"},
        {AttackCategory::kSsrf,          R"re(\b127\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)re"},
        {AttackCategory::kSsrf,          R"re(\b0\.0\.0\.0\b)re"},
        {AttackCategory::kSsrf,          R"re(\[::1?\])re"},
        {AttackCategory::kSsrf,          R"re(\b169\.254\.\d{1,3}\.\d{1,3}\b)re"},
        {AttackCategory::kSsrf,          R"re(metadata\.google\.internal)re"},
        {AttackCategory::kSsrf,          R"re(\b100\.100\.100\.200\b)re"},
    };
}

namespace {

// 값 아래의 모든 문자열 leaf 를 검사한다.
bool scan_leaves(const AttackDetector& detector, const Value& value,
                 const std::string& path, AttackScanResult& out) {
    if (value.is_string()) {
        auto result = detector.check(value.as_string());
        if (result.detected) {
            result.field = path;
            out          = std::move(result);
            return true;
        }
        return false;
    }
    if (value.is_array()) {
        const auto& arr = value.as_array();
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (scan_leaves(detector, arr[i], fmt::format("{}[{}]", path, i), out)) {
                return true;
            }
        }
        return false;
    }
    if (value.is_object()) {
        for (const auto& [key, child] : value.as_object()) {
            if (scan_leaves(detector, child, path + "." + key, out)) {
                return true;
            }
        }
    }
    return false;
}

bool is_field(const std::vector<std::string>& fields, const std::string& key) {
    return std::find(fields.begin(), fields.end(), key) != fields.end();
}

// 대상 키를 찾아 재귀 순회한다. 대상 키 아래도 계속 내려간다.
bool walk(const AttackDetector& detector, const Value& value, const std::string& path,
          const std::vector<std::string>& fields, AttackScanResult& out) {
    if (value.is_object()) {
        for (const auto& [key, child] : value.as_object()) {
            const std::string child_path = path.empty() ? key : path + "." + key;
            if (is_field(fields, key) && scan_leaves(detector, child, child_path, out)) {
                return true;
            }
            if (walk(detector, child, child_path, fields, out)) {
                return true;
            }
        }
        return false;
    }
    if (value.is_array()) {
        const auto& arr = value.as_array();
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (walk(detector, arr[i], fmt::format("{}[{}]", path, i), fields, out)) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

AttackDetector::AttackDetector()
    : AttackDetector(default_attack_patterns()) {}

AttackDetector::AttackDetector(std::vector<AttackPattern> patterns) {
    compiled_patterns_.reserve(patterns.size());

    for (auto& p : patterns) {
        try {
            auto re = std::make_shared<std::regex>(
                p.pattern,
                std::regex_constants::icase | std::regex_constants::ECMAScript
            );
            compiled_patterns_.push_back(CompiledPattern{p.category, p.pattern, std::move(re)});
        } catch (const std::regex_error& e) {
            // [보안 주의] 건너뛴 패턴만큼 탐지 범위가 줄어든다 (false negative 증가).
            spdlog::warn("attack_detector: invalid regex pattern '{}', skipping: {}",
                         p.pattern, e.what());
        }
    }

    // [Fail-close] 유효한 패턴이 하나도 없으면 모든 검사 대상 인자를 탐지로 처리한다.
    if (compiled_patterns_.empty()) {
        fail_close_active_ = true;
        spdlog::error("attack_detector: no valid attack patterns loaded, "
                      "fail-close active: every scanned argument will be flagged");
    }
}

AttackDetector::~AttackDetector()                                     = default;
AttackDetector::AttackDetector(AttackDetector&&) noexcept            = default;
AttackDetector& AttackDetector::operator=(AttackDetector&&) noexcept = default;

AttackScanResult AttackDetector::check(std::string_view text) const {
    if (fail_close_active_) {
        return AttackScanResult{true, AttackCategory::kUnavailable, "", ""};
    }

    const std::string str(text);
    for (const auto& cp : compiled_patterns_) {
        if (!cp.compiled) {
            continue;
        }
        if (search_windowed(str, *cp.compiled)) {
            return AttackScanResult{true, cp.category, "", cp.source_pattern};
        }
    }
    return AttackScanResult{};
}

AttackScanResult AttackDetector::scan(const ToolCall& call, const DetectAttacksConfig& cfg) const {
    AttackScanResult result{};
    if (cfg.fields.empty()) {
        return result;
    }
    if (walk(*this, Value(call.arguments), "", cfg.fields, result)) {
        spdlog::info("attack_detector: {} in tool '{}' argument '{}' (pattern '{}')",
                     category_to_string(result.category), call.tool_name,
                     result.field, result.matched_pattern);
    }
    return result;
}
