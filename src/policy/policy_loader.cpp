// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML/JSON 정책 문서를 Policy 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱/검증 실패 시 부분 정책을 반환하지 않는다.
// - Fail-fast: 잘못된 정책(알 수 없는 constraint type, 컴파일 불가 pattern 등)은
//   로드 시점에 오류로 처리한다. 호출 시점까지 미루지 않는다.
// - 선택 필드 누락 시 구조체 기본값을 적용한다.
// - 알 수 없는 최상위 키는 무시한다.
// - 문서 전체를 로그에 출력하지 않는다 (민감 정보 보호).
//
// [스칼라 타입 판정]
// yaml-cpp 는 스칼라 타입 정보를 노출하지 않으므로 다음 규칙으로 판정한다.
//   따옴표 스칼라(tag "!")        → string
//   null / ~ / 빈 값              → null
//   true / false (대소문자 변형)   → boolean
//   정수 리터럴                    → integer
//   실수 리터럴                    → double
//   그 외                          → string
// enum 과 deny condition 의 엄격 비교가 이 판정에 의존한다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <memory>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// ---------------------------------------------------------------------------
// PolicySchemaError
//   스키마 검증 실패. load_from_node 에서 잡아 std::unexpected 로 변환한다.
// ---------------------------------------------------------------------------
class PolicySchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---------------------------------------------------------------------------
// 스칼라 → Value
// ---------------------------------------------------------------------------
Value scalar_to_value(const YAML::Node& node) {
    const std::string& raw = node.Scalar();

    if (node.Tag() == "!") {
        return Value(raw);
    }
    if (raw.empty() || raw == "~" || raw == "null" || raw == "Null" || raw == "NULL") {
        return Value();
    }
    if (raw == "true" || raw == "True" || raw == "TRUE") {
        return Value(true);
    }
    if (raw == "false" || raw == "False" || raw == "FALSE") {
        return Value(false);
    }

    const char* begin = raw.data();
    const char* end   = raw.data() + raw.size();

    std::int64_t int_value{0};
    {
        auto [ptr, ec] = std::from_chars(begin, end, int_value);
        if (ec == std::errc{} && ptr == end) {
            return Value(int_value);
        }
    }

    double double_value{0.0};
    {
        auto [ptr, ec] = std::from_chars(begin, end, double_value);
        if (ec == std::errc{} && ptr == end) {
            return Value(double_value);
        }
    }

    return Value(raw);
}

Value node_to_value(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return Value();
    }
    if (node.IsScalar()) {
        return scalar_to_value(node);
    }
    if (node.IsSequence()) {
        Value::Array arr;
        arr.reserve(node.size());
        for (const auto& item : node) {
            arr.push_back(node_to_value(item));
        }
        return Value(std::move(arr));
    }
    if (node.IsMap()) {
        Value::Object obj;
        for (const auto& kv : node) {
            obj.emplace(kv.first.as<std::string>(), node_to_value(kv.second));
        }
        return Value(std::move(obj));
    }
    return Value();
}

// ---------------------------------------------------------------------------
// 필드 읽기 헬퍼
//   키가 없으면 fallback. 키가 있는데 타입이 맞지 않으면 PolicySchemaError.
// ---------------------------------------------------------------------------
bool read_bool(const YAML::Node& parent, const char* key, bool fallback, std::string_view where) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        throw PolicySchemaError(fmt::format("{}.{} must be a boolean", where, key));
    }
}

std::uint64_t read_uint(const YAML::Node& parent, const char* key, std::uint64_t fallback,
                        std::string_view where) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    long long value{0};
    try {
        value = node.as<long long>();
    } catch (const YAML::Exception&) {
        throw PolicySchemaError(fmt::format("{}.{} must be an integer", where, key));
    }
    if (value < 0) {
        throw PolicySchemaError(fmt::format("{}.{} must be non-negative", where, key));
    }
    return static_cast<std::uint64_t>(value);
}

std::optional<double> read_optional_double(const YAML::Node& parent, const char* key,
                                           std::string_view where) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<double>();
    } catch (const YAML::Exception&) {
        throw PolicySchemaError(fmt::format("{}.{} must be a number", where, key));
    }
}

std::optional<std::string> read_optional_string(const YAML::Node& parent, const char* key,
                                                std::string_view where) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        throw PolicySchemaError(fmt::format("{}.{} must be a string", where, key));
    }
    return node.Scalar();
}

std::string read_required_string(const YAML::Node& parent, const char* key, std::string_view where) {
    auto value = read_optional_string(parent, key, where);
    if (!value || value->empty()) {
        throw PolicySchemaError(fmt::format("{}.{} is required", where, key));
    }
    return *value;
}

std::vector<std::string> read_string_sequence(const YAML::Node& parent, const char* key,
                                              std::string_view where) {
    std::vector<std::string> result;
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsSequence()) {
        throw PolicySchemaError(fmt::format("{}.{} must be a list", where, key));
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw PolicySchemaError(fmt::format("{}.{} entries must be strings", where, key));
        }
        result.push_back(item.Scalar());
    }
    return result;
}

// ---------------------------------------------------------------------------
// Constraint 파싱
// ---------------------------------------------------------------------------
ConstraintType parse_constraint_type(const std::string& raw, std::string_view where) {
    if (raw == "string")  return ConstraintType::kString;
    if (raw == "integer") return ConstraintType::kInteger;
    if (raw == "number")  return ConstraintType::kNumber;
    if (raw == "boolean") return ConstraintType::kBoolean;
    throw PolicySchemaError(fmt::format("{}.type '{}' is not one of string|integer|number|boolean",
                                        where, raw));
}

Constraint parse_constraint(const YAML::Node& node, std::string_view where) {
    if (!node.IsMap()) {
        throw PolicySchemaError(fmt::format("{} must be a map", where));
    }

    Constraint c{};
    c.type        = parse_constraint_type(read_required_string(node, "type", where), where);
    c.pattern     = read_optional_string(node, "pattern", where);
    c.min         = read_optional_double(node, "min", where);
    c.max         = read_optional_double(node, "max", where);
    c.required    = read_bool(node, "required", false, where);
    c.description = read_optional_string(node, "description", where);

    if (c.pattern.has_value()) {
        try {
            c.compiled_pattern = std::make_shared<const std::regex>(
                *c.pattern, std::regex_constants::ECMAScript);
        } catch (const std::regex_error& e) {
            throw PolicySchemaError(fmt::format("{}.pattern '{}' is not a valid regex: {}",
                                                where, *c.pattern, e.what()));
        }
        if (c.type != ConstraintType::kString) {
            spdlog::warn("policy_loader: {}.pattern ignored for non-string constraint", where);
        }
    }

    if (c.min.has_value() && c.max.has_value() && *c.min > *c.max) {
        throw PolicySchemaError(fmt::format("{}: min ({}) is greater than max ({})",
                                            where, *c.min, *c.max));
    }

    const YAML::Node enum_node = node["enum"];
    if (enum_node && !enum_node.IsNull()) {
        if (!enum_node.IsSequence()) {
            throw PolicySchemaError(fmt::format("{}.enum must be a list", where));
        }
        std::vector<Value> values;
        values.reserve(enum_node.size());
        for (const auto& item : enum_node) {
            if (!item.IsScalar()) {
                throw PolicySchemaError(fmt::format("{}.enum entries must be scalars", where));
            }
            values.push_back(scalar_to_value(item));
        }
        c.enum_values = std::move(values);
    }

    return c;
}

// ---------------------------------------------------------------------------
// 규칙 파싱
// ---------------------------------------------------------------------------
AllowRule parse_allow_rule(const YAML::Node& node, std::size_t index) {
    const std::string where = fmt::format("allow_rules[{}]", index);
    if (!node.IsMap()) {
        throw PolicySchemaError(fmt::format("{} must be a map", where));
    }

    AllowRule rule{};
    rule.tool = read_required_string(node, "tool", where);

    const YAML::Node roles_node = node["roles"];
    if (roles_node && !roles_node.IsNull()) {
        auto roles = read_string_sequence(node, "roles", where);
        // roles: [] 는 생략과 같다 (모든 역할 허용).
        if (!roles.empty()) {
            rule.roles = std::move(roles);
        }
    }

    const YAML::Node constraints_node = node["constraints"];
    if (constraints_node && !constraints_node.IsNull()) {
        if (!constraints_node.IsMap()) {
            throw PolicySchemaError(fmt::format("{}.constraints must be a map", where));
        }
        // yaml-cpp 맵 순회는 문서 순서를 보존한다.
        for (const auto& kv : constraints_node) {
            const auto name = kv.first.as<std::string>();
            rule.constraints.push_back(ConstraintEntry{
                name,
                parse_constraint(kv.second, fmt::format("{}.constraints.{}", where, name))
            });
        }
    }

    return rule;
}

DenyRule parse_deny_rule(const YAML::Node& node, std::size_t index) {
    const std::string where = fmt::format("deny_rules[{}]", index);
    if (!node.IsMap()) {
        throw PolicySchemaError(fmt::format("{} must be a map", where));
    }

    DenyRule rule{};
    rule.tool = read_required_string(node, "tool", where);

    const YAML::Node cond_node = node["condition"];
    if (cond_node && !cond_node.IsNull()) {
        if (!cond_node.IsMap()) {
            throw PolicySchemaError(fmt::format("{}.condition must be a map", where));
        }
        rule.condition = node_to_value(cond_node).as_object();
    }

    if (auto reason = read_optional_string(node, "reason", where)) {
        rule.reason = *reason;
    }
    return rule;
}

// ---------------------------------------------------------------------------
// 설정 블록 파싱
// ---------------------------------------------------------------------------
ValidateConfig parse_validate(const YAML::Node& node) {
    ValidateConfig cfg{};
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw PolicySchemaError("validate must be a map");
    }
    cfg.reject_unknown_args = read_bool(node, "reject_unknown_args", cfg.reject_unknown_args, "validate");
    cfg.max_arg_bytes       = read_uint(node, "max_arg_bytes", cfg.max_arg_bytes, "validate");
    return cfg;
}

RateLimitScope parse_scope(const std::string& raw) {
    if (raw == "actor")      return RateLimitScope::kActor;
    if (raw == "tool")       return RateLimitScope::kTool;
    if (raw == "actor+tool") return RateLimitScope::kActorTool;
    if (raw == "global")     return RateLimitScope::kGlobal;
    throw PolicySchemaError(fmt::format(
        "rate_limit.scope '{}' is not one of actor|tool|actor+tool|global", raw));
}

RateLimitConfig parse_rate_limit(const YAML::Node& node) {
    RateLimitConfig cfg{};
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw PolicySchemaError("rate_limit must be a map");
    }
    cfg.enabled          = read_bool(node, "enabled", cfg.enabled, "rate_limit");
    cfg.limit_per_minute = static_cast<std::uint32_t>(
        read_uint(node, "limit_per_minute", cfg.limit_per_minute, "rate_limit"));
    cfg.burst            = static_cast<std::uint32_t>(read_uint(node, "burst", cfg.burst, "rate_limit"));
    if (auto scope = read_optional_string(node, "scope", "rate_limit")) {
        cfg.scope = parse_scope(*scope);
    }
    return cfg;
}

DetectAttacksConfig parse_detect_attacks(const YAML::Node& node) {
    DetectAttacksConfig cfg{};
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw PolicySchemaError("detect_attacks must be a map");
    }
    cfg.enabled = read_bool(node, "enabled", cfg.enabled, "detect_attacks");

    if (auto on_detect = read_optional_string(node, "on_detect", "detect_attacks")) {
        if (*on_detect == "deny") {
            cfg.on_detect = OnDetect::kDeny;
        } else if (*on_detect == "flag" || *on_detect == "allow") {
            cfg.on_detect = OnDetect::kFlag;
        } else {
            throw PolicySchemaError(fmt::format(
                "detect_attacks.on_detect '{}' is not one of deny|flag", *on_detect));
        }
    }

    if (node["fields"]) {
        cfg.fields = read_string_sequence(node, "fields", "detect_attacks");
    }
    return cfg;
}

RedactConfig parse_redact(const YAML::Node& node) {
    RedactConfig cfg{};
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw PolicySchemaError("redact must be a map");
    }
    cfg.enabled    = read_bool(node, "enabled", cfg.enabled, "redact");
    cfg.pii_emails = read_bool(node, "pii_emails", cfg.pii_emails, "redact");
    cfg.pii_phones = read_bool(node, "pii_phones", cfg.pii_phones, "redact");
    cfg.max_string_len = static_cast<std::uint32_t>(
        read_uint(node, "max_string_len", cfg.max_string_len, "redact"));
    if (node["deny_keys"]) {
        cfg.deny_keys = read_string_sequence(node, "deny_keys", "redact");
    }
    return cfg;
}

AuditConfig parse_audit(const YAML::Node& node) {
    AuditConfig cfg{};
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw PolicySchemaError("audit must be a map");
    }
    cfg.include_argument_values =
        read_bool(node, "include_argument_values", cfg.include_argument_values, "audit");
    cfg.include_result = read_bool(node, "include_result", cfg.include_result, "audit");
    if (node["deny_keys"]) {
        cfg.deny_keys = read_string_sequence(node, "deny_keys", "audit");
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 루트 파싱
// ---------------------------------------------------------------------------
std::expected<Policy, std::string> load_from_node(const YAML::Node& root, std::string_view source) {
    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "policy_loader: '{}' is not a valid policy document (top-level must be a map)", source);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    Policy policy{};
    try {
        policy.policy_id = read_required_string(root, "policy_id", "policy");
        policy.version   = read_required_string(root, "version", "policy");

        if (auto def = read_optional_string(root, "default", "policy")) {
            if (*def == "deny") {
                policy.default_action = DefaultAction::kDeny;
            } else if (*def == "allow") {
                policy.default_action = DefaultAction::kAllow;
            } else {
                throw PolicySchemaError(fmt::format("policy.default '{}' is not one of allow|deny", *def));
            }
        }

        const YAML::Node allow_node = root["allow_rules"];
        if (allow_node && !allow_node.IsNull()) {
            if (!allow_node.IsSequence()) {
                throw PolicySchemaError("allow_rules must be a list");
            }
            policy.allow_rules.reserve(allow_node.size());
            for (std::size_t i = 0; i < allow_node.size(); ++i) {
                policy.allow_rules.push_back(parse_allow_rule(allow_node[i], i));
            }
        }

        const YAML::Node deny_node = root["deny_rules"];
        if (deny_node && !deny_node.IsNull()) {
            if (!deny_node.IsSequence()) {
                throw PolicySchemaError("deny_rules must be a list");
            }
            policy.deny_rules.reserve(deny_node.size());
            for (std::size_t i = 0; i < deny_node.size(); ++i) {
                policy.deny_rules.push_back(parse_deny_rule(deny_node[i], i));
            }
        }

        policy.validate       = parse_validate(root["validate"]);
        policy.rate_limit     = parse_rate_limit(root["rate_limit"]);
        policy.detect_attacks = parse_detect_attacks(root["detect_attacks"]);
        policy.redact         = parse_redact(root["redact"]);
        policy.audit          = parse_audit(root["audit"]);
    } catch (const PolicySchemaError& e) {
        const std::string err = fmt::format("policy_loader: invalid policy in '{}': {}", source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("policy_loader: YAML error in '{}': {}", source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (policy.allow_rules.empty() && policy.default_action == DefaultAction::kDeny) {
        // 오류는 아니지만 모든 호출이 차단된다.
        spdlog::warn("policy_loader: policy '{}' has no allow rules and default deny: "
                     "every tool call will be denied", policy.policy_id);
    }

    spdlog::info(
        "policy_loader: policy '{}' v{} loaded: allow_rules={}, deny_rules={}, default={}",
        policy.policy_id, policy.version,
        policy.allow_rules.size(), policy.deny_rules.size(),
        policy.default_action == DefaultAction::kAllow ? "allow" : "deny");

    return policy;
}

std::expected<Policy, std::string> parse_text(const std::string& text, std::string_view source) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        // 라인 번호 포함한 상세 에러 메시지
        const std::string err = fmt::format(
            "policy_loader: parse error in '{}' at line {}, col {}: {}",
            source,
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("policy_loader: YAML error in '{}': {}", source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return load_from_node(root, source);
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<Policy, std::string>
PolicyLoader::load(const std::filesystem::path& policy_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(policy_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve policy path '{}': {}",
            policy_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("policy_loader: loading policy from '{}'", canonical_path.string());

    // 2. 파일 읽기
    std::ifstream file(canonical_path);
    if (!file.is_open()) {
        const std::string err = fmt::format(
            "policy_loader: cannot open file '{}'", canonical_path.string());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    // 3. 파싱 + 검증
    return parse_text(buffer.str(), canonical_path.string());
}

std::expected<Policy, std::string>
PolicyLoader::load_from_string(std::string_view text) {
    return parse_text(std::string(text), "<memory>");
}
