// ---------------------------------------------------------------------------
// policy_engine.cpp
//
// ToolCall 을 allow/deny 규칙으로 평가한다.
//
// [Fail-close 원칙: 절대 위반 금지]
// 1. policy_ == nullptr → 차단
// 2. deny 규칙 일치 → 차단 (allow 규칙보다 우선)
// 3. 정책 일치 없음 + default: deny → 차단
// 4. 허용은 allow 규칙 통과 또는 default: allow 에서만
//
// [allow 규칙 fall-through]
// 같은 tool 에 대한 allow 규칙이 여러 개일 때, 앞 규칙이 역할/제약으로
// 실패하면 다음 규칙을 평가한다. 모두 실패하면 default 로 넘어간다.
// default: deny 인 경우 첫 번째 실패 사유를 reason 에 포함하여
// 호출자가 어떤 제약을 어겼는지 알 수 있게 한다.
//
// [오탐/미탐 트레이드오프]
// - tool = "*" allow 규칙이 앞에 있으면 특정 툴 규칙이 무시될 수 있다.
//   규칙 순서는 정책 문서에서 명확히 정의해야 한다.
// - default: allow 는 제약 실패 호출도 허용한다. 운영 환경에서는 deny 권장.
// ---------------------------------------------------------------------------

#include "policy/policy_engine.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "policy/constraint_matcher.hpp"

namespace {

// ---------------------------------------------------------------------------
// deny 규칙 condition 일치 여부
//   condition 의 모든 키가 인자에 있고 값이 literal_equals 로 일치해야 한다.
//   integer 제약과 같은 수 판정을 써서 5.0 으로 {id: 5} 규칙을 피해갈 수 없다.
// ---------------------------------------------------------------------------
bool condition_matches(const ValueMap& condition, const ValueMap& arguments) {
    for (const auto& [key, expected] : condition) {
        const auto it = arguments.find(key);
        if (it == arguments.end() || !literal_equals(it->second, expected)) {
            return false;
        }
    }
    return true;
}

bool roles_intersect(const std::vector<std::string>& rule_roles,
                     const std::vector<std::string>& call_roles) {
    return std::any_of(rule_roles.begin(), rule_roles.end(), [&call_roles](const std::string& r) {
        return std::find(call_roles.begin(), call_roles.end(), r) != call_roles.end();
    });
}

Decision make_decision(bool allowed, std::string reason, const Policy& policy,
                       std::optional<std::string> remediation = std::nullopt) {
    return Decision{
        allowed,
        std::move(reason),
        policy.policy_id,
        std::move(remediation),
        DecisionLayer::kAuthorize
    };
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyEngine 생성자
// ---------------------------------------------------------------------------
PolicyEngine::PolicyEngine(std::shared_ptr<const Policy> policy)
    : policy_(policy) {
    if (!policy) {
        spdlog::warn("policy_engine: constructed with nullptr policy: all tool calls will be denied (fail-close)");
    } else {
        spdlog::info("policy_engine: initialized policy '{}' v{} with {} allow rules, {} deny rules",
                     policy->policy_id, policy->version,
                     policy->allow_rules.size(), policy->deny_rules.size());
    }
}

Decision PolicyEngine::evaluate(const ToolCall& call) const {
    // 로컬 shared_ptr 로 스냅샷을 잡으면 reload() 가 교체해도 수명이 유지된다.
    const auto policy = policy_.load();
    if (!policy) {
        spdlog::error("policy_engine: policy is null, denying tool '{}' (fail-close)", call.tool_name);
        return Decision{
            false,
            "policy unavailable",
            "",
            std::nullopt,
            DecisionLayer::kAuthorize
        };
    }
    return evaluate(*policy, call);
}

// ---------------------------------------------------------------------------
// PolicyEngine::evaluate (정적) 구현
// ---------------------------------------------------------------------------
Decision PolicyEngine::evaluate(const Policy& policy, const ToolCall& call) {
    // Step 1: deny 규칙 (문서 순서)
    for (const auto& rule : policy.deny_rules) {
        if (!tool_matches(rule.tool, call.tool_name)) {
            continue;
        }
        if (rule.condition.has_value() && !condition_matches(*rule.condition, call.arguments)) {
            continue;
        }
        spdlog::info("policy_engine: deny rule matched tool='{}' actor='{}' policy='{}'",
                     call.tool_name, call.actor.value_or(""), policy.policy_id);
        return make_decision(false, rule.reason, policy);
    }

    // Step 2: allow 규칙 (문서 순서, 실패 시 다음 규칙으로)
    std::optional<std::string> first_failure;
    for (const auto& rule : policy.allow_rules) {
        if (!tool_matches(rule.tool, call.tool_name)) {
            continue;
        }

        // roles 가 없거나 비어 있으면 모든 역할 허용
        if (rule.roles.has_value() && !rule.roles->empty() &&
            !roles_intersect(*rule.roles, call.roles)) {
            spdlog::debug("policy_engine: allow rule for '{}' skipped, role not permitted",
                          rule.tool);
            if (!first_failure) {
                first_failure = "actor role not permitted for this tool";
            }
            continue;
        }

        const auto outcome = ConstraintMatcher::match_all(rule.constraints, call.arguments);
        if (!outcome.ok) {
            spdlog::debug("policy_engine: allow rule for '{}' skipped, {}", rule.tool, outcome.reason);
            if (!first_failure) {
                first_failure = outcome.reason;
            }
            continue;
        }

        spdlog::debug("policy_engine: allow rule matched tool='{}' actor='{}'",
                      call.tool_name, call.actor.value_or(""));
        return make_decision(true, "matched allow rule", policy);
    }

    // Step 3: default
    if (policy.default_action == DefaultAction::kAllow) {
        spdlog::debug("policy_engine: no allow rule passed for '{}', default allow", call.tool_name);
        return make_decision(true, "no matching allow rule / default allow", policy);
    }

    if (first_failure) {
        spdlog::info("policy_engine: tool '{}' denied, {} (default deny)",
                     call.tool_name, *first_failure);
        return make_decision(
            false,
            fmt::format("{} (default deny)", *first_failure),
            policy,
            "Fix tool arguments or roles to satisfy policy constraints.");
    }

    spdlog::info("policy_engine: no matching allow rule for tool '{}' (default deny)", call.tool_name);
    return make_decision(false, "no matching allow rule / default deny", policy,
                         "Request access via policy update.");
}

std::shared_ptr<const Policy> PolicyEngine::snapshot() const {
    return policy_.load();
}

// ---------------------------------------------------------------------------
// PolicyEngine::reload 구현
//
// new_policy == nullptr 로 교체하면 이후 모든 evaluate() 가 차단된다 (fail-close).
// ---------------------------------------------------------------------------
void PolicyEngine::reload(std::shared_ptr<const Policy> new_policy) {
    if (!new_policy) {
        spdlog::warn("policy_engine: reload called with nullptr policy: "
                     "all tool calls will be denied after reload (fail-close)");
    } else {
        spdlog::info("policy_engine: reloading policy '{}' v{}",
                     new_policy->policy_id, new_policy->version);
    }
    policy_.store(std::move(new_policy));
}
