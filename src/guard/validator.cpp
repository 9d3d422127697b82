// ---------------------------------------------------------------------------
// validator.cpp
// ---------------------------------------------------------------------------

#include "guard/validator.hpp"

#include <spdlog/spdlog.h>

std::set<std::string> Validator::known_arguments(const Policy& policy, const std::string& tool_name) {
    std::set<std::string> known;
    for (const auto& rule : policy.allow_rules) {
        if (!tool_matches(rule.tool, tool_name)) {
            continue;
        }
        for (const auto& entry : rule.constraints) {
            known.insert(entry.argument);
        }
    }
    return known;
}

std::size_t Validator::serialized_size(const ValueMap& arguments) {
    return Value(arguments).to_json().size();
}

Decision Validator::validate(const ToolCall& call, const Policy& policy) {
    const auto& cfg = policy.validate;

    if (call.tool_name.empty()) {
        return Decision{false, "tool name is empty", policy.policy_id, std::nullopt,
                        DecisionLayer::kValidate};
    }

    if (cfg.max_arg_bytes > 0) {
        const std::size_t size = serialized_size(call.arguments);
        if (size > cfg.max_arg_bytes) {
            spdlog::info("validator: tool '{}' arguments too large ({} > {} bytes)",
                         call.tool_name, size, cfg.max_arg_bytes);
            return Decision{
                false,
                fmt::format("argument payload too large ({} > {} bytes)", size, cfg.max_arg_bytes),
                policy.policy_id,
                "Reduce arguments payload size.",
                DecisionLayer::kValidate
            };
        }
    }

    if (cfg.reject_unknown_args) {
        const auto known = known_arguments(policy, call.tool_name);
        // ValueMap 은 키 정렬이므로 보고되는 첫 번째 unknown 키가 결정적이다.
        for (const auto& [key, value] : call.arguments) {
            if (known.contains(key)) {
                continue;
            }
            spdlog::info("validator: tool '{}' unknown argument '{}'", call.tool_name, key);
            return Decision{
                false,
                fmt::format("unknown argument: {}", key),
                policy.policy_id,
                "Remove unknown arguments.",
                DecisionLayer::kValidate
            };
        }
    }

    return Decision{true, "arguments valid", policy.policy_id, std::nullopt, DecisionLayer::kValidate};
}
