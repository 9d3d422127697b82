// ---------------------------------------------------------------------------
// test_validator.cpp
//
// Validator 단위 테스트.
//
// [테스트 범위]
// - 빈 tool_name 차단
// - max_arg_bytes 초과 차단 (compact JSON 바이트 수 기준)
// - reject_unknown_args: 선언되지 않은 키 차단, 역할 무관 합집합
// - 검사 순서: 크기 검사가 키 검사보다 먼저
// - 비활성 설정 → 통과
// ---------------------------------------------------------------------------

#include "guard/validator.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

ToolCall make_call(std::string tool, ValueMap args) {
    ToolCall call{};
    call.tool_name = std::move(tool);
    call.arguments = std::move(args);
    call.roles     = {"support"};
    return call;
}

Policy make_policy(bool reject_unknown, std::uint64_t max_bytes) {
    Policy policy{};
    policy.policy_id                    = "validator-policy";
    policy.validate.reject_unknown_args = reject_unknown;
    policy.validate.max_arg_bytes       = max_bytes;

    AllowRule support{};
    support.tool        = "search_tickets";
    support.roles       = std::vector<std::string>{"support"};
    support.constraints = {{"query", Constraint{}}, {"limit", Constraint{}}};
    policy.allow_rules.push_back(support);

    // 다른 역할 전용 규칙의 키도 알려진 키로 취급한다
    AllowRule admin{};
    admin.tool        = "search_tickets";
    admin.roles       = std::vector<std::string>{"admin"};
    admin.constraints = {{"include_deleted", Constraint{}}};
    policy.allow_rules.push_back(admin);

    return policy;
}

}  // namespace

TEST(Validator, EmptyToolNameDenied) {
    const auto decision = Validator::validate(make_call("", {}), make_policy(false, 0));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "tool name is empty");
    EXPECT_EQ(decision.layer, DecisionLayer::kValidate);
}

TEST(Validator, SerializedSizeIsCompactJson) {
    // {"a":1} → 7 bytes
    EXPECT_EQ(Validator::serialized_size(ValueMap{{"a", 1}}), 7u);
    EXPECT_EQ(Validator::serialized_size(ValueMap{}), 2u);
}

TEST(Validator, PayloadTooLarge) {
    const auto policy   = make_policy(false, 16);
    const auto decision = Validator::validate(
        make_call("search_tickets", {{"query", std::string(64, 'x')}}), policy);
    EXPECT_FALSE(decision.allowed);
    EXPECT_NE(decision.reason.find("too large"), std::string::npos);
    EXPECT_EQ(decision.policy_id, "validator-policy");
    EXPECT_EQ(decision.remediation, std::optional<std::string>("Reduce arguments payload size."));
}

TEST(Validator, PayloadAtLimitPasses) {
    // {"query":"abc"} → 15 bytes
    const auto decision =
        Validator::validate(make_call("search_tickets", {{"query", "abc"}}), make_policy(false, 15));
    EXPECT_TRUE(decision.allowed);
}

TEST(Validator, UnknownArgumentRejected) {
    const auto decision = Validator::validate(
        make_call("search_tickets", {{"query", "x"}, {"drop", true}}), make_policy(true, 0));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "unknown argument: drop");
    EXPECT_EQ(decision.remediation, std::optional<std::string>("Remove unknown arguments."));
}

TEST(Validator, KnownArgumentsIgnoreRoles) {
    const auto policy = make_policy(true, 0);
    const auto known  = Validator::known_arguments(policy, "search_tickets");
    EXPECT_EQ(known, (std::set<std::string>{"include_deleted", "limit", "query"}));

    const auto decision = Validator::validate(
        make_call("search_tickets", {{"include_deleted", true}}), policy);
    EXPECT_TRUE(decision.allowed);
}

TEST(Validator, ToolWithoutRulesHasNoKnownArguments) {
    const auto decision =
        Validator::validate(make_call("other_tool", {{"x", 1}}), make_policy(true, 0));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "unknown argument: x");

    // 인자가 없으면 통과 (판정은 authorize 레이어 소관)
    EXPECT_TRUE(Validator::validate(make_call("other_tool", {}), make_policy(true, 0)).allowed);
}

TEST(Validator, SizeCheckedBeforeUnknownKeys) {
    const auto decision = Validator::validate(
        make_call("search_tickets", {{"unknown", std::string(100, 'y')}}), make_policy(true, 32));
    EXPECT_FALSE(decision.allowed);
    EXPECT_NE(decision.reason.find("too large"), std::string::npos);
}

TEST(Validator, DisabledChecksPass) {
    const auto decision = Validator::validate(
        make_call("search_tickets", {{"anything", std::string(10000, 'z')}}), make_policy(false, 0));
    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(decision.reason, "arguments valid");
}
