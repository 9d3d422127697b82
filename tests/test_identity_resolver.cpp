// ---------------------------------------------------------------------------
// test_identity_resolver.cpp
//
// StaticIdentityResolver / apply_identity 단위 테스트.
// ---------------------------------------------------------------------------

#include "identity/identity_resolver.hpp"

#include <gtest/gtest.h>
#include <memory>

class StaticIdentityResolverTest : public ::testing::Test {
protected:
    StaticIdentityResolver resolver_{{
        {"key-support", Identity{"agent-1", {"support"}}},
        {"key-admin", Identity{"ops-admin", {"admin", "support"}}},
    }};
};

TEST_F(StaticIdentityResolverTest, KnownCredentialResolves) {
    const auto identity = resolver_.resolve("key-admin");
    ASSERT_TRUE(identity.has_value()) << identity.error();
    EXPECT_EQ(identity->actor, "ops-admin");
    EXPECT_EQ(identity->roles, (std::vector<std::string>{"admin", "support"}));
}

TEST_F(StaticIdentityResolverTest, EmptyCredentialRejected) {
    const auto identity = resolver_.resolve("");
    ASSERT_FALSE(identity.has_value());
    EXPECT_EQ(identity.error(), "empty credential");
}

TEST_F(StaticIdentityResolverTest, UnknownCredentialRejectedWithoutEcho) {
    const auto identity = resolver_.resolve("stolen-key-123");
    ASSERT_FALSE(identity.has_value());
    EXPECT_EQ(identity.error(), "unknown credential");
    EXPECT_EQ(identity.error().find("stolen-key-123"), std::string::npos);
}

TEST_F(StaticIdentityResolverTest, UsableThroughInterface) {
    const IdentityResolver& base = resolver_;
    EXPECT_TRUE(base.resolve("key-support").has_value());
}

TEST(ApplyIdentity, ReplacesActorAndRolesOnly) {
    ToolCall call{};
    call.tool_name  = "get_user";
    call.arguments  = {{"user_id", "EMP123456"}};
    call.roles      = {"spoofed-admin"};
    call.actor      = "claimed";
    call.request_id = "req-9";

    const auto resolved = apply_identity(call, Identity{"agent-1", {"support"}});
    EXPECT_EQ(resolved.actor, std::optional<std::string>("agent-1"));
    EXPECT_EQ(resolved.roles, (std::vector<std::string>{"support"}));
    EXPECT_EQ(resolved.tool_name, "get_user");
    EXPECT_EQ(resolved.request_id, std::optional<std::string>("req-9"));
    EXPECT_EQ(resolved.arguments, call.arguments);
}
