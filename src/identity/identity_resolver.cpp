// ---------------------------------------------------------------------------
// identity_resolver.cpp
// ---------------------------------------------------------------------------

#include "identity/identity_resolver.hpp"

#include <utility>

#include <spdlog/spdlog.h>

StaticIdentityResolver::StaticIdentityResolver(std::unordered_map<std::string, Identity> table)
    : table_(std::move(table)) {
    spdlog::debug("identity_resolver: static table with {} credentials", table_.size());
}

std::expected<Identity, std::string>
StaticIdentityResolver::resolve(std::string_view credential) const {
    if (credential.empty()) {
        return std::unexpected(std::string("empty credential"));
    }
    const auto it = table_.find(std::string(credential));
    if (it == table_.end()) {
        spdlog::info("identity_resolver: unknown credential rejected");
        return std::unexpected(std::string("unknown credential"));
    }
    return it->second;
}

ToolCall apply_identity(ToolCall call, const Identity& identity) {
    call.actor = identity.actor;
    call.roles = identity.roles;
    return call;
}
