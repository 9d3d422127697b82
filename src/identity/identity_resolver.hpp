#pragma once

// ---------------------------------------------------------------------------
// identity_resolver.hpp
//
// 자격 증명 → actor/roles 해석 계약 (외부 콜라보레이터 인터페이스).
//
// [설계 원칙]
// - 코어는 자격 증명을 검증하지 않는다. ToolCall 이 파이프라인에 들어가기 전에
//   호출자가 resolve() + apply_identity() 로 actor/roles 를 채운다.
// - 해석 실패는 std::unexpected(reason). 호출자는 실패 시 ToolCall 을
//   만들지 말거나 roles 를 비워 default deny 로 떨어지게 해야 한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "common/types.hpp"

struct Identity {
    std::string              actor{};
    std::vector<std::string> roles{};
};

class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;

    [[nodiscard]] virtual std::expected<Identity, std::string>
    resolve(std::string_view credential) const = 0;
};

// ---------------------------------------------------------------------------
// StaticIdentityResolver
//   고정 자격 증명 테이블. 개발/테스트용.
//   빈 자격 증명과 테이블에 없는 자격 증명은 실패.
//   실패 사유에 자격 증명 값을 포함하지 않는다.
// ---------------------------------------------------------------------------
class StaticIdentityResolver final : public IdentityResolver {
public:
    explicit StaticIdentityResolver(std::unordered_map<std::string, Identity> table);

    [[nodiscard]] std::expected<Identity, std::string>
    resolve(std::string_view credential) const override;

private:
    std::unordered_map<std::string, Identity> table_;
};

// apply_identity: call 의 actor/roles 를 identity 로 교체한 사본
[[nodiscard]] ToolCall apply_identity(ToolCall call, const Identity& identity);
