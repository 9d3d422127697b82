#include "common/types.hpp"

std::string_view layer_to_string(DecisionLayer layer) noexcept {
    switch (layer) {
        case DecisionLayer::kNone:          return "none";
        case DecisionLayer::kRateLimit:     return "rate_limit";
        case DecisionLayer::kValidate:      return "validate";
        case DecisionLayer::kAuthorize:     return "authorize";
        case DecisionLayer::kDetectAttacks: return "detect_attacks";
        case DecisionLayer::kExecute:       return "execute";
        case DecisionLayer::kRedact:        return "redact";
        default:                            return "none";
    }
}
