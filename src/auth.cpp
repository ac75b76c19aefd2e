// =============================================================================
// auth.cpp - AuthorizationGate
// =============================================================================

#include "swaptrade/auth.hpp"

namespace swaptrade {

AuthorizationGate::AuthorizationGate(const IIdentityVerifier* verifier)
    : verifier_(verifier) {}

bool AuthorizationGate::identities_equal(const Address& a, const Address& b) {
    uint8_t diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<uint8_t>(a[i] ^ b[i]);
    }
    return diff == 0;
}

int32_t AuthorizationGate::require(const Address& caller, const Address& required) const {
    const IIdentityVerifier& verifier = verifier_ ? *verifier_ : default_verifier_;

    // Evaluate both conditions before deciding
    bool verified = verifier.is_verified(caller);
    bool matches = identities_equal(caller, required);
    if (!(verified && matches)) {
        return errors::UNAUTHORIZED;
    }
    return errors::OK;
}

int32_t AuthorizationGate::require_admin(const Address& caller, const Address& admin) const {
    return require(caller, admin);
}

} // namespace swaptrade
