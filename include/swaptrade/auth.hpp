#ifndef SWAPTRADE_AUTH_HPP
#define SWAPTRADE_AUTH_HPP

#include "types.hpp"

namespace swaptrade {

// =============================================================================
// Identity Verification (host capability)
// =============================================================================

// Signature checking lives in the host. The core only asks whether the
// claimed caller identity was attested for the current call.
class IIdentityVerifier {
public:
    virtual ~IIdentityVerifier() = default;
    virtual bool is_verified(const Address& caller) const = 0;
};

// Host already attested the caller before invoking the core
class HostAttestedVerifier : public IIdentityVerifier {
public:
    bool is_verified(const Address&) const override { return true; }
};

// =============================================================================
// AuthorizationGate
// =============================================================================

class AuthorizationGate {
public:
    // verifier == nullptr uses a HostAttestedVerifier
    explicit AuthorizationGate(const IIdentityVerifier* verifier = nullptr);

    // UNAUTHORIZED unless caller is verified and equals required
    int32_t require(const Address& caller, const Address& required) const;

    // UNAUTHORIZED unless caller is verified and is the current admin
    int32_t require_admin(const Address& caller, const Address& admin) const;

    // Compares every byte regardless of where the first mismatch is
    static bool identities_equal(const Address& a, const Address& b);

private:
    const IIdentityVerifier* verifier_;
    HostAttestedVerifier default_verifier_;
};

} // namespace swaptrade

#endif // SWAPTRADE_AUTH_HPP
