#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/keys/identity_key_pair.hpp"
#include "sigil/keys/public_key.hpp"
#include "sigil/session/protocol_address.hpp"
#include <cstdint>
#include <optional>
#include <string_view>
namespace sigil::protocol::stores {
using protocol::Result;
using protocol::SigilFailure;
using keys::IdentityKeyPair;
using keys::PublicKey;
using session::ProtocolAddress;
enum class IdentityTrustDecision {
    Trusted,
    Untrusted,
    Changed
};
enum class Direction {
    Sending,
    Receiving
};
constexpr std::string_view ToString(const IdentityTrustDecision decision) noexcept {
    switch (decision) {
        case IdentityTrustDecision::Trusted: return "Trusted";
        case IdentityTrustDecision::Untrusted: return "Untrusted";
        case IdentityTrustDecision::Changed: return "Changed";
    }
    return "Unknown";
}
/// Local identity plus the remote identities seen so far, keyed by account name.
class IIdentityKeyStore {
public:
    virtual ~IIdentityKeyStore() = default;
    [[nodiscard]] virtual Result<IdentityKeyPair, SigilFailure> GetIdentityKeyPair() const = 0;
    [[nodiscard]] virtual uint32_t GetLocalRegistrationId() const = 0;
    /// True when the stored identity was added or replaced.
    [[nodiscard]] virtual Result<bool, SigilFailure> SaveIdentity(const ProtocolAddress& address, const PublicKey& identity_key) = 0;
    [[nodiscard]] virtual Result<std::optional<PublicKey>, SigilFailure> GetIdentity(const ProtocolAddress& address) const = 0;
    [[nodiscard]] virtual Result<IdentityTrustDecision, SigilFailure> IsTrustedIdentity(
        const ProtocolAddress& address,
        const PublicKey& identity_key,
        Direction direction) const = 0;
};
}
