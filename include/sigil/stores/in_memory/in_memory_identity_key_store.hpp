#pragma once
#include "sigil/stores/i_identity_key_store.hpp"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
namespace sigil::protocol::stores {
/**
 * @brief Trust-on-first-use identity store.
 *
 * An unknown identity is trusted. A stored identity that no longer matches
 * is reported as Changed when receiving and Untrusted when sending, so a
 * host never encrypts to a replaced key without confirming it first.
 */
class InMemoryIdentityKeyStore final : public IIdentityKeyStore {
public:
    InMemoryIdentityKeyStore(IdentityKeyPair identity_key_pair, uint32_t local_registration_id);
    [[nodiscard]] Result<IdentityKeyPair, SigilFailure> GetIdentityKeyPair() const override;
    [[nodiscard]] uint32_t GetLocalRegistrationId() const override;
    [[nodiscard]] Result<bool, SigilFailure> SaveIdentity(const ProtocolAddress& address, const PublicKey& identity_key) override;
    [[nodiscard]] Result<std::optional<PublicKey>, SigilFailure> GetIdentity(const ProtocolAddress& address) const override;
    [[nodiscard]] Result<IdentityTrustDecision, SigilFailure> IsTrustedIdentity(
        const ProtocolAddress& address,
        const PublicKey& identity_key,
        Direction direction) const override;
    void Clear() noexcept { identities_.clear(); }
    [[nodiscard]] size_t Size() const noexcept { return identities_.size(); }
private:
    IdentityKeyPair identity_key_pair_;
    uint32_t local_registration_id_;
    std::unordered_map<std::string, std::vector<uint8_t>> identities_;
};
}
