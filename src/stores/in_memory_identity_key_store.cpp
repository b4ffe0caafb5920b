#include "sigil/stores/in_memory/in_memory_identity_key_store.hpp"
#include "sigil/crypto/secure_memory.hpp"

namespace sigil::protocol::stores {

InMemoryIdentityKeyStore::InMemoryIdentityKeyStore(
    IdentityKeyPair identity_key_pair,
    const uint32_t local_registration_id)
    : identity_key_pair_(std::move(identity_key_pair))
    , local_registration_id_(local_registration_id) {}

Result<IdentityKeyPair, SigilFailure> InMemoryIdentityKeyStore::GetIdentityKeyPair() const {
    SIGIL_TRY_ASSIGN(public_key, identity_key_pair_.GetPublicKey());
    SIGIL_TRY_ASSIGN(private_key, identity_key_pair_.GetPrivateKey());
    return Result<IdentityKeyPair, SigilFailure>::Ok(
        IdentityKeyPair::FromKeys(std::move(public_key), std::move(private_key)));
}

uint32_t InMemoryIdentityKeyStore::GetLocalRegistrationId() const {
    return local_registration_id_;
}

Result<bool, SigilFailure> InMemoryIdentityKeyStore::SaveIdentity(
    const ProtocolAddress& address,
    const PublicKey& identity_key) {
    SIGIL_TRY_ASSIGN(serialized, identity_key.Serialize());
    const auto it = identities_.find(address.GetName());
    if (it != identities_.end() && it->second == serialized) {
        return Result<bool, SigilFailure>::Ok(false);
    }
    identities_.insert_or_assign(address.GetName(), std::move(serialized));
    return Result<bool, SigilFailure>::Ok(true);
}

Result<std::optional<PublicKey>, SigilFailure> InMemoryIdentityKeyStore::GetIdentity(
    const ProtocolAddress& address) const {
    using LoadResult = Result<std::optional<PublicKey>, SigilFailure>;
    const auto it = identities_.find(address.GetName());
    if (it == identities_.end()) {
        return LoadResult::Ok(std::nullopt);
    }
    SIGIL_TRY_ASSIGN(key, PublicKey::Deserialize(it->second));
    return LoadResult::Ok(std::optional<PublicKey>(std::move(key)));
}

Result<IdentityTrustDecision, SigilFailure> InMemoryIdentityKeyStore::IsTrustedIdentity(
    const ProtocolAddress& address,
    const PublicKey& identity_key,
    const Direction direction) const {
    const auto it = identities_.find(address.GetName());
    if (it == identities_.end()) {
        return Result<IdentityTrustDecision, SigilFailure>::Ok(IdentityTrustDecision::Trusted);
    }
    SIGIL_TRY_ASSIGN(serialized, identity_key.Serialize());
    if (crypto::SecureMemory::ConstantTimeEquals(it->second, serialized)) {
        return Result<IdentityTrustDecision, SigilFailure>::Ok(IdentityTrustDecision::Trusted);
    }
    return Result<IdentityTrustDecision, SigilFailure>::Ok(direction == Direction::Sending
        ? IdentityTrustDecision::Untrusted
        : IdentityTrustDecision::Changed);
}

}
