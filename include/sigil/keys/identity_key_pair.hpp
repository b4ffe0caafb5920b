#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/keys/private_key.hpp"
#include "sigil/keys/public_key.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::keys {
/**
 * @brief Long-term identity: a public key and its private key.
 *
 * Owns both components. Dispose() marks the pair disposed before releasing
 * either key, so no operation can observe a half-released pair.
 */
class IdentityKeyPair {
public:
    [[nodiscard]] static Result<IdentityKeyPair, SigilFailure> Generate();
    /// Takes ownership of both keys.
    [[nodiscard]] static IdentityKeyPair FromKeys(PublicKey public_key, PrivateKey private_key) noexcept;
    [[nodiscard]] static Result<IdentityKeyPair, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] Result<SecureBytes, SigilFailure> Serialize() const;
    /// Signs another identity key, binding the two identities together.
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> SignAlternateIdentity(const PublicKey& other) const;
    [[nodiscard]] static Result<bool, SigilFailure> VerifyAlternateIdentity(
        const PublicKey& identity,
        const PublicKey& other,
        std::span<const uint8_t> signature);
    /// Independent copies; the pair keeps its own keys.
    [[nodiscard]] Result<PublicKey, SigilFailure> GetPublicKey() const;
    [[nodiscard]] Result<PrivateKey, SigilFailure> GetPrivateKey() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept { return disposed_; }
    IdentityKeyPair(IdentityKeyPair&& other) noexcept;
    IdentityKeyPair& operator=(IdentityKeyPair&& other) noexcept;
    IdentityKeyPair(const IdentityKeyPair&) = delete;
    IdentityKeyPair& operator=(const IdentityKeyPair&) = delete;
    ~IdentityKeyPair();
private:
    IdentityKeyPair(PublicKey public_key, PrivateKey private_key) noexcept;
    [[nodiscard]] Result<Unit, SigilFailure> CheckNotDisposed() const;
    PublicKey public_key_;
    PrivateKey private_key_;
    bool disposed_;
};
}
