#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/keys/public_key.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::keys {
using crypto::SecureBytes;
using PrivateKeyHandle = ffi::ResourceHandle<ffi::PrivateKeyTraits>;
/**
 * @brief Curve25519 private key held by the engine.
 *
 * The scalar never leaves the engine except through Serialize(), which
 * returns it in a SecureBytes the caller must dispose.
 */
class PrivateKey {
public:
    [[nodiscard]] static Result<PrivateKey, SigilFailure> Generate();
    [[nodiscard]] static Result<PrivateKey, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] static PrivateKey FromHandle(PrivateKeyHandle handle) noexcept;
    [[nodiscard]] Result<SecureBytes, SigilFailure> Serialize() const;
    [[nodiscard]] Result<PublicKey, SigilFailure> GetPublicKey() const;
    /// 64-byte XEdDSA signature.
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Sign(std::span<const uint8_t> message) const;
    /// X25519 shared secret with the other party's public key.
    [[nodiscard]] Result<SecureBytes, SigilFailure> Agree(const PublicKey& their_key) const;
    [[nodiscard]] Result<PrivateKey, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    [[nodiscard]] const PrivateKeyHandle& Handle() const noexcept { return handle_; }
    PrivateKey(PrivateKey&&) noexcept = default;
    PrivateKey& operator=(PrivateKey&&) noexcept = default;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;
    ~PrivateKey() = default;
private:
    explicit PrivateKey(PrivateKeyHandle handle) noexcept;
    PrivateKeyHandle handle_;
};
}
