#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include <cstdint>
#include <span>
namespace sigil::protocol::kyber {
using crypto::SecureBytes;
using KyberSecretKeyHandle = ffi::ResourceHandle<ffi::KyberSecretKeyTraits>;
class KyberSecretKey {
public:
    [[nodiscard]] static Result<KyberSecretKey, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] static KyberSecretKey FromHandle(KyberSecretKeyHandle handle) noexcept;
    [[nodiscard]] Result<SecureBytes, SigilFailure> Serialize() const;
    /// Recovers the 32-byte shared secret from a 1568-byte ciphertext.
    [[nodiscard]] Result<SecureBytes, SigilFailure> Decapsulate(std::span<const uint8_t> ciphertext) const;
    [[nodiscard]] Result<KyberSecretKey, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    [[nodiscard]] const KyberSecretKeyHandle& Handle() const noexcept { return handle_; }
    KyberSecretKey(KyberSecretKey&&) noexcept = default;
    KyberSecretKey& operator=(KyberSecretKey&&) noexcept = default;
    KyberSecretKey(const KyberSecretKey&) = delete;
    KyberSecretKey& operator=(const KyberSecretKey&) = delete;
    ~KyberSecretKey() = default;
private:
    explicit KyberSecretKey(KyberSecretKeyHandle handle) noexcept;
    KyberSecretKeyHandle handle_;
};
}
