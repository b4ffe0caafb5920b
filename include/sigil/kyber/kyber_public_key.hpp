#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::kyber {
using protocol::Result;
using protocol::SigilFailure;
using crypto::SecureBytes;
using KyberPublicKeyHandle = ffi::ResourceHandle<ffi::KyberPublicKeyTraits>;
/// Output of a Kyber-1024 encapsulation.
struct Encapsulation {
    std::vector<uint8_t> ciphertext;
    SecureBytes shared_secret;
};
/// Kyber-1024 public key. Serialized form: 0x08 type byte, then 1568 key bytes.
class KyberPublicKey {
public:
    [[nodiscard]] static Result<KyberPublicKey, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] static KyberPublicKey FromHandle(KyberPublicKeyHandle handle) noexcept;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Serialize() const;
    [[nodiscard]] Result<bool, SigilFailure> Equals(const KyberPublicKey& other) const;
    [[nodiscard]] Result<Encapsulation, SigilFailure> Encapsulate() const;
    [[nodiscard]] Result<KyberPublicKey, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    [[nodiscard]] const KyberPublicKeyHandle& Handle() const noexcept { return handle_; }
    KyberPublicKey(KyberPublicKey&&) noexcept = default;
    KyberPublicKey& operator=(KyberPublicKey&&) noexcept = default;
    KyberPublicKey(const KyberPublicKey&) = delete;
    KyberPublicKey& operator=(const KyberPublicKey&) = delete;
    ~KyberPublicKey() = default;
private:
    explicit KyberPublicKey(KyberPublicKeyHandle handle) noexcept;
    KyberPublicKeyHandle handle_;
};
}
