#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/kyber/kyber_public_key.hpp"
#include "sigil/kyber/kyber_secret_key.hpp"
namespace sigil::protocol::kyber {
using KyberKeyPairHandle = ffi::ResourceHandle<ffi::KyberKeyPairTraits>;
/// Kyber-1024 key pair generated by liboqs inside the engine.
class KyberKeyPair {
public:
    [[nodiscard]] static Result<KyberKeyPair, SigilFailure> Generate();
    [[nodiscard]] static KyberKeyPair FromHandle(KyberKeyPairHandle handle) noexcept;
    [[nodiscard]] Result<KyberPublicKey, SigilFailure> GetPublicKey() const;
    [[nodiscard]] Result<KyberSecretKey, SigilFailure> GetSecretKey() const;
    [[nodiscard]] Result<KyberKeyPair, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    [[nodiscard]] const KyberKeyPairHandle& Handle() const noexcept { return handle_; }
    KyberKeyPair(KyberKeyPair&&) noexcept = default;
    KyberKeyPair& operator=(KyberKeyPair&&) noexcept = default;
    KyberKeyPair(const KyberKeyPair&) = delete;
    KyberKeyPair& operator=(const KyberKeyPair&) = delete;
    ~KyberKeyPair() = default;
private:
    explicit KyberKeyPair(KyberKeyPairHandle handle) noexcept;
    KyberKeyPairHandle handle_;
};
}
