#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/keys/public_key.hpp"
#include "sigil/kyber/kyber_public_key.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
namespace sigil::protocol::prekeys {
using keys::PublicKey;
using kyber::KyberPublicKey;
using PreKeyBundleHandle = ffi::ResourceHandle<ffi::PreKeyBundleTraits>;
/**
 * @brief Public half of a peer's pre-keys, as fetched from a server.
 *
 * The one-time pre-key is optional; the signed and Kyber pre-keys are not.
 */
class PreKeyBundle {
public:
    struct Parameters {
        uint32_t registration_id = 0;
        uint32_t device_id = 0;
        std::optional<uint32_t> pre_key_id;
        const PublicKey* pre_key = nullptr;
        uint32_t signed_pre_key_id = 0;
        const PublicKey* signed_pre_key = nullptr;
        std::span<const uint8_t> signed_pre_key_signature;
        const PublicKey* identity_key = nullptr;
        uint32_t kyber_pre_key_id = 0;
        const KyberPublicKey* kyber_pre_key = nullptr;
        std::span<const uint8_t> kyber_pre_key_signature;
    };
    [[nodiscard]] static Result<PreKeyBundle, SigilFailure> Create(const Parameters& parameters);
    [[nodiscard]] Result<uint32_t, SigilFailure> GetRegistrationId() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetDeviceId() const;
    [[nodiscard]] Result<std::optional<uint32_t>, SigilFailure> GetPreKeyId() const;
    [[nodiscard]] Result<std::optional<PublicKey>, SigilFailure> GetPreKeyPublic() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetSignedPreKeyId() const;
    [[nodiscard]] Result<PublicKey, SigilFailure> GetSignedPreKeyPublic() const;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> GetSignedPreKeySignature() const;
    [[nodiscard]] Result<PublicKey, SigilFailure> GetIdentityKey() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetKyberPreKeyId() const;
    [[nodiscard]] Result<KyberPublicKey, SigilFailure> GetKyberPreKeyPublic() const;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> GetKyberPreKeySignature() const;
    /// True when both pre-key signatures verify under the identity key.
    [[nodiscard]] Result<bool, SigilFailure> VerifySignatures() const;
    [[nodiscard]] Result<PreKeyBundle, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    PreKeyBundle(PreKeyBundle&&) noexcept = default;
    PreKeyBundle& operator=(PreKeyBundle&&) noexcept = default;
    PreKeyBundle(const PreKeyBundle&) = delete;
    PreKeyBundle& operator=(const PreKeyBundle&) = delete;
    ~PreKeyBundle() = default;
private:
    explicit PreKeyBundle(PreKeyBundleHandle handle) noexcept;
    PreKeyBundleHandle handle_;
};
}
