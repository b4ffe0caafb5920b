#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/keys/private_key.hpp"
#include "sigil/keys/public_key.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::prekeys {
using crypto::SecureBytes;
using keys::PrivateKey;
using keys::PublicKey;
using SignedPreKeyRecordHandle = ffi::ResourceHandle<ffi::SignedPreKeyRecordTraits>;
/**
 * @brief Medium-term Curve25519 pre-key signed by the identity key.
 *
 * The signature is stored as given; Create() does not check it.
 */
class SignedPreKeyRecord {
public:
    [[nodiscard]] static Result<SignedPreKeyRecord, SigilFailure> Create(
        uint32_t id,
        uint64_t timestamp,
        const PublicKey& public_key,
        const PrivateKey& private_key,
        std::span<const uint8_t> signature);
    [[nodiscard]] static Result<SignedPreKeyRecord, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] Result<SecureBytes, SigilFailure> Serialize() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetId() const;
    /// Milliseconds since the Unix epoch.
    [[nodiscard]] Result<uint64_t, SigilFailure> GetTimestamp() const;
    [[nodiscard]] Result<PublicKey, SigilFailure> GetPublicKey() const;
    [[nodiscard]] Result<PrivateKey, SigilFailure> GetPrivateKey() const;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> GetSignature() const;
    [[nodiscard]] Result<SignedPreKeyRecord, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    SignedPreKeyRecord(SignedPreKeyRecord&&) noexcept = default;
    SignedPreKeyRecord& operator=(SignedPreKeyRecord&&) noexcept = default;
    SignedPreKeyRecord(const SignedPreKeyRecord&) = delete;
    SignedPreKeyRecord& operator=(const SignedPreKeyRecord&) = delete;
    ~SignedPreKeyRecord() = default;
private:
    explicit SignedPreKeyRecord(SignedPreKeyRecordHandle handle) noexcept;
    SignedPreKeyRecordHandle handle_;
};
}
