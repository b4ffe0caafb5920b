#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/keys/private_key.hpp"
#include "sigil/keys/public_key.hpp"
#include <cstdint>
#include <span>
namespace sigil::protocol::prekeys {
using protocol::Result;
using protocol::SigilFailure;
using crypto::SecureBytes;
using keys::PrivateKey;
using keys::PublicKey;
using PreKeyRecordHandle = ffi::ResourceHandle<ffi::PreKeyRecordTraits>;
/// One-time Curve25519 pre-key with its id.
class PreKeyRecord {
public:
    [[nodiscard]] static Result<PreKeyRecord, SigilFailure> Create(
        uint32_t id,
        const PublicKey& public_key,
        const PrivateKey& private_key);
    [[nodiscard]] static Result<PreKeyRecord, SigilFailure> Deserialize(std::span<const uint8_t> data);
    /// Contains the private key.
    [[nodiscard]] Result<SecureBytes, SigilFailure> Serialize() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetId() const;
    [[nodiscard]] Result<PublicKey, SigilFailure> GetPublicKey() const;
    [[nodiscard]] Result<PrivateKey, SigilFailure> GetPrivateKey() const;
    [[nodiscard]] Result<PreKeyRecord, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    PreKeyRecord(PreKeyRecord&&) noexcept = default;
    PreKeyRecord& operator=(PreKeyRecord&&) noexcept = default;
    PreKeyRecord(const PreKeyRecord&) = delete;
    PreKeyRecord& operator=(const PreKeyRecord&) = delete;
    ~PreKeyRecord() = default;
private:
    explicit PreKeyRecord(PreKeyRecordHandle handle) noexcept;
    PreKeyRecordHandle handle_;
};
}
