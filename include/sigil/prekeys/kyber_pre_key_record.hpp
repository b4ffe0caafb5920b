#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/kyber/kyber_key_pair.hpp"
#include "sigil/kyber/kyber_public_key.hpp"
#include "sigil/kyber/kyber_secret_key.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::prekeys {
using crypto::SecureBytes;
using kyber::KyberKeyPair;
using kyber::KyberPublicKey;
using kyber::KyberSecretKey;
using KyberPreKeyRecordHandle = ffi::ResourceHandle<ffi::KyberPreKeyRecordTraits>;
/// Signed Kyber-1024 pre-key.
class KyberPreKeyRecord {
public:
    [[nodiscard]] static Result<KyberPreKeyRecord, SigilFailure> Create(
        uint32_t id,
        uint64_t timestamp,
        const KyberKeyPair& key_pair,
        std::span<const uint8_t> signature);
    [[nodiscard]] static Result<KyberPreKeyRecord, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] Result<SecureBytes, SigilFailure> Serialize() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetId() const;
    [[nodiscard]] Result<uint64_t, SigilFailure> GetTimestamp() const;
    [[nodiscard]] Result<KyberPublicKey, SigilFailure> GetPublicKey() const;
    [[nodiscard]] Result<KyberSecretKey, SigilFailure> GetSecretKey() const;
    [[nodiscard]] Result<KyberKeyPair, SigilFailure> GetKeyPair() const;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> GetSignature() const;
    [[nodiscard]] Result<KyberPreKeyRecord, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    KyberPreKeyRecord(KyberPreKeyRecord&&) noexcept = default;
    KyberPreKeyRecord& operator=(KyberPreKeyRecord&&) noexcept = default;
    KyberPreKeyRecord(const KyberPreKeyRecord&) = delete;
    KyberPreKeyRecord& operator=(const KyberPreKeyRecord&) = delete;
    ~KyberPreKeyRecord() = default;
private:
    explicit KyberPreKeyRecord(KyberPreKeyRecordHandle handle) noexcept;
    KyberPreKeyRecordHandle handle_;
};
}
