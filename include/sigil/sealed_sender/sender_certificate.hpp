#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/keys/private_key.hpp"
#include "sigil/keys/public_key.hpp"
#include "sigil/sealed_sender/server_certificate.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
namespace sigil::protocol::sealed_sender {
using SenderCertificateHandle = ffi::ResourceHandle<ffi::SenderCertificateTraits>;
/**
 * @brief Binds a sender's uuid, optional phone number, device and identity
 * key to an expiry, signed by a server certificate.
 */
class SenderCertificate {
public:
    [[nodiscard]] static Result<SenderCertificate, SigilFailure> Create(
        const std::string& sender_uuid,
        const std::optional<std::string>& sender_e164,
        uint32_t device_id,
        const PublicKey& sender_key,
        uint64_t expiration,
        const ServerCertificate& signer,
        const PrivateKey& signer_key);
    [[nodiscard]] static Result<SenderCertificate, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Serialize() const;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> GetCertificate() const;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> GetSignature() const;
    [[nodiscard]] Result<std::string, SigilFailure> GetSenderUuid() const;
    [[nodiscard]] Result<std::optional<std::string>, SigilFailure> GetSenderE164() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetDeviceId() const;
    /// Milliseconds since the epoch.
    [[nodiscard]] Result<uint64_t, SigilFailure> GetExpiration() const;
    [[nodiscard]] Result<PublicKey, SigilFailure> GetKey() const;
    [[nodiscard]] Result<ServerCertificate, SigilFailure> GetServerCertificate() const;
    /**
     * Checks both signatures up to trust_root, that the server key id has
     * not been revoked, and that the certificate has not expired at now_millis.
     * An invalid certificate is Ok(false), not an error.
     */
    [[nodiscard]] Result<bool, SigilFailure> Validate(const PublicKey& trust_root, uint64_t now_millis) const;
    [[nodiscard]] Result<SenderCertificate, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    SenderCertificate(SenderCertificate&&) noexcept = default;
    SenderCertificate& operator=(SenderCertificate&&) noexcept = default;
    SenderCertificate(const SenderCertificate&) = delete;
    SenderCertificate& operator=(const SenderCertificate&) = delete;
    ~SenderCertificate() = default;
private:
    explicit SenderCertificate(SenderCertificateHandle handle) noexcept;
    SenderCertificateHandle handle_;
};
}
