#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/keys/private_key.hpp"
#include "sigil/keys/public_key.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::sealed_sender {
using protocol::Result;
using protocol::SigilFailure;
using keys::PrivateKey;
using keys::PublicKey;
using ServerCertificateHandle = ffi::ResourceHandle<ffi::ServerCertificateTraits>;
/// Server key endorsed by the trust root. Signs sender certificates.
class ServerCertificate {
public:
    [[nodiscard]] static Result<ServerCertificate, SigilFailure> Create(
        uint32_t key_id,
        const PublicKey& server_key,
        const PrivateKey& trust_root);
    [[nodiscard]] static Result<ServerCertificate, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] static ServerCertificate FromHandle(ServerCertificateHandle handle) noexcept;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Serialize() const;
    /// Signed body, without the signature.
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> GetCertificate() const;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> GetSignature() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetKeyId() const;
    [[nodiscard]] Result<PublicKey, SigilFailure> GetKey() const;
    [[nodiscard]] Result<ServerCertificate, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    [[nodiscard]] const ServerCertificateHandle& Handle() const noexcept { return handle_; }
    ServerCertificate(ServerCertificate&&) noexcept = default;
    ServerCertificate& operator=(ServerCertificate&&) noexcept = default;
    ServerCertificate(const ServerCertificate&) = delete;
    ServerCertificate& operator=(const ServerCertificate&) = delete;
    ~ServerCertificate() = default;
private:
    explicit ServerCertificate(ServerCertificateHandle handle) noexcept;
    ServerCertificateHandle handle_;
};
}
