#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/groups/distribution_id.hpp"
#include "sigil/keys/private_key.hpp"
#include "sigil/keys/public_key.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::groups {
using keys::PrivateKey;
using keys::PublicKey;
using SenderKeyMessageHandle = ffi::ResourceHandle<ffi::SenderKeyMessageTraits>;
/**
 * @brief One group ciphertext: version byte, protobuf body, 64-byte signature.
 *
 * Normally produced by GroupSession::Encrypt. Create() exists for tests and
 * for hosts that drive the chain themselves.
 */
class SenderKeyMessage {
public:
    [[nodiscard]] static Result<SenderKeyMessage, SigilFailure> Create(
        const DistributionId& distribution_id,
        uint32_t chain_id,
        uint32_t iteration,
        std::span<const uint8_t> ciphertext,
        const PrivateKey& signing_key);
    [[nodiscard]] static Result<SenderKeyMessage, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Serialize() const;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> GetCipherText() const;
    [[nodiscard]] Result<DistributionId, SigilFailure> GetDistributionId() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetChainId() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetIteration() const;
    [[nodiscard]] Result<bool, SigilFailure> VerifySignature(const PublicKey& signing_key) const;
    [[nodiscard]] Result<SenderKeyMessage, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    SenderKeyMessage(SenderKeyMessage&&) noexcept = default;
    SenderKeyMessage& operator=(SenderKeyMessage&&) noexcept = default;
    SenderKeyMessage(const SenderKeyMessage&) = delete;
    SenderKeyMessage& operator=(const SenderKeyMessage&) = delete;
    ~SenderKeyMessage() = default;
private:
    explicit SenderKeyMessage(SenderKeyMessageHandle handle) noexcept;
    SenderKeyMessageHandle handle_;
};
}
