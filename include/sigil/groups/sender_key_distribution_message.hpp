#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/groups/distribution_id.hpp"
#include "sigil/keys/public_key.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::groups {
using crypto::SecureBytes;
using keys::PublicKey;
using SenderKeyDistributionMessageHandle = ffi::ResourceHandle<ffi::SenderKeyDistributionMessageTraits>;
/// Hands a sender's chain key and signing key to group members.
class SenderKeyDistributionMessage {
public:
    /// chain_key must be 32 bytes.
    [[nodiscard]] static Result<SenderKeyDistributionMessage, SigilFailure> Create(
        const DistributionId& distribution_id,
        uint32_t chain_id,
        uint32_t iteration,
        std::span<const uint8_t> chain_key,
        const PublicKey& signing_key);
    [[nodiscard]] static Result<SenderKeyDistributionMessage, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] static SenderKeyDistributionMessage FromHandle(SenderKeyDistributionMessageHandle handle) noexcept;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Serialize() const;
    [[nodiscard]] Result<SecureBytes, SigilFailure> GetChainKey() const;
    [[nodiscard]] Result<DistributionId, SigilFailure> GetDistributionId() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetChainId() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetIteration() const;
    [[nodiscard]] Result<PublicKey, SigilFailure> GetSignatureKey() const;
    [[nodiscard]] Result<SenderKeyDistributionMessage, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    [[nodiscard]] const SenderKeyDistributionMessageHandle& Handle() const noexcept { return handle_; }
    SenderKeyDistributionMessage(SenderKeyDistributionMessage&&) noexcept = default;
    SenderKeyDistributionMessage& operator=(SenderKeyDistributionMessage&&) noexcept = default;
    SenderKeyDistributionMessage(const SenderKeyDistributionMessage&) = delete;
    SenderKeyDistributionMessage& operator=(const SenderKeyDistributionMessage&) = delete;
    ~SenderKeyDistributionMessage() = default;
private:
    explicit SenderKeyDistributionMessage(SenderKeyDistributionMessageHandle handle) noexcept;
    SenderKeyDistributionMessageHandle handle_;
};
}
