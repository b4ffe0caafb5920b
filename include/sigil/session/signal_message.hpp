#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/keys/public_key.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
namespace sigil::protocol::session {
using keys::PublicKey;
using SignalMessageHandle = ffi::ResourceHandle<ffi::SignalMessageTraits>;
/**
 * @brief One pairwise ratchet ciphertext: version byte, protobuf body, 8-byte MAC.
 *
 * The MAC binds both identity keys, so VerifyMac needs the sender's and the
 * receiver's identity in that order. Create() exists for tests and for hosts
 * that drive the ratchet themselves.
 */
class SignalMessage {
public:
    [[nodiscard]] static Result<SignalMessage, SigilFailure> Create(
        uint8_t message_version,
        std::span<const uint8_t> mac_key,
        const PublicKey& sender_ratchet_key,
        uint32_t counter,
        uint32_t previous_counter,
        std::span<const uint8_t> ciphertext,
        const PublicKey& sender_identity_key,
        const PublicKey& receiver_identity_key,
        std::span<const uint8_t> pq_ratchet = {});
    [[nodiscard]] static Result<SignalMessage, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Serialize() const;
    /// The encrypted payload inside the protobuf body.
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> GetBody() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetCounter() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetMessageVersion() const;
    [[nodiscard]] Result<PublicKey, SigilFailure> GetSenderRatchetKey() const;
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, SigilFailure> GetPqRatchet() const;
    [[nodiscard]] Result<bool, SigilFailure> VerifyMac(
        const PublicKey& sender_identity_key,
        const PublicKey& receiver_identity_key,
        std::span<const uint8_t> mac_key) const;
    [[nodiscard]] Result<SignalMessage, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    SignalMessage(SignalMessage&&) noexcept = default;
    SignalMessage& operator=(SignalMessage&&) noexcept = default;
    SignalMessage(const SignalMessage&) = delete;
    SignalMessage& operator=(const SignalMessage&) = delete;
    ~SignalMessage() = default;
private:
    explicit SignalMessage(SignalMessageHandle handle) noexcept;
    SignalMessageHandle handle_;
};
}
