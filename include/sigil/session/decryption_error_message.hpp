#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/keys/public_key.hpp"
#include "sigil/session/ciphertext_message_type.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
namespace sigil::protocol::session {
using keys::PublicKey;
using DecryptionErrorMessageHandle = ffi::ResourceHandle<ffi::DecryptionErrorMessageTraits>;
/**
 * @brief Notice sent back to a sender whose message could not be decrypted.
 *
 * For Whisper and PreKey originals the notice names the ratchet key the
 * failed message was sent under. Sender key and plaintext originals carry
 * none.
 */
class DecryptionErrorMessage {
public:
    [[nodiscard]] static Result<DecryptionErrorMessage, SigilFailure> ForOriginalMessage(
        std::span<const uint8_t> original_bytes,
        CiphertextMessageType original_type,
        uint64_t timestamp,
        uint32_t original_sender_device_id);
    [[nodiscard]] static Result<DecryptionErrorMessage, SigilFailure> Deserialize(std::span<const uint8_t> data);
    /// data is a decrypted content body ending in the 0x80 padding boundary.
    [[nodiscard]] static Result<DecryptionErrorMessage, SigilFailure> ExtractFromSerializedContent(
        std::span<const uint8_t> data);
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Serialize() const;
    [[nodiscard]] Result<uint64_t, SigilFailure> GetTimestamp() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetDeviceId() const;
    [[nodiscard]] Result<std::optional<PublicKey>, SigilFailure> GetRatchetKey() const;
    [[nodiscard]] Result<DecryptionErrorMessage, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    DecryptionErrorMessage(DecryptionErrorMessage&&) noexcept = default;
    DecryptionErrorMessage& operator=(DecryptionErrorMessage&&) noexcept = default;
    DecryptionErrorMessage(const DecryptionErrorMessage&) = delete;
    DecryptionErrorMessage& operator=(const DecryptionErrorMessage&) = delete;
    ~DecryptionErrorMessage() = default;
private:
    explicit DecryptionErrorMessage(DecryptionErrorMessageHandle handle) noexcept;
    DecryptionErrorMessageHandle handle_;
};
}
