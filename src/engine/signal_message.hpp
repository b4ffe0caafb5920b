#pragma once

#include "engine_failure.hpp"
#include "native_objects.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace sigil::engine {

/**
 * @brief Wire codec for pairwise ratchet messages.
 *
 * A SignalMessage is version || protobuf || MAC. The version byte carries the
 * message version in the high nibble and the current version in the low one.
 * The MAC is HMAC-SHA256 keyed with the 32-byte message MAC key over
 * sender identity || receiver identity || version || protobuf, truncated to
 * 8 bytes. Versions below 3 are legacy and rejected.
 */
class SignalMessages {
public:
    static Result<std::unique_ptr<SglSignalMessage>, EngineFailure> Create(
        uint8_t message_version,
        std::span<const uint8_t> mac_key,
        const Curve25519PublicBytes& sender_ratchet_key,
        uint32_t counter,
        uint32_t previous_counter,
        std::span<const uint8_t> ciphertext,
        const Curve25519PublicBytes& sender_identity_key,
        const Curve25519PublicBytes& receiver_identity_key,
        std::span<const uint8_t> pq_ratchet);

    static Result<std::unique_ptr<SglSignalMessage>, EngineFailure> Parse(std::span<const uint8_t> data);

    static Result<bool, EngineFailure> VerifyMac(
        const SglSignalMessage& message,
        const Curve25519PublicBytes& sender_identity_key,
        const Curve25519PublicBytes& receiver_identity_key,
        std::span<const uint8_t> mac_key);

    /// Ratchet key of a pre-key message's inner SignalMessage.
    static Result<Curve25519PublicBytes, EngineFailure> PreKeyMessageRatchetKey(std::span<const uint8_t> data);

private:
    static Result<std::vector<uint8_t>, EngineFailure> ComputeMac(
        std::span<const uint8_t> mac_key,
        const Curve25519PublicBytes& sender_identity_key,
        const Curve25519PublicBytes& receiver_identity_key,
        std::span<const uint8_t> message);

    static Result<Unit, EngineFailure> CheckVersion(uint8_t version_byte);
};

/**
 * @brief Decryption error notices sent back to a message's sender.
 *
 * The notice carries the original timestamp, the original sender's device
 * and, for pairwise messages, the ratchet key the failed message was sent
 * under so the sender can tell which session broke.
 */
class DecryptionErrorMessages {
public:
    static Result<std::unique_ptr<SglDecryptionErrorMessage>, EngineFailure> ForOriginal(
        std::span<const uint8_t> original_bytes,
        uint8_t original_type,
        uint64_t timestamp,
        uint32_t original_sender_device_id);

    static Result<std::unique_ptr<SglDecryptionErrorMessage>, EngineFailure> Parse(std::span<const uint8_t> data);

    static Result<std::unique_ptr<SglDecryptionErrorMessage>, EngineFailure> ExtractFromContent(
        std::span<const uint8_t> data);
};

}
