#pragma once

#include "sigil/core/constants.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace sigil::protocol::validation {

/**
 * @brief Structural checks run on caller bytes before they reach the engine.
 *
 * Every rule is a pure function of the input. None touches the engine, so a
 * rejected input never allocates a native object. The checks are shallow:
 * they catch truncation, the wrong key family and obvious garbage, not
 * every malformed protobuf. The engine still parses fully.
 *
 * The low-order point list is a fixed blocklist of the seven well-known
 * Curve25519 encodings, not a full on-curve or subgroup check.
 */
class SerializationValidator {
public:
    using Check = Result<Unit, ValidationFailure>;

    static constexpr size_t LOW_ORDER_POINT_COUNT = 7;

    /// The blocklisted 32-byte encodings, in little-endian order.
    static const std::array<std::array<uint8_t, KeyConstants::CURVE_25519_KEY_SIZE>, LOW_ORDER_POINT_COUNT>&
    LowOrderPoints() noexcept;

    [[nodiscard]] static bool IsLowOrderPoint(std::span<const uint8_t> key_bytes) noexcept;

    // ========================================================================
    // Keys (exact length)
    // ========================================================================

    /// 33 bytes, 0x05 type byte, point not blocklisted.
    [[nodiscard]] static Check ValidatePublicKey(std::span<const uint8_t> data);

    [[nodiscard]] static Check ValidatePrivateKey(std::span<const uint8_t> data);

    [[nodiscard]] static Check ValidateIdentityKeyPair(std::span<const uint8_t> data);

    [[nodiscard]] static Check ValidateKyberPublicKey(std::span<const uint8_t> data);

    [[nodiscard]] static Check ValidateKyberSecretKey(std::span<const uint8_t> data);

    // ========================================================================
    // Records (minimum length plus leading protobuf tag)
    // ========================================================================

    [[nodiscard]] static Check ValidatePreKeyRecord(std::span<const uint8_t> data);

    [[nodiscard]] static Check ValidateSignedPreKeyRecord(std::span<const uint8_t> data);

    [[nodiscard]] static Check ValidateKyberPreKeyRecord(std::span<const uint8_t> data);

    [[nodiscard]] static Check ValidateSessionRecord(std::span<const uint8_t> data);

    [[nodiscard]] static Check ValidateSenderKeyRecord(std::span<const uint8_t> data);

    [[nodiscard]] static Check ValidateSenderCertificate(std::span<const uint8_t> data);

    [[nodiscard]] static Check ValidateServerCertificate(std::span<const uint8_t> data);

    // ========================================================================
    // Messages
    // ========================================================================

    /// High nibble of the first byte is the message version, 2 through 4.
    [[nodiscard]] static Check ValidateSignalMessage(std::span<const uint8_t> data);

    [[nodiscard]] static Check ValidateSenderKeyMessage(std::span<const uint8_t> data);

    [[nodiscard]] static Check ValidateSenderKeyDistributionMessage(std::span<const uint8_t> data);

    /// Only the wire type of the first tag is checked.
    [[nodiscard]] static Check ValidateDecryptionErrorMessage(std::span<const uint8_t> data);

    // ========================================================================
    // Building blocks
    // ========================================================================

    /// Non-empty, at most the 10 MiB ceiling, at least min_length.
    [[nodiscard]] static Check ValidateLength(
        std::span<const uint8_t> data,
        size_t min_length,
        std::string_view type_name);

private:
    static Check ValidateExactLength(
        std::span<const uint8_t> data,
        size_t expected_length,
        std::string_view type_name);

    static Check ValidateLeadingTag(
        std::span<const uint8_t> data,
        std::span<const uint8_t> allowed_tags,
        std::string_view type_name);

    static Check ValidateMessageVersion(
        std::span<const uint8_t> data,
        std::string_view type_name);

    static Check Reject(ValidationReason reason, std::string_view type_name, std::string message, size_t length);
};

/// Lifts a validation result into the binding's failure type.
[[nodiscard]] inline Result<Unit, SigilFailure> Enforce(
    SerializationValidator::Check check,
    const std::string_view context) {
    if (check.IsErr()) {
        return Result<Unit, SigilFailure>::Err(
            SigilFailure::FromValidationFailure(check.UnwrapErr(), std::string(context)));
    }
    return Result<Unit, SigilFailure>::Ok(unit);
}

}
