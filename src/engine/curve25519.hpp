#pragma once

#include "engine_failure.hpp"
#include "secure_memory_handle.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace sigil::engine {

using Curve25519PublicBytes = std::array<uint8_t, 32>;

/**
 * @brief X25519 agreement and XEdDSA signatures over Montgomery keys.
 *
 * One Curve25519 key pair serves both purposes. Signatures are R || s
 * (64 bytes) and verify against the Edwards point derived from the
 * Montgomery u-coordinate with the sign bit cleared.
 */
class Curve25519 {
public:
    static Result<SecureMemoryHandle, EngineFailure> GeneratePrivateKey();

    /// Type byte 0x05 followed by the 32-byte u-coordinate.
    static std::vector<uint8_t> SerializePublicKey(const Curve25519PublicBytes& key);

    static Result<Curve25519PublicBytes, EngineFailure> ParsePublicKey(std::span<const uint8_t> data);

    /// Clamps a caller-supplied 32-byte scalar into a private key.
    static Result<SecureMemoryHandle, EngineFailure> PrivateKeyFromBytes(std::span<const uint8_t> scalar);

    static Result<Curve25519PublicBytes, EngineFailure> DerivePublicKey(const SecureMemoryHandle& private_key);

    static Result<std::vector<uint8_t>, EngineFailure> Agree(
        const SecureMemoryHandle& private_key,
        std::span<const uint8_t> their_public);

    static Result<std::vector<uint8_t>, EngineFailure> Sign(
        const SecureMemoryHandle& private_key,
        std::span<const uint8_t> message);

    static Result<bool, EngineFailure> Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

private:
    static Result<std::array<uint8_t, 32>, EngineFailure> MontgomeryToEdwards(std::span<const uint8_t> u);
};

}
