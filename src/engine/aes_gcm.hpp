#pragma once

#include "engine_failure.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace sigil::engine {

/**
 * AES-256-GCM authenticated encryption.
 *
 * Stateless: the caller owns nonce uniqueness per key. Output of Encrypt is
 * ciphertext || 16-byte tag; Decrypt fails with INVALID_MESSAGE when the tag
 * does not verify.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, EngineFailure> Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, EngineFailure> Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});

private:
    AesGcm() = delete;
};

}
