#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/crypto/secure_bytes.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
namespace sigil::protocol::crypto {
class Hkdf {
public:
    /**
     * HKDF-SHA256 (RFC 5869). Output length must be 1..8160 bytes; an empty
     * salt means the all-zero salt.
     */
    [[nodiscard]] static Result<SecureBytes, SigilFailure> DeriveSecrets(
        std::span<const uint8_t> input_key_material,
        std::span<const uint8_t> info,
        std::span<const uint8_t> salt,
        size_t output_length);
};
}
