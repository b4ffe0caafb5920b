#pragma once

#include "engine_failure.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace sigil::engine {

/// HKDF-SHA256 (RFC 5869) through the OpenSSL 3 KDF interface.
class Hkdf {
public:
    static Result<Unit, EngineFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, EngineFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});
};

}
