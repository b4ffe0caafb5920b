#pragma once

#include "engine_failure.hpp"
#include "native_objects.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace sigil::engine {

/**
 * @brief Safety numbers for two identity keys.
 *
 * Each party's digest starts as SHA-512(0x0000 || key || identifier || key)
 * and is rehashed as SHA-512(digest || key) for the remaining iterations.
 * The display form is six 5-digit groups per party (a 40-bit big-endian
 * chunk mod 100000), the two halves ordered so that both sides print the
 * same 60 digits. The scannable form is a CombinedFingerprints protobuf
 * holding the first 32 bytes of each digest.
 */
class Fingerprints {
public:
    static Result<std::unique_ptr<SglFingerprint>, EngineFailure> Create(
        uint32_t iterations,
        uint32_t version,
        std::span<const uint8_t> local_identifier,
        const Curve25519PublicBytes& local_key,
        std::span<const uint8_t> remote_identifier,
        const Curve25519PublicBytes& remote_key);

    /// True when theirs is the other party's scannable encoding of ours.
    static Result<bool, EngineFailure> Compare(std::span<const uint8_t> ours, std::span<const uint8_t> theirs);

private:
    using Digest = std::array<uint8_t, 64>;

    static Digest IteratedDigest(
        uint32_t iterations,
        std::span<const uint8_t> identifier,
        const Curve25519PublicBytes& key);

    static std::string DisplayDigits(const Digest& digest);
};

}
