#include "fingerprint.hpp"
#include "curve25519.hpp"
#include "sodium_interop.hpp"

#include "sigil/core/constants.hpp"
#include "sigil/core/format.hpp"
#include "sigil/wire.pb.h"

#include <sodium.h>

namespace sigil::engine {

using protocol::FingerprintConstants;

namespace {
    constexpr std::array<uint8_t, 2> HASH_FORMAT_VERSION = {0x00, 0x00};

    std::span<const uint8_t> AsBytes(const std::string& value) {
        return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
    }

    std::string ScannableHalf(std::span<const uint8_t> digest) {
        return {reinterpret_cast<const char*>(digest.data()), FingerprintConstants::SCANNABLE_CONTENT_SIZE};
    }

    Result<proto::wire::CombinedFingerprints, EngineFailure> ParseCombined(std::span<const uint8_t> data) {
        proto::wire::CombinedFingerprints combined;
        if (data.empty() || !combined.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
            return Result<proto::wire::CombinedFingerprints, EngineFailure>::Err(
                EngineFailure::Protobuf("Failed to parse scannable fingerprint"));
        }
        return Result<proto::wire::CombinedFingerprints, EngineFailure>::Ok(std::move(combined));
    }
}

Fingerprints::Digest Fingerprints::IteratedDigest(
    const uint32_t iterations,
    std::span<const uint8_t> identifier,
    const Curve25519PublicBytes& key) {
    const auto key_bytes = Curve25519::SerializePublicKey(key);
    Digest digest{};

    crypto_hash_sha512_state state;
    crypto_hash_sha512_init(&state);
    crypto_hash_sha512_update(&state, HASH_FORMAT_VERSION.data(), HASH_FORMAT_VERSION.size());
    crypto_hash_sha512_update(&state, key_bytes.data(), key_bytes.size());
    crypto_hash_sha512_update(&state, identifier.data(), identifier.size());
    crypto_hash_sha512_update(&state, key_bytes.data(), key_bytes.size());
    crypto_hash_sha512_final(&state, digest.data());

    for (uint32_t i = 1; i < iterations; ++i) {
        crypto_hash_sha512_init(&state);
        crypto_hash_sha512_update(&state, digest.data(), digest.size());
        crypto_hash_sha512_update(&state, key_bytes.data(), key_bytes.size());
        crypto_hash_sha512_final(&state, digest.data());
    }
    sodium_memzero(&state, sizeof(state));
    return digest;
}

std::string Fingerprints::DisplayDigits(const Digest& digest) {
    std::string digits;
    digits.reserve(FingerprintConstants::DISPLAY_STRING_LENGTH / 2);
    for (size_t chunk = 0; chunk < FingerprintConstants::DISPLAY_CHUNKS; ++chunk) {
        uint64_t value = 0;
        for (size_t i = 0; i < FingerprintConstants::DISPLAY_CHUNK_BYTES; ++i) {
            value = (value << 8) | digest[chunk * FingerprintConstants::DISPLAY_CHUNK_BYTES + i];
        }
        digits += compat::format("{:05}", value % FingerprintConstants::DISPLAY_CHUNK_MODULUS);
    }
    return digits;
}

Result<std::unique_ptr<SglFingerprint>, EngineFailure> Fingerprints::Create(
    const uint32_t iterations,
    const uint32_t version,
    std::span<const uint8_t> local_identifier,
    const Curve25519PublicBytes& local_key,
    std::span<const uint8_t> remote_identifier,
    const Curve25519PublicBytes& remote_key) {
    using ResultType = Result<std::unique_ptr<SglFingerprint>, EngineFailure>;

    if (iterations < FingerprintConstants::MIN_ITERATIONS || iterations > FingerprintConstants::MAX_ITERATIONS) {
        return ResultType::Err(EngineFailure::InvalidArgument(
            compat::format("Fingerprint iterations must be {}-{}, got {}",
                FingerprintConstants::MIN_ITERATIONS, FingerprintConstants::MAX_ITERATIONS, iterations)));
    }

    auto local = IteratedDigest(iterations, local_identifier, local_key);
    auto remote = IteratedDigest(iterations, remote_identifier, remote_key);

    const std::string local_digits = DisplayDigits(local);
    const std::string remote_digits = DisplayDigits(remote);

    proto::wire::CombinedFingerprints combined;
    combined.set_version(version);
    combined.mutable_local_fingerprint()->set_content(ScannableHalf(local));
    combined.mutable_remote_fingerprint()->set_content(ScannableHalf(remote));
    SodiumInterop::SecureWipe(local);
    SodiumInterop::SecureWipe(remote);
    std::string encoded;
    if (!combined.SerializeToString(&encoded)) {
        return ResultType::Err(EngineFailure::Protobuf("Failed to encode scannable fingerprint"));
    }

    auto fingerprint = std::make_unique<SglFingerprint>();
    fingerprint->display = local_digits < remote_digits
        ? local_digits + remote_digits
        : remote_digits + local_digits;
    fingerprint->scannable.assign(encoded.begin(), encoded.end());
    return ResultType::Ok(std::move(fingerprint));
}

Result<bool, EngineFailure> Fingerprints::Compare(std::span<const uint8_t> ours, std::span<const uint8_t> theirs) {
    SGL_TRY_ASSIGN(mine, ParseCombined(ours));
    SGL_TRY_ASSIGN(other, ParseCombined(theirs));
    if (mine.version() != other.version()) {
        return Result<bool, EngineFailure>::Err(EngineFailure::FingerprintVersionMismatch(
            compat::format("Fingerprint version mismatch: {} vs {}", mine.version(), other.version())));
    }
    const bool same_local = SodiumInterop::ConstantTimeEquals(
        AsBytes(other.remote_fingerprint().content()), AsBytes(mine.local_fingerprint().content()));
    const bool same_remote = SodiumInterop::ConstantTimeEquals(
        AsBytes(other.local_fingerprint().content()), AsBytes(mine.remote_fingerprint().content()));
    return Result<bool, EngineFailure>::Ok(same_local && same_remote);
}

}
