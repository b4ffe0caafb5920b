#include "curve25519.hpp"
#include "sodium_interop.hpp"

#include "sigil/core/constants.hpp"

#include <openssl/bn.h>
#include <sodium.h>

#include <algorithm>
#include <memory>
#include <string>

namespace sigil::engine {

using protocol::KeyConstants;

namespace {
    constexpr size_t SCALAR_SIZE = crypto_core_ed25519_SCALARBYTES;
    constexpr size_t NONREDUCED_SCALAR_SIZE = crypto_core_ed25519_NONREDUCEDSCALARBYTES;
    constexpr size_t XEDDSA_RANDOM_SIZE = 64;

    struct BN_Deleter {
        void operator()(BIGNUM* bn) const { BN_free(bn); }
    };
    struct BN_CTX_Deleter {
        void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
    };
    using BN_ptr = std::unique_ptr<BIGNUM, BN_Deleter>;
    using BN_CTX_ptr = std::unique_ptr<BN_CTX, BN_CTX_Deleter>;

    void Clamp(std::span<uint8_t> scalar) {
        scalar[0] &= 248;
        scalar[31] &= 127;
        scalar[31] |= 64;
    }

    void ReduceScalar(uint8_t out[SCALAR_SIZE], std::span<const uint8_t> input) {
        uint8_t wide[NONREDUCED_SCALAR_SIZE] = {};
        std::copy(input.begin(), input.end(), wide);
        crypto_core_ed25519_scalar_reduce(out, wide);
        sodium_memzero(wide, sizeof(wide));
    }
}

Result<SecureMemoryHandle, EngineFailure> Curve25519::GeneratePrivateKey() {
    auto handle_result = SecureMemoryHandle::Allocate(KeyConstants::PRIVATE_KEY_SIZE);
    if (handle_result.IsErr()) {
        return handle_result;
    }
    auto handle = std::move(handle_result).Unwrap();
    handle.WithWriteAccess([](std::span<uint8_t> scalar) {
        SodiumInterop::FillRandom(scalar);
        Clamp(scalar);
    });
    return Result<SecureMemoryHandle, EngineFailure>::Ok(std::move(handle));
}

std::vector<uint8_t> Curve25519::SerializePublicKey(const Curve25519PublicBytes& key) {
    std::vector<uint8_t> serialized;
    serialized.reserve(KeyConstants::PUBLIC_KEY_SIZE);
    serialized.push_back(KeyConstants::CURVE_25519_KEY_TYPE);
    serialized.insert(serialized.end(), key.begin(), key.end());
    return serialized;
}

Result<Curve25519PublicBytes, EngineFailure> Curve25519::ParsePublicKey(std::span<const uint8_t> data) {
    if (data.empty()) {
        return Result<Curve25519PublicBytes, EngineFailure>::Err(
            EngineFailure::InvalidKey("No key type identifier"));
    }
    if (data[0] != KeyConstants::CURVE_25519_KEY_TYPE) {
        return Result<Curve25519PublicBytes, EngineFailure>::Err(
            EngineFailure::InvalidKey("Bad key type: " + std::to_string(data[0])));
    }
    if (data.size() != KeyConstants::PUBLIC_KEY_SIZE) {
        return Result<Curve25519PublicBytes, EngineFailure>::Err(
            EngineFailure::InvalidKey("Bad key length: " + std::to_string(data.size())));
    }
    Curve25519PublicBytes key{};
    std::copy(data.begin() + 1, data.end(), key.begin());
    return Result<Curve25519PublicBytes, EngineFailure>::Ok(key);
}

Result<SecureMemoryHandle, EngineFailure> Curve25519::PrivateKeyFromBytes(std::span<const uint8_t> scalar) {
    if (scalar.size() != KeyConstants::PRIVATE_KEY_SIZE) {
        return Result<SecureMemoryHandle, EngineFailure>::Err(
            EngineFailure::InvalidKey("Private key must be 32 bytes"));
    }
    auto handle_result = SecureMemoryHandle::FromBytes(scalar);
    if (handle_result.IsErr()) {
        return handle_result;
    }
    auto handle = std::move(handle_result).Unwrap();
    handle.WithWriteAccess([](std::span<uint8_t> bytes) { Clamp(bytes); });
    return Result<SecureMemoryHandle, EngineFailure>::Ok(std::move(handle));
}

Result<Curve25519PublicBytes, EngineFailure> Curve25519::DerivePublicKey(const SecureMemoryHandle& private_key) {
    Curve25519PublicBytes public_key{};
    const int rc = private_key.WithReadAccess([&](std::span<const uint8_t> scalar) {
        return crypto_scalarmult_base(public_key.data(), scalar.data());
    });
    if (rc != 0) {
        return Result<Curve25519PublicBytes, EngineFailure>::Err(
            EngineFailure::InvalidKey("Failed to derive Curve25519 public key"));
    }
    return Result<Curve25519PublicBytes, EngineFailure>::Ok(public_key);
}

Result<std::vector<uint8_t>, EngineFailure> Curve25519::Agree(
    const SecureMemoryHandle& private_key,
    std::span<const uint8_t> their_public) {
    if (their_public.size() != KeyConstants::CURVE_25519_KEY_SIZE) {
        return Result<std::vector<uint8_t>, EngineFailure>::Err(
            EngineFailure::InvalidKey("Peer public key must be 32 bytes"));
    }
    std::vector<uint8_t> shared(KeyConstants::AGREEMENT_SIZE);
    const int rc = private_key.WithReadAccess([&](std::span<const uint8_t> scalar) {
        return crypto_scalarmult(shared.data(), scalar.data(), their_public.data());
    });
    if (rc != 0) {
        SodiumInterop::SecureWipe(shared);
        return Result<std::vector<uint8_t>, EngineFailure>::Err(
            EngineFailure::InvalidKey("X25519 agreement produced a low-order result"));
    }
    return Result<std::vector<uint8_t>, EngineFailure>::Ok(std::move(shared));
}

Result<std::vector<uint8_t>, EngineFailure> Curve25519::Sign(
    const SecureMemoryHandle& private_key,
    std::span<const uint8_t> message) {
    uint8_t k[SCALAR_SIZE];
    uint8_t a[SCALAR_SIZE];
    uint8_t r[SCALAR_SIZE];
    uint8_t h[SCALAR_SIZE];
    uint8_t ha[SCALAR_SIZE];
    uint8_t edwards_public[crypto_core_ed25519_BYTES];
    uint8_t digest[crypto_hash_sha512_BYTES];
    uint8_t random_z[XEDDSA_RANDOM_SIZE];
    std::vector<uint8_t> signature(KeyConstants::SIGNATURE_SIZE);

    auto wipe = [&]() {
        sodium_memzero(k, sizeof(k));
        sodium_memzero(a, sizeof(a));
        sodium_memzero(r, sizeof(r));
        sodium_memzero(ha, sizeof(ha));
        sodium_memzero(digest, sizeof(digest));
        sodium_memzero(random_z, sizeof(random_z));
    };

    private_key.WithReadAccess([&](std::span<const uint8_t> scalar) { ReduceScalar(k, scalar); });
    if (crypto_scalarmult_ed25519_base_noclamp(edwards_public, k) != 0) {
        wipe();
        return Result<std::vector<uint8_t>, EngineFailure>::Err(
            EngineFailure::InvalidKey("Private key maps to the identity point"));
    }

    const bool sign_bit = (edwards_public[31] & 0x80) != 0;
    edwards_public[31] &= 0x7F;
    if (sign_bit) {
        crypto_core_ed25519_scalar_negate(a, k);
    } else {
        std::copy(k, k + SCALAR_SIZE, a);
    }

    SodiumInterop::FillRandom(random_z);
    uint8_t prefix[32];
    prefix[0] = 0xFE;
    std::fill(prefix + 1, prefix + sizeof(prefix), 0xFF);

    crypto_hash_sha512_state state;
    crypto_hash_sha512_init(&state);
    crypto_hash_sha512_update(&state, prefix, sizeof(prefix));
    crypto_hash_sha512_update(&state, a, sizeof(a));
    crypto_hash_sha512_update(&state, message.data(), message.size());
    crypto_hash_sha512_update(&state, random_z, sizeof(random_z));
    crypto_hash_sha512_final(&state, digest);
    crypto_core_ed25519_scalar_reduce(r, digest);

    if (crypto_scalarmult_ed25519_base_noclamp(signature.data(), r) != 0) {
        wipe();
        return Result<std::vector<uint8_t>, EngineFailure>::Err(
            EngineFailure::Internal("XEdDSA nonce produced the identity point"));
    }

    crypto_hash_sha512_init(&state);
    crypto_hash_sha512_update(&state, signature.data(), 32);
    crypto_hash_sha512_update(&state, edwards_public, sizeof(edwards_public));
    crypto_hash_sha512_update(&state, message.data(), message.size());
    crypto_hash_sha512_final(&state, digest);
    crypto_core_ed25519_scalar_reduce(h, digest);

    crypto_core_ed25519_scalar_mul(ha, h, a);
    crypto_core_ed25519_scalar_add(signature.data() + 32, r, ha);

    wipe();
    sodium_memzero(&state, sizeof(state));
    return Result<std::vector<uint8_t>, EngineFailure>::Ok(std::move(signature));
}

Result<bool, EngineFailure> Curve25519::Verify(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {
    if (public_key.size() != KeyConstants::CURVE_25519_KEY_SIZE) {
        return Result<bool, EngineFailure>::Err(
            EngineFailure::InvalidKey("Public key must be 32 bytes"));
    }
    if (signature.size() != KeyConstants::SIGNATURE_SIZE) {
        return Result<bool, EngineFailure>::Ok(false);
    }

    auto edwards = MontgomeryToEdwards(public_key);
    if (edwards.IsErr()) {
        return Result<bool, EngineFailure>::Ok(false);
    }
    const auto& edwards_public = edwards.Unwrap();
    const int rc = crypto_sign_ed25519_verify_detached(
        signature.data(), message.data(), message.size(), edwards_public.data());
    return Result<bool, EngineFailure>::Ok(rc == 0);
}

Result<std::array<uint8_t, 32>, EngineFailure> Curve25519::MontgomeryToEdwards(std::span<const uint8_t> u) {
    BN_CTX_ptr ctx(BN_CTX_new());
    BN_ptr p(BN_new());
    BN_ptr u_bn(BN_lebin2bn(u.data(), static_cast<int>(u.size()), nullptr));
    BN_ptr numerator(BN_new());
    BN_ptr denominator(BN_new());
    BN_ptr y(BN_new());
    if (!ctx || !p || !u_bn || !numerator || !denominator || !y) {
        return Result<std::array<uint8_t, 32>, EngineFailure>::Err(
            EngineFailure::OutOfMemory("BIGNUM allocation failed"));
    }

    // p = 2^255 - 19
    BN_set_bit(p.get(), 255);
    BN_sub_word(p.get(), 19);

    if (BN_cmp(u_bn.get(), p.get()) >= 0) {
        return Result<std::array<uint8_t, 32>, EngineFailure>::Err(
            EngineFailure::InvalidKey("Public key is not a canonical field element"));
    }

    BN_copy(numerator.get(), u_bn.get());
    BN_copy(denominator.get(), u_bn.get());
    if (BN_is_zero(numerator.get())) {
        BN_copy(numerator.get(), p.get());
    }
    BN_sub_word(numerator.get(), 1);
    BN_add_word(denominator.get(), 1);
    BN_mod(denominator.get(), denominator.get(), p.get(), ctx.get());
    if (BN_is_zero(denominator.get())) {
        return Result<std::array<uint8_t, 32>, EngineFailure>::Err(
            EngineFailure::InvalidKey("Public key has no Edwards equivalent"));
    }
    if (BN_mod_inverse(denominator.get(), denominator.get(), p.get(), ctx.get()) == nullptr ||
        BN_mod_mul(y.get(), numerator.get(), denominator.get(), p.get(), ctx.get()) != 1) {
        return Result<std::array<uint8_t, 32>, EngineFailure>::Err(
            EngineFailure::Internal("Field arithmetic failed"));
    }

    std::array<uint8_t, 32> encoded{};
    if (BN_bn2lebinpad(y.get(), encoded.data(), static_cast<int>(encoded.size())) < 0) {
        return Result<std::array<uint8_t, 32>, EngineFailure>::Err(
            EngineFailure::Internal("Failed to encode Edwards point"));
    }
    encoded[31] &= 0x7F;
    return Result<std::array<uint8_t, 32>, EngineFailure>::Ok(encoded);
}

}
