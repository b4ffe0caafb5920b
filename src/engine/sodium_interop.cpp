#include "sodium_interop.hpp"

#include "sigil/core/constants.hpp"

#include <sodium.h>

namespace sigil::engine {

using protocol::ErrorMessages;

Result<Unit, EngineFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, EngineFailure>::Err(
            EngineFailure::Internal(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, EngineFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (buffer.empty()) {
        return;
    }
    sodium_memzero(buffer.data(), buffer.size());
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

void SodiumInterop::FillRandom(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        randombytes_buf(buffer.data(), buffer.size());
    }
}

uint32_t SodiumInterop::GenerateRandomUInt32(const bool ensure_non_zero) {
    uint32_t value = randombytes_random();
    while (ensure_non_zero && value == 0) {
        value = randombytes_random();
    }
    return value;
}

std::vector<uint8_t> SodiumInterop::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {
    std::vector<uint8_t> mac(crypto_auth_hmacsha256_BYTES);
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    crypto_auth_hmacsha256_update(&state, data.data(), data.size());
    crypto_auth_hmacsha256_final(&state, mac.data());
    sodium_memzero(&state, sizeof(state));
    return mac;
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
