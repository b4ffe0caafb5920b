#pragma once

#include "engine_failure.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace sigil::engine {

/**
 * @brief Thin layer over the libsodium calls the engine needs.
 *
 * Initialize() is thread-safe and idempotent; every exported engine entry
 * point runs it before touching key material.
 */
class SodiumInterop {
public:
    static Result<Unit, EngineFailure> Initialize();

    static bool IsInitialized() noexcept;

    /// Overwrites the buffer with zeros; a no-op for an empty span.
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    static bool ConstantTimeEquals(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept;

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void FillRandom(std::span<uint8_t> buffer) noexcept;

    static uint32_t GenerateRandomUInt32(bool ensure_non_zero = false);

    static std::vector<uint8_t> HmacSha256(std::span<const uint8_t> key, std::span<const uint8_t> data);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::once_flag init_flag_;
    static inline std::atomic<bool> initialized_{false};
};

}
