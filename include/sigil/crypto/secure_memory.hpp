#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sigil::protocol::crypto {

/**
 * @brief Wiping and comparison helpers for caller-side secret buffers.
 *
 * Neither function touches the engine; both are safe before sgl_init().
 */
class SecureMemory {
public:
    // ========================================================================
    // Wiping
    // ========================================================================

    /**
     * @brief Overwrite every byte of the buffer with zero.
     *
     * Uses sodium_memzero, which the compiler may not elide. An empty span
     * is a no-op.
     */
    static void Zero(std::span<uint8_t> buffer) noexcept;

    static void Zero(std::vector<uint8_t>& buffer) noexcept;

    // ========================================================================
    // Comparison
    // ========================================================================

    /**
     * @brief Compare two buffers without leaking where they differ.
     *
     * Always walks max(a.size(), b.size()) bytes, reading zero past the end
     * of the shorter input, so the running time depends only on the longer
     * length. Returns false on any length mismatch.
     */
    [[nodiscard]] static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;
};

}
