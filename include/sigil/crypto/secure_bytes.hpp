#pragma once

#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sigil::protocol::crypto {

/**
 * @brief Move-only owner of secret bytes copied out of the engine.
 *
 * Dispose() zeroes and releases the bytes; the destructor does the same if
 * Dispose() was never called. Expose() fails with Disposed afterwards.
 */
class SecureBytes {
public:
    SecureBytes() noexcept = default;
    explicit SecureBytes(std::vector<uint8_t> bytes) noexcept;
    ~SecureBytes();

    static SecureBytes CopyFrom(std::span<const uint8_t> bytes);

    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;
    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    /// View valid until the next Dispose() or move.
    [[nodiscard]] Result<std::span<const uint8_t>, SigilFailure> Expose() const;

    void Dispose() noexcept;

    [[nodiscard]] bool IsDisposed() const noexcept {
        return disposed_;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return bytes_.size();
    }

private:
    std::vector<uint8_t> bytes_;
    bool disposed_ = false;
};

}
