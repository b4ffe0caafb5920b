#pragma once

#include <cstddef>

#include "sigil/core/constants.hpp"

namespace sigil::protocol::configuration {

/// Limits the binding enforces before marshalling caller data.
///
/// Passed explicitly to the objects that need it. There is no process-wide
/// configuration; two sessions in one process may use different limits.
///
/// @example
/// ```cpp
/// // Server-side fan-out: accept the full 10 MiB
/// auto config = BindingConfig::Default();
///
/// // Embedded client: reject anything above 64 KiB
/// auto config = BindingConfig::Constrained();
///
/// // Custom limit
/// auto config = BindingConfig::Default().WithMaxPayloadSize(1 << 20);
/// ```
class BindingConfig {
public:
    /// Payload limit equal to the validator's upper bound (10 MiB).
    [[nodiscard]] static constexpr BindingConfig Default() noexcept {
        return BindingConfig(LimitConstants::MAX_INPUT_SIZE);
    }

    /// Payload limit for memory-constrained hosts (64 KiB).
    [[nodiscard]] static constexpr BindingConfig Constrained() noexcept {
        return BindingConfig(LimitConstants::CONSTRAINED_INPUT_SIZE);
    }

    /// Returns a copy with a different payload limit.
    ///
    /// The limit is clamped to the validator's upper bound: no configuration
    /// lets more than 10 MiB reach the engine.
    [[nodiscard]] constexpr BindingConfig WithMaxPayloadSize(const size_t max_payload_size) const noexcept {
        return BindingConfig(max_payload_size < LimitConstants::MAX_INPUT_SIZE
            ? max_payload_size
            : LimitConstants::MAX_INPUT_SIZE);
    }

    [[nodiscard]] constexpr size_t GetMaxPayloadSize() const noexcept {
        return max_payload_size_;
    }

    [[nodiscard]] constexpr bool Accepts(const size_t payload_size) const noexcept {
        return payload_size <= max_payload_size_;
    }

    constexpr bool operator==(const BindingConfig& other) const noexcept {
        return max_payload_size_ == other.max_payload_size_;
    }

    constexpr bool operator!=(const BindingConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    explicit constexpr BindingConfig(const size_t max_payload_size) noexcept
        : max_payload_size_(max_payload_size) {}

    size_t max_payload_size_;
};

} // namespace sigil::protocol::configuration
