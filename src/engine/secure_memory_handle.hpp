#pragma once

#include "engine_failure.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace sigil::engine {

/**
 * @brief Move-only owner of a sodium_malloc region.
 *
 * The region is guard-paged, locked in RAM and zeroed by sodium_free when
 * the handle is destroyed. Secret keys held by engine objects live here.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, EngineFailure> Allocate(size_t size);

    static Result<SecureMemoryHandle, EngineFailure> FromBytes(std::span<const uint8_t> data);

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}
    ~SecureMemoryHandle();

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    [[nodiscard]] Result<SecureMemoryHandle, EngineFailure> Clone() const;

    Result<Unit, EngineFailure> Write(std::span<const uint8_t> data);

    [[nodiscard]] std::vector<uint8_t> ReadBytes() const;

    /// Read-only view for the duration of one call; never store the span.
    template<typename F>
    auto WithReadAccess(F&& func) const -> std::invoke_result_t<F, std::span<const uint8_t>> {
        return std::forward<F>(func)(std::span<const uint8_t>(static_cast<const uint8_t*>(ptr_), size_));
    }

    template<typename F>
    auto WithWriteAccess(F&& func) -> std::invoke_result_t<F, std::span<uint8_t>> {
        return std::forward<F>(func)(std::span<uint8_t>(static_cast<uint8_t*>(ptr_), size_));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void* ptr_;
    size_t size_;
};

}
