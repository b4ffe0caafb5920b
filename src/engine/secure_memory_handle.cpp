#include "secure_memory_handle.hpp"
#include "sodium_interop.hpp"

#include "sigil/core/format.hpp"

#include <cstring>

namespace sigil::engine {

Result<SecureMemoryHandle, EngineFailure> SecureMemoryHandle::Allocate(const size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, EngineFailure>::Err(
            EngineFailure::InvalidState("libsodium is not initialized"));
    }
    if (size == 0) {
        return Result<SecureMemoryHandle, EngineFailure>::Err(
            EngineFailure::InvalidArgument("Cannot allocate zero-sized secure memory"));
    }

    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return Result<SecureMemoryHandle, EngineFailure>::Err(
            EngineFailure::OutOfMemory(
                compat::format("Failed to allocate {} bytes of secure memory", size)));
    }
    return Result<SecureMemoryHandle, EngineFailure>::Ok(SecureMemoryHandle(ptr, size));
}

Result<SecureMemoryHandle, EngineFailure> SecureMemoryHandle::FromBytes(std::span<const uint8_t> data) {
    auto handle_result = Allocate(data.size());
    if (handle_result.IsErr()) {
        return handle_result;
    }
    auto handle = std::move(handle_result).Unwrap();
    if (auto write = handle.Write(data); write.IsErr()) {
        return Result<SecureMemoryHandle, EngineFailure>::Err(std::move(write).UnwrapErr());
    }
    return Result<SecureMemoryHandle, EngineFailure>::Ok(std::move(handle));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(other.ptr_)
    , size_(other.size_) {
    other.ptr_ = nullptr;
    other.size_ = 0;
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        if (ptr_ != nullptr) {
            SodiumInterop::FreeSecure(ptr_);
        }
        ptr_ = other.ptr_;
        size_ = other.size_;
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

Result<SecureMemoryHandle, EngineFailure> SecureMemoryHandle::Clone() const {
    if (IsInvalid()) {
        return Result<SecureMemoryHandle, EngineFailure>::Err(
            EngineFailure::InvalidState("Cannot clone an empty secure memory handle"));
    }
    return WithReadAccess([](std::span<const uint8_t> bytes) {
        return FromBytes(bytes);
    });
}

Result<Unit, EngineFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, EngineFailure>::Err(
            EngineFailure::InvalidState("Secure memory handle is empty"));
    }
    if (data.size() > size_) {
        return Result<Unit, EngineFailure>::Err(
            EngineFailure::InvalidArgument(
                compat::format("Data exceeds secure buffer (data: {}, buffer: {})", data.size(), size_)));
    }

    std::memcpy(ptr_, data.data(), data.size());
    if (data.size() < size_) {
        std::memset(static_cast<uint8_t*>(ptr_) + data.size(), 0, size_ - data.size());
    }
    return Result<Unit, EngineFailure>::Ok(unit);
}

std::vector<uint8_t> SecureMemoryHandle::ReadBytes() const {
    if (IsInvalid()) {
        return {};
    }
    const auto* begin = static_cast<const uint8_t*>(ptr_);
    return {begin, begin + size_};
}

}
