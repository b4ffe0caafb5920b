/**
 * @file sgl_internal.hpp
 * @brief Shared helpers for the engine's C ABI implementation
 *
 * This header is NOT part of the public API. Every exported function runs its
 * body through Guard(), which initializes the engine, converts failures into
 * SglFfiError objects and keeps C++ exceptions from crossing the ABI.
 */

#ifndef SGL_INTERNAL_HPP
#define SGL_INTERNAL_HPP

#include "sigil/c_api/sgl_ffi.h"
#include "engine/engine_failure.hpp"
#include "engine/native_objects.hpp"
#include "engine/sodium_interop.hpp"

#include <exception>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sigil::engine::capi {

using ApiResult = Result<Unit, EngineFailure>;

inline ApiResult Success() {
    return ApiResult::Ok(unit);
}

SglFfiError* MakeError(const EngineFailure& failure) noexcept;

template<typename Body>
SglFfiError* Guard(Body&& body) noexcept {
    try {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return MakeError(init.UnwrapErr());
        }
        auto result = std::forward<Body>(body)();
        if (result.IsErr()) {
            return MakeError(result.UnwrapErr());
        }
        return nullptr;
    } catch (const std::bad_alloc&) {
        return MakeError(EngineFailure::OutOfMemory("Allocation failed"));
    } catch (const std::exception& ex) {
        return MakeError(EngineFailure::Internal(ex.what()));
    }
}

ApiResult RequireOut(const void* out);

Result<std::span<const uint8_t>, EngineFailure> Borrow(SglBorrowedBuffer buffer);

template<typename T>
Result<const T*, EngineFailure> Deref(const T* raw) {
    if (raw == nullptr) {
        return Result<const T*, EngineFailure>::Err(
            EngineFailure::NullParameter("Object pointer is null"));
    }
    return Result<const T*, EngineFailure>::Ok(raw);
}

template<typename T>
Result<T*, EngineFailure> DerefMut(T* raw) {
    if (raw == nullptr) {
        return Result<T*, EngineFailure>::Err(
            EngineFailure::NullParameter("Object pointer is null"));
    }
    return Result<T*, EngineFailure>::Ok(raw);
}

/// Copies bytes into an engine-owned buffer released by sgl_free_buffer.
ApiResult WriteOwned(SglOwnedBuffer* out, std::span<const uint8_t> bytes);

/// Copies a string into an engine-owned C string released by sgl_free_string.
ApiResult WriteString(const char** out, std::string_view value);

/// Releases an object that was created through the ABI. Null is a no-op.
template<typename T>
ApiResult Destroy(T* raw) {
    delete raw;
    return Success();
}

std::vector<uint8_t> SerializePublicKey(const Curve25519PublicBytes& key);

Result<Curve25519PublicBytes, EngineFailure> ParsePublicKey(std::span<const uint8_t> data);

SglPublicKey* NewPublicKey(const Curve25519PublicBytes& key);

Result<SglPrivateKey*, EngineFailure> NewPrivateKey(const SecureMemoryHandle& key);

std::vector<uint8_t> SerializeKyberPublicKey(std::span<const uint8_t> key);

Result<std::vector<uint8_t>, EngineFailure> ParseKyberPublicKey(std::span<const uint8_t> data);

template<typename Message>
Result<Message, EngineFailure> ParseProto(std::span<const uint8_t> data, std::string_view what) {
    Message message;
    if (!message.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        return Result<Message, EngineFailure>::Err(
            EngineFailure::Protobuf("Failed to parse " + std::string(what)));
    }
    return Result<Message, EngineFailure>::Ok(std::move(message));
}

template<typename Message>
std::vector<uint8_t> SerializeProto(const Message& message) {
    std::vector<uint8_t> bytes(message.ByteSizeLong());
    if (!bytes.empty()) {
        message.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()));
    }
    return bytes;
}

inline std::vector<uint8_t> ToBytes(const std::string& value) {
    return {value.begin(), value.end()};
}

inline std::string ToProtoBytes(std::span<const uint8_t> value) {
    return {value.begin(), value.end()};
}

} // namespace sigil::engine::capi

#endif // SGL_INTERNAL_HPP
