/**
 * @file sgl_common.cpp
 * @brief Library lifecycle, error objects, owned memory and shared key codecs
 */

#include "sigil/c_api/sgl_ffi.h"
#include "sgl_internal.hpp"

#include "engine/curve25519.hpp"
#include "sigil/core/constants.hpp"

#include <cstring>
#include <memory>

using namespace sigil::engine;
using namespace sigil::engine::capi;
using sigil::protocol::ErrorMessages;
using sigil::protocol::KeyConstants;

namespace sigil::engine::capi {

namespace {
    // Returned when even the error object cannot be allocated. Never freed.
    SglFfiError* OutOfMemoryError() noexcept {
        static SglFfiError error(SGL_ERROR_CODE_OUT_OF_MEMORY, "Out of memory");
        return &error;
    }
}

SglFfiError* MakeError(const EngineFailure& failure) noexcept {
    try {
        auto* error = new (std::nothrow) SglFfiError(failure.code, failure.message);
        return error != nullptr ? error : OutOfMemoryError();
    } catch (const std::bad_alloc&) {
        return OutOfMemoryError();
    }
}

ApiResult RequireOut(const void* out) {
    if (out == nullptr) {
        return ApiResult::Err(EngineFailure::NullParameter(std::string(ErrorMessages::NULL_OUTPUT)));
    }
    return Success();
}

Result<std::span<const uint8_t>, EngineFailure> Borrow(const SglBorrowedBuffer buffer) {
    if (buffer.base == nullptr && buffer.length > 0) {
        return Result<std::span<const uint8_t>, EngineFailure>::Err(
            EngineFailure::NullParameter(std::string(ErrorMessages::NULL_BUFFER)));
    }
    if (buffer.base == nullptr) {
        return Result<std::span<const uint8_t>, EngineFailure>::Ok({});
    }
    return Result<std::span<const uint8_t>, EngineFailure>::Ok(
        std::span<const uint8_t>(buffer.base, buffer.length));
}

ApiResult WriteOwned(SglOwnedBuffer* out, std::span<const uint8_t> bytes) {
    SGL_TRY(RequireOut(out));
    out->base = nullptr;
    out->length = 0;
    if (bytes.empty()) {
        return Success();
    }
    auto* data = new (std::nothrow) uint8_t[bytes.size()];
    if (data == nullptr) {
        return ApiResult::Err(EngineFailure::OutOfMemory(std::string(ErrorMessages::ALLOCATION_FAILED)));
    }
    std::memcpy(data, bytes.data(), bytes.size());
    LiveObjects::Acquire();
    out->base = data;
    out->length = bytes.size();
    return Success();
}

ApiResult WriteString(const char** out, const std::string_view value) {
    SGL_TRY(RequireOut(out));
    auto* data = new (std::nothrow) char[value.size() + 1];
    if (data == nullptr) {
        return ApiResult::Err(EngineFailure::OutOfMemory(std::string(ErrorMessages::ALLOCATION_FAILED)));
    }
    std::memcpy(data, value.data(), value.size());
    data[value.size()] = '\0';
    LiveObjects::Acquire();
    *out = data;
    return Success();
}

std::vector<uint8_t> SerializePublicKey(const Curve25519PublicBytes& key) {
    return Curve25519::SerializePublicKey(key);
}

Result<Curve25519PublicBytes, EngineFailure> ParsePublicKey(std::span<const uint8_t> data) {
    return Curve25519::ParsePublicKey(data);
}

SglPublicKey* NewPublicKey(const Curve25519PublicBytes& key) {
    auto* object = new SglPublicKey();
    object->key = key;
    return object;
}

Result<SglPrivateKey*, EngineFailure> NewPrivateKey(const SecureMemoryHandle& key) {
    SGL_TRY_ASSIGN(copy, key.Clone());
    auto object = std::make_unique<SglPrivateKey>();
    object->key = std::move(copy);
    return Result<SglPrivateKey*, EngineFailure>::Ok(object.release());
}

std::vector<uint8_t> SerializeKyberPublicKey(std::span<const uint8_t> key) {
    std::vector<uint8_t> serialized;
    serialized.reserve(key.size() + 1);
    serialized.push_back(KeyConstants::KYBER_1024_KEY_TYPE);
    serialized.insert(serialized.end(), key.begin(), key.end());
    return serialized;
}

Result<std::vector<uint8_t>, EngineFailure> ParseKyberPublicKey(std::span<const uint8_t> data) {
    if (data.empty() || data[0] != KeyConstants::KYBER_1024_KEY_TYPE) {
        return Result<std::vector<uint8_t>, EngineFailure>::Err(
            EngineFailure::InvalidKey("Bad Kyber key type"));
    }
    if (data.size() != KeyConstants::SERIALIZED_KYBER_PUBLIC_KEY_SIZE) {
        return Result<std::vector<uint8_t>, EngineFailure>::Err(
            EngineFailure::InvalidKey("Bad Kyber public key length: " + std::to_string(data.size())));
    }
    return Result<std::vector<uint8_t>, EngineFailure>::Ok(
        std::vector<uint8_t>(data.begin() + 1, data.end()));
}

} // namespace sigil::engine::capi

// ============================================================================
// Library, errors and memory
// ============================================================================

const char* sgl_version(void) {
    return SIGIL_VERSION_STRING;
}

SglFfiError* sgl_init(void) {
    return Guard([]() { return Success(); });
}

uint32_t sgl_error_get_type(const SglFfiError* err) {
    if (err == nullptr) {
        return 0;
    }
    return static_cast<uint32_t>(err->code);
}

SglFfiError* sgl_error_get_message(const SglFfiError* err, const char** out) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(error, Deref(err));
        return WriteString(out, error->message);
    });
}

void sgl_error_free(SglFfiError* err) {
    if (err == nullptr || err == OutOfMemoryError()) {
        return;
    }
    delete err;
}

void sgl_free_buffer(const uint8_t* base, const size_t length) {
    if (base == nullptr) {
        return;
    }
    auto* data = const_cast<uint8_t*>(base);
    SodiumInterop::SecureWipe(std::span<uint8_t>(data, length));
    delete[] data;
    LiveObjects::Release();
}

void sgl_free_string(const char* str) {
    if (str == nullptr) {
        return;
    }
    delete[] str;
    LiveObjects::Release();
}

size_t sgl_debug_live_object_count(void) {
    return LiveObjects::Count();
}
