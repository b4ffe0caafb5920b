#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/debug/lifecycle_log.hpp"

namespace sigil::protocol::ffi {

SigilFailureType ClassifyNativeCode(const uint32_t code) noexcept {
    switch (code) {
        case SGL_ERROR_CODE_NULL_PARAMETER:
            return SigilFailureType::NullPointer;
        case SGL_ERROR_CODE_INVALID_ARGUMENT:
        case SGL_ERROR_CODE_INVALID_TYPE:
        case SGL_ERROR_CODE_FINGERPRINT_VERSION_MISMATCH:
            return SigilFailureType::InvalidArgument;
        case SGL_ERROR_CODE_PROTOBUF_ERROR:
        case SGL_ERROR_CODE_INVALID_MESSAGE:
            return SigilFailureType::Serialization;
        case SGL_ERROR_CODE_INVALID_KEY:
        case SGL_ERROR_CODE_INVALID_SIGNATURE:
        case SGL_ERROR_CODE_VERIFICATION_FAILED:
        case SGL_ERROR_CODE_DUPLICATED_MESSAGE:
        case SGL_ERROR_CODE_NO_SENDER_KEY_STATE:
            return SigilFailureType::CryptoError;
        case SGL_ERROR_CODE_UNSUPPORTED:
            return SigilFailureType::Unsupported;
        default:
            return SigilFailureType::Native;
    }
}

SigilFailure FromNativeCode(const uint32_t code, std::string context, std::string message) {
    return SigilFailure::FromNative(ClassifyNativeCode(code), code, std::move(context), std::move(message));
}

Result<Unit, SigilFailure> CheckNativeError(SglFfiError* error, const std::string_view context) {
    if (error == nullptr) {
        return Result<Unit, SigilFailure>::Ok(unit);
    }

    const uint32_t code = sgl_error_get_type(error);
    std::string message;
    {
        auto free_error = MakeScopeGuard([error]() { sgl_error_free(error); });
        const char* raw_message = nullptr;
        SglFfiError* message_error = sgl_error_get_message(error, &raw_message);
        if (message_error != nullptr) {
            sgl_error_free(message_error);
        } else if (raw_message != nullptr) {
            auto free_message = MakeScopeGuard([raw_message]() { sgl_free_string(raw_message); });
            message.assign(raw_message);
        }
    }

    SIGIL_LOG_NATIVE_ERROR(context, code);
    if (message.empty()) {
        message = "engine error " + std::to_string(code);
    }
    return Result<Unit, SigilFailure>::Err(
        FromNativeCode(code, std::string(context), std::move(message)));
}

std::vector<uint8_t> TakeOwnedBuffer(SglOwnedBuffer& buffer) {
    const uint8_t* base = buffer.base;
    const size_t length = buffer.length;
    buffer = SglOwnedBuffer{nullptr, 0};
    auto release = MakeScopeGuard([base, length]() { sgl_free_buffer(base, length); });
    if (base == nullptr || length == 0) {
        return {};
    }
    return std::vector<uint8_t>(base, base + length);
}

crypto::SecureBytes TakeOwnedSecret(SglOwnedBuffer& buffer) {
    const uint8_t* base = buffer.base;
    const size_t length = buffer.length;
    buffer = SglOwnedBuffer{nullptr, 0};
    auto release = MakeScopeGuard([base, length]() { sgl_free_buffer(base, length); });
    if (base == nullptr || length == 0) {
        return crypto::SecureBytes{};
    }
    return crypto::SecureBytes::CopyFrom(std::span<const uint8_t>(base, length));
}

std::optional<std::string> TakeOwnedString(const char*& str) {
    const char* raw = str;
    str = nullptr;
    if (raw == nullptr) {
        return std::nullopt;
    }
    auto release = MakeScopeGuard([raw]() { sgl_free_string(raw); });
    return std::string(raw);
}

}
