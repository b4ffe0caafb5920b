#pragma once

#include "sigil/c_api/sgl_ffi.h"
#include "sigil/core/result.hpp"

#include <string>

namespace sigil::engine {

using protocol::Result;
using protocol::Unit;
using protocol::unit;

class EngineFailure {
public:
    SglErrorCode code;
    std::string message;
    EngineFailure(const SglErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}
    static EngineFailure InvalidState(std::string msg) {
        return {SGL_ERROR_CODE_INVALID_STATE, std::move(msg)};
    }
    static EngineFailure Internal(std::string msg) {
        return {SGL_ERROR_CODE_INTERNAL_ERROR, std::move(msg)};
    }
    static EngineFailure NullParameter(std::string msg) {
        return {SGL_ERROR_CODE_NULL_PARAMETER, std::move(msg)};
    }
    static EngineFailure InvalidArgument(std::string msg) {
        return {SGL_ERROR_CODE_INVALID_ARGUMENT, std::move(msg)};
    }
    static EngineFailure InvalidType(std::string msg) {
        return {SGL_ERROR_CODE_INVALID_TYPE, std::move(msg)};
    }
    static EngineFailure Unsupported(std::string msg) {
        return {SGL_ERROR_CODE_UNSUPPORTED, std::move(msg)};
    }
    static EngineFailure Protobuf(std::string msg) {
        return {SGL_ERROR_CODE_PROTOBUF_ERROR, std::move(msg)};
    }
    static EngineFailure InvalidKey(std::string msg) {
        return {SGL_ERROR_CODE_INVALID_KEY, std::move(msg)};
    }
    static EngineFailure InvalidSignature(std::string msg) {
        return {SGL_ERROR_CODE_INVALID_SIGNATURE, std::move(msg)};
    }
    static EngineFailure InvalidMessage(std::string msg) {
        return {SGL_ERROR_CODE_INVALID_MESSAGE, std::move(msg)};
    }
    static EngineFailure DuplicatedMessage(std::string msg) {
        return {SGL_ERROR_CODE_DUPLICATED_MESSAGE, std::move(msg)};
    }
    static EngineFailure NoSenderKeyState(std::string msg) {
        return {SGL_ERROR_CODE_NO_SENDER_KEY_STATE, std::move(msg)};
    }
    static EngineFailure VerificationFailed(std::string msg) {
        return {SGL_ERROR_CODE_VERIFICATION_FAILED, std::move(msg)};
    }
    static EngineFailure FingerprintVersionMismatch(std::string msg) {
        return {SGL_ERROR_CODE_FINGERPRINT_VERSION_MISMATCH, std::move(msg)};
    }
    static EngineFailure OutOfMemory(std::string msg) {
        return {SGL_ERROR_CODE_OUT_OF_MEMORY, std::move(msg)};
    }
};

/// Carries a failure out of a function whose Result value type differs.
struct FailureCarrier {
    EngineFailure failure;
    template<typename T>
    operator Result<T, EngineFailure>() const {
        return Result<T, EngineFailure>::Err(failure);
    }
};

inline FailureCarrier Propagate(EngineFailure failure) {
    return FailureCarrier{std::move(failure)};
}

}

#define SGL_TRY(expr) \
    do { \
        auto&& sgl_try_result_ = (expr); \
        if (sgl_try_result_.IsErr()) { \
            return ::sigil::engine::Propagate(std::move(sgl_try_result_).UnwrapErr()); \
        } \
    } while (0)

#define SGL_TRY_ASSIGN(var, expr) \
    auto var##_result_ = (expr); \
    if (var##_result_.IsErr()) { \
        return ::sigil::engine::Propagate(std::move(var##_result_).UnwrapErr()); \
    } \
    auto var = std::move(var##_result_).Unwrap()
