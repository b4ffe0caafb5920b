#pragma once
#include "sigil/core/result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
namespace sigil::protocol {
enum class ValidationReason {
    EmptyInput,
    InvalidLength,
    InvalidKeyType,
    LowOrderPoint,
    TooShort,
    TooLong,
    InvalidStructureTag,
    InvalidVersion,
    InvalidWireType
};
enum class SigilFailureType {
    InvalidArgument,
    NullPointer,
    Serialization,
    CryptoError,
    Disposed,
    Unsupported,
    Native
};
constexpr std::string_view ToString(const ValidationReason reason) noexcept {
    switch (reason) {
        case ValidationReason::EmptyInput: return "EmptyInput";
        case ValidationReason::InvalidLength: return "InvalidLength";
        case ValidationReason::InvalidKeyType: return "InvalidKeyType";
        case ValidationReason::LowOrderPoint: return "LowOrderPoint";
        case ValidationReason::TooShort: return "TooShort";
        case ValidationReason::TooLong: return "TooLong";
        case ValidationReason::InvalidStructureTag: return "InvalidStructureTag";
        case ValidationReason::InvalidVersion: return "InvalidVersion";
        case ValidationReason::InvalidWireType: return "InvalidWireType";
    }
    return "Unknown";
}
constexpr std::string_view ToString(const SigilFailureType type) noexcept {
    switch (type) {
        case SigilFailureType::InvalidArgument: return "InvalidArgument";
        case SigilFailureType::NullPointer: return "NullPointer";
        case SigilFailureType::Serialization: return "Serialization";
        case SigilFailureType::CryptoError: return "CryptoError";
        case SigilFailureType::Disposed: return "Disposed";
        case SigilFailureType::Unsupported: return "Unsupported";
        case SigilFailureType::Native: return "Native";
    }
    return "Unknown";
}
class ValidationFailure {
public:
    ValidationReason reason;
    std::string message;
    ValidationFailure(const ValidationReason r, std::string msg)
        : reason(r), message(std::move(msg)) {}
};
/**
 * @brief Failure surfaced by every binding operation.
 *
 * Built after any native error object has already been released, so it
 * never refers to engine memory. native_code is set only for failures that
 * originated in the engine; validation_reason only for failures rejected
 * before a native call.
 */
class SigilFailure {
public:
    SigilFailureType type;
    std::string context;
    std::string message;
    std::optional<uint32_t> native_code;
    std::optional<ValidationReason> validation_reason;
    SigilFailure(const SigilFailureType t, std::string ctx, std::string msg)
        : type(t), context(std::move(ctx)), message(std::move(msg)) {}
    static SigilFailure InvalidArgument(std::string ctx, std::string msg) {
        return {SigilFailureType::InvalidArgument, std::move(ctx), std::move(msg)};
    }
    static SigilFailure NullPointer(std::string ctx, std::string msg) {
        return {SigilFailureType::NullPointer, std::move(ctx), std::move(msg)};
    }
    static SigilFailure Serialization(std::string ctx, std::string msg) {
        return {SigilFailureType::Serialization, std::move(ctx), std::move(msg)};
    }
    static SigilFailure CryptoError(std::string ctx, std::string msg) {
        return {SigilFailureType::CryptoError, std::move(ctx), std::move(msg)};
    }
    static SigilFailure Disposed(std::string ctx) {
        std::string msg = ctx + " has been disposed";
        return {SigilFailureType::Disposed, std::move(ctx), std::move(msg)};
    }
    static SigilFailure Unsupported(std::string ctx, std::string msg) {
        return {SigilFailureType::Unsupported, std::move(ctx), std::move(msg)};
    }
    static SigilFailure Native(const uint32_t code, std::string ctx, std::string msg) {
        return FromNative(SigilFailureType::Native, code, std::move(ctx), std::move(msg));
    }
    static SigilFailure FromNative(
        const SigilFailureType t,
        const uint32_t code,
        std::string ctx,
        std::string msg) {
        SigilFailure failure{t, std::move(ctx), std::move(msg)};
        failure.native_code = code;
        return failure;
    }
    static SigilFailure FromValidationFailure(const ValidationFailure& vf, std::string ctx) {
        SigilFailure failure{SigilFailureType::InvalidArgument, std::move(ctx), vf.message};
        failure.validation_reason = vf.reason;
        return failure;
    }
    [[nodiscard]] std::string Describe() const {
        std::string out(ToString(type));
        if (native_code.has_value()) {
            out += "(" + std::to_string(*native_code) + ")";
        }
        out += " in " + context + ": " + message;
        return out;
    }
};
/// Carries a failure out of a function whose Result value type differs.
struct SigilFailureCarrier {
    SigilFailure failure;
    template<typename T>
    operator Result<T, SigilFailure>() const {
        return Result<T, SigilFailure>::Err(failure);
    }
};
inline SigilFailureCarrier Propagate(SigilFailure failure) {
    return SigilFailureCarrier{std::move(failure)};
}
}
#define SIGIL_TRY(expr) \
    do { \
        auto&& sigil_try_result_ = (expr); \
        if (sigil_try_result_.IsErr()) { \
            return ::sigil::protocol::Propagate(std::move(sigil_try_result_).UnwrapErr()); \
        } \
    } while (0)
#define SIGIL_TRY_ASSIGN(var, expr) \
    auto var##_result_ = (expr); \
    if (var##_result_.IsErr()) { \
        return ::sigil::protocol::Propagate(std::move(var##_result_).UnwrapErr()); \
    } \
    auto var = std::move(var##_result_).Unwrap()
