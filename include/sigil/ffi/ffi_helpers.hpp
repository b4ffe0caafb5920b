#pragma once

#include "sigil/c_api/sgl_ffi.h"
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/core/scope_guard.hpp"
#include "sigil/crypto/secure_bytes.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sigil::protocol::ffi {

// ============================================================================
// Error translation
// ============================================================================

/**
 * @brief Maps an engine error code to the binding's failure kind.
 *
 * Codes the binding does not know are reported as Native; the numeric code
 * travels with the failure either way.
 */
[[nodiscard]] SigilFailureType ClassifyNativeCode(uint32_t code) noexcept;

/**
 * @brief Builds a failure from an engine error code and message.
 */
[[nodiscard]] SigilFailure FromNativeCode(uint32_t code, std::string context, std::string message);

/**
 * @brief Single translation point for every engine call.
 *
 * A null error means success. Otherwise the code is read, the message is
 * read on a best-effort basis (a failure to read it is not reported), and
 * the error object is released exactly once before the SigilFailure is
 * built. The caller never sees the error pointer again.
 */
[[nodiscard]] Result<Unit, SigilFailure> CheckNativeError(SglFfiError* error, std::string_view context);

// ============================================================================
// Buffer marshalling
// ============================================================================

[[nodiscard]] inline SglBorrowedBuffer Borrow(std::span<const uint8_t> data) noexcept {
    return SglBorrowedBuffer{data.data(), data.size()};
}

[[nodiscard]] inline SglBorrowedMutableBuffer BorrowMutable(std::span<uint8_t> data) noexcept {
    return SglBorrowedMutableBuffer{data.data(), data.size()};
}

/// Copies the engine buffer into caller memory, then releases it.
[[nodiscard]] std::vector<uint8_t> TakeOwnedBuffer(SglOwnedBuffer& buffer);

/// As TakeOwnedBuffer, for buffers holding secret material.
[[nodiscard]] crypto::SecureBytes TakeOwnedSecret(SglOwnedBuffer& buffer);

/// Copies an engine string, then releases it. Null becomes nullopt.
[[nodiscard]] std::optional<std::string> TakeOwnedString(const char*& str);

// ============================================================================
// Call shapes
// ============================================================================

/**
 * @brief Runs an engine call that writes an owned buffer.
 *
 * The buffer is released on every path, including when the copy throws.
 */
template<typename Call>
[[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> CallForBytes(
    const std::string_view context,
    Call&& call) {
    SglOwnedBuffer out{nullptr, 0};
    auto status = CheckNativeError(std::forward<Call>(call)(&out), context);
    if (status.IsErr()) {
        return Result<std::vector<uint8_t>, SigilFailure>::Err(std::move(status).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, SigilFailure>::Ok(TakeOwnedBuffer(out));
}

template<typename Call>
[[nodiscard]] Result<crypto::SecureBytes, SigilFailure> CallForSecret(
    const std::string_view context,
    Call&& call) {
    SglOwnedBuffer out{nullptr, 0};
    auto status = CheckNativeError(std::forward<Call>(call)(&out), context);
    if (status.IsErr()) {
        return Result<crypto::SecureBytes, SigilFailure>::Err(std::move(status).UnwrapErr());
    }
    return Result<crypto::SecureBytes, SigilFailure>::Ok(TakeOwnedSecret(out));
}

/// Engine call writing a scalar (bool, integer, uuid) out-parameter.
template<typename T, typename Call>
[[nodiscard]] Result<T, SigilFailure> CallForValue(
    const std::string_view context,
    Call&& call) {
    T out{};
    auto status = CheckNativeError(std::forward<Call>(call)(&out), context);
    if (status.IsErr()) {
        return Result<T, SigilFailure>::Err(std::move(status).UnwrapErr());
    }
    return Result<T, SigilFailure>::Ok(out);
}

template<typename Call>
[[nodiscard]] Result<std::optional<std::string>, SigilFailure> CallForString(
    const std::string_view context,
    Call&& call) {
    const char* out = nullptr;
    auto status = CheckNativeError(std::forward<Call>(call)(&out), context);
    if (status.IsErr()) {
        return Result<std::optional<std::string>, SigilFailure>::Err(std::move(status).UnwrapErr());
    }
    return Result<std::optional<std::string>, SigilFailure>::Ok(TakeOwnedString(out));
}

template<typename Call>
[[nodiscard]] Result<Unit, SigilFailure> CallForStatus(
    const std::string_view context,
    Call&& call) {
    return CheckNativeError(std::forward<Call>(call)(), context);
}

}
