/**
 * @file sgl_protocol.cpp
 * @brief Pairwise ratchet messages and decryption error notices
 */

#include "sigil/c_api/sgl_ffi.h"
#include "sgl_internal.hpp"

#include "engine/signal_message.hpp"

#include <memory>

using namespace sigil::engine;
using namespace sigil::engine::capi;

namespace {

ApiResult WriteU32(uint32_t* out, const uint32_t value) {
    SGL_TRY(RequireOut(out));
    *out = value;
    return Success();
}

ApiResult WriteU64(uint64_t* out, const uint64_t value) {
    SGL_TRY(RequireOut(out));
    *out = value;
    return Success();
}

} // namespace

// ============================================================================
// Signal messages
// ============================================================================

SglFfiError* sgl_signal_message_new(
    SglMutPointerSignalMessage* out,
    const uint8_t message_version,
    const SglBorrowedBuffer mac_key,
    const SglConstPointerPublicKey sender_ratchet_key,
    const uint32_t counter,
    const uint32_t previous_counter,
    const SglBorrowedBuffer ciphertext,
    const SglConstPointerPublicKey sender_identity_key,
    const SglConstPointerPublicKey receiver_identity_key,
    const SglBorrowedBuffer pq_ratchet) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(mac_key_bytes, Borrow(mac_key));
        SGL_TRY_ASSIGN(ratchet_key, Deref(sender_ratchet_key.raw));
        SGL_TRY_ASSIGN(ciphertext_bytes, Borrow(ciphertext));
        SGL_TRY_ASSIGN(sender, Deref(sender_identity_key.raw));
        SGL_TRY_ASSIGN(receiver, Deref(receiver_identity_key.raw));
        SGL_TRY_ASSIGN(pq_ratchet_bytes, Borrow(pq_ratchet));
        SGL_TRY_ASSIGN(message, SignalMessages::Create(
            message_version, mac_key_bytes, ratchet_key->key, counter, previous_counter,
            ciphertext_bytes, sender->key, receiver->key, pq_ratchet_bytes));
        out->raw = message.release();
        return Success();
    });
}

SglFfiError* sgl_signal_message_deserialize(SglMutPointerSignalMessage* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        SGL_TRY_ASSIGN(message, SignalMessages::Parse(bytes));
        out->raw = message.release();
        return Success();
    });
}

SglFfiError* sgl_signal_message_get_serialized(SglOwnedBuffer* out, const SglConstPointerSignalMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteOwned(out, object->serialized);
    });
}

SglFfiError* sgl_signal_message_get_body(SglOwnedBuffer* out, const SglConstPointerSignalMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteOwned(out, object->ciphertext);
    });
}

SglFfiError* sgl_signal_message_get_counter(uint32_t* out, const SglConstPointerSignalMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteU32(out, object->counter);
    });
}

SglFfiError* sgl_signal_message_get_message_version(uint32_t* out, const SglConstPointerSignalMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteU32(out, object->message_version);
    });
}

SglFfiError* sgl_signal_message_get_sender_ratchet_key(
    SglMutPointerPublicKey* out,
    const SglConstPointerSignalMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        out->raw = NewPublicKey(object->sender_ratchet_key);
        return Success();
    });
}

SglFfiError* sgl_signal_message_get_pq_ratchet(SglOwnedBuffer* out, const SglConstPointerSignalMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteOwned(out, object->pq_ratchet);
    });
}

SglFfiError* sgl_signal_message_verify_mac(
    bool* out,
    const SglConstPointerSignalMessage message,
    const SglConstPointerPublicKey sender_identity_key,
    const SglConstPointerPublicKey receiver_identity_key,
    const SglBorrowedBuffer mac_key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        SGL_TRY_ASSIGN(sender, Deref(sender_identity_key.raw));
        SGL_TRY_ASSIGN(receiver, Deref(receiver_identity_key.raw));
        SGL_TRY_ASSIGN(mac_key_bytes, Borrow(mac_key));
        SGL_TRY_ASSIGN(valid, SignalMessages::VerifyMac(*object, sender->key, receiver->key, mac_key_bytes));
        *out = valid;
        return Success();
    });
}

SglFfiError* sgl_signal_message_clone(SglMutPointerSignalMessage* out, const SglConstPointerSignalMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        out->raw = new SglSignalMessage(*object);
        return Success();
    });
}

SglFfiError* sgl_signal_message_destroy(const SglMutPointerSignalMessage message) {
    return Guard([&]() { return Destroy(message.raw); });
}

// ============================================================================
// Decryption error messages
// ============================================================================

SglFfiError* sgl_decryption_error_message_for_original_message(
    SglMutPointerDecryptionErrorMessage* out,
    const SglBorrowedBuffer original_bytes,
    const uint8_t original_type,
    const uint64_t timestamp,
    const uint32_t original_sender_device_id) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(original_bytes));
        SGL_TRY_ASSIGN(message, DecryptionErrorMessages::ForOriginal(
            bytes, original_type, timestamp, original_sender_device_id));
        out->raw = message.release();
        return Success();
    });
}

SglFfiError* sgl_decryption_error_message_deserialize(
    SglMutPointerDecryptionErrorMessage* out,
    const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        SGL_TRY_ASSIGN(message, DecryptionErrorMessages::Parse(bytes));
        out->raw = message.release();
        return Success();
    });
}

SglFfiError* sgl_decryption_error_message_extract_from_serialized_content(
    SglMutPointerDecryptionErrorMessage* out,
    const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        SGL_TRY_ASSIGN(message, DecryptionErrorMessages::ExtractFromContent(bytes));
        out->raw = message.release();
        return Success();
    });
}

SglFfiError* sgl_decryption_error_message_serialize(
    SglOwnedBuffer* out,
    const SglConstPointerDecryptionErrorMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteOwned(out, object->serialized);
    });
}

SglFfiError* sgl_decryption_error_message_get_timestamp(
    uint64_t* out,
    const SglConstPointerDecryptionErrorMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteU64(out, object->timestamp);
    });
}

SglFfiError* sgl_decryption_error_message_get_device_id(
    uint32_t* out,
    const SglConstPointerDecryptionErrorMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteU32(out, object->device_id);
    });
}

SglFfiError* sgl_decryption_error_message_get_ratchet_key(
    SglMutPointerPublicKey* out,
    const SglConstPointerDecryptionErrorMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        out->raw = object->ratchet_key.has_value() ? NewPublicKey(*object->ratchet_key) : nullptr;
        return Success();
    });
}

SglFfiError* sgl_decryption_error_message_clone(
    SglMutPointerDecryptionErrorMessage* out,
    const SglConstPointerDecryptionErrorMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        out->raw = new SglDecryptionErrorMessage(*object);
        return Success();
    });
}

SglFfiError* sgl_decryption_error_message_destroy(const SglMutPointerDecryptionErrorMessage message) {
    return Guard([&]() { return Destroy(message.raw); });
}
