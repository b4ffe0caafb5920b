/**
 * @file sgl_crypto.cpp
 * @brief AES-256-GCM cipher contexts, safety number fingerprints and HKDF-SHA256
 */

#include "sigil/c_api/sgl_ffi.h"
#include "sgl_internal.hpp"

#include "engine/aes_gcm.hpp"
#include "engine/fingerprint.hpp"
#include "engine/hkdf.hpp"
#include "sigil/core/constants.hpp"

#include <memory>

using namespace sigil::engine;
using namespace sigil::engine::capi;
using sigil::protocol::CipherConstants;

SglFfiError* sgl_aes256_gcm_cipher_new(SglMutPointerAes256GcmCipher* out, const SglBorrowedBuffer key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(key_bytes, Borrow(key));
        if (key_bytes.size() != CipherConstants::AES_KEY_SIZE) {
            return ApiResult::Err(EngineFailure::InvalidArgument(
                "AES-256-GCM key must be 32 bytes, got " + std::to_string(key_bytes.size())));
        }
        SGL_TRY_ASSIGN(handle, SecureMemoryHandle::FromBytes(key_bytes));
        auto cipher = std::make_unique<SglAes256GcmCipher>();
        cipher->key = std::move(handle);
        out->raw = cipher.release();
        return Success();
    });
}

SglFfiError* sgl_aes256_gcm_cipher_encrypt(
    SglOwnedBuffer* out,
    const SglConstPointerAes256GcmCipher cipher,
    const SglBorrowedBuffer plaintext,
    const SglBorrowedBuffer nonce,
    const SglBorrowedBuffer associated_data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(cipher.raw));
        SGL_TRY_ASSIGN(plaintext_bytes, Borrow(plaintext));
        SGL_TRY_ASSIGN(nonce_bytes, Borrow(nonce));
        SGL_TRY_ASSIGN(aad, Borrow(associated_data));
        SGL_TRY_ASSIGN(ciphertext, object->key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
            return AesGcm::Encrypt(key_bytes, nonce_bytes, plaintext_bytes, aad);
        }));
        return WriteOwned(out, ciphertext);
    });
}

SglFfiError* sgl_aes256_gcm_cipher_decrypt(
    SglOwnedBuffer* out,
    const SglConstPointerAes256GcmCipher cipher,
    const SglBorrowedBuffer ciphertext,
    const SglBorrowedBuffer nonce,
    const SglBorrowedBuffer associated_data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(cipher.raw));
        SGL_TRY_ASSIGN(ciphertext_bytes, Borrow(ciphertext));
        SGL_TRY_ASSIGN(nonce_bytes, Borrow(nonce));
        SGL_TRY_ASSIGN(aad, Borrow(associated_data));
        SGL_TRY_ASSIGN(plaintext, object->key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
            return AesGcm::Decrypt(key_bytes, nonce_bytes, ciphertext_bytes, aad);
        }));
        auto written = WriteOwned(out, plaintext);
        SodiumInterop::SecureWipe(plaintext);
        return written;
    });
}

SglFfiError* sgl_aes256_gcm_cipher_destroy(const SglMutPointerAes256GcmCipher cipher) {
    return Guard([&]() { return Destroy(cipher.raw); });
}

SglFfiError* sgl_fingerprint_new(
    SglMutPointerFingerprint* out,
    const uint32_t iterations,
    const uint32_t version,
    const SglBorrowedBuffer local_identifier,
    const SglConstPointerPublicKey local_key,
    const SglBorrowedBuffer remote_identifier,
    const SglConstPointerPublicKey remote_key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(local_id, Borrow(local_identifier));
        SGL_TRY_ASSIGN(local, Deref(local_key.raw));
        SGL_TRY_ASSIGN(remote_id, Borrow(remote_identifier));
        SGL_TRY_ASSIGN(remote, Deref(remote_key.raw));
        SGL_TRY_ASSIGN(fingerprint, Fingerprints::Create(
            iterations, version, local_id, local->key, remote_id, remote->key));
        out->raw = fingerprint.release();
        return Success();
    });
}

SglFfiError* sgl_fingerprint_display_string(const char** out, const SglConstPointerFingerprint fingerprint) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(fingerprint.raw));
        return WriteString(out, object->display);
    });
}

SglFfiError* sgl_fingerprint_scannable_encoding(SglOwnedBuffer* out, const SglConstPointerFingerprint fingerprint) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(fingerprint.raw));
        return WriteOwned(out, object->scannable);
    });
}

SglFfiError* sgl_fingerprint_compare(bool* out, const SglBorrowedBuffer fprint1, const SglBorrowedBuffer fprint2) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(ours, Borrow(fprint1));
        SGL_TRY_ASSIGN(theirs, Borrow(fprint2));
        SGL_TRY_ASSIGN(matches, Fingerprints::Compare(ours, theirs));
        *out = matches;
        return Success();
    });
}

SglFfiError* sgl_fingerprint_clone(SglMutPointerFingerprint* out, const SglConstPointerFingerprint fingerprint) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(fingerprint.raw));
        out->raw = new SglFingerprint(*object);
        return Success();
    });
}

SglFfiError* sgl_fingerprint_destroy(const SglMutPointerFingerprint fingerprint) {
    return Guard([&]() { return Destroy(fingerprint.raw); });
}

SglFfiError* sgl_hkdf_derive(
    const SglBorrowedMutableBuffer output,
    const SglBorrowedBuffer input_key_material,
    const SglBorrowedBuffer label,
    const SglBorrowedBuffer salt) {
    return Guard([&]() -> ApiResult {
        if (output.base == nullptr) {
            return ApiResult::Err(EngineFailure::NullParameter("HKDF output buffer is null"));
        }
        SGL_TRY_ASSIGN(ikm, Borrow(input_key_material));
        SGL_TRY_ASSIGN(info, Borrow(label));
        SGL_TRY_ASSIGN(salt_bytes, Borrow(salt));
        return Hkdf::DeriveKey(ikm, std::span<uint8_t>(output.base, output.length), salt_bytes, info);
    });
}
