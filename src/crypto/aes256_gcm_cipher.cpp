#include "sigil/crypto/aes256_gcm_cipher.hpp"
#include "sigil/core/constants.hpp"
#include "sigil/core/format.hpp"
#include "sigil/ffi/ffi_helpers.hpp"

namespace sigil::protocol::crypto {
using ffi::Borrow;

Aes256GcmCipher::Aes256GcmCipher(Aes256GcmCipherHandle handle, const BindingConfig config) noexcept
    : handle_(std::move(handle)), config_(config) {}

Result<Aes256GcmCipher, SigilFailure> Aes256GcmCipher::New(
    std::span<const uint8_t> key,
    const BindingConfig config) {
    if (key.size() != CipherConstants::AES_KEY_SIZE) {
        return Result<Aes256GcmCipher, SigilFailure>::Err(
            SigilFailure::InvalidArgument("Aes256GcmCipher.New",
                compat::format("Key must be {} bytes, got {}", CipherConstants::AES_KEY_SIZE, key.size())));
    }
    SIGIL_TRY_ASSIGN(handle, Aes256GcmCipherHandle::Create("Aes256GcmCipher.New",
        [key](SglMutPointerAes256GcmCipher* out) {
            return sgl_aes256_gcm_cipher_new(out, Borrow(key));
        }));
    return Result<Aes256GcmCipher, SigilFailure>::Ok(Aes256GcmCipher(std::move(handle), config));
}

Result<Unit, SigilFailure> Aes256GcmCipher::CheckInputs(
    std::span<const uint8_t> payload,
    std::span<const uint8_t> nonce,
    const char* context) const {
    if (nonce.size() != CipherConstants::AES_GCM_NONCE_SIZE) {
        return Result<Unit, SigilFailure>::Err(SigilFailure::InvalidArgument(context,
            compat::format("Nonce must be {} bytes, got {}", CipherConstants::AES_GCM_NONCE_SIZE, nonce.size())));
    }
    if (!config_.Accepts(payload.size())) {
        return Result<Unit, SigilFailure>::Err(SigilFailure::InvalidArgument(context,
            compat::format("Payload of {} bytes exceeds the configured limit of {} bytes",
                payload.size(), config_.GetMaxPayloadSize())));
    }
    return Result<Unit, SigilFailure>::Ok(Unit{});
}

Result<std::vector<uint8_t>, SigilFailure> Aes256GcmCipher::Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> associated_data) const {
    SIGIL_TRY(CheckInputs(plaintext, nonce, "Aes256GcmCipher.Encrypt"));
    return handle_.With([&](const SglConstPointerAes256GcmCipher cipher) {
        return ffi::CallForBytes("Aes256GcmCipher.Encrypt", [&](SglOwnedBuffer* out) {
            return sgl_aes256_gcm_cipher_encrypt(
                out, cipher, Borrow(plaintext), Borrow(nonce), Borrow(associated_data));
        });
    });
}

Result<std::vector<uint8_t>, SigilFailure> Aes256GcmCipher::Decrypt(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> associated_data) const {
    SIGIL_TRY(CheckInputs(ciphertext, nonce, "Aes256GcmCipher.Decrypt"));
    if (ciphertext.size() < CipherConstants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, SigilFailure>::Err(
            SigilFailure::InvalidArgument("Aes256GcmCipher.Decrypt",
                compat::format("Ciphertext shorter than the {}-byte tag", CipherConstants::AES_GCM_TAG_SIZE)));
    }
    return handle_.With([&](const SglConstPointerAes256GcmCipher cipher) {
        return ffi::CallForBytes("Aes256GcmCipher.Decrypt", [&](SglOwnedBuffer* out) {
            return sgl_aes256_gcm_cipher_decrypt(
                out, cipher, Borrow(ciphertext), Borrow(nonce), Borrow(associated_data));
        });
    });
}

void Aes256GcmCipher::Dispose() noexcept {
    handle_.Dispose();
}

bool Aes256GcmCipher::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
