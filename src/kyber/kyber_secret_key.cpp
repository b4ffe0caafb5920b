#include "sigil/kyber/kyber_secret_key.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::kyber {
using ffi::Borrow;
using validation::SerializationValidator;

KyberSecretKey::KyberSecretKey(KyberSecretKeyHandle handle) noexcept
    : handle_(std::move(handle)) {}

KyberSecretKey KyberSecretKey::FromHandle(KyberSecretKeyHandle handle) noexcept {
    return KyberSecretKey(std::move(handle));
}

Result<KyberSecretKey, SigilFailure> KyberSecretKey::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateKyberSecretKey(data), "KyberSecretKey.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, KyberSecretKeyHandle::Create("KyberSecretKey.Deserialize",
        [data](SglMutPointerKyberSecretKey* out) {
            return sgl_kyber_secret_key_deserialize(out, Borrow(data));
        }));
    return Result<KyberSecretKey, SigilFailure>::Ok(KyberSecretKey(std::move(handle)));
}

Result<SecureBytes, SigilFailure> KyberSecretKey::Serialize() const {
    return handle_.With([](const SglConstPointerKyberSecretKey key) {
        return ffi::CallForSecret("KyberSecretKey.Serialize", [key](SglOwnedBuffer* out) {
            return sgl_kyber_secret_key_serialize(out, key);
        });
    });
}

Result<SecureBytes, SigilFailure> KyberSecretKey::Decapsulate(std::span<const uint8_t> ciphertext) const {
    if (ciphertext.size() != KeyConstants::KYBER_1024_CIPHERTEXT_SIZE) {
        return Result<SecureBytes, SigilFailure>::Err(SigilFailure::InvalidArgument(
            "KyberSecretKey.Decapsulate",
            "ciphertext must be " + std::to_string(KeyConstants::KYBER_1024_CIPHERTEXT_SIZE) +
            " bytes, got " + std::to_string(ciphertext.size())));
    }
    return handle_.With([ciphertext](const SglConstPointerKyberSecretKey key) {
        return ffi::CallForSecret("KyberSecretKey.Decapsulate", [key, ciphertext](SglOwnedBuffer* out) {
            return sgl_kyber_secret_key_decapsulate(out, key, Borrow(ciphertext));
        });
    });
}

Result<KyberSecretKey, SigilFailure> KyberSecretKey::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<KyberSecretKey, SigilFailure>::Ok(KyberSecretKey(std::move(copy)));
}

void KyberSecretKey::Dispose() noexcept {
    handle_.Dispose();
}

bool KyberSecretKey::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
