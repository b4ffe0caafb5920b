#include "sigil/keys/private_key.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::keys {
using ffi::Borrow;
using validation::SerializationValidator;

PrivateKey::PrivateKey(PrivateKeyHandle handle) noexcept
    : handle_(std::move(handle)) {}

PrivateKey PrivateKey::FromHandle(PrivateKeyHandle handle) noexcept {
    return PrivateKey(std::move(handle));
}

Result<PrivateKey, SigilFailure> PrivateKey::Generate() {
    SIGIL_TRY_ASSIGN(handle, PrivateKeyHandle::Create("PrivateKey.Generate",
        [](SglMutPointerPrivateKey* out) {
            return sgl_privatekey_generate(out);
        }));
    return Result<PrivateKey, SigilFailure>::Ok(PrivateKey(std::move(handle)));
}

Result<PrivateKey, SigilFailure> PrivateKey::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(SerializationValidator::ValidatePrivateKey(data), "PrivateKey.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, PrivateKeyHandle::Create("PrivateKey.Deserialize",
        [data](SglMutPointerPrivateKey* out) {
            return sgl_privatekey_deserialize(out, Borrow(data));
        }));
    return Result<PrivateKey, SigilFailure>::Ok(PrivateKey(std::move(handle)));
}

Result<SecureBytes, SigilFailure> PrivateKey::Serialize() const {
    return handle_.With([](const SglConstPointerPrivateKey key) {
        return ffi::CallForSecret("PrivateKey.Serialize", [key](SglOwnedBuffer* out) {
            return sgl_privatekey_serialize(out, key);
        });
    });
}

Result<PublicKey, SigilFailure> PrivateKey::GetPublicKey() const {
    SIGIL_TRY_ASSIGN(key, handle_.Use());
    SIGIL_TRY_ASSIGN(public_handle, PublicKeyHandle::Create("PrivateKey.GetPublicKey",
        [key](SglMutPointerPublicKey* out) {
            return sgl_privatekey_get_public_key(out, key);
        }));
    return Result<PublicKey, SigilFailure>::Ok(PublicKey::FromHandle(std::move(public_handle)));
}

Result<std::vector<uint8_t>, SigilFailure> PrivateKey::Sign(std::span<const uint8_t> message) const {
    return handle_.With([message](const SglConstPointerPrivateKey key) {
        return ffi::CallForBytes("PrivateKey.Sign", [key, message](SglOwnedBuffer* out) {
            return sgl_privatekey_sign(out, key, Borrow(message));
        });
    });
}

Result<SecureBytes, SigilFailure> PrivateKey::Agree(const PublicKey& their_key) const {
    SIGIL_TRY_ASSIGN(key, handle_.Use());
    SIGIL_TRY_ASSIGN(their, their_key.Handle().Use());
    return ffi::CallForSecret("PrivateKey.Agree", [key, their](SglOwnedBuffer* out) {
        return sgl_privatekey_agree(out, key, their);
    });
}

Result<PrivateKey, SigilFailure> PrivateKey::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<PrivateKey, SigilFailure>::Ok(PrivateKey(std::move(copy)));
}

void PrivateKey::Dispose() noexcept {
    handle_.Dispose();
}

bool PrivateKey::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
