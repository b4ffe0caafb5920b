#include "sigil/keys/public_key.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::keys {
using ffi::Borrow;
using validation::SerializationValidator;

PublicKey::PublicKey(PublicKeyHandle handle) noexcept
    : handle_(std::move(handle)) {}

PublicKey PublicKey::FromHandle(PublicKeyHandle handle) noexcept {
    return PublicKey(std::move(handle));
}

Result<PublicKey, SigilFailure> PublicKey::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(SerializationValidator::ValidatePublicKey(data), "PublicKey.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, PublicKeyHandle::Create("PublicKey.Deserialize",
        [data](SglMutPointerPublicKey* out) {
            return sgl_publickey_deserialize(out, Borrow(data));
        }));
    return Result<PublicKey, SigilFailure>::Ok(PublicKey(std::move(handle)));
}

Result<std::vector<uint8_t>, SigilFailure> PublicKey::Serialize() const {
    return handle_.With([](const SglConstPointerPublicKey key) {
        return ffi::CallForBytes("PublicKey.Serialize", [key](SglOwnedBuffer* out) {
            return sgl_publickey_serialize(out, key);
        });
    });
}

Result<std::vector<uint8_t>, SigilFailure> PublicKey::GetPublicKeyBytes() const {
    return handle_.With([](const SglConstPointerPublicKey key) {
        return ffi::CallForBytes("PublicKey.GetPublicKeyBytes", [key](SglOwnedBuffer* out) {
            return sgl_publickey_get_public_key_bytes(out, key);
        });
    });
}

Result<bool, SigilFailure> PublicKey::Verify(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) const {
    return handle_.With([message, signature](const SglConstPointerPublicKey key) {
        return ffi::CallForValue<bool>("PublicKey.Verify", [&](bool* out) {
            return sgl_publickey_verify(out, key, Borrow(message), Borrow(signature));
        });
    });
}

Result<bool, SigilFailure> PublicKey::Equals(const PublicKey& other) const {
    SIGIL_TRY_ASSIGN(lhs, handle_.Use());
    SIGIL_TRY_ASSIGN(rhs, other.handle_.Use());
    return ffi::CallForValue<bool>("PublicKey.Equals", [lhs, rhs](bool* out) {
        return sgl_publickey_equals(out, lhs, rhs);
    });
}

Result<int32_t, SigilFailure> PublicKey::Compare(const PublicKey& other) const {
    SIGIL_TRY_ASSIGN(lhs, handle_.Use());
    SIGIL_TRY_ASSIGN(rhs, other.handle_.Use());
    return ffi::CallForValue<int32_t>("PublicKey.Compare", [lhs, rhs](int32_t* out) {
        return sgl_publickey_compare(out, lhs, rhs);
    });
}

Result<PublicKey, SigilFailure> PublicKey::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<PublicKey, SigilFailure>::Ok(PublicKey(std::move(copy)));
}

void PublicKey::Dispose() noexcept {
    handle_.Dispose();
}

bool PublicKey::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
