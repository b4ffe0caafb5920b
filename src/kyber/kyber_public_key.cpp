#include "sigil/kyber/kyber_public_key.hpp"
#include "sigil/core/scope_guard.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::kyber {
using ffi::Borrow;
using validation::SerializationValidator;

KyberPublicKey::KyberPublicKey(KyberPublicKeyHandle handle) noexcept
    : handle_(std::move(handle)) {}

KyberPublicKey KyberPublicKey::FromHandle(KyberPublicKeyHandle handle) noexcept {
    return KyberPublicKey(std::move(handle));
}

Result<KyberPublicKey, SigilFailure> KyberPublicKey::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateKyberPublicKey(data), "KyberPublicKey.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, KyberPublicKeyHandle::Create("KyberPublicKey.Deserialize",
        [data](SglMutPointerKyberPublicKey* out) {
            return sgl_kyber_public_key_deserialize(out, Borrow(data));
        }));
    return Result<KyberPublicKey, SigilFailure>::Ok(KyberPublicKey(std::move(handle)));
}

Result<std::vector<uint8_t>, SigilFailure> KyberPublicKey::Serialize() const {
    return handle_.With([](const SglConstPointerKyberPublicKey key) {
        return ffi::CallForBytes("KyberPublicKey.Serialize", [key](SglOwnedBuffer* out) {
            return sgl_kyber_public_key_serialize(out, key);
        });
    });
}

Result<bool, SigilFailure> KyberPublicKey::Equals(const KyberPublicKey& other) const {
    SIGIL_TRY_ASSIGN(lhs, handle_.Use());
    SIGIL_TRY_ASSIGN(rhs, other.handle_.Use());
    return ffi::CallForValue<bool>("KyberPublicKey.Equals", [lhs, rhs](bool* out) {
        return sgl_kyber_public_key_equals(out, lhs, rhs);
    });
}

Result<Encapsulation, SigilFailure> KyberPublicKey::Encapsulate() const {
    SIGIL_TRY_ASSIGN(key, handle_.Use());
    SglOwnedBuffer ciphertext{nullptr, 0};
    SglOwnedBuffer shared_secret{nullptr, 0};
    auto release = MakeScopeGuard([&ciphertext, &shared_secret]() {
        sgl_free_buffer(ciphertext.base, ciphertext.length);
        sgl_free_buffer(shared_secret.base, shared_secret.length);
    });
    SIGIL_TRY(ffi::CheckNativeError(
        sgl_kyber_public_key_encapsulate(&ciphertext, &shared_secret, key),
        "KyberPublicKey.Encapsulate"));
    Encapsulation result;
    result.ciphertext = ffi::TakeOwnedBuffer(ciphertext);
    result.shared_secret = ffi::TakeOwnedSecret(shared_secret);
    return Result<Encapsulation, SigilFailure>::Ok(std::move(result));
}

Result<KyberPublicKey, SigilFailure> KyberPublicKey::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<KyberPublicKey, SigilFailure>::Ok(KyberPublicKey(std::move(copy)));
}

void KyberPublicKey::Dispose() noexcept {
    handle_.Dispose();
}

bool KyberPublicKey::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
