#include "sigil/keys/identity_key_pair.hpp"
#include "sigil/debug/lifecycle_log.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::keys {
using ffi::Borrow;
using validation::SerializationValidator;

IdentityKeyPair::IdentityKeyPair(PublicKey public_key, PrivateKey private_key) noexcept
    : public_key_(std::move(public_key))
    , private_key_(std::move(private_key))
    , disposed_(false) {}

IdentityKeyPair::IdentityKeyPair(IdentityKeyPair&& other) noexcept
    : public_key_(std::move(other.public_key_))
    , private_key_(std::move(other.private_key_))
    , disposed_(other.disposed_) {
    other.disposed_ = true;
}

IdentityKeyPair& IdentityKeyPair::operator=(IdentityKeyPair&& other) noexcept {
    if (this != &other) {
        Dispose();
        public_key_ = std::move(other.public_key_);
        private_key_ = std::move(other.private_key_);
        disposed_ = other.disposed_;
        other.disposed_ = true;
    }
    return *this;
}

IdentityKeyPair::~IdentityKeyPair() {
    Dispose();
}

Result<IdentityKeyPair, SigilFailure> IdentityKeyPair::Generate() {
    SIGIL_TRY_ASSIGN(private_key, PrivateKey::Generate());
    SIGIL_TRY_ASSIGN(public_key, private_key.GetPublicKey());
    return Result<IdentityKeyPair, SigilFailure>::Ok(
        IdentityKeyPair(std::move(public_key), std::move(private_key)));
}

IdentityKeyPair IdentityKeyPair::FromKeys(PublicKey public_key, PrivateKey private_key) noexcept {
    return IdentityKeyPair(std::move(public_key), std::move(private_key));
}

Result<IdentityKeyPair, SigilFailure> IdentityKeyPair::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateIdentityKeyPair(data), "IdentityKeyPair.Deserialize"));
    SglMutPointerPublicKey out_public{nullptr};
    SglMutPointerPrivateKey out_private{nullptr};
    SIGIL_TRY(ffi::CheckNativeError(
        sgl_identitykeypair_deserialize(&out_public, &out_private, Borrow(data)),
        "IdentityKeyPair.Deserialize"));
    // Adopt both before checking either so a null on one side still releases the other.
    auto public_handle = PublicKeyHandle::Adopt(out_public, "IdentityKeyPair.Deserialize");
    auto private_handle = PrivateKeyHandle::Adopt(out_private, "IdentityKeyPair.Deserialize");
    if (public_handle.IsErr()) {
        return Result<IdentityKeyPair, SigilFailure>::Err(std::move(public_handle).UnwrapErr());
    }
    if (private_handle.IsErr()) {
        return Result<IdentityKeyPair, SigilFailure>::Err(std::move(private_handle).UnwrapErr());
    }
    return Result<IdentityKeyPair, SigilFailure>::Ok(IdentityKeyPair(
        PublicKey::FromHandle(std::move(public_handle).Unwrap()),
        PrivateKey::FromHandle(std::move(private_handle).Unwrap())));
}

Result<Unit, SigilFailure> IdentityKeyPair::CheckNotDisposed() const {
    if (disposed_) {
        return Result<Unit, SigilFailure>::Err(SigilFailure::Disposed("IdentityKeyPair"));
    }
    return Result<Unit, SigilFailure>::Ok(unit);
}

Result<SecureBytes, SigilFailure> IdentityKeyPair::Serialize() const {
    SIGIL_TRY(CheckNotDisposed());
    SIGIL_TRY_ASSIGN(public_ptr, public_key_.Handle().Use());
    SIGIL_TRY_ASSIGN(private_ptr, private_key_.Handle().Use());
    return ffi::CallForSecret("IdentityKeyPair.Serialize", [public_ptr, private_ptr](SglOwnedBuffer* out) {
        return sgl_identitykeypair_serialize(out, public_ptr, private_ptr);
    });
}

Result<std::vector<uint8_t>, SigilFailure> IdentityKeyPair::SignAlternateIdentity(const PublicKey& other) const {
    SIGIL_TRY(CheckNotDisposed());
    SIGIL_TRY_ASSIGN(public_ptr, public_key_.Handle().Use());
    SIGIL_TRY_ASSIGN(private_ptr, private_key_.Handle().Use());
    SIGIL_TRY_ASSIGN(other_ptr, other.Handle().Use());
    return ffi::CallForBytes("IdentityKeyPair.SignAlternateIdentity",
        [public_ptr, private_ptr, other_ptr](SglOwnedBuffer* out) {
            return sgl_identitykeypair_sign_alternate_identity(out, public_ptr, private_ptr, other_ptr);
        });
}

Result<bool, SigilFailure> IdentityKeyPair::VerifyAlternateIdentity(
    const PublicKey& identity,
    const PublicKey& other,
    std::span<const uint8_t> signature) {
    SIGIL_TRY_ASSIGN(identity_ptr, identity.Handle().Use());
    SIGIL_TRY_ASSIGN(other_ptr, other.Handle().Use());
    return ffi::CallForValue<bool>("IdentityKeyPair.VerifyAlternateIdentity",
        [identity_ptr, other_ptr, signature](bool* out) {
            return sgl_identitykey_verify_alternate_identity(out, identity_ptr, other_ptr, Borrow(signature));
        });
}

Result<PublicKey, SigilFailure> IdentityKeyPair::GetPublicKey() const {
    SIGIL_TRY(CheckNotDisposed());
    return public_key_.Clone();
}

Result<PrivateKey, SigilFailure> IdentityKeyPair::GetPrivateKey() const {
    SIGIL_TRY(CheckNotDisposed());
    return private_key_.Clone();
}

void IdentityKeyPair::Dispose() noexcept {
    if (disposed_) {
        return;
    }
    disposed_ = true;
    SIGIL_LOG_LIFECYCLE("IdentityKeyPair", "disposed");
    public_key_.Dispose();
    private_key_.Dispose();
}

}
