#include "sigil/prekeys/pre_key_bundle.hpp"
#include "sigil/ffi/ffi_helpers.hpp"

namespace sigil::protocol::prekeys {
using ffi::Borrow;
using keys::PublicKey;
using keys::PublicKeyHandle;
using kyber::KyberPublicKey;
using kyber::KyberPublicKeyHandle;

namespace {

Result<Unit, SigilFailure> RequirePresent(const void* ptr, const char* field) {
    if (ptr == nullptr) {
        return Result<Unit, SigilFailure>::Err(SigilFailure::NullPointer(
            "PreKeyBundle.Create", std::string(field) + " is required"));
    }
    return Result<Unit, SigilFailure>::Ok(unit);
}

}

PreKeyBundle::PreKeyBundle(PreKeyBundleHandle handle) noexcept
    : handle_(std::move(handle)) {}

Result<PreKeyBundle, SigilFailure> PreKeyBundle::Create(const Parameters& parameters) {
    SIGIL_TRY(RequirePresent(parameters.signed_pre_key, "signed_pre_key"));
    SIGIL_TRY(RequirePresent(parameters.identity_key, "identity_key"));
    SIGIL_TRY(RequirePresent(parameters.kyber_pre_key, "kyber_pre_key"));
    if (parameters.pre_key_id.has_value() != (parameters.pre_key != nullptr)) {
        return Result<PreKeyBundle, SigilFailure>::Err(SigilFailure::InvalidArgument(
            "PreKeyBundle.Create", "pre_key_id and pre_key must be given together"));
    }

    SglConstPointerPublicKey pre_key{nullptr};
    if (parameters.pre_key != nullptr) {
        SIGIL_TRY_ASSIGN(pre_key_ptr, parameters.pre_key->Handle().Use());
        pre_key = pre_key_ptr;
    }
    SIGIL_TRY_ASSIGN(signed_pre_key, parameters.signed_pre_key->Handle().Use());
    SIGIL_TRY_ASSIGN(identity_key, parameters.identity_key->Handle().Use());
    SIGIL_TRY_ASSIGN(kyber_pre_key, parameters.kyber_pre_key->Handle().Use());

    SIGIL_TRY_ASSIGN(handle, PreKeyBundleHandle::Create("PreKeyBundle.Create",
        [&](SglMutPointerPreKeyBundle* out) {
            return sgl_pre_key_bundle_new(
                out,
                parameters.registration_id,
                parameters.device_id,
                parameters.pre_key_id.value_or(0),
                pre_key,
                parameters.signed_pre_key_id,
                signed_pre_key,
                Borrow(parameters.signed_pre_key_signature),
                identity_key,
                parameters.kyber_pre_key_id,
                kyber_pre_key,
                Borrow(parameters.kyber_pre_key_signature));
        }));
    return Result<PreKeyBundle, SigilFailure>::Ok(PreKeyBundle(std::move(handle)));
}

Result<uint32_t, SigilFailure> PreKeyBundle::GetRegistrationId() const {
    return handle_.With([](const SglConstPointerPreKeyBundle bundle) {
        return ffi::CallForValue<uint32_t>("PreKeyBundle.GetRegistrationId", [bundle](uint32_t* out) {
            return sgl_pre_key_bundle_get_registration_id(out, bundle);
        });
    });
}

Result<uint32_t, SigilFailure> PreKeyBundle::GetDeviceId() const {
    return handle_.With([](const SglConstPointerPreKeyBundle bundle) {
        return ffi::CallForValue<uint32_t>("PreKeyBundle.GetDeviceId", [bundle](uint32_t* out) {
            return sgl_pre_key_bundle_get_device_id(out, bundle);
        });
    });
}

Result<std::optional<uint32_t>, SigilFailure> PreKeyBundle::GetPreKeyId() const {
    SIGIL_TRY_ASSIGN(bundle, handle_.Use());
    uint32_t id = 0;
    bool present = false;
    SIGIL_TRY(ffi::CheckNativeError(
        sgl_pre_key_bundle_get_pre_key_id(&id, &present, bundle), "PreKeyBundle.GetPreKeyId"));
    if (!present) {
        return Result<std::optional<uint32_t>, SigilFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<uint32_t>, SigilFailure>::Ok(id);
}

Result<std::optional<PublicKey>, SigilFailure> PreKeyBundle::GetPreKeyPublic() const {
    SIGIL_TRY_ASSIGN(bundle, handle_.Use());
    SglMutPointerPublicKey out{nullptr};
    SIGIL_TRY(ffi::CheckNativeError(
        sgl_pre_key_bundle_get_pre_key_public(&out, bundle), "PreKeyBundle.GetPreKeyPublic"));
    if (out.raw == nullptr) {
        return Result<std::optional<PublicKey>, SigilFailure>::Ok(std::nullopt);
    }
    SIGIL_TRY_ASSIGN(key, PublicKeyHandle::Adopt(out, "PreKeyBundle.GetPreKeyPublic"));
    return Result<std::optional<PublicKey>, SigilFailure>::Ok(PublicKey::FromHandle(std::move(key)));
}

Result<uint32_t, SigilFailure> PreKeyBundle::GetSignedPreKeyId() const {
    return handle_.With([](const SglConstPointerPreKeyBundle bundle) {
        return ffi::CallForValue<uint32_t>("PreKeyBundle.GetSignedPreKeyId", [bundle](uint32_t* out) {
            return sgl_pre_key_bundle_get_signed_pre_key_id(out, bundle);
        });
    });
}

Result<PublicKey, SigilFailure> PreKeyBundle::GetSignedPreKeyPublic() const {
    SIGIL_TRY_ASSIGN(bundle, handle_.Use());
    SIGIL_TRY_ASSIGN(key, PublicKeyHandle::Create("PreKeyBundle.GetSignedPreKeyPublic",
        [bundle](SglMutPointerPublicKey* out) {
            return sgl_pre_key_bundle_get_signed_pre_key_public(out, bundle);
        }));
    return Result<PublicKey, SigilFailure>::Ok(PublicKey::FromHandle(std::move(key)));
}

Result<std::vector<uint8_t>, SigilFailure> PreKeyBundle::GetSignedPreKeySignature() const {
    return handle_.With([](const SglConstPointerPreKeyBundle bundle) {
        return ffi::CallForBytes("PreKeyBundle.GetSignedPreKeySignature", [bundle](SglOwnedBuffer* out) {
            return sgl_pre_key_bundle_get_signed_pre_key_signature(out, bundle);
        });
    });
}

Result<PublicKey, SigilFailure> PreKeyBundle::GetIdentityKey() const {
    SIGIL_TRY_ASSIGN(bundle, handle_.Use());
    SIGIL_TRY_ASSIGN(key, PublicKeyHandle::Create("PreKeyBundle.GetIdentityKey",
        [bundle](SglMutPointerPublicKey* out) {
            return sgl_pre_key_bundle_get_identity_key(out, bundle);
        }));
    return Result<PublicKey, SigilFailure>::Ok(PublicKey::FromHandle(std::move(key)));
}

Result<uint32_t, SigilFailure> PreKeyBundle::GetKyberPreKeyId() const {
    return handle_.With([](const SglConstPointerPreKeyBundle bundle) {
        return ffi::CallForValue<uint32_t>("PreKeyBundle.GetKyberPreKeyId", [bundle](uint32_t* out) {
            return sgl_pre_key_bundle_get_kyber_pre_key_id(out, bundle);
        });
    });
}

Result<KyberPublicKey, SigilFailure> PreKeyBundle::GetKyberPreKeyPublic() const {
    SIGIL_TRY_ASSIGN(bundle, handle_.Use());
    SIGIL_TRY_ASSIGN(key, KyberPublicKeyHandle::Create("PreKeyBundle.GetKyberPreKeyPublic",
        [bundle](SglMutPointerKyberPublicKey* out) {
            return sgl_pre_key_bundle_get_kyber_pre_key_public(out, bundle);
        }));
    return Result<KyberPublicKey, SigilFailure>::Ok(KyberPublicKey::FromHandle(std::move(key)));
}

Result<std::vector<uint8_t>, SigilFailure> PreKeyBundle::GetKyberPreKeySignature() const {
    return handle_.With([](const SglConstPointerPreKeyBundle bundle) {
        return ffi::CallForBytes("PreKeyBundle.GetKyberPreKeySignature", [bundle](SglOwnedBuffer* out) {
            return sgl_pre_key_bundle_get_kyber_pre_key_signature(out, bundle);
        });
    });
}

Result<bool, SigilFailure> PreKeyBundle::VerifySignatures() const {
    return handle_.With([](const SglConstPointerPreKeyBundle bundle) {
        return ffi::CallForValue<bool>("PreKeyBundle.VerifySignatures", [bundle](bool* out) {
            return sgl_pre_key_bundle_verify_signatures(out, bundle);
        });
    });
}

Result<PreKeyBundle, SigilFailure> PreKeyBundle::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<PreKeyBundle, SigilFailure>::Ok(PreKeyBundle(std::move(copy)));
}

void PreKeyBundle::Dispose() noexcept {
    handle_.Dispose();
}

bool PreKeyBundle::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
