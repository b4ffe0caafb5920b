#include "sigil/sealed_sender/sender_certificate.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::sealed_sender {
using ffi::Borrow;
using keys::PublicKeyHandle;
using validation::SerializationValidator;

SenderCertificate::SenderCertificate(SenderCertificateHandle handle) noexcept
    : handle_(std::move(handle)) {}

Result<SenderCertificate, SigilFailure> SenderCertificate::Create(
    const std::string& sender_uuid,
    const std::optional<std::string>& sender_e164,
    const uint32_t device_id,
    const PublicKey& sender_key,
    const uint64_t expiration,
    const ServerCertificate& signer,
    const PrivateKey& signer_key) {
    if (sender_uuid.empty()) {
        return Result<SenderCertificate, SigilFailure>::Err(
            SigilFailure::InvalidArgument("SenderCertificate.Create", "Sender uuid is empty"));
    }
    SIGIL_TRY_ASSIGN(key, sender_key.Handle().Use());
    SIGIL_TRY_ASSIGN(signer_cert, signer.Handle().Use());
    SIGIL_TRY_ASSIGN(signing_key, signer_key.Handle().Use());
    const char* e164 = sender_e164.has_value() ? sender_e164->c_str() : nullptr;
    SIGIL_TRY_ASSIGN(handle, SenderCertificateHandle::Create("SenderCertificate.Create",
        [&](SglMutPointerSenderCertificate* out) {
            return sgl_sender_certificate_new(
                out, sender_uuid.c_str(), e164, device_id, key, expiration, signer_cert, signing_key);
        }));
    return Result<SenderCertificate, SigilFailure>::Ok(SenderCertificate(std::move(handle)));
}

Result<SenderCertificate, SigilFailure> SenderCertificate::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateSenderCertificate(data), "SenderCertificate.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, SenderCertificateHandle::Create("SenderCertificate.Deserialize",
        [data](SglMutPointerSenderCertificate* out) {
            return sgl_sender_certificate_deserialize(out, Borrow(data));
        }));
    return Result<SenderCertificate, SigilFailure>::Ok(SenderCertificate(std::move(handle)));
}

Result<std::vector<uint8_t>, SigilFailure> SenderCertificate::Serialize() const {
    return handle_.With([](const SglConstPointerSenderCertificate cert) {
        return ffi::CallForBytes("SenderCertificate.Serialize", [cert](SglOwnedBuffer* out) {
            return sgl_sender_certificate_serialize(out, cert);
        });
    });
}

Result<std::vector<uint8_t>, SigilFailure> SenderCertificate::GetCertificate() const {
    return handle_.With([](const SglConstPointerSenderCertificate cert) {
        return ffi::CallForBytes("SenderCertificate.GetCertificate", [cert](SglOwnedBuffer* out) {
            return sgl_sender_certificate_get_certificate(out, cert);
        });
    });
}

Result<std::vector<uint8_t>, SigilFailure> SenderCertificate::GetSignature() const {
    return handle_.With([](const SglConstPointerSenderCertificate cert) {
        return ffi::CallForBytes("SenderCertificate.GetSignature", [cert](SglOwnedBuffer* out) {
            return sgl_sender_certificate_get_signature(out, cert);
        });
    });
}

Result<std::string, SigilFailure> SenderCertificate::GetSenderUuid() const {
    SIGIL_TRY_ASSIGN(cert, handle_.Use());
    SIGIL_TRY_ASSIGN(uuid, ffi::CallForString("SenderCertificate.GetSenderUuid", [cert](const char** out) {
        return sgl_sender_certificate_get_sender_uuid(out, cert);
    }));
    if (!uuid.has_value()) {
        return Result<std::string, SigilFailure>::Err(
            SigilFailure::NullPointer("SenderCertificate.GetSenderUuid",
                std::string(ErrorMessages::NATIVE_RETURNED_NULL)));
    }
    return Result<std::string, SigilFailure>::Ok(std::move(*uuid));
}

Result<std::optional<std::string>, SigilFailure> SenderCertificate::GetSenderE164() const {
    return handle_.With([](const SglConstPointerSenderCertificate cert) {
        return ffi::CallForString("SenderCertificate.GetSenderE164", [cert](const char** out) {
            return sgl_sender_certificate_get_sender_e164(out, cert);
        });
    });
}

Result<uint32_t, SigilFailure> SenderCertificate::GetDeviceId() const {
    return handle_.With([](const SglConstPointerSenderCertificate cert) {
        return ffi::CallForValue<uint32_t>("SenderCertificate.GetDeviceId", [cert](uint32_t* out) {
            return sgl_sender_certificate_get_device_id(out, cert);
        });
    });
}

Result<uint64_t, SigilFailure> SenderCertificate::GetExpiration() const {
    return handle_.With([](const SglConstPointerSenderCertificate cert) {
        return ffi::CallForValue<uint64_t>("SenderCertificate.GetExpiration", [cert](uint64_t* out) {
            return sgl_sender_certificate_get_expiration(out, cert);
        });
    });
}

Result<PublicKey, SigilFailure> SenderCertificate::GetKey() const {
    SIGIL_TRY_ASSIGN(cert, handle_.Use());
    SIGIL_TRY_ASSIGN(key, PublicKeyHandle::Create("SenderCertificate.GetKey",
        [cert](SglMutPointerPublicKey* out) {
            return sgl_sender_certificate_get_key(out, cert);
        }));
    return Result<PublicKey, SigilFailure>::Ok(PublicKey::FromHandle(std::move(key)));
}

Result<ServerCertificate, SigilFailure> SenderCertificate::GetServerCertificate() const {
    SIGIL_TRY_ASSIGN(cert, handle_.Use());
    SIGIL_TRY_ASSIGN(server, ServerCertificateHandle::Create("SenderCertificate.GetServerCertificate",
        [cert](SglMutPointerServerCertificate* out) {
            return sgl_sender_certificate_get_server_certificate(out, cert);
        }));
    return Result<ServerCertificate, SigilFailure>::Ok(ServerCertificate::FromHandle(std::move(server)));
}

Result<bool, SigilFailure> SenderCertificate::Validate(const PublicKey& trust_root, const uint64_t now_millis) const {
    SIGIL_TRY_ASSIGN(cert, handle_.Use());
    SIGIL_TRY_ASSIGN(root, trust_root.Handle().Use());
    return ffi::CallForValue<bool>("SenderCertificate.Validate", [cert, root, now_millis](bool* out) {
        return sgl_sender_certificate_validate(out, cert, root, now_millis);
    });
}

Result<SenderCertificate, SigilFailure> SenderCertificate::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<SenderCertificate, SigilFailure>::Ok(SenderCertificate(std::move(copy)));
}

void SenderCertificate::Dispose() noexcept {
    handle_.Dispose();
}

bool SenderCertificate::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
