#include "sigil/sealed_sender/server_certificate.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::sealed_sender {
using ffi::Borrow;
using keys::PublicKeyHandle;
using validation::SerializationValidator;

ServerCertificate::ServerCertificate(ServerCertificateHandle handle) noexcept
    : handle_(std::move(handle)) {}

ServerCertificate ServerCertificate::FromHandle(ServerCertificateHandle handle) noexcept {
    return ServerCertificate(std::move(handle));
}

Result<ServerCertificate, SigilFailure> ServerCertificate::Create(
    const uint32_t key_id,
    const PublicKey& server_key,
    const PrivateKey& trust_root) {
    SIGIL_TRY_ASSIGN(key, server_key.Handle().Use());
    SIGIL_TRY_ASSIGN(root, trust_root.Handle().Use());
    SIGIL_TRY_ASSIGN(handle, ServerCertificateHandle::Create("ServerCertificate.Create",
        [key_id, key, root](SglMutPointerServerCertificate* out) {
            return sgl_server_certificate_new(out, key_id, key, root);
        }));
    return Result<ServerCertificate, SigilFailure>::Ok(ServerCertificate(std::move(handle)));
}

Result<ServerCertificate, SigilFailure> ServerCertificate::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateServerCertificate(data), "ServerCertificate.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, ServerCertificateHandle::Create("ServerCertificate.Deserialize",
        [data](SglMutPointerServerCertificate* out) {
            return sgl_server_certificate_deserialize(out, Borrow(data));
        }));
    return Result<ServerCertificate, SigilFailure>::Ok(ServerCertificate(std::move(handle)));
}

Result<std::vector<uint8_t>, SigilFailure> ServerCertificate::Serialize() const {
    return handle_.With([](const SglConstPointerServerCertificate cert) {
        return ffi::CallForBytes("ServerCertificate.Serialize", [cert](SglOwnedBuffer* out) {
            return sgl_server_certificate_serialize(out, cert);
        });
    });
}

Result<std::vector<uint8_t>, SigilFailure> ServerCertificate::GetCertificate() const {
    return handle_.With([](const SglConstPointerServerCertificate cert) {
        return ffi::CallForBytes("ServerCertificate.GetCertificate", [cert](SglOwnedBuffer* out) {
            return sgl_server_certificate_get_certificate(out, cert);
        });
    });
}

Result<std::vector<uint8_t>, SigilFailure> ServerCertificate::GetSignature() const {
    return handle_.With([](const SglConstPointerServerCertificate cert) {
        return ffi::CallForBytes("ServerCertificate.GetSignature", [cert](SglOwnedBuffer* out) {
            return sgl_server_certificate_get_signature(out, cert);
        });
    });
}

Result<uint32_t, SigilFailure> ServerCertificate::GetKeyId() const {
    return handle_.With([](const SglConstPointerServerCertificate cert) {
        return ffi::CallForValue<uint32_t>("ServerCertificate.GetKeyId", [cert](uint32_t* out) {
            return sgl_server_certificate_get_key_id(out, cert);
        });
    });
}

Result<PublicKey, SigilFailure> ServerCertificate::GetKey() const {
    SIGIL_TRY_ASSIGN(cert, handle_.Use());
    SIGIL_TRY_ASSIGN(key, PublicKeyHandle::Create("ServerCertificate.GetKey",
        [cert](SglMutPointerPublicKey* out) {
            return sgl_server_certificate_get_key(out, cert);
        }));
    return Result<PublicKey, SigilFailure>::Ok(PublicKey::FromHandle(std::move(key)));
}

Result<ServerCertificate, SigilFailure> ServerCertificate::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<ServerCertificate, SigilFailure>::Ok(ServerCertificate(std::move(copy)));
}

void ServerCertificate::Dispose() noexcept {
    handle_.Dispose();
}

bool ServerCertificate::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
