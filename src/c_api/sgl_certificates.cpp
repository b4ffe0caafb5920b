/**
 * @file sgl_certificates.cpp
 * @brief Sealed sender server and sender certificates
 *
 * A server certificate binds a key id and server key under the trust root.
 * A sender certificate binds a sender identity under a server key and embeds
 * the server certificate that vouches for that key.
 */

#include "sigil/c_api/sgl_ffi.h"
#include "sgl_internal.hpp"

#include "engine/curve25519.hpp"
#include "sigil/core/constants.hpp"
#include "sigil/sealed_sender.pb.h"

#include <algorithm>
#include <memory>

using namespace sigil::engine;
using namespace sigil::engine::capi;
using sigil::protocol::CertificateConstants;
using sigil::proto::sealed_sender::SenderCertificate;
using sigil::proto::sealed_sender::ServerCertificate;

namespace {

std::span<const uint8_t> AsBytes(const std::string& value) {
    return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
}

Result<ServerCertificateData, EngineFailure> ParseServerCertificate(const ServerCertificate& wrapper) {
    using ResultType = Result<ServerCertificateData, EngineFailure>;
    if (wrapper.certificate().empty() || wrapper.signature().empty()) {
        return ResultType::Err(EngineFailure::InvalidMessage("Server certificate is missing required fields"));
    }
    SGL_TRY_ASSIGN(inner, ParseProto<ServerCertificate::Certificate>(
        AsBytes(wrapper.certificate()), "server certificate body"));
    SGL_TRY_ASSIGN(key, Curve25519::ParsePublicKey(AsBytes(inner.key())));

    ServerCertificateData data;
    data.serialized = SerializeProto(wrapper);
    data.certificate = ToBytes(wrapper.certificate());
    data.signature = ToBytes(wrapper.signature());
    data.key_id = inner.id();
    data.key = key;
    return ResultType::Ok(std::move(data));
}

ServerCertificate ToServerCertificateProto(const ServerCertificateData& data) {
    ServerCertificate wrapper;
    wrapper.set_certificate(ToProtoBytes(data.certificate));
    wrapper.set_signature(ToProtoBytes(data.signature));
    return wrapper;
}

bool IsRevoked(const uint32_t key_id) {
    const auto& revoked = CertificateConstants::REVOKED_SERVER_KEY_IDS;
    return std::find(revoked.begin(), revoked.end(), key_id) != revoked.end();
}

Result<std::unique_ptr<SglSenderCertificate>, EngineFailure> ParseSenderCertificate(std::span<const uint8_t> bytes) {
    using ResultType = Result<std::unique_ptr<SglSenderCertificate>, EngineFailure>;
    SGL_TRY_ASSIGN(wrapper, ParseProto<SenderCertificate>(bytes, "sender certificate"));
    if (wrapper.certificate().empty() || wrapper.signature().empty()) {
        return ResultType::Err(EngineFailure::InvalidMessage("Sender certificate is missing required fields"));
    }
    SGL_TRY_ASSIGN(inner, ParseProto<SenderCertificate::Certificate>(
        AsBytes(wrapper.certificate()), "sender certificate body"));
    if (inner.sender_uuid().empty()) {
        return ResultType::Err(EngineFailure::InvalidMessage("Sender certificate has no sender uuid"));
    }
    if (!inner.has_signer()) {
        return ResultType::Err(EngineFailure::InvalidMessage("Sender certificate has no signer"));
    }
    SGL_TRY_ASSIGN(key, Curve25519::ParsePublicKey(AsBytes(inner.identity_key())));
    SGL_TRY_ASSIGN(signer, ParseServerCertificate(inner.signer()));

    auto cert = std::make_unique<SglSenderCertificate>();
    cert->serialized.assign(bytes.begin(), bytes.end());
    cert->certificate = ToBytes(wrapper.certificate());
    cert->signature = ToBytes(wrapper.signature());
    cert->sender_uuid = inner.sender_uuid();
    if (!inner.sender_e164().empty()) {
        cert->sender_e164 = inner.sender_e164();
    }
    cert->device_id = inner.sender_device();
    cert->expiration = inner.expires();
    cert->key = key;
    cert->signer = std::move(signer);
    return ResultType::Ok(std::move(cert));
}

ApiResult WriteCopy(SglMutPointerServerCertificate* out, const ServerCertificateData& data) {
    SGL_TRY(RequireOut(out));
    auto cert = std::make_unique<SglServerCertificate>();
    cert->data = data;
    out->raw = cert.release();
    return Success();
}

} // namespace

// ============================================================================
// Server certificates
// ============================================================================

SglFfiError* sgl_server_certificate_new(
    SglMutPointerServerCertificate* out,
    const uint32_t key_id,
    const SglConstPointerPublicKey server_key,
    const SglConstPointerPrivateKey trust_root) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(key, Deref(server_key.raw));
        SGL_TRY_ASSIGN(root, Deref(trust_root.raw));

        ServerCertificate::Certificate inner;
        inner.set_id(key_id);
        inner.set_key(ToProtoBytes(SerializePublicKey(key->key)));
        const auto certificate = SerializeProto(inner);
        SGL_TRY_ASSIGN(signature, Curve25519::Sign(root->key, certificate));

        ServerCertificate wrapper;
        wrapper.set_certificate(ToProtoBytes(certificate));
        wrapper.set_signature(ToProtoBytes(signature));

        auto cert = std::make_unique<SglServerCertificate>();
        cert->data.serialized = SerializeProto(wrapper);
        cert->data.certificate = certificate;
        cert->data.signature = signature;
        cert->data.key_id = key_id;
        cert->data.key = key->key;
        out->raw = cert.release();
        return Success();
    });
}

SglFfiError* sgl_server_certificate_deserialize(SglMutPointerServerCertificate* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        SGL_TRY_ASSIGN(wrapper, ParseProto<ServerCertificate>(bytes, "server certificate"));
        SGL_TRY_ASSIGN(parsed, ParseServerCertificate(wrapper));
        parsed.serialized.assign(bytes.begin(), bytes.end());
        auto cert = std::make_unique<SglServerCertificate>();
        cert->data = std::move(parsed);
        out->raw = cert.release();
        return Success();
    });
}

SglFfiError* sgl_server_certificate_serialize(SglOwnedBuffer* out, const SglConstPointerServerCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        return WriteOwned(out, object->data.serialized);
    });
}

SglFfiError* sgl_server_certificate_get_certificate(SglOwnedBuffer* out, const SglConstPointerServerCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        return WriteOwned(out, object->data.certificate);
    });
}

SglFfiError* sgl_server_certificate_get_signature(SglOwnedBuffer* out, const SglConstPointerServerCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        return WriteOwned(out, object->data.signature);
    });
}

SglFfiError* sgl_server_certificate_get_key_id(uint32_t* out, const SglConstPointerServerCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        *out = object->data.key_id;
        return Success();
    });
}

SglFfiError* sgl_server_certificate_get_key(SglMutPointerPublicKey* out, const SglConstPointerServerCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        out->raw = NewPublicKey(object->data.key);
        return Success();
    });
}

SglFfiError* sgl_server_certificate_clone(SglMutPointerServerCertificate* out, const SglConstPointerServerCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        return WriteCopy(out, object->data);
    });
}

SglFfiError* sgl_server_certificate_destroy(const SglMutPointerServerCertificate cert) {
    return Guard([&]() { return Destroy(cert.raw); });
}

// ============================================================================
// Sender certificates
// ============================================================================

SglFfiError* sgl_sender_certificate_new(
    SglMutPointerSenderCertificate* out,
    const char* sender_uuid,
    const char* sender_e164,
    const uint32_t device_id,
    const SglConstPointerPublicKey sender_key,
    const uint64_t expiration,
    const SglConstPointerServerCertificate signer_cert,
    const SglConstPointerPrivateKey signer_key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        if (sender_uuid == nullptr) {
            return ApiResult::Err(EngineFailure::NullParameter("Sender uuid is null"));
        }
        SGL_TRY_ASSIGN(key, Deref(sender_key.raw));
        SGL_TRY_ASSIGN(signer, Deref(signer_cert.raw));
        SGL_TRY_ASSIGN(signing_key, Deref(signer_key.raw));

        SenderCertificate::Certificate inner;
        inner.set_sender_uuid(sender_uuid);
        if (sender_e164 != nullptr) {
            inner.set_sender_e164(sender_e164);
        }
        inner.set_sender_device(device_id);
        inner.set_expires(expiration);
        inner.set_identity_key(ToProtoBytes(SerializePublicKey(key->key)));
        *inner.mutable_signer() = ToServerCertificateProto(signer->data);
        const auto certificate = SerializeProto(inner);
        SGL_TRY_ASSIGN(signature, Curve25519::Sign(signing_key->key, certificate));

        SenderCertificate wrapper;
        wrapper.set_certificate(ToProtoBytes(certificate));
        wrapper.set_signature(ToProtoBytes(signature));

        auto cert = std::make_unique<SglSenderCertificate>();
        cert->serialized = SerializeProto(wrapper);
        cert->certificate = certificate;
        cert->signature = signature;
        cert->sender_uuid = sender_uuid;
        if (sender_e164 != nullptr && sender_e164[0] != '\0') {
            cert->sender_e164 = std::string(sender_e164);
        }
        cert->device_id = device_id;
        cert->expiration = expiration;
        cert->key = key->key;
        cert->signer = signer->data;
        out->raw = cert.release();
        return Success();
    });
}

SglFfiError* sgl_sender_certificate_deserialize(SglMutPointerSenderCertificate* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        SGL_TRY_ASSIGN(cert, ParseSenderCertificate(bytes));
        out->raw = cert.release();
        return Success();
    });
}

SglFfiError* sgl_sender_certificate_serialize(SglOwnedBuffer* out, const SglConstPointerSenderCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        return WriteOwned(out, object->serialized);
    });
}

SglFfiError* sgl_sender_certificate_get_certificate(SglOwnedBuffer* out, const SglConstPointerSenderCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        return WriteOwned(out, object->certificate);
    });
}

SglFfiError* sgl_sender_certificate_get_signature(SglOwnedBuffer* out, const SglConstPointerSenderCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        return WriteOwned(out, object->signature);
    });
}

SglFfiError* sgl_sender_certificate_get_sender_uuid(const char** out, const SglConstPointerSenderCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        return WriteString(out, object->sender_uuid);
    });
}

SglFfiError* sgl_sender_certificate_get_sender_e164(const char** out, const SglConstPointerSenderCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        if (!object->sender_e164.has_value()) {
            *out = nullptr;
            return Success();
        }
        return WriteString(out, *object->sender_e164);
    });
}

SglFfiError* sgl_sender_certificate_get_device_id(uint32_t* out, const SglConstPointerSenderCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        *out = object->device_id;
        return Success();
    });
}

SglFfiError* sgl_sender_certificate_get_expiration(uint64_t* out, const SglConstPointerSenderCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        *out = object->expiration;
        return Success();
    });
}

SglFfiError* sgl_sender_certificate_get_key(SglMutPointerPublicKey* out, const SglConstPointerSenderCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        out->raw = NewPublicKey(object->key);
        return Success();
    });
}

SglFfiError* sgl_sender_certificate_get_server_certificate(
    SglMutPointerServerCertificate* out,
    const SglConstPointerSenderCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        return WriteCopy(out, object->signer);
    });
}

SglFfiError* sgl_sender_certificate_validate(
    bool* out,
    const SglConstPointerSenderCertificate cert,
    const SglConstPointerPublicKey trust_root,
    const uint64_t now_millis) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        SGL_TRY_ASSIGN(root, Deref(trust_root.raw));
        *out = false;

        SGL_TRY_ASSIGN(server_valid, Curve25519::Verify(
            root->key, object->signer.certificate, object->signer.signature));
        if (!server_valid || IsRevoked(object->signer.key_id)) {
            return Success();
        }
        SGL_TRY_ASSIGN(sender_valid, Curve25519::Verify(
            object->signer.key, object->certificate, object->signature));
        if (!sender_valid) {
            return Success();
        }
        *out = now_millis <= object->expiration;
        return Success();
    });
}

SglFfiError* sgl_sender_certificate_clone(SglMutPointerSenderCertificate* out, const SglConstPointerSenderCertificate cert) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(cert.raw));
        out->raw = new SglSenderCertificate(*object);
        return Success();
    });
}

SglFfiError* sgl_sender_certificate_destroy(const SglMutPointerSenderCertificate cert) {
    return Guard([&]() { return Destroy(cert.raw); });
}
