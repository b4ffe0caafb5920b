/**
 * @file sgl_prekeys.cpp
 * @brief One-time, signed and Kyber pre-key records and pre-key bundles
 */

#include "sigil/c_api/sgl_ffi.h"
#include "sgl_internal.hpp"

#include "engine/curve25519.hpp"
#include "sigil/core/constants.hpp"
#include "sigil/storage.pb.h"

#include <memory>

using namespace sigil::engine;
using namespace sigil::engine::capi;
using sigil::protocol::KeyConstants;
using sigil::proto::storage::PreKeyRecordStructure;
using sigil::proto::storage::SignedPreKeyRecordStructure;

namespace {

Result<SecureMemoryHandle, EngineFailure> ParsePrivateKey(const std::string& bytes) {
    if (bytes.size() != KeyConstants::PRIVATE_KEY_SIZE) {
        return Result<SecureMemoryHandle, EngineFailure>::Err(
            EngineFailure::InvalidKey("Bad private key length: " + std::to_string(bytes.size())));
    }
    return Curve25519::PrivateKeyFromBytes(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
}

std::span<const uint8_t> AsBytes(const std::string& value) {
    return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
}

Result<SecureMemoryHandle, EngineFailure> ParseKyberSecretKey(const std::string& bytes) {
    if (bytes.size() != KeyConstants::SERIALIZED_KYBER_SECRET_KEY_SIZE
        || static_cast<uint8_t>(bytes[0]) != KeyConstants::KYBER_1024_KEY_TYPE) {
        return Result<SecureMemoryHandle, EngineFailure>::Err(
            EngineFailure::InvalidKey("Bad Kyber secret key encoding"));
    }
    return SecureMemoryHandle::FromBytes(AsBytes(bytes).subspan(1));
}

std::string PrivateKeyToProto(const SecureMemoryHandle& key) {
    return key.WithReadAccess([](std::span<const uint8_t> scalar) {
        return ToProtoBytes(scalar);
    });
}

std::string KyberSecretKeyToProto(const SecureMemoryHandle& key) {
    return key.WithReadAccess([](std::span<const uint8_t> secret) {
        std::string encoded;
        encoded.reserve(secret.size() + 1);
        encoded.push_back(static_cast<char>(KeyConstants::KYBER_1024_KEY_TYPE));
        encoded.append(reinterpret_cast<const char*>(secret.data()), secret.size());
        return encoded;
    });
}

/// Serializes a message holding key material and wipes the intermediate copies.
template<typename Message>
ApiResult WriteSecretProto(SglOwnedBuffer* out, Message& message) {
    auto bytes = SerializeProto(message);
    auto written = WriteOwned(out, bytes);
    SodiumInterop::SecureWipe(bytes);
    if (auto* secret = message.mutable_private_key(); !secret->empty()) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(secret->data()), secret->size()));
    }
    return written;
}

ApiResult WritePrivateKey(SglMutPointerPrivateKey* out, const SecureMemoryHandle& key) {
    SGL_TRY(RequireOut(out));
    SGL_TRY_ASSIGN(object, NewPrivateKey(key));
    out->raw = object;
    return Success();
}

ApiResult WritePublicKey(SglMutPointerPublicKey* out, const Curve25519PublicBytes& key) {
    SGL_TRY(RequireOut(out));
    out->raw = NewPublicKey(key);
    return Success();
}

ApiResult WriteKyberPublicKey(SglMutPointerKyberPublicKey* out, const std::vector<uint8_t>& key) {
    SGL_TRY(RequireOut(out));
    auto object = std::make_unique<SglKyberPublicKey>();
    object->key = key;
    out->raw = object.release();
    return Success();
}

template<typename Out>
ApiResult WriteScalar(Out* out, const Out value) {
    SGL_TRY(RequireOut(out));
    *out = value;
    return Success();
}

} // namespace

// ============================================================================
// One-time pre-keys
// ============================================================================

SglFfiError* sgl_pre_key_record_new(
    SglMutPointerPreKeyRecord* out,
    const uint32_t id,
    const SglConstPointerPublicKey public_key,
    const SglConstPointerPrivateKey private_key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(pub, Deref(public_key.raw));
        SGL_TRY_ASSIGN(priv, Deref(private_key.raw));
        SGL_TRY_ASSIGN(secret, priv->key.Clone());
        auto record = std::make_unique<SglPreKeyRecord>();
        record->id = id;
        record->public_key = pub->key;
        record->private_key = std::move(secret);
        out->raw = record.release();
        return Success();
    });
}

SglFfiError* sgl_pre_key_record_deserialize(SglMutPointerPreKeyRecord* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        SGL_TRY_ASSIGN(message, ParseProto<PreKeyRecordStructure>(bytes, "pre-key record"));
        SGL_TRY_ASSIGN(public_key, ParsePublicKey(AsBytes(message.public_key())));
        SGL_TRY_ASSIGN(secret, ParsePrivateKey(message.private_key()));
        SodiumInterop::SecureWipe(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(message.mutable_private_key()->data()), message.private_key().size()));
        auto record = std::make_unique<SglPreKeyRecord>();
        record->id = message.id();
        record->public_key = public_key;
        record->private_key = std::move(secret);
        out->raw = record.release();
        return Success();
    });
}

SglFfiError* sgl_pre_key_record_serialize(SglOwnedBuffer* out, const SglConstPointerPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        PreKeyRecordStructure message;
        message.set_id(object->id);
        message.set_public_key(ToProtoBytes(SerializePublicKey(object->public_key)));
        message.set_private_key(PrivateKeyToProto(object->private_key));
        return WriteSecretProto(out, message);
    });
}

SglFfiError* sgl_pre_key_record_get_id(uint32_t* out, const SglConstPointerPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        return WriteScalar(out, object->id);
    });
}

SglFfiError* sgl_pre_key_record_get_public_key(SglMutPointerPublicKey* out, const SglConstPointerPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        return WritePublicKey(out, object->public_key);
    });
}

SglFfiError* sgl_pre_key_record_get_private_key(SglMutPointerPrivateKey* out, const SglConstPointerPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        return WritePrivateKey(out, object->private_key);
    });
}

SglFfiError* sgl_pre_key_record_clone(SglMutPointerPreKeyRecord* out, const SglConstPointerPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        SGL_TRY_ASSIGN(secret, object->private_key.Clone());
        auto copy = std::make_unique<SglPreKeyRecord>();
        copy->id = object->id;
        copy->public_key = object->public_key;
        copy->private_key = std::move(secret);
        out->raw = copy.release();
        return Success();
    });
}

SglFfiError* sgl_pre_key_record_destroy(const SglMutPointerPreKeyRecord record) {
    return Guard([&]() { return Destroy(record.raw); });
}

// ============================================================================
// Signed pre-keys
// ============================================================================

SglFfiError* sgl_signed_pre_key_record_new(
    SglMutPointerSignedPreKeyRecord* out,
    const uint32_t id,
    const uint64_t timestamp,
    const SglConstPointerPublicKey public_key,
    const SglConstPointerPrivateKey private_key,
    const SglBorrowedBuffer signature) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(pub, Deref(public_key.raw));
        SGL_TRY_ASSIGN(priv, Deref(private_key.raw));
        SGL_TRY_ASSIGN(signature_bytes, Borrow(signature));
        SGL_TRY_ASSIGN(secret, priv->key.Clone());
        auto record = std::make_unique<SglSignedPreKeyRecord>();
        record->id = id;
        record->timestamp = timestamp;
        record->public_key = pub->key;
        record->private_key = std::move(secret);
        record->signature.assign(signature_bytes.begin(), signature_bytes.end());
        out->raw = record.release();
        return Success();
    });
}

SglFfiError* sgl_signed_pre_key_record_deserialize(SglMutPointerSignedPreKeyRecord* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        SGL_TRY_ASSIGN(message, ParseProto<SignedPreKeyRecordStructure>(bytes, "signed pre-key record"));
        SGL_TRY_ASSIGN(public_key, ParsePublicKey(AsBytes(message.public_key())));
        SGL_TRY_ASSIGN(secret, ParsePrivateKey(message.private_key()));
        SodiumInterop::SecureWipe(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(message.mutable_private_key()->data()), message.private_key().size()));
        auto record = std::make_unique<SglSignedPreKeyRecord>();
        record->id = message.id();
        record->timestamp = message.timestamp();
        record->public_key = public_key;
        record->private_key = std::move(secret);
        record->signature = ToBytes(message.signature());
        out->raw = record.release();
        return Success();
    });
}

SglFfiError* sgl_signed_pre_key_record_serialize(SglOwnedBuffer* out, const SglConstPointerSignedPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        SignedPreKeyRecordStructure message;
        message.set_id(object->id);
        message.set_timestamp(object->timestamp);
        message.set_public_key(ToProtoBytes(SerializePublicKey(object->public_key)));
        message.set_private_key(PrivateKeyToProto(object->private_key));
        message.set_signature(ToProtoBytes(object->signature));
        return WriteSecretProto(out, message);
    });
}

SglFfiError* sgl_signed_pre_key_record_get_id(uint32_t* out, const SglConstPointerSignedPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        return WriteScalar(out, object->id);
    });
}

SglFfiError* sgl_signed_pre_key_record_get_timestamp(uint64_t* out, const SglConstPointerSignedPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        return WriteScalar(out, object->timestamp);
    });
}

SglFfiError* sgl_signed_pre_key_record_get_public_key(
    SglMutPointerPublicKey* out,
    const SglConstPointerSignedPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        return WritePublicKey(out, object->public_key);
    });
}

SglFfiError* sgl_signed_pre_key_record_get_private_key(
    SglMutPointerPrivateKey* out,
    const SglConstPointerSignedPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        return WritePrivateKey(out, object->private_key);
    });
}

SglFfiError* sgl_signed_pre_key_record_get_signature(SglOwnedBuffer* out, const SglConstPointerSignedPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        return WriteOwned(out, object->signature);
    });
}

SglFfiError* sgl_signed_pre_key_record_clone(
    SglMutPointerSignedPreKeyRecord* out,
    const SglConstPointerSignedPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        SGL_TRY_ASSIGN(secret, object->private_key.Clone());
        auto copy = std::make_unique<SglSignedPreKeyRecord>();
        copy->id = object->id;
        copy->timestamp = object->timestamp;
        copy->public_key = object->public_key;
        copy->private_key = std::move(secret);
        copy->signature = object->signature;
        out->raw = copy.release();
        return Success();
    });
}

SglFfiError* sgl_signed_pre_key_record_destroy(const SglMutPointerSignedPreKeyRecord record) {
    return Guard([&]() { return Destroy(record.raw); });
}

// ============================================================================
// Kyber pre-keys
// ============================================================================

SglFfiError* sgl_kyber_pre_key_record_new(
    SglMutPointerKyberPreKeyRecord* out,
    const uint32_t id,
    const uint64_t timestamp,
    const SglConstPointerKyberKeyPair key_pair,
    const SglBorrowedBuffer signature) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(pair, Deref(key_pair.raw));
        SGL_TRY_ASSIGN(signature_bytes, Borrow(signature));
        SGL_TRY_ASSIGN(secret, pair->secret_key.Clone());
        auto record = std::make_unique<SglKyberPreKeyRecord>();
        record->id = id;
        record->timestamp = timestamp;
        record->public_key = pair->public_key;
        record->secret_key = std::move(secret);
        record->signature.assign(signature_bytes.begin(), signature_bytes.end());
        out->raw = record.release();
        return Success();
    });
}

SglFfiError* sgl_kyber_pre_key_record_deserialize(SglMutPointerKyberPreKeyRecord* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        SGL_TRY_ASSIGN(message, ParseProto<SignedPreKeyRecordStructure>(bytes, "Kyber pre-key record"));
        SGL_TRY_ASSIGN(public_key, ParseKyberPublicKey(AsBytes(message.public_key())));
        SGL_TRY_ASSIGN(secret, ParseKyberSecretKey(message.private_key()));
        SodiumInterop::SecureWipe(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(message.mutable_private_key()->data()), message.private_key().size()));
        auto record = std::make_unique<SglKyberPreKeyRecord>();
        record->id = message.id();
        record->timestamp = message.timestamp();
        record->public_key = std::move(public_key);
        record->secret_key = std::move(secret);
        record->signature = ToBytes(message.signature());
        out->raw = record.release();
        return Success();
    });
}

SglFfiError* sgl_kyber_pre_key_record_serialize(SglOwnedBuffer* out, const SglConstPointerKyberPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        SignedPreKeyRecordStructure message;
        message.set_id(object->id);
        message.set_timestamp(object->timestamp);
        message.set_public_key(ToProtoBytes(SerializeKyberPublicKey(object->public_key)));
        message.set_private_key(KyberSecretKeyToProto(object->secret_key));
        message.set_signature(ToProtoBytes(object->signature));
        return WriteSecretProto(out, message);
    });
}

SglFfiError* sgl_kyber_pre_key_record_get_id(uint32_t* out, const SglConstPointerKyberPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        return WriteScalar(out, object->id);
    });
}

SglFfiError* sgl_kyber_pre_key_record_get_timestamp(uint64_t* out, const SglConstPointerKyberPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        return WriteScalar(out, object->timestamp);
    });
}

SglFfiError* sgl_kyber_pre_key_record_get_public_key(
    SglMutPointerKyberPublicKey* out,
    const SglConstPointerKyberPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        return WriteKyberPublicKey(out, object->public_key);
    });
}

SglFfiError* sgl_kyber_pre_key_record_get_secret_key(
    SglMutPointerKyberSecretKey* out,
    const SglConstPointerKyberPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        SGL_TRY_ASSIGN(secret, object->secret_key.Clone());
        auto key = std::make_unique<SglKyberSecretKey>();
        key->key = std::move(secret);
        out->raw = key.release();
        return Success();
    });
}

SglFfiError* sgl_kyber_pre_key_record_get_key_pair(
    SglMutPointerKyberKeyPair* out,
    const SglConstPointerKyberPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        SGL_TRY_ASSIGN(secret, object->secret_key.Clone());
        auto pair = std::make_unique<SglKyberKeyPair>();
        pair->public_key = object->public_key;
        pair->secret_key = std::move(secret);
        out->raw = pair.release();
        return Success();
    });
}

SglFfiError* sgl_kyber_pre_key_record_get_signature(SglOwnedBuffer* out, const SglConstPointerKyberPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        return WriteOwned(out, object->signature);
    });
}

SglFfiError* sgl_kyber_pre_key_record_clone(
    SglMutPointerKyberPreKeyRecord* out,
    const SglConstPointerKyberPreKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        SGL_TRY_ASSIGN(secret, object->secret_key.Clone());
        auto copy = std::make_unique<SglKyberPreKeyRecord>();
        copy->id = object->id;
        copy->timestamp = object->timestamp;
        copy->public_key = object->public_key;
        copy->secret_key = std::move(secret);
        copy->signature = object->signature;
        out->raw = copy.release();
        return Success();
    });
}

SglFfiError* sgl_kyber_pre_key_record_destroy(const SglMutPointerKyberPreKeyRecord record) {
    return Guard([&]() { return Destroy(record.raw); });
}

// ============================================================================
// Pre-key bundles
// ============================================================================

SglFfiError* sgl_pre_key_bundle_new(
    SglMutPointerPreKeyBundle* out,
    const uint32_t registration_id,
    const uint32_t device_id,
    const uint32_t pre_key_id,
    const SglConstPointerPublicKey pre_key,
    const uint32_t signed_pre_key_id,
    const SglConstPointerPublicKey signed_pre_key,
    const SglBorrowedBuffer signed_pre_key_signature,
    const SglConstPointerPublicKey identity_key,
    const uint32_t kyber_pre_key_id,
    const SglConstPointerKyberPublicKey kyber_pre_key,
    const SglBorrowedBuffer kyber_pre_key_signature) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(spk, Deref(signed_pre_key.raw));
        SGL_TRY_ASSIGN(spk_signature, Borrow(signed_pre_key_signature));
        SGL_TRY_ASSIGN(identity, Deref(identity_key.raw));
        SGL_TRY_ASSIGN(kyber, Deref(kyber_pre_key.raw));
        SGL_TRY_ASSIGN(kyber_signature, Borrow(kyber_pre_key_signature));

        auto bundle = std::make_unique<SglPreKeyBundle>();
        bundle->registration_id = registration_id;
        bundle->device_id = device_id;
        if (pre_key.raw != nullptr) {
            bundle->pre_key_id = pre_key_id;
            bundle->pre_key = pre_key.raw->key;
        }
        bundle->signed_pre_key_id = signed_pre_key_id;
        bundle->signed_pre_key = spk->key;
        bundle->signed_pre_key_signature.assign(spk_signature.begin(), spk_signature.end());
        bundle->identity_key = identity->key;
        bundle->kyber_pre_key_id = kyber_pre_key_id;
        bundle->kyber_pre_key = kyber->key;
        bundle->kyber_pre_key_signature.assign(kyber_signature.begin(), kyber_signature.end());
        out->raw = bundle.release();
        return Success();
    });
}

SglFfiError* sgl_pre_key_bundle_get_registration_id(uint32_t* out, const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        return WriteScalar(out, object->registration_id);
    });
}

SglFfiError* sgl_pre_key_bundle_get_device_id(uint32_t* out, const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        return WriteScalar(out, object->device_id);
    });
}

SglFfiError* sgl_pre_key_bundle_get_pre_key_id(
    uint32_t* out,
    bool* out_present,
    const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY(RequireOut(out_present));
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        *out_present = object->pre_key_id.has_value();
        *out = object->pre_key_id.value_or(0);
        return Success();
    });
}

SglFfiError* sgl_pre_key_bundle_get_pre_key_public(SglMutPointerPublicKey* out, const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        if (!object->pre_key.has_value()) {
            out->raw = nullptr;
            return Success();
        }
        return WritePublicKey(out, *object->pre_key);
    });
}

SglFfiError* sgl_pre_key_bundle_get_signed_pre_key_id(uint32_t* out, const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        return WriteScalar(out, object->signed_pre_key_id);
    });
}

SglFfiError* sgl_pre_key_bundle_get_signed_pre_key_public(
    SglMutPointerPublicKey* out,
    const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        return WritePublicKey(out, object->signed_pre_key);
    });
}

SglFfiError* sgl_pre_key_bundle_get_signed_pre_key_signature(
    SglOwnedBuffer* out,
    const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        return WriteOwned(out, object->signed_pre_key_signature);
    });
}

SglFfiError* sgl_pre_key_bundle_get_identity_key(SglMutPointerPublicKey* out, const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        return WritePublicKey(out, object->identity_key);
    });
}

SglFfiError* sgl_pre_key_bundle_get_kyber_pre_key_id(uint32_t* out, const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        return WriteScalar(out, object->kyber_pre_key_id);
    });
}

SglFfiError* sgl_pre_key_bundle_get_kyber_pre_key_public(
    SglMutPointerKyberPublicKey* out,
    const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        return WriteKyberPublicKey(out, object->kyber_pre_key);
    });
}

SglFfiError* sgl_pre_key_bundle_get_kyber_pre_key_signature(
    SglOwnedBuffer* out,
    const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        return WriteOwned(out, object->kyber_pre_key_signature);
    });
}

SglFfiError* sgl_pre_key_bundle_verify_signatures(bool* out, const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        *out = false;
        if (object->signed_pre_key_signature.size() != KeyConstants::SIGNATURE_SIZE
            || object->kyber_pre_key_signature.size() != KeyConstants::SIGNATURE_SIZE) {
            return Success();
        }
        SGL_TRY_ASSIGN(signed_ok, Curve25519::Verify(
            object->identity_key,
            SerializePublicKey(object->signed_pre_key),
            object->signed_pre_key_signature));
        if (!signed_ok) {
            return Success();
        }
        SGL_TRY_ASSIGN(kyber_ok, Curve25519::Verify(
            object->identity_key,
            SerializeKyberPublicKey(object->kyber_pre_key),
            object->kyber_pre_key_signature));
        *out = kyber_ok;
        return Success();
    });
}

SglFfiError* sgl_pre_key_bundle_clone(SglMutPointerPreKeyBundle* out, const SglConstPointerPreKeyBundle bundle) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(bundle.raw));
        out->raw = new SglPreKeyBundle(*object);
        return Success();
    });
}

SglFfiError* sgl_pre_key_bundle_destroy(const SglMutPointerPreKeyBundle bundle) {
    return Guard([&]() { return Destroy(bundle.raw); });
}
