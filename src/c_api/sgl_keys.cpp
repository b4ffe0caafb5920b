/**
 * @file sgl_keys.cpp
 * @brief Curve25519 public/private keys and identity key pairs
 */

#include "sigil/c_api/sgl_ffi.h"
#include "sgl_internal.hpp"

#include "engine/curve25519.hpp"
#include "sigil/core/constants.hpp"

#include <algorithm>
#include <cstring>
#include <memory>

using namespace sigil::engine;
using namespace sigil::engine::capi;
using sigil::protocol::KeyConstants;

namespace {

std::vector<uint8_t> AlternateIdentityMessage(const Curve25519PublicBytes& other) {
    std::vector<uint8_t> message(KeyConstants::ALTERNATE_IDENTITY_PADDING_SIZE, 0xFF);
    message.insert(
        message.end(),
        KeyConstants::ALTERNATE_IDENTITY_CONTEXT.begin(),
        KeyConstants::ALTERNATE_IDENTITY_CONTEXT.end());
    const auto serialized = SerializePublicKey(other);
    message.insert(message.end(), serialized.begin(), serialized.end());
    return message;
}

} // namespace

// ============================================================================
// Public keys
// ============================================================================

SglFfiError* sgl_publickey_deserialize(SglMutPointerPublicKey* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        SGL_TRY_ASSIGN(key, ParsePublicKey(bytes));
        out->raw = NewPublicKey(key);
        return Success();
    });
}

SglFfiError* sgl_publickey_serialize(SglOwnedBuffer* out, const SglConstPointerPublicKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        return WriteOwned(out, SerializePublicKey(object->key));
    });
}

SglFfiError* sgl_publickey_get_public_key_bytes(SglOwnedBuffer* out, const SglConstPointerPublicKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        return WriteOwned(out, object->key);
    });
}

SglFfiError* sgl_publickey_verify(
    bool* out,
    const SglConstPointerPublicKey key,
    const SglBorrowedBuffer message,
    const SglBorrowedBuffer signature) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        SGL_TRY_ASSIGN(message_bytes, Borrow(message));
        SGL_TRY_ASSIGN(signature_bytes, Borrow(signature));
        SGL_TRY_ASSIGN(valid, Curve25519::Verify(object->key, message_bytes, signature_bytes));
        *out = valid;
        return Success();
    });
}

SglFfiError* sgl_publickey_equals(bool* out, const SglConstPointerPublicKey lhs, const SglConstPointerPublicKey rhs) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(left, Deref(lhs.raw));
        SGL_TRY_ASSIGN(right, Deref(rhs.raw));
        *out = SodiumInterop::ConstantTimeEquals(left->key, right->key);
        return Success();
    });
}

SglFfiError* sgl_publickey_compare(int32_t* out, const SglConstPointerPublicKey lhs, const SglConstPointerPublicKey rhs) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(left, Deref(lhs.raw));
        SGL_TRY_ASSIGN(right, Deref(rhs.raw));
        const int cmp = std::memcmp(left->key.data(), right->key.data(), left->key.size());
        *out = cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
        return Success();
    });
}

SglFfiError* sgl_publickey_clone(SglMutPointerPublicKey* out, const SglConstPointerPublicKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        out->raw = NewPublicKey(object->key);
        return Success();
    });
}

SglFfiError* sgl_publickey_destroy(const SglMutPointerPublicKey key) {
    return Guard([&]() { return Destroy(key.raw); });
}

// ============================================================================
// Private keys
// ============================================================================

SglFfiError* sgl_privatekey_generate(SglMutPointerPrivateKey* out) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(handle, Curve25519::GeneratePrivateKey());
        auto object = std::make_unique<SglPrivateKey>();
        object->key = std::move(handle);
        out->raw = object.release();
        return Success();
    });
}

SglFfiError* sgl_privatekey_deserialize(SglMutPointerPrivateKey* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        if (bytes.size() != KeyConstants::PRIVATE_KEY_SIZE) {
            return ApiResult::Err(EngineFailure::InvalidKey(
                "Bad private key length: " + std::to_string(bytes.size())));
        }
        SGL_TRY_ASSIGN(handle, Curve25519::PrivateKeyFromBytes(bytes));
        auto object = std::make_unique<SglPrivateKey>();
        object->key = std::move(handle);
        out->raw = object.release();
        return Success();
    });
}

SglFfiError* sgl_privatekey_serialize(SglOwnedBuffer* out, const SglConstPointerPrivateKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        auto bytes = object->key.ReadBytes();
        auto written = WriteOwned(out, bytes);
        SodiumInterop::SecureWipe(bytes);
        return written;
    });
}

SglFfiError* sgl_privatekey_get_public_key(SglMutPointerPublicKey* out, const SglConstPointerPrivateKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        SGL_TRY_ASSIGN(public_key, Curve25519::DerivePublicKey(object->key));
        out->raw = NewPublicKey(public_key);
        return Success();
    });
}

SglFfiError* sgl_privatekey_sign(SglOwnedBuffer* out, const SglConstPointerPrivateKey key, const SglBorrowedBuffer message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        SGL_TRY_ASSIGN(message_bytes, Borrow(message));
        SGL_TRY_ASSIGN(signature, Curve25519::Sign(object->key, message_bytes));
        return WriteOwned(out, signature);
    });
}

SglFfiError* sgl_privatekey_agree(
    SglOwnedBuffer* out,
    const SglConstPointerPrivateKey key,
    const SglConstPointerPublicKey their_key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        SGL_TRY_ASSIGN(theirs, Deref(their_key.raw));
        SGL_TRY_ASSIGN(shared, Curve25519::Agree(object->key, theirs->key));
        auto written = WriteOwned(out, shared);
        SodiumInterop::SecureWipe(shared);
        return written;
    });
}

SglFfiError* sgl_privatekey_clone(SglMutPointerPrivateKey* out, const SglConstPointerPrivateKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        SGL_TRY_ASSIGN(copy, NewPrivateKey(object->key));
        out->raw = copy;
        return Success();
    });
}

SglFfiError* sgl_privatekey_destroy(const SglMutPointerPrivateKey key) {
    return Guard([&]() { return Destroy(key.raw); });
}

// ============================================================================
// Identity key pairs
// ============================================================================

SglFfiError* sgl_identitykeypair_serialize(
    SglOwnedBuffer* out,
    const SglConstPointerPublicKey public_key,
    const SglConstPointerPrivateKey private_key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(pub, Deref(public_key.raw));
        SGL_TRY_ASSIGN(priv, Deref(private_key.raw));
        std::vector<uint8_t> encoded;
        encoded.reserve(KeyConstants::IDENTITY_KEY_PAIR_SIZE);
        encoded.push_back(KeyConstants::IDENTITY_KEY_PAIR_TAG);
        encoded.push_back(static_cast<uint8_t>(KeyConstants::PUBLIC_KEY_SIZE));
        const auto serialized_public = SerializePublicKey(pub->key);
        encoded.insert(encoded.end(), serialized_public.begin(), serialized_public.end());
        encoded.push_back(KeyConstants::IDENTITY_KEY_PAIR_PRIVATE_TAG);
        encoded.push_back(static_cast<uint8_t>(KeyConstants::PRIVATE_KEY_SIZE));
        priv->key.WithReadAccess([&](std::span<const uint8_t> scalar) {
            encoded.insert(encoded.end(), scalar.begin(), scalar.end());
        });
        auto written = WriteOwned(out, encoded);
        SodiumInterop::SecureWipe(encoded);
        return written;
    });
}

SglFfiError* sgl_identitykeypair_deserialize(
    SglMutPointerPublicKey* out_public,
    SglMutPointerPrivateKey* out_private,
    const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out_public));
        SGL_TRY(RequireOut(out_private));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        if (bytes.size() != KeyConstants::IDENTITY_KEY_PAIR_SIZE) {
            return ApiResult::Err(EngineFailure::Protobuf(
                "Bad identity key pair length: " + std::to_string(bytes.size())));
        }
        constexpr size_t private_offset = 2 + KeyConstants::PUBLIC_KEY_SIZE;
        if (bytes[0] != KeyConstants::IDENTITY_KEY_PAIR_TAG
            || bytes[1] != KeyConstants::PUBLIC_KEY_SIZE
            || bytes[private_offset] != KeyConstants::IDENTITY_KEY_PAIR_PRIVATE_TAG
            || bytes[private_offset + 1] != KeyConstants::PRIVATE_KEY_SIZE) {
            return ApiResult::Err(EngineFailure::Protobuf("Malformed identity key pair"));
        }
        SGL_TRY_ASSIGN(public_key, ParsePublicKey(bytes.subspan(2, KeyConstants::PUBLIC_KEY_SIZE)));
        SGL_TRY_ASSIGN(handle, Curve25519::PrivateKeyFromBytes(
            bytes.subspan(private_offset + 2, KeyConstants::PRIVATE_KEY_SIZE)));
        SGL_TRY_ASSIGN(derived, Curve25519::DerivePublicKey(handle));
        if (!SodiumInterop::ConstantTimeEquals(derived, public_key)) {
            return ApiResult::Err(EngineFailure::InvalidKey("Identity public key does not match private key"));
        }
        auto private_object = std::make_unique<SglPrivateKey>();
        private_object->key = std::move(handle);
        std::unique_ptr<SglPublicKey> public_object(NewPublicKey(public_key));
        out_public->raw = public_object.release();
        out_private->raw = private_object.release();
        return Success();
    });
}

SglFfiError* sgl_identitykeypair_sign_alternate_identity(
    SglOwnedBuffer* out,
    const SglConstPointerPublicKey public_key,
    const SglConstPointerPrivateKey private_key,
    const SglConstPointerPublicKey other_identity) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(Deref(public_key.raw));
        SGL_TRY_ASSIGN(priv, Deref(private_key.raw));
        SGL_TRY_ASSIGN(other, Deref(other_identity.raw));
        SGL_TRY_ASSIGN(signature, Curve25519::Sign(priv->key, AlternateIdentityMessage(other->key)));
        return WriteOwned(out, signature);
    });
}

SglFfiError* sgl_identitykey_verify_alternate_identity(
    bool* out,
    const SglConstPointerPublicKey identity,
    const SglConstPointerPublicKey other_identity,
    const SglBorrowedBuffer signature) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(own, Deref(identity.raw));
        SGL_TRY_ASSIGN(other, Deref(other_identity.raw));
        SGL_TRY_ASSIGN(signature_bytes, Borrow(signature));
        SGL_TRY_ASSIGN(valid, Curve25519::Verify(own->key, AlternateIdentityMessage(other->key), signature_bytes));
        *out = valid;
        return Success();
    });
}
