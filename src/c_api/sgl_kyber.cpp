/**
 * @file sgl_kyber.cpp
 * @brief Kyber-1024 key pairs, public and secret keys
 */

#include "sigil/c_api/sgl_ffi.h"
#include "sgl_internal.hpp"

#include "engine/kyber_interop.hpp"
#include "sigil/core/constants.hpp"

#include <memory>

using namespace sigil::engine;
using namespace sigil::engine::capi;
using sigil::protocol::KeyConstants;

namespace {

Result<SglKyberSecretKey*, EngineFailure> NewSecretKey(const SecureMemoryHandle& key) {
    SGL_TRY_ASSIGN(copy, key.Clone());
    auto object = std::make_unique<SglKyberSecretKey>();
    object->key = std::move(copy);
    return Result<SglKyberSecretKey*, EngineFailure>::Ok(object.release());
}

SglKyberPublicKey* NewKyberPublicKey(const std::vector<uint8_t>& key) {
    auto* object = new SglKyberPublicKey();
    object->key = key;
    return object;
}

} // namespace

// ============================================================================
// Key pairs
// ============================================================================

SglFfiError* sgl_kyber_key_pair_generate(SglMutPointerKyberKeyPair* out) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(generated, KyberInterop::GenerateKeyPair());
        auto object = std::make_unique<SglKyberKeyPair>();
        object->secret_key = std::move(generated.first);
        object->public_key = std::move(generated.second);
        out->raw = object.release();
        return Success();
    });
}

SglFfiError* sgl_kyber_key_pair_get_public_key(SglMutPointerKyberPublicKey* out, const SglConstPointerKyberKeyPair pair) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(pair.raw));
        out->raw = NewKyberPublicKey(object->public_key);
        return Success();
    });
}

SglFfiError* sgl_kyber_key_pair_get_secret_key(SglMutPointerKyberSecretKey* out, const SglConstPointerKyberKeyPair pair) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(pair.raw));
        SGL_TRY_ASSIGN(secret, NewSecretKey(object->secret_key));
        out->raw = secret;
        return Success();
    });
}

SglFfiError* sgl_kyber_key_pair_clone(SglMutPointerKyberKeyPair* out, const SglConstPointerKyberKeyPair pair) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(pair.raw));
        SGL_TRY_ASSIGN(secret, object->secret_key.Clone());
        auto copy = std::make_unique<SglKyberKeyPair>();
        copy->public_key = object->public_key;
        copy->secret_key = std::move(secret);
        out->raw = copy.release();
        return Success();
    });
}

SglFfiError* sgl_kyber_key_pair_destroy(const SglMutPointerKyberKeyPair pair) {
    return Guard([&]() { return Destroy(pair.raw); });
}

// ============================================================================
// Public keys
// ============================================================================

SglFfiError* sgl_kyber_public_key_deserialize(SglMutPointerKyberPublicKey* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        SGL_TRY_ASSIGN(key, ParseKyberPublicKey(bytes));
        out->raw = NewKyberPublicKey(key);
        return Success();
    });
}

SglFfiError* sgl_kyber_public_key_serialize(SglOwnedBuffer* out, const SglConstPointerKyberPublicKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        return WriteOwned(out, SerializeKyberPublicKey(object->key));
    });
}

SglFfiError* sgl_kyber_public_key_equals(
    bool* out,
    const SglConstPointerKyberPublicKey lhs,
    const SglConstPointerKyberPublicKey rhs) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(left, Deref(lhs.raw));
        SGL_TRY_ASSIGN(right, Deref(rhs.raw));
        *out = SodiumInterop::ConstantTimeEquals(left->key, right->key);
        return Success();
    });
}

SglFfiError* sgl_kyber_public_key_encapsulate(
    SglOwnedBuffer* out_ciphertext,
    SglOwnedBuffer* out_shared_secret,
    const SglConstPointerKyberPublicKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out_ciphertext));
        SGL_TRY(RequireOut(out_shared_secret));
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        SGL_TRY_ASSIGN(encapsulated, KyberInterop::Encapsulate(object->key));
        auto shared = encapsulated.second.ReadBytes();
        auto written = WriteOwned(out_shared_secret, shared);
        SodiumInterop::SecureWipe(shared);
        SGL_TRY(written);
        auto ct_written = WriteOwned(out_ciphertext, encapsulated.first);
        if (ct_written.IsErr()) {
            sgl_free_buffer(out_shared_secret->base, out_shared_secret->length);
            out_shared_secret->base = nullptr;
            out_shared_secret->length = 0;
        }
        return ct_written;
    });
}

SglFfiError* sgl_kyber_public_key_clone(SglMutPointerKyberPublicKey* out, const SglConstPointerKyberPublicKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        out->raw = NewKyberPublicKey(object->key);
        return Success();
    });
}

SglFfiError* sgl_kyber_public_key_destroy(const SglMutPointerKyberPublicKey key) {
    return Guard([&]() { return Destroy(key.raw); });
}

// ============================================================================
// Secret keys
// ============================================================================

SglFfiError* sgl_kyber_secret_key_deserialize(SglMutPointerKyberSecretKey* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        if (bytes.empty() || bytes[0] != KeyConstants::KYBER_1024_KEY_TYPE) {
            return ApiResult::Err(EngineFailure::InvalidKey("Bad Kyber key type"));
        }
        if (bytes.size() != KeyConstants::SERIALIZED_KYBER_SECRET_KEY_SIZE) {
            return ApiResult::Err(EngineFailure::InvalidKey(
                "Bad Kyber secret key length: " + std::to_string(bytes.size())));
        }
        SGL_TRY_ASSIGN(handle, SecureMemoryHandle::FromBytes(bytes.subspan(1)));
        auto object = std::make_unique<SglKyberSecretKey>();
        object->key = std::move(handle);
        out->raw = object.release();
        return Success();
    });
}

SglFfiError* sgl_kyber_secret_key_serialize(SglOwnedBuffer* out, const SglConstPointerKyberSecretKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        std::vector<uint8_t> encoded;
        encoded.reserve(KeyConstants::SERIALIZED_KYBER_SECRET_KEY_SIZE);
        encoded.push_back(KeyConstants::KYBER_1024_KEY_TYPE);
        object->key.WithReadAccess([&](std::span<const uint8_t> secret) {
            encoded.insert(encoded.end(), secret.begin(), secret.end());
        });
        auto written = WriteOwned(out, encoded);
        SodiumInterop::SecureWipe(encoded);
        return written;
    });
}

SglFfiError* sgl_kyber_secret_key_decapsulate(
    SglOwnedBuffer* out_shared_secret,
    const SglConstPointerKyberSecretKey key,
    const SglBorrowedBuffer ciphertext) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        SGL_TRY_ASSIGN(ct, Borrow(ciphertext));
        SGL_TRY_ASSIGN(shared_handle, KyberInterop::Decapsulate(ct, object->key));
        auto shared = shared_handle.ReadBytes();
        auto written = WriteOwned(out_shared_secret, shared);
        SodiumInterop::SecureWipe(shared);
        return written;
    });
}

SglFfiError* sgl_kyber_secret_key_clone(SglMutPointerKyberSecretKey* out, const SglConstPointerKyberSecretKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(key.raw));
        SGL_TRY_ASSIGN(copy, NewSecretKey(object->key));
        out->raw = copy;
        return Success();
    });
}

SglFfiError* sgl_kyber_secret_key_destroy(const SglMutPointerKyberSecretKey key) {
    return Guard([&]() { return Destroy(key.raw); });
}
