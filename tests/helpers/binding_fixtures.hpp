#pragma once

#include <catch2/catch_test_macros.hpp>
#include "sigil/c_api/sgl_ffi.h"
#include "sigil/core/failures.hpp"
#include "sigil/keys/identity_key_pair.hpp"
#include "sigil/keys/private_key.hpp"
#include "sigil/kyber/kyber_key_pair.hpp"
#include "sigil/prekeys/kyber_pre_key_record.hpp"
#include "sigil/prekeys/signed_pre_key_record.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sigil::protocol::test_helpers {
    inline size_t LiveObjects() {
        return sgl_debug_live_object_count();
    }

    /// True when the result failed with the given kind.
    template<typename T>
    bool FailedWith(const Result<T, SigilFailure>& result, const SigilFailureType type) {
        return result.IsErrAnd([type](const SigilFailure& failure) { return failure.type == type; });
    }

    template<typename T>
    bool RejectedWith(const Result<T, SigilFailure>& result, const ValidationReason reason) {
        return result.IsErrAnd([reason](const SigilFailure& failure) {
            return failure.type == SigilFailureType::InvalidArgument
                && failure.validation_reason == reason;
        });
    }

    inline std::vector<uint8_t> SerializedPublicKey(const uint8_t fill) {
        std::vector<uint8_t> bytes(KeyConstants::PUBLIC_KEY_SIZE, fill);
        bytes[0] = KeyConstants::CURVE_25519_KEY_TYPE;
        return bytes;
    }

    inline keys::PrivateKey GeneratePrivateKey() {
        auto key = keys::PrivateKey::Generate();
        REQUIRE(key.IsOk());
        return std::move(key).Unwrap();
    }

    inline keys::IdentityKeyPair GenerateIdentity() {
        auto identity = keys::IdentityKeyPair::Generate();
        REQUIRE(identity.IsOk());
        return std::move(identity).Unwrap();
    }

    inline prekeys::SignedPreKeyRecord MakeSignedPreKey(
        const keys::IdentityKeyPair& identity,
        const uint32_t id,
        const uint64_t timestamp = 1'700'000'000'000ULL) {
        auto private_key = GeneratePrivateKey();
        auto public_key = private_key.GetPublicKey();
        REQUIRE(public_key.IsOk());
        auto serialized = public_key.Unwrap().Serialize();
        REQUIRE(serialized.IsOk());
        auto identity_private = identity.GetPrivateKey();
        REQUIRE(identity_private.IsOk());
        auto signature = identity_private.Unwrap().Sign(serialized.Unwrap());
        REQUIRE(signature.IsOk());
        auto record = prekeys::SignedPreKeyRecord::Create(
            id, timestamp, public_key.Unwrap(), private_key, signature.Unwrap());
        REQUIRE(record.IsOk());
        return std::move(record).Unwrap();
    }

    inline prekeys::KyberPreKeyRecord MakeKyberPreKey(
        const keys::IdentityKeyPair& identity,
        const uint32_t id,
        const uint64_t timestamp = 1'700'000'000'000ULL) {
        auto pair = kyber::KyberKeyPair::Generate();
        REQUIRE(pair.IsOk());
        auto public_key = pair.Unwrap().GetPublicKey();
        REQUIRE(public_key.IsOk());
        auto serialized = public_key.Unwrap().Serialize();
        REQUIRE(serialized.IsOk());
        auto identity_private = identity.GetPrivateKey();
        REQUIRE(identity_private.IsOk());
        auto signature = identity_private.Unwrap().Sign(serialized.Unwrap());
        REQUIRE(signature.IsOk());
        auto record = prekeys::KyberPreKeyRecord::Create(id, timestamp, pair.Unwrap(), signature.Unwrap());
        REQUIRE(record.IsOk());
        return std::move(record).Unwrap();
    }
}
