#include <catch2/catch_test_macros.hpp>
#include "sigil/kyber/kyber_key_pair.hpp"
#include "sigil/kyber/kyber_public_key.hpp"
#include "sigil/kyber/kyber_secret_key.hpp"
#include "helpers/binding_fixtures.hpp"
#include <algorithm>
#include <vector>
using namespace sigil::protocol;
using namespace sigil::protocol::kyber;
using namespace sigil::protocol::test_helpers;

namespace {
bool SameSecret(const crypto::SecureBytes& a, const crypto::SecureBytes& b) {
    const auto left = a.Expose().Unwrap();
    const auto right = b.Expose().Unwrap();
    return std::equal(left.begin(), left.end(), right.begin(), right.end());
}
}

TEST_CASE("Kyber - Encapsulation round trip", "[kyber][pq]") {
    auto pair = std::move(KyberKeyPair::Generate()).Unwrap();
    auto public_key = std::move(pair.GetPublicKey()).Unwrap();
    auto secret_key = std::move(pair.GetSecretKey()).Unwrap();

    auto encapsulated = public_key.Encapsulate();
    REQUIRE(encapsulated.IsOk());
    auto& encapsulation = encapsulated.Unwrap();
    REQUIRE(encapsulation.ciphertext.size() == KeyConstants::KYBER_1024_CIPHERTEXT_SIZE);
    REQUIRE(encapsulation.shared_secret.Size() == KeyConstants::KYBER_1024_SHARED_SECRET_SIZE);

    SECTION("Decapsulation recovers the shared secret") {
        auto decapsulated = secret_key.Decapsulate(encapsulation.ciphertext);
        REQUIRE(decapsulated.IsOk());
        REQUIRE(SameSecret(decapsulated.Unwrap(), encapsulation.shared_secret));
    }
    SECTION("Tampered ciphertext yields a different secret") {
        auto tampered = encapsulation.ciphertext;
        tampered[100] ^= 0xFF;
        auto decapsulated = secret_key.Decapsulate(tampered);
        REQUIRE(decapsulated.IsOk());
        REQUIRE_FALSE(SameSecret(decapsulated.Unwrap(), encapsulation.shared_secret));
    }
    SECTION("Wrong ciphertext length is rejected before the engine") {
        std::vector<uint8_t> short_ciphertext(KeyConstants::KYBER_1024_CIPHERTEXT_SIZE - 1, 0x00);
        REQUIRE(FailedWith(secret_key.Decapsulate(short_ciphertext), SigilFailureType::InvalidArgument));
    }
    SECTION("Each encapsulation is fresh") {
        auto second = std::move(public_key.Encapsulate()).Unwrap();
        REQUIRE(second.ciphertext != encapsulation.ciphertext);
    }
}

TEST_CASE("Kyber - Key serialization", "[kyber][pq]") {
    auto pair = std::move(KyberKeyPair::Generate()).Unwrap();
    auto public_key = std::move(pair.GetPublicKey()).Unwrap();

    SECTION("Public key carries the type prefix") {
        auto serialized = public_key.Serialize();
        REQUIRE(serialized.IsOk());
        REQUIRE(serialized.Unwrap().size() == KeyConstants::SERIALIZED_KYBER_PUBLIC_KEY_SIZE);
        REQUIRE(serialized.Unwrap()[0] == KeyConstants::KYBER_1024_KEY_TYPE);

        auto restored = KyberPublicKey::Deserialize(serialized.Unwrap());
        REQUIRE(restored.IsOk());
        REQUIRE(restored.Unwrap().Equals(public_key).Unwrap());
    }
    SECTION("Secret key restores a working key") {
        auto secret = std::move(pair.GetSecretKey()).Unwrap();
        auto serialized = std::move(secret.Serialize()).Unwrap();
        auto restored = KyberSecretKey::Deserialize(serialized.Expose().Unwrap());
        REQUIRE(restored.IsOk());

        auto encapsulation = std::move(public_key.Encapsulate()).Unwrap();
        auto recovered = restored.Unwrap().Decapsulate(encapsulation.ciphertext);
        REQUIRE(SameSecret(recovered.Unwrap(), encapsulation.shared_secret));
    }
    SECTION("Curve25519 key is not a Kyber key") {
        std::vector<uint8_t> wrong(KeyConstants::SERIALIZED_KYBER_PUBLIC_KEY_SIZE, 0x11);
        wrong[0] = KeyConstants::CURVE_25519_KEY_TYPE;
        REQUIRE(RejectedWith(KyberPublicKey::Deserialize(wrong), ValidationReason::InvalidKeyType));
    }
    SECTION("Independent key pairs differ") {
        auto other = std::move(KyberKeyPair::Generate()).Unwrap();
        auto other_public = std::move(other.GetPublicKey()).Unwrap();
        REQUIRE_FALSE(other_public.Equals(public_key).Unwrap());
    }
    SECTION("Clone survives disposal of the pair") {
        auto clone = std::move(pair.Clone()).Unwrap();
        pair.Dispose();
        REQUIRE(FailedWith(pair.GetPublicKey(), SigilFailureType::Disposed));
        REQUIRE(clone.GetPublicKey().IsOk());
    }
}
