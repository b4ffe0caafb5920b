#include <catch2/catch_test_macros.hpp>
#include "sigil/keys/identity_key_pair.hpp"
#include "sigil/keys/private_key.hpp"
#include "sigil/keys/public_key.hpp"
#include "helpers/binding_fixtures.hpp"
#include <string>
#include <vector>
using namespace sigil::protocol;
using namespace sigil::protocol::keys;
using namespace sigil::protocol::test_helpers;

TEST_CASE("PublicKey - Serialization", "[keys]") {
    SECTION("Deserialize and serialize preserve the bytes") {
        const auto bytes = SerializedPublicKey(0x21);
        auto key = PublicKey::Deserialize(bytes);
        REQUIRE(key.IsOk());
        REQUIRE(key.Unwrap().Serialize().Unwrap() == bytes);
        const auto raw = key.Unwrap().GetPublicKeyBytes().Unwrap();
        REQUIRE(raw.size() == KeyConstants::CURVE_25519_KEY_SIZE);
        REQUIRE(std::equal(raw.begin(), raw.end(), bytes.begin() + 1));
    }
    SECTION("Low-order point is rejected before the engine") {
        const size_t before = LiveObjects();
        std::vector<uint8_t> zero(KeyConstants::PUBLIC_KEY_SIZE, 0x00);
        zero[0] = KeyConstants::CURVE_25519_KEY_TYPE;
        auto key = PublicKey::Deserialize(zero);
        REQUIRE(RejectedWith(key, ValidationReason::LowOrderPoint));
        REQUIRE(LiveObjects() == before);
    }
    SECTION("Truncated key") {
        auto key = PublicKey::Deserialize(std::vector<uint8_t>{0x05, 0x01, 0x02});
        REQUIRE(RejectedWith(key, ValidationReason::InvalidLength));
    }
}

TEST_CASE("PublicKey - Comparison", "[keys]") {
    auto a = std::move(PublicKey::Deserialize(SerializedPublicKey(0x10))).Unwrap();
    auto a_again = std::move(PublicKey::Deserialize(SerializedPublicKey(0x10))).Unwrap();
    auto b = std::move(PublicKey::Deserialize(SerializedPublicKey(0x20))).Unwrap();

    REQUIRE(a.Equals(a_again).Unwrap());
    REQUIRE_FALSE(a.Equals(b).Unwrap());
    REQUIRE(a.Compare(a_again).Unwrap() == 0);
    REQUIRE(a.Compare(b).Unwrap() == -1);
    REQUIRE(b.Compare(a).Unwrap() == 1);

    SECTION("Clone compares equal") {
        auto clone = a.Clone();
        REQUIRE(clone.IsOk());
        REQUIRE(clone.Unwrap().Equals(a).Unwrap());
    }
    SECTION("Comparing against a disposed key fails") {
        b.Dispose();
        REQUIRE(FailedWith(a.Equals(b), SigilFailureType::Disposed));
    }
}

TEST_CASE("PrivateKey - Signing and agreement", "[keys][crypto]") {
    auto alice = GeneratePrivateKey();
    auto bob = GeneratePrivateKey();
    auto alice_public = std::move(alice.GetPublicKey()).Unwrap();
    auto bob_public = std::move(bob.GetPublicKey()).Unwrap();

    SECTION("Signature verifies under the matching public key") {
        const std::vector<uint8_t> message = {'h', 'e', 'l', 'l', 'o'};
        auto signature = alice.Sign(message);
        REQUIRE(signature.IsOk());
        REQUIRE(signature.Unwrap().size() == KeyConstants::SIGNATURE_SIZE);
        REQUIRE(alice_public.Verify(message, signature.Unwrap()).Unwrap());
        REQUIRE_FALSE(bob_public.Verify(message, signature.Unwrap()).Unwrap());

        auto tampered = signature.Unwrap();
        tampered[10] ^= 0x01;
        REQUIRE_FALSE(alice_public.Verify(message, tampered).Unwrap());
    }
    SECTION("Both sides agree on the same secret") {
        auto ab = alice.Agree(bob_public);
        auto ba = bob.Agree(alice_public);
        REQUIRE(ab.IsOk());
        REQUIRE(ba.IsOk());
        const auto left = ab.Unwrap().Expose().Unwrap();
        const auto right = ba.Unwrap().Expose().Unwrap();
        REQUIRE(left.size() == KeyConstants::AGREEMENT_SIZE);
        REQUIRE(std::equal(left.begin(), left.end(), right.begin(), right.end()));
    }
    SECTION("Serialized scalar restores the same key") {
        auto scalar = alice.Serialize();
        REQUIRE(scalar.IsOk());
        REQUIRE(scalar.Unwrap().Size() == KeyConstants::PRIVATE_KEY_SIZE);
        auto restored = PrivateKey::Deserialize(scalar.Unwrap().Expose().Unwrap());
        REQUIRE(restored.IsOk());
        auto restored_public = restored.Unwrap().GetPublicKey();
        REQUIRE(restored_public.Unwrap().Equals(alice_public).Unwrap());
        scalar.Unwrap().Dispose();
    }
    SECTION("Wrong scalar length is rejected") {
        REQUIRE(RejectedWith(PrivateKey::Deserialize(std::vector<uint8_t>(31, 0x01)),
            ValidationReason::InvalidLength));
    }
}

TEST_CASE("IdentityKeyPair - Lifecycle", "[keys][identity]") {
    auto identity = GenerateIdentity();

    SECTION("Serialized pair restores both keys") {
        auto serialized = identity.Serialize();
        REQUIRE(serialized.IsOk());
        const auto bytes = serialized.Unwrap().Expose().Unwrap();
        REQUIRE(bytes.size() == KeyConstants::IDENTITY_KEY_PAIR_SIZE);
        REQUIRE(bytes[0] == KeyConstants::IDENTITY_KEY_PAIR_TAG);

        auto restored = IdentityKeyPair::Deserialize(bytes);
        REQUIRE(restored.IsOk());
        auto original_public = std::move(identity.GetPublicKey()).Unwrap();
        auto restored_public = std::move(restored.Unwrap().GetPublicKey()).Unwrap();
        REQUIRE(restored_public.Equals(original_public).Unwrap());
    }
    SECTION("Mismatched public key is rejected by the engine") {
        auto serialized = std::move(identity.Serialize()).Unwrap();
        const auto view = serialized.Expose().Unwrap();
        std::vector<uint8_t> bytes(view.begin(), view.end());
        bytes[5] ^= 0x40;
        auto restored = IdentityKeyPair::Deserialize(bytes);
        REQUIRE(FailedWith(restored, SigilFailureType::CryptoError));
    }
    SECTION("Alternate identity signature") {
        auto other = GenerateIdentity();
        auto identity_public = std::move(identity.GetPublicKey()).Unwrap();
        auto other_public = std::move(other.GetPublicKey()).Unwrap();

        auto signature = identity.SignAlternateIdentity(other_public);
        REQUIRE(signature.IsOk());
        REQUIRE(IdentityKeyPair::VerifyAlternateIdentity(identity_public, other_public, signature.Unwrap()).Unwrap());
        REQUIRE_FALSE(IdentityKeyPair::VerifyAlternateIdentity(other_public, identity_public, signature.Unwrap()).Unwrap());
    }
    SECTION("Disposed pair refuses every operation") {
        identity.Dispose();
        identity.Dispose();
        REQUIRE(identity.IsDisposed());
        REQUIRE(FailedWith(identity.GetPublicKey(), SigilFailureType::Disposed));
        REQUIRE(FailedWith(identity.GetPrivateKey(), SigilFailureType::Disposed));
        REQUIRE(FailedWith(identity.Serialize(), SigilFailureType::Disposed));
    }
    SECTION("Getters return independent copies") {
        auto first = std::move(identity.GetPublicKey()).Unwrap();
        first.Dispose();
        auto second = identity.GetPublicKey();
        REQUIRE(second.IsOk());
    }
}
