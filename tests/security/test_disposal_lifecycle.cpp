#include <catch2/catch_test_macros.hpp>
#include "sigil/crypto/aes256_gcm_cipher.hpp"
#include "sigil/crypto/fingerprint.hpp"
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/groups/sender_key_record.hpp"
#include "sigil/keys/identity_key_pair.hpp"
#include "sigil/kyber/kyber_key_pair.hpp"
#include "sigil/prekeys/pre_key_bundle.hpp"
#include "sigil/sealed_sender/server_certificate.hpp"
#include "sigil/session/decryption_error_message.hpp"
#include "sigil/session/session_record.hpp"
#include "sigil/session/signal_message.hpp"
#include "helpers/binding_fixtures.hpp"
#include <utility>
#include <vector>
using namespace sigil::protocol;
using namespace sigil::protocol::test_helpers;

namespace {
    /// Disposes twice, then expects every later use to fail as Disposed.
    template<typename Object, typename Use>
    void ExpectDisposedAfterDispose(Object& object, Use use) {
        REQUIRE_FALSE(object.IsDisposed());
        REQUIRE(use(object).IsOk());
        object.Dispose();
        REQUIRE(object.IsDisposed());
        object.Dispose();
        REQUIRE(object.IsDisposed());
        REQUIRE(FailedWith(use(object), SigilFailureType::Disposed));
    }
}

TEST_CASE("Disposal - Use after dispose fails cleanly", "[security][disposal]") {
    const size_t baseline = LiveObjects();

    SECTION("PublicKey") {
        auto private_key = GeneratePrivateKey();
        auto key = std::move(private_key.GetPublicKey()).Unwrap();
        ExpectDisposedAfterDispose(key, [](const keys::PublicKey& k) { return k.Serialize(); });
    }
    SECTION("PrivateKey") {
        auto key = GeneratePrivateKey();
        const std::vector<uint8_t> message = {1, 2, 3};
        ExpectDisposedAfterDispose(key, [&message](const keys::PrivateKey& k) { return k.Sign(message); });
    }
    SECTION("IdentityKeyPair") {
        auto identity = GenerateIdentity();
        ExpectDisposedAfterDispose(identity, [](const keys::IdentityKeyPair& i) { return i.GetPublicKey(); });
    }
    SECTION("KyberKeyPair") {
        auto pair = std::move(kyber::KyberKeyPair::Generate()).Unwrap();
        ExpectDisposedAfterDispose(pair, [](const kyber::KyberKeyPair& p) { return p.GetPublicKey(); });
    }
    SECTION("SessionRecord") {
        auto record = std::move(session::SessionRecord::NewFresh()).Unwrap();
        ExpectDisposedAfterDispose(record, [](const session::SessionRecord& r) { return r.HasCurrentState(); });
    }
    SECTION("SenderKeyRecord") {
        auto record = std::move(groups::SenderKeyRecord::NewFresh()).Unwrap();
        ExpectDisposedAfterDispose(record, [](const groups::SenderKeyRecord& r) { return r.Serialize(); });
    }
    SECTION("ServerCertificate") {
        auto trust_root = GeneratePrivateKey();
        auto server_key = std::move(GeneratePrivateKey().GetPublicKey()).Unwrap();
        auto cert = std::move(sealed_sender::ServerCertificate::Create(1, server_key, trust_root)).Unwrap();
        ExpectDisposedAfterDispose(cert, [](const sealed_sender::ServerCertificate& c) { return c.GetKeyId(); });
    }
    SECTION("PreKeyBundle") {
        auto identity = GenerateIdentity();
        const auto identity_key = std::move(identity.GetPublicKey()).Unwrap();
        const auto signed_pre_key = MakeSignedPreKey(identity, 2);
        const auto kyber_pre_key = MakeKyberPreKey(identity, 3);
        const auto signed_public = std::move(signed_pre_key.GetPublicKey()).Unwrap();
        const auto signed_signature = std::move(signed_pre_key.GetSignature()).Unwrap();
        const auto kyber_public = std::move(kyber_pre_key.GetPublicKey()).Unwrap();
        const auto kyber_signature = std::move(kyber_pre_key.GetSignature()).Unwrap();

        prekeys::PreKeyBundle::Parameters parameters;
        parameters.registration_id = 77;
        parameters.device_id = 1;
        parameters.signed_pre_key_id = 2;
        parameters.signed_pre_key = &signed_public;
        parameters.signed_pre_key_signature = signed_signature;
        parameters.identity_key = &identity_key;
        parameters.kyber_pre_key_id = 3;
        parameters.kyber_pre_key = &kyber_public;
        parameters.kyber_pre_key_signature = kyber_signature;
        auto bundle = std::move(prekeys::PreKeyBundle::Create(parameters)).Unwrap();
        ExpectDisposedAfterDispose(bundle, [](const prekeys::PreKeyBundle& b) { return b.VerifySignatures(); });
    }
    SECTION("SignalMessage and DecryptionErrorMessage") {
        const std::vector<uint8_t> mac_key(32, 0x2a);
        const std::vector<uint8_t> body = {'r', 'a', 't'};
        const auto identity = std::move(GeneratePrivateKey().GetPublicKey()).Unwrap();
        const auto ratchet = std::move(GeneratePrivateKey().GetPublicKey()).Unwrap();
        auto message = std::move(session::SignalMessage::Create(
            4, mac_key, ratchet, 0, 0, body, identity, identity)).Unwrap();
        auto dem = std::move(session::DecryptionErrorMessage::ForOriginalMessage(
            message.Serialize().Unwrap(), session::CiphertextMessageType::Whisper, 1, 1)).Unwrap();
        ExpectDisposedAfterDispose(message, [](const session::SignalMessage& m) { return m.GetBody(); });
        ExpectDisposedAfterDispose(dem, [](const session::DecryptionErrorMessage& d) { return d.GetRatchetKey(); });
    }
    SECTION("Fingerprint") {
        const auto key = std::move(GeneratePrivateKey().GetPublicKey()).Unwrap();
        const std::vector<uint8_t> id = {'a'};
        auto fingerprint = std::move(crypto::Fingerprint::Create(id, key, id, key, 2)).Unwrap();
        ExpectDisposedAfterDispose(fingerprint, [](const crypto::Fingerprint& f) { return f.ScannableEncoding(); });
    }
    SECTION("Aes256GcmCipher") {
        const std::vector<uint8_t> key(32, 0x42);
        const std::vector<uint8_t> nonce(12, 0x01);
        const std::vector<uint8_t> plaintext = {'h', 'i'};
        auto cipher = std::move(crypto::Aes256GcmCipher::New(key)).Unwrap();
        ExpectDisposedAfterDispose(cipher, [&](const crypto::Aes256GcmCipher& c) {
            return c.Encrypt(plaintext, nonce);
        });
    }
    SECTION("SecureBytes") {
        const std::vector<uint8_t> secret(32, 0x5A);
        auto bytes = crypto::SecureBytes::CopyFrom(secret);
        ExpectDisposedAfterDispose(bytes, [](const crypto::SecureBytes& b) { return b.Expose(); });
    }

    REQUIRE(LiveObjects() == baseline);
}

TEST_CASE("Disposal - Native objects are released", "[security][disposal][memory]") {
    const size_t baseline = LiveObjects();

    SECTION("Scope exit releases handles") {
        {
            auto pair = std::move(kyber::KyberKeyPair::Generate()).Unwrap();
            auto public_key = std::move(pair.GetPublicKey()).Unwrap();
            auto secret_key = std::move(pair.GetSecretKey()).Unwrap();
            REQUIRE(LiveObjects() == baseline + 3);
        }
        REQUIRE(LiveObjects() == baseline);
    }
    SECTION("Dispose releases before scope exit") {
        auto key = GeneratePrivateKey();
        REQUIRE(LiveObjects() == baseline + 1);
        key.Dispose();
        REQUIRE(LiveObjects() == baseline);
    }
    SECTION("Moved-from objects do not double release") {
        auto key = GeneratePrivateKey();
        auto moved = std::move(key);
        REQUIRE(key.IsDisposed());
        REQUIRE(LiveObjects() == baseline + 1);
        key.Dispose();
        REQUIRE(LiveObjects() == baseline + 1);
        moved.Dispose();
        REQUIRE(LiveObjects() == baseline);
    }
    SECTION("Clone survives disposal of the original") {
        auto record = std::move(session::SessionRecord::NewFresh()).Unwrap();
        auto copy = std::move(record.Clone()).Unwrap();
        record.Dispose();
        REQUIRE(copy.HasCurrentState().IsOk());
        REQUIRE(LiveObjects() == baseline + 1);
    }
    SECTION("Failed operations leave nothing behind") {
        const std::vector<uint8_t> bad_key(16, 0x00);
        for (int i = 0; i < 50; ++i) {
            REQUIRE(crypto::Aes256GcmCipher::New(bad_key).IsErr());
            REQUIRE(keys::PrivateKey::Deserialize(bad_key).IsErr());
        }
        REQUIRE(LiveObjects() == baseline);
    }
}
