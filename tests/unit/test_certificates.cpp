#include <catch2/catch_test_macros.hpp>
#include "sigil/sealed_sender/sender_certificate.hpp"
#include "sigil/sealed_sender/server_certificate.hpp"
#include "helpers/binding_fixtures.hpp"
#include <optional>
#include <string>
#include <vector>
using namespace sigil::protocol;
using namespace sigil::protocol::keys;
using namespace sigil::protocol::sealed_sender;
using namespace sigil::protocol::test_helpers;

namespace {
constexpr uint64_t kExpiration = 1'900'000'000'000ULL;
constexpr const char* kSenderUuid = "9d0652a3-dcc3-4d11-975f-74d61598733f";

struct CertificateChain {
    PrivateKey trust_root = GeneratePrivateKey();
    PrivateKey server_key = GeneratePrivateKey();
    PrivateKey sender_key = GeneratePrivateKey();

    ServerCertificate Server(const uint32_t key_id = 1) const {
        auto server_public = std::move(server_key.GetPublicKey()).Unwrap();
        auto certificate = ServerCertificate::Create(key_id, server_public, trust_root);
        REQUIRE(certificate.IsOk());
        return std::move(certificate).Unwrap();
    }

    SenderCertificate Sender(const ServerCertificate& server,
                             const std::optional<std::string>& e164 = std::string("+14152222222")) const {
        auto sender_public = std::move(sender_key.GetPublicKey()).Unwrap();
        auto certificate = SenderCertificate::Create(
            kSenderUuid, e164, 3, sender_public, kExpiration, server, server_key);
        REQUIRE(certificate.IsOk());
        return std::move(certificate).Unwrap();
    }

    PublicKey TrustRoot() const {
        return std::move(trust_root.GetPublicKey()).Unwrap();
    }
};
}

TEST_CASE("ServerCertificate - Fields", "[certificates]") {
    CertificateChain chain;
    auto server = chain.Server(77);

    REQUIRE(server.GetKeyId().Unwrap() == 77);
    auto server_public = std::move(chain.server_key.GetPublicKey()).Unwrap();
    REQUIRE(server.GetKey().Unwrap().Equals(server_public).Unwrap());
    REQUIRE(server.GetSignature().Unwrap().size() == KeyConstants::SIGNATURE_SIZE);

    SECTION("Signature covers the certificate body") {
        auto trust_root = chain.TrustRoot();
        REQUIRE(trust_root.Verify(server.GetCertificate().Unwrap(), server.GetSignature().Unwrap()).Unwrap());
    }
    SECTION("Serialized certificate restores") {
        auto restored = ServerCertificate::Deserialize(server.Serialize().Unwrap());
        REQUIRE(restored.IsOk());
        REQUIRE(restored.Unwrap().GetKeyId().Unwrap() == 77);
        REQUIRE(restored.Unwrap().GetCertificate().Unwrap() == server.GetCertificate().Unwrap());
    }
    SECTION("Short input is rejected") {
        REQUIRE(RejectedWith(ServerCertificate::Deserialize(std::vector<uint8_t>{0x0a, 0x01}), ValidationReason::TooShort));
    }
}

TEST_CASE("SenderCertificate - Fields", "[certificates]") {
    CertificateChain chain;
    auto server = chain.Server();
    auto sender = chain.Sender(server);

    REQUIRE(sender.GetSenderUuid().Unwrap() == kSenderUuid);
    REQUIRE(sender.GetSenderE164().Unwrap() == std::optional<std::string>("+14152222222"));
    REQUIRE(sender.GetDeviceId().Unwrap() == 3);
    REQUIRE(sender.GetExpiration().Unwrap() == kExpiration);
    auto sender_public = std::move(chain.sender_key.GetPublicKey()).Unwrap();
    REQUIRE(sender.GetKey().Unwrap().Equals(sender_public).Unwrap());
    REQUIRE(sender.GetServerCertificate().Unwrap().GetKeyId().Unwrap() == 1);

    SECTION("Phone number is optional") {
        auto without_number = chain.Sender(server, std::nullopt);
        REQUIRE_FALSE(without_number.GetSenderE164().Unwrap().has_value());
    }
    SECTION("Sender uuid is required") {
        auto result = SenderCertificate::Create("", std::nullopt, 1, sender_public, kExpiration, server, chain.server_key);
        REQUIRE(FailedWith(result, SigilFailureType::InvalidArgument));
    }
    SECTION("Serialized certificate restores") {
        auto restored = SenderCertificate::Deserialize(sender.Serialize().Unwrap());
        REQUIRE(restored.IsOk());
        REQUIRE(restored.Unwrap().GetSenderUuid().Unwrap() == kSenderUuid);
        REQUIRE(restored.Unwrap().Validate(chain.TrustRoot(), kExpiration).Unwrap());
    }
}

TEST_CASE("SenderCertificate - Validation", "[certificates][security]") {
    CertificateChain chain;
    auto server = chain.Server();
    auto sender = chain.Sender(server);
    auto trust_root = chain.TrustRoot();

    SECTION("Valid until the expiration instant") {
        REQUIRE(sender.Validate(trust_root, kExpiration - 1).Unwrap());
        REQUIRE(sender.Validate(trust_root, kExpiration).Unwrap());
    }
    SECTION("Expired certificate is not valid") {
        REQUIRE_FALSE(sender.Validate(trust_root, kExpiration + 1).Unwrap());
    }
    SECTION("Another trust root is not accepted") {
        auto other_root = GeneratePrivateKey();
        auto other_public = std::move(other_root.GetPublicKey()).Unwrap();
        REQUIRE_FALSE(sender.Validate(other_public, kExpiration - 1).Unwrap());
    }
    SECTION("Revoked server key id is not accepted") {
        auto revoked_server = chain.Server(CertificateConstants::REVOKED_SERVER_KEY_IDS[0]);
        auto revoked_sender = chain.Sender(revoked_server);
        REQUIRE_FALSE(revoked_sender.Validate(trust_root, kExpiration - 1).Unwrap());
    }
    SECTION("Sender certificate signed by the wrong server key") {
        auto impostor_key = GeneratePrivateKey();
        auto sender_public = std::move(chain.sender_key.GetPublicKey()).Unwrap();
        auto forged = std::move(SenderCertificate::Create(
            kSenderUuid, std::nullopt, 3, sender_public, kExpiration, server, impostor_key)).Unwrap();
        REQUIRE_FALSE(forged.Validate(trust_root, kExpiration - 1).Unwrap());
    }
    SECTION("Disposed trust root fails instead of validating") {
        trust_root.Dispose();
        REQUIRE(FailedWith(sender.Validate(trust_root, kExpiration - 1), SigilFailureType::Disposed));
    }
}
