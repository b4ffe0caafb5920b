#include <catch2/catch_test_macros.hpp>
#include "sigil/session/ciphertext_message_type.hpp"
#include "sigil/session/decryption_error_message.hpp"
#include "sigil/session/signal_message.hpp"
#include "helpers/binding_fixtures.hpp"
#include <string>
#include <vector>
using namespace sigil::protocol;
using namespace sigil::protocol::session;
using namespace sigil::protocol::test_helpers;

namespace {
constexpr uint64_t kTimestamp = 1'700'000'000'000ULL;

std::vector<uint8_t> Text(const std::string& text) {
    return {text.begin(), text.end()};
}

PublicKey PublicOf(const keys::PrivateKey& key) {
    auto public_key = key.GetPublicKey();
    REQUIRE(public_key.IsOk());
    return std::move(public_key).Unwrap();
}

struct PairwiseParties {
    keys::PrivateKey sender_identity = GeneratePrivateKey();
    keys::PrivateKey receiver_identity = GeneratePrivateKey();
    keys::PrivateKey ratchet = GeneratePrivateKey();
    std::vector<uint8_t> mac_key = std::vector<uint8_t>(MessageConstants::MAC_KEY_SIZE, 0x2a);

    SignalMessage Make(
        const uint8_t version = MessageConstants::CIPHERTEXT_MESSAGE_CURRENT_VERSION,
        const std::vector<uint8_t>& pq_ratchet = {}) {
        auto message = SignalMessage::Create(version, mac_key, PublicOf(ratchet), 7, 3,
            Text("ratchet ciphertext"), PublicOf(sender_identity), PublicOf(receiver_identity), pq_ratchet);
        REQUIRE(message.IsOk());
        return std::move(message).Unwrap();
    }
};

/// Wraps a decryption error message the way a decrypted content body carries it.
std::vector<uint8_t> ContentCarrying(const std::vector<uint8_t>& dem) {
    REQUIRE(dem.size() < 0x80);
    std::vector<uint8_t> content{0x42, static_cast<uint8_t>(dem.size())};
    content.insert(content.end(), dem.begin(), dem.end());
    content.push_back(MessageConstants::PADDING_BOUNDARY_BYTE);
    return content;
}
}

TEST_CASE("SignalMessage - Construction and accessors", "[session][message]") {
    PairwiseParties parties;
    auto message = parties.Make();

    REQUIRE(message.GetMessageVersion().Unwrap() == MessageConstants::CIPHERTEXT_MESSAGE_CURRENT_VERSION);
    REQUIRE(message.GetCounter().Unwrap() == 7);
    REQUIRE(message.GetBody().Unwrap() == Text("ratchet ciphertext"));
    REQUIRE_FALSE(message.GetPqRatchet().Unwrap().has_value());
    REQUIRE(message.GetSenderRatchetKey().Unwrap().Equals(PublicOf(parties.ratchet)).Unwrap());

    auto bytes = message.Serialize().Unwrap();
    REQUIRE(bytes.front() == 0x44);

    SECTION("Deserialized copy matches") {
        auto restored = SignalMessage::Deserialize(bytes);
        REQUIRE(restored.IsOk());
        REQUIRE(restored.Unwrap().Serialize().Unwrap() == bytes);
        REQUIRE(restored.Unwrap().GetCounter().Unwrap() == 7);
        REQUIRE(restored.Unwrap().GetBody().Unwrap() == Text("ratchet ciphertext"));
    }
    SECTION("Post-quantum ratchet state is carried") {
        const std::vector<uint8_t> pq(48, 0x5c);
        auto with_pq = parties.Make(MessageConstants::CIPHERTEXT_MESSAGE_CURRENT_VERSION, pq);
        auto restored = std::move(SignalMessage::Deserialize(with_pq.Serialize().Unwrap())).Unwrap();
        REQUIRE(restored.GetPqRatchet().Unwrap() == pq);
    }
    SECTION("Pre-Kyber version three is still produced") {
        auto v3 = parties.Make(MessageConstants::CIPHERTEXT_MESSAGE_PRE_KYBER_VERSION);
        REQUIRE(v3.GetMessageVersion().Unwrap() == 3);
        REQUIRE(v3.Serialize().Unwrap().front() == 0x34);
    }
    SECTION("Empty ciphertext is refused") {
        auto empty = SignalMessage::Create(4, parties.mac_key, PublicOf(parties.ratchet), 0, 0, {},
            PublicOf(parties.sender_identity), PublicOf(parties.receiver_identity));
        REQUIRE(FailedWith(empty, SigilFailureType::InvalidArgument));
    }
}

TEST_CASE("SignalMessage - MAC verification", "[session][message][mac]") {
    PairwiseParties parties;
    auto message = parties.Make();
    const auto sender = PublicOf(parties.sender_identity);
    const auto receiver = PublicOf(parties.receiver_identity);

    SECTION("Correct key and identity order verify") {
        REQUIRE(message.VerifyMac(sender, receiver, parties.mac_key).Unwrap());
    }
    SECTION("Wrong MAC key fails") {
        const std::vector<uint8_t> other_key(MessageConstants::MAC_KEY_SIZE, 0x2b);
        REQUIRE_FALSE(message.VerifyMac(sender, receiver, other_key).Unwrap());
    }
    SECTION("Swapped identities fail") {
        REQUIRE_FALSE(message.VerifyMac(receiver, sender, parties.mac_key).Unwrap());
    }
    SECTION("Tampered MAC fails after a round trip") {
        auto bytes = message.Serialize().Unwrap();
        bytes.back() ^= 0x01;
        auto tampered = std::move(SignalMessage::Deserialize(bytes)).Unwrap();
        REQUIRE_FALSE(tampered.VerifyMac(sender, receiver, parties.mac_key).Unwrap());
    }
    SECTION("MAC key must be 32 bytes") {
        const std::vector<uint8_t> short_key(16, 0x2a);
        REQUIRE(FailedWith(message.VerifyMac(sender, receiver, short_key), SigilFailureType::InvalidArgument));
    }
}

TEST_CASE("SignalMessage - Version handling", "[session][message][validation]") {
    PairwiseParties parties;
    const auto baseline = LiveObjects();

    SECTION("Legacy version two cannot be created") {
        auto legacy = SignalMessage::Create(2, parties.mac_key, PublicOf(parties.ratchet), 0, 0, Text("x"),
            PublicOf(parties.sender_identity), PublicOf(parties.receiver_identity));
        REQUIRE(FailedWith(legacy, SigilFailureType::InvalidArgument));
    }
    SECTION("Legacy version two passes the validator but the engine refuses it") {
        auto bytes = parties.Make().Serialize().Unwrap();
        bytes[0] = 0x24;
        auto result = SignalMessage::Deserialize(bytes);
        REQUIRE(FailedWith(result, SigilFailureType::Serialization));
        REQUIRE(result.UnwrapErr().native_code == static_cast<uint32_t>(SGL_ERROR_CODE_INVALID_MESSAGE));
    }
    SECTION("Unknown versions are rejected before the engine") {
        auto bytes = parties.Make().Serialize().Unwrap();
        bytes[0] = 0x54;
        REQUIRE(RejectedWith(SignalMessage::Deserialize(bytes), ValidationReason::InvalidVersion));
        REQUIRE(RejectedWith(SignalMessage::Deserialize(std::vector<uint8_t>(40, 0x11)), ValidationReason::InvalidVersion));
    }
    SECTION("Truncated input is rejected before the engine") {
        REQUIRE(RejectedWith(SignalMessage::Deserialize(std::vector<uint8_t>{0x44, 0x0a}), ValidationReason::TooShort));
        REQUIRE(RejectedWith(SignalMessage::Deserialize({}), ValidationReason::EmptyInput));
    }
    REQUIRE(LiveObjects() == baseline);
}

TEST_CASE("SignalMessage - Lifecycle", "[session][message][lifecycle]") {
    PairwiseParties parties;
    auto message = parties.Make();
    auto copy = message.Clone();
    REQUIRE(copy.IsOk());
    message.Dispose();
    REQUIRE(message.IsDisposed());
    REQUIRE(FailedWith(message.GetCounter(), SigilFailureType::Disposed));
    REQUIRE(copy.Unwrap().GetCounter().Unwrap() == 7);
}

TEST_CASE("DecryptionErrorMessage - For an original message", "[session][dem]") {
    PairwiseParties parties;
    auto original = parties.Make();
    const auto original_bytes = original.Serialize().Unwrap();

    SECTION("Whisper original names its ratchet key") {
        auto dem = DecryptionErrorMessage::ForOriginalMessage(
            original_bytes, CiphertextMessageType::Whisper, kTimestamp, 5);
        REQUIRE(dem.IsOk());
        REQUIRE(dem.Unwrap().GetTimestamp().Unwrap() == kTimestamp);
        REQUIRE(dem.Unwrap().GetDeviceId().Unwrap() == 5);
        auto ratchet_key = dem.Unwrap().GetRatchetKey().Unwrap();
        REQUIRE(ratchet_key.has_value());
        REQUIRE(ratchet_key->Equals(PublicOf(parties.ratchet)).Unwrap());

        auto restored = DecryptionErrorMessage::Deserialize(dem.Unwrap().Serialize().Unwrap());
        REQUIRE(restored.IsOk());
        REQUIRE(restored.Unwrap().GetTimestamp().Unwrap() == kTimestamp);
        REQUIRE(restored.Unwrap().GetDeviceId().Unwrap() == 5);
        REQUIRE(restored.Unwrap().GetRatchetKey().Unwrap()->Equals(PublicOf(parties.ratchet)).Unwrap());
    }
    SECTION("Pre-key original names the inner message's ratchet key") {
        std::vector<uint8_t> pre_key{0x44, 0x22, static_cast<uint8_t>(original_bytes.size())};
        pre_key.insert(pre_key.end(), original_bytes.begin(), original_bytes.end());
        auto dem = DecryptionErrorMessage::ForOriginalMessage(
            pre_key, CiphertextMessageType::PreKey, kTimestamp, 2);
        REQUIRE(dem.IsOk());
        REQUIRE(dem.Unwrap().GetRatchetKey().Unwrap()->Equals(PublicOf(parties.ratchet)).Unwrap());
    }
    SECTION("Sender key and plaintext originals carry no ratchet key") {
        for (const auto type : {CiphertextMessageType::SenderKey, CiphertextMessageType::Plaintext}) {
            auto dem = DecryptionErrorMessage::ForOriginalMessage(Text("opaque"), type, kTimestamp, 3);
            REQUIRE(dem.IsOk());
            REQUIRE_FALSE(dem.Unwrap().GetRatchetKey().Unwrap().has_value());
            REQUIRE(dem.Unwrap().GetDeviceId().Unwrap() == 3);
        }
    }
    SECTION("Unknown message type is refused") {
        auto dem = DecryptionErrorMessage::ForOriginalMessage(
            original_bytes, static_cast<CiphertextMessageType>(5), kTimestamp, 1);
        REQUIRE(FailedWith(dem, SigilFailureType::InvalidArgument));
    }
    SECTION("Unparseable Whisper original is refused") {
        auto dem = DecryptionErrorMessage::ForOriginalMessage(
            std::vector<uint8_t>(40, 0x11), CiphertextMessageType::Whisper, kTimestamp, 1);
        REQUIRE(FailedWith(dem, SigilFailureType::Serialization));
    }
    SECTION("Empty original never reaches the engine") {
        const auto baseline = LiveObjects();
        auto dem = DecryptionErrorMessage::ForOriginalMessage({}, CiphertextMessageType::Whisper, kTimestamp, 1);
        REQUIRE(FailedWith(dem, SigilFailureType::InvalidArgument));
        REQUIRE(LiveObjects() == baseline);
    }
}

TEST_CASE("DecryptionErrorMessage - Parsing", "[session][dem][validation]") {
    PairwiseParties parties;
    auto original = parties.Make();
    auto dem = std::move(DecryptionErrorMessage::ForOriginalMessage(
        original.Serialize().Unwrap(), CiphertextMessageType::Whisper, kTimestamp, 9)).Unwrap();
    const auto dem_bytes = dem.Serialize().Unwrap();

    SECTION("Extracted from a padded content body") {
        auto extracted = DecryptionErrorMessage::ExtractFromSerializedContent(ContentCarrying(dem_bytes));
        REQUIRE(extracted.IsOk());
        REQUIRE(extracted.Unwrap().GetTimestamp().Unwrap() == kTimestamp);
        REQUIRE(extracted.Unwrap().GetDeviceId().Unwrap() == 9);
    }
    SECTION("Content without the padding boundary is refused") {
        auto content = ContentCarrying(dem_bytes);
        content.pop_back();
        auto extracted = DecryptionErrorMessage::ExtractFromSerializedContent(content);
        REQUIRE(FailedWith(extracted, SigilFailureType::Serialization));
        REQUIRE(extracted.UnwrapErr().native_code == static_cast<uint32_t>(SGL_ERROR_CODE_INVALID_MESSAGE));
    }
    SECTION("Invalid wire type is rejected before the engine") {
        const auto baseline = LiveObjects();
        std::vector<uint8_t> bad(20, 0x00);
        bad[0] = 0x0e;
        REQUIRE(RejectedWith(DecryptionErrorMessage::Deserialize(bad), ValidationReason::InvalidWireType));
        REQUIRE(RejectedWith(DecryptionErrorMessage::Deserialize(std::vector<uint8_t>{0x0a}), ValidationReason::TooShort));
        REQUIRE(LiveObjects() == baseline);
    }
    SECTION("Clone survives disposal of the source") {
        auto copy = std::move(dem.Clone()).Unwrap();
        dem.Dispose();
        REQUIRE(dem.IsDisposed());
        REQUIRE(FailedWith(dem.GetTimestamp(), SigilFailureType::Disposed));
        REQUIRE(copy.Serialize().Unwrap() == dem_bytes);
    }
}
