#include <catch2/catch_test_macros.hpp>
#include "sigil/groups/distribution_id.hpp"
#include "sigil/groups/group_session.hpp"
#include "sigil/groups/sender_key_distribution_message.hpp"
#include "sigil/groups/sender_key_message.hpp"
#include "sigil/groups/sender_key_record.hpp"
#include "sigil/stores/in_memory/in_memory_sender_key_store.hpp"
#include "helpers/binding_fixtures.hpp"
#include <string>
#include <vector>
using namespace sigil::protocol;
using namespace sigil::protocol::groups;
using namespace sigil::protocol::test_helpers;
using configuration::BindingConfig;
using session::ProtocolAddress;
using stores::InMemorySenderKeyStore;

namespace {
const DistributionId kGroupId = {
    0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};

std::vector<uint8_t> Text(const std::string& text) {
    return {text.begin(), text.end()};
}
}

TEST_CASE("DistributionId - Conversions", "[groups][uuid]") {
    SECTION("Canonical string form") {
        REQUIRE(DistributionIdToString(kGroupId) == "6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    }
    SECTION("Parsing accepts hyphenated, bare and upper-case forms") {
        REQUIRE(DistributionIdFromString("6ba7b810-9dad-11d1-80b4-00c04fd430c8").Unwrap() == kGroupId);
        REQUIRE(DistributionIdFromString("6ba7b8109dad11d180b400c04fd430c8").Unwrap() == kGroupId);
        REQUIRE(DistributionIdFromString("6BA7B810-9DAD-11D1-80B4-00C04FD430C8").Unwrap() == kGroupId);
    }
    SECTION("Malformed strings are rejected") {
        REQUIRE(FailedWith(DistributionIdFromString("6ba7b810-9dad-11d1-80b4"), SigilFailureType::InvalidArgument));
        REQUIRE(FailedWith(DistributionIdFromString("zzzzzzzz-9dad-11d1-80b4-00c04fd430c8"), SigilFailureType::InvalidArgument));
        REQUIRE(FailedWith(DistributionIdFromString(""), SigilFailureType::InvalidArgument));
    }
    SECTION("Raw bytes must be exactly sixteen") {
        REQUIRE(DistributionIdFromBytes(kGroupId).Unwrap() == kGroupId);
        const std::vector<uint8_t> fifteen(15, 0x01);
        REQUIRE(FailedWith(DistributionIdFromBytes(fifteen), SigilFailureType::InvalidArgument));
    }
    SECTION("Native UUID conversion is lossless") {
        REQUIRE(FromNativeUuid(ToNativeUuid(kGroupId)) == kGroupId);
    }
}

TEST_CASE("SenderKeyName - Store key", "[groups]") {
    const SenderKeyName name{ProtocolAddress("alice", 1), kGroupId};
    REQUIRE(name.ToString() == "alice.1::6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    REQUIRE(name == SenderKeyName{ProtocolAddress("alice", 1), kGroupId});
    REQUIRE_FALSE(name == SenderKeyName{ProtocolAddress("alice", 2), kGroupId});
}

TEST_CASE("SenderKeyRecord - Fresh record", "[groups][record]") {
    auto record = std::move(SenderKeyRecord::NewFresh()).Unwrap();
    REQUIRE(record.Serialize().Unwrap().empty());
    REQUIRE(RejectedWith(SenderKeyRecord::Deserialize({}), ValidationReason::EmptyInput));
}

TEST_CASE("GroupSession - Sender key exchange", "[groups][session]") {
    const ProtocolAddress alice_address("alice", 1);
    const ProtocolAddress bob_address("bob", 1);
    InMemorySenderKeyStore alice_store;
    InMemorySenderKeyStore bob_store;
    GroupSession alice(alice_address, kGroupId, alice_store);
    GroupSession bob(bob_address, kGroupId, bob_store);

    auto distribution = alice.CreateDistributionMessage();
    REQUIRE(distribution.IsOk());
    REQUIRE(alice_store.ContainsSenderKey(SenderKeyName{alice_address, kGroupId}));
    REQUIRE(distribution.Unwrap().GetDistributionId().Unwrap() == kGroupId);
    REQUIRE(distribution.Unwrap().GetChainKey().Unwrap().Size() == GroupConstants::CHAIN_KEY_SIZE);

    SECTION("Member decrypts after processing the distribution message") {
        REQUIRE(bob.ProcessDistributionMessage(alice_address, distribution.Unwrap()).IsOk());
        REQUIRE(bob_store.ContainsSenderKey(SenderKeyName{alice_address, kGroupId}));

        const auto plaintext = Text("hello group");
        auto ciphertext = alice.Encrypt(plaintext);
        REQUIRE(ciphertext.IsOk());
        auto decrypted = bob.Decrypt(alice_address, ciphertext.Unwrap());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == plaintext);
    }
    SECTION("Distribution message survives serialization") {
        auto bytes = distribution.Unwrap().Serialize().Unwrap();
        auto restored = SenderKeyDistributionMessage::Deserialize(bytes);
        REQUIRE(restored.IsOk());
        REQUIRE(bob.ProcessDistributionMessage(alice_address, restored.Unwrap()).IsOk());

        auto ciphertext = std::move(alice.Encrypt(Text("via bytes"))).Unwrap();
        REQUIRE(bob.Decrypt(alice_address, ciphertext).Unwrap() == Text("via bytes"));
    }
    SECTION("Messages are signed with the distributed key") {
        auto ciphertext = std::move(alice.Encrypt(Text("signed"))).Unwrap();
        auto message = std::move(SenderKeyMessage::Deserialize(ciphertext)).Unwrap();
        REQUIRE(message.GetDistributionId().Unwrap() == kGroupId);
        REQUIRE(message.GetChainId().Unwrap() == distribution.Unwrap().GetChainId().Unwrap());
        REQUIRE(message.GetIteration().Unwrap() == 0);

        auto signing_key = std::move(distribution.Unwrap().GetSignatureKey()).Unwrap();
        REQUIRE(message.VerifySignature(signing_key).Unwrap());
        auto stranger = GeneratePrivateKey();
        auto stranger_public = std::move(stranger.GetPublicKey()).Unwrap();
        REQUIRE_FALSE(message.VerifySignature(stranger_public).Unwrap());
    }
    SECTION("Out-of-order delivery within the window") {
        REQUIRE(bob.ProcessDistributionMessage(alice_address, distribution.Unwrap()).IsOk());
        auto first = std::move(alice.Encrypt(Text("first"))).Unwrap();
        auto second = std::move(alice.Encrypt(Text("second"))).Unwrap();
        auto third = std::move(alice.Encrypt(Text("third"))).Unwrap();

        REQUIRE(bob.Decrypt(alice_address, third).Unwrap() == Text("third"));
        REQUIRE(bob.Decrypt(alice_address, first).Unwrap() == Text("first"));
        REQUIRE(bob.Decrypt(alice_address, second).Unwrap() == Text("second"));
    }
    SECTION("Replayed message is rejected") {
        REQUIRE(bob.ProcessDistributionMessage(alice_address, distribution.Unwrap()).IsOk());
        auto ciphertext = std::move(alice.Encrypt(Text("once"))).Unwrap();
        REQUIRE(bob.Decrypt(alice_address, ciphertext).IsOk());
        auto replay = bob.Decrypt(alice_address, ciphertext);
        REQUIRE(FailedWith(replay, SigilFailureType::CryptoError));
        REQUIRE(replay.UnwrapErr().native_code == static_cast<uint32_t>(SGL_ERROR_CODE_DUPLICATED_MESSAGE));
    }
    SECTION("Decrypt without sender state fails and stores nothing") {
        auto ciphertext = std::move(alice.Encrypt(Text("too early"))).Unwrap();
        auto result = bob.Decrypt(alice_address, ciphertext);
        REQUIRE(FailedWith(result, SigilFailureType::CryptoError));
        REQUIRE(result.UnwrapErr().native_code == static_cast<uint32_t>(SGL_ERROR_CODE_NO_SENDER_KEY_STATE));
        REQUIRE_FALSE(bob_store.ContainsSenderKey(SenderKeyName{alice_address, kGroupId}));
    }
    SECTION("Tampered ciphertext fails without advancing stored state") {
        REQUIRE(bob.ProcessDistributionMessage(alice_address, distribution.Unwrap()).IsOk());
        auto ciphertext = std::move(alice.Encrypt(Text("intact"))).Unwrap();
        auto tampered = ciphertext;
        tampered.back() ^= 0x01;
        REQUIRE(FailedWith(bob.Decrypt(alice_address, tampered), SigilFailureType::CryptoError));
        REQUIRE(bob.Decrypt(alice_address, ciphertext).Unwrap() == Text("intact"));
    }
    SECTION("Garbage is rejected before the engine") {
        const std::vector<uint8_t> garbage(40, 0x11);
        REQUIRE(RejectedWith(bob.Decrypt(alice_address, garbage), ValidationReason::InvalidVersion));
    }
}

TEST_CASE("GroupSession - Encrypt needs a sender chain", "[groups][session]") {
    InMemorySenderKeyStore store;
    GroupSession alice(ProtocolAddress("alice", 1), kGroupId, store);
    auto result = alice.Encrypt(Text("no chain"));
    REQUIRE(FailedWith(result, SigilFailureType::CryptoError));
    REQUIRE(store.Size() == 0);
}

TEST_CASE("GroupSession - Shared store", "[groups][session]") {
    const ProtocolAddress alice_address("alice", 1);
    const ProtocolAddress bob_address("bob", 1);
    InMemorySenderKeyStore shared;
    GroupSession alice(alice_address, kGroupId, shared);
    GroupSession bob(bob_address, kGroupId, shared);

    auto from_alice = std::move(alice.CreateDistributionMessage()).Unwrap();
    auto from_bob = std::move(bob.CreateDistributionMessage()).Unwrap();
    REQUIRE(shared.Size() == 2);

    SECTION("Records are keyed per sender") {
        REQUIRE(shared.ContainsSenderKey(SenderKeyName{alice_address, kGroupId}));
        REQUIRE(shared.ContainsSenderKey(SenderKeyName{bob_address, kGroupId}));
        REQUIRE_FALSE(shared.ContainsSenderKey(SenderKeyName{alice_address, DistributionId{}}));
        REQUIRE(from_bob.GetDistributionId().Unwrap() == kGroupId);
    }
    SECTION("Re-processing an own distribution keeps the signing key") {
        REQUIRE(bob.ProcessDistributionMessage(alice_address, from_alice).IsOk());
        REQUIRE(shared.Size() == 2);
        REQUIRE(alice.Encrypt(Text("still sending")).IsOk());
    }
}

TEST_CASE("GroupSession - Configuration and bookkeeping", "[groups][session][config]") {
    InMemorySenderKeyStore store;

    SECTION("Create validates the raw id") {
        const std::vector<uint8_t> short_id(8, 0x00);
        REQUIRE(FailedWith(GroupSession::Create(ProtocolAddress("alice", 1), short_id, store),
            SigilFailureType::InvalidArgument));
        auto session = GroupSession::Create(ProtocolAddress("alice", 1), kGroupId, store);
        REQUIRE(session.IsOk());
        REQUIRE(session.Unwrap().GetDistributionId() == kGroupId);
    }
    SECTION("Payload above the configured limit is refused") {
        GroupSession alice(ProtocolAddress("alice", 1), kGroupId, store,
            BindingConfig::Default().WithMaxPayloadSize(16));
        REQUIRE(alice.CreateDistributionMessage().IsOk());
        const std::vector<uint8_t> large(17, 0x61);
        REQUIRE(FailedWith(alice.Encrypt(large), SigilFailureType::InvalidArgument));
        REQUIRE(alice.Encrypt(std::vector<uint8_t>(16, 0x61)).IsOk());
        REQUIRE(FailedWith(alice.Decrypt(ProtocolAddress("bob", 1), large), SigilFailureType::InvalidArgument));
    }
    SECTION("Operation counter counts attempted operations") {
        GroupSession alice(ProtocolAddress("alice", 1), kGroupId, store);
        REQUIRE(alice.GetOperationCount() == 0);
        REQUIRE(alice.CreateDistributionMessage().IsOk());
        REQUIRE(alice.Encrypt(Text("one")).IsOk());
        REQUIRE(alice.GetOperationCount() == 2);
        REQUIRE(alice.GetConfig() == BindingConfig::Default());
        REQUIRE(alice.GetSenderAddress() == ProtocolAddress("alice", 1));
    }
}
