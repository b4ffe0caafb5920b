#include <catch2/catch_test_macros.hpp>
#include "sigil/stores/in_memory/in_memory_identity_key_store.hpp"
#include "sigil/stores/in_memory/in_memory_kyber_pre_key_store.hpp"
#include "sigil/stores/in_memory/in_memory_pre_key_store.hpp"
#include "sigil/stores/in_memory/in_memory_sender_key_store.hpp"
#include "sigil/stores/in_memory/in_memory_session_store.hpp"
#include "sigil/stores/in_memory/in_memory_signed_pre_key_store.hpp"
#include "helpers/binding_fixtures.hpp"
#include "helpers/session_fixtures.hpp"
#include <vector>
using namespace sigil::protocol;
using namespace sigil::protocol::keys;
using namespace sigil::protocol::prekeys;
using namespace sigil::protocol::stores;
using namespace sigil::protocol::test_helpers;

namespace {
    SessionRecord StoredSession() {
        auto ratchet_private = GeneratePrivateKey();
        StoredSessionShape shape;
        shape.sender_ratchet_key = ratchet_private.GetPublicKey().Unwrap().Serialize().Unwrap();
        auto record = SessionRecord::Deserialize(StoredSessionRecord(shape));
        REQUIRE(record.IsOk());
        return std::move(record).Unwrap();
    }

    PreKeyRecord MakePreKey(const uint32_t id) {
        auto private_key = GeneratePrivateKey();
        auto public_key = std::move(private_key.GetPublicKey()).Unwrap();
        auto record = PreKeyRecord::Create(id, public_key, private_key);
        REQUIRE(record.IsOk());
        return std::move(record).Unwrap();
    }
}

TEST_CASE("InMemorySessionStore - Load and store", "[stores][session]") {
    InMemorySessionStore store;
    const ProtocolAddress bob("bob", 1);

    REQUIRE_FALSE(store.LoadSession(bob).Unwrap().has_value());
    REQUIRE_FALSE(store.ContainsSession(bob));

    SECTION("Stored session comes back intact") {
        const auto record = StoredSession();
        REQUIRE(store.StoreSession(bob, record).IsOk());
        REQUIRE(store.ContainsSession(bob));

        auto loaded = store.LoadSession(bob);
        REQUIRE(loaded.IsOk());
        REQUIRE(loaded.Unwrap().has_value());
        REQUIRE(loaded.Unwrap()->GetRemoteRegistrationId().Unwrap() == 222);
        REQUIRE(loaded.Unwrap()->Serialize().Unwrap() == record.Serialize().Unwrap());
    }
    SECTION("Fresh record loads back as a fresh record") {
        const auto fresh = std::move(SessionRecord::NewFresh()).Unwrap();
        REQUIRE(store.StoreSession(bob, fresh).IsOk());

        auto loaded = store.LoadSession(bob);
        REQUIRE(loaded.IsOk());
        REQUIRE(loaded.Unwrap().has_value());
        REQUIRE_FALSE(loaded.Unwrap()->HasCurrentState().Unwrap());
    }
    SECTION("Store replaces the previous record") {
        REQUIRE(store.StoreSession(bob, std::move(SessionRecord::NewFresh()).Unwrap()).IsOk());
        REQUIRE(store.StoreSession(bob, StoredSession()).IsOk());
        REQUIRE(store.Size() == 1);
        REQUIRE(store.LoadSession(bob).Unwrap()->HasCurrentState().Unwrap());
    }
    SECTION("Delete removes one device") {
        REQUIRE(store.StoreSession(bob, StoredSession()).IsOk());
        store.DeleteSession(bob);
        REQUIRE_FALSE(store.ContainsSession(bob));
        store.DeleteSession(bob);
        REQUIRE(store.Size() == 0);
    }
}

TEST_CASE("InMemorySessionStore - Devices per name", "[stores][session]") {
    InMemorySessionStore store;
    const auto record = StoredSession();
    REQUIRE(store.StoreSession(ProtocolAddress("bob", 3), record).IsOk());
    REQUIRE(store.StoreSession(ProtocolAddress("bob", 1), record).IsOk());
    REQUIRE(store.StoreSession(ProtocolAddress("bobby", 2), record).IsOk());
    REQUIRE(store.StoreSession(ProtocolAddress("alice", 1), record).IsOk());

    SECTION("Sub-devices are listed in device order") {
        REQUIRE(store.GetSubDeviceSessions("bob") == std::vector<uint32_t>{1, 3});
        REQUIRE(store.GetSubDeviceSessions("bobby") == std::vector<uint32_t>{2});
        REQUIRE(store.GetSubDeviceSessions("carol").empty());
    }
    SECTION("DeleteAllSessions leaves other names alone") {
        store.DeleteAllSessions("bob");
        REQUIRE(store.GetSubDeviceSessions("bob").empty());
        REQUIRE(store.ContainsSession(ProtocolAddress("bobby", 2)));
        REQUIRE(store.ContainsSession(ProtocolAddress("alice", 1)));
        REQUIRE(store.Size() == 2);
    }
    SECTION("Clear") {
        store.Clear();
        REQUIRE(store.Size() == 0);
    }
}

TEST_CASE("InMemoryIdentityKeyStore - Trust on first use", "[stores][identity]") {
    auto local = GenerateIdentity();
    const auto local_public = std::move(local.GetPublicKey()).Unwrap();
    InMemoryIdentityKeyStore store(std::move(local), 4242);

    const ProtocolAddress bob("bob", 1);
    const auto bob_key = std::move(GenerateIdentity().GetPublicKey()).Unwrap();
    const auto other_key = std::move(GenerateIdentity().GetPublicKey()).Unwrap();

    SECTION("Local identity and registration id") {
        REQUIRE(store.GetLocalRegistrationId() == 4242);
        auto pair = store.GetIdentityKeyPair();
        REQUIRE(pair.IsOk());
        REQUIRE(pair.Unwrap().GetPublicKey().Unwrap().Equals(local_public).Unwrap());
    }
    SECTION("Unknown identities are trusted in both directions") {
        REQUIRE(store.IsTrustedIdentity(bob, bob_key, Direction::Sending).Unwrap() == IdentityTrustDecision::Trusted);
        REQUIRE(store.IsTrustedIdentity(bob, bob_key, Direction::Receiving).Unwrap() == IdentityTrustDecision::Trusted);
        REQUIRE_FALSE(store.GetIdentity(bob).Unwrap().has_value());
    }
    SECTION("Saving reports whether the identity changed") {
        REQUIRE(store.SaveIdentity(bob, bob_key).Unwrap());
        REQUIRE_FALSE(store.SaveIdentity(bob, bob_key).Unwrap());
        REQUIRE(store.SaveIdentity(bob, other_key).Unwrap());
        REQUIRE(store.Size() == 1);
        REQUIRE(store.GetIdentity(bob).Unwrap()->Equals(other_key).Unwrap());
    }
    SECTION("Known identity is keyed by name across devices") {
        REQUIRE(store.SaveIdentity(bob, bob_key).IsOk());
        const ProtocolAddress bob_tablet("bob", 2);
        REQUIRE(store.IsTrustedIdentity(bob_tablet, bob_key, Direction::Sending).Unwrap() == IdentityTrustDecision::Trusted);
        REQUIRE(store.GetIdentity(bob_tablet).Unwrap()->Equals(bob_key).Unwrap());
    }
    SECTION("A different key is untrusted for sending and changed for receiving") {
        REQUIRE(store.SaveIdentity(bob, bob_key).IsOk());
        REQUIRE(store.IsTrustedIdentity(bob, other_key, Direction::Sending).Unwrap() == IdentityTrustDecision::Untrusted);
        REQUIRE(store.IsTrustedIdentity(bob, other_key, Direction::Receiving).Unwrap() == IdentityTrustDecision::Changed);
        REQUIRE(ToString(IdentityTrustDecision::Changed) == "Changed");
    }
    SECTION("Clear forgets remote identities only") {
        REQUIRE(store.SaveIdentity(bob, bob_key).IsOk());
        store.Clear();
        REQUIRE(store.Size() == 0);
        REQUIRE(store.GetIdentityKeyPair().IsOk());
    }
}

TEST_CASE("InMemoryPreKeyStore - Lifecycle", "[stores][prekeys]") {
    InMemoryPreKeyStore store;
    REQUIRE_FALSE(store.LoadPreKey(1).Unwrap().has_value());

    const auto first = MakePreKey(1);
    REQUIRE(store.StorePreKey(1, first).IsOk());
    REQUIRE(store.StorePreKey(7, MakePreKey(7)).IsOk());

    REQUIRE(store.ContainsPreKey(1));
    REQUIRE(store.GetAllPreKeyIds() == std::vector<uint32_t>{1, 7});

    auto loaded = store.LoadPreKey(1);
    REQUIRE(loaded.IsOk());
    REQUIRE(loaded.Unwrap()->GetId().Unwrap() == 1);
    REQUIRE(loaded.Unwrap()->GetPublicKey().Unwrap().Equals(first.GetPublicKey().Unwrap()).Unwrap());

    SECTION("Remove is one-shot") {
        store.RemovePreKey(1);
        REQUIRE_FALSE(store.ContainsPreKey(1));
        REQUIRE_FALSE(store.LoadPreKey(1).Unwrap().has_value());
        store.RemovePreKey(1);
        REQUIRE(store.Size() == 1);
    }
    SECTION("Clear") {
        store.Clear();
        REQUIRE(store.GetAllPreKeyIds().empty());
    }
}

TEST_CASE("InMemorySignedPreKeyStore - Lifecycle", "[stores][prekeys]") {
    const auto identity = GenerateIdentity();
    InMemorySignedPreKeyStore store;

    const auto record = MakeSignedPreKey(identity, 5, 1'700'000'000'123ULL);
    REQUIRE(store.StoreSignedPreKey(5, record).IsOk());
    REQUIRE(store.ContainsSignedPreKey(5));
    REQUIRE_FALSE(store.ContainsSignedPreKey(6));

    auto loaded = store.LoadSignedPreKey(5);
    REQUIRE(loaded.IsOk());
    REQUIRE(loaded.Unwrap()->GetTimestamp().Unwrap() == 1'700'000'000'123ULL);
    REQUIRE(loaded.Unwrap()->GetSignature().Unwrap() == record.GetSignature().Unwrap());

    store.RemoveSignedPreKey(5);
    REQUIRE(store.GetAllSignedPreKeyIds().empty());
    REQUIRE(store.Size() == 0);
}

TEST_CASE("InMemoryKyberPreKeyStore - Used marking", "[stores][kyber]") {
    const auto identity = GenerateIdentity();
    InMemoryKyberPreKeyStore store;

    const auto record = MakeKyberPreKey(identity, 9);
    REQUIRE(store.StoreKyberPreKey(9, record).IsOk());
    REQUIRE(store.StoreKyberPreKey(10, MakeKyberPreKey(identity, 10)).IsOk());
    REQUIRE(store.GetAllKyberPreKeyIds() == std::vector<uint32_t>{9, 10});

    auto loaded = store.LoadKyberPreKey(9);
    REQUIRE(loaded.IsOk());
    REQUIRE(loaded.Unwrap()->GetPublicKey().Unwrap().Equals(record.GetPublicKey().Unwrap()).Unwrap());

    REQUIRE_FALSE(store.IsKyberPreKeyUsed(9));
    store.MarkKyberPreKeyUsed(9);
    REQUIRE(store.IsKyberPreKeyUsed(9));
    REQUIRE_FALSE(store.IsKyberPreKeyUsed(10));

    SECTION("Used keys stay loadable") {
        REQUIRE(store.LoadKyberPreKey(9).Unwrap().has_value());
    }
    SECTION("Removing a key drops its used mark") {
        store.RemoveKyberPreKey(9);
        REQUIRE_FALSE(store.ContainsKyberPreKey(9));
        REQUIRE_FALSE(store.IsKyberPreKeyUsed(9));
    }
    SECTION("Clear drops keys and marks") {
        store.Clear();
        REQUIRE(store.Size() == 0);
        REQUIRE_FALSE(store.IsKyberPreKeyUsed(9));
    }
}

TEST_CASE("InMemorySenderKeyStore - Keyed by sender and group", "[stores][groups]") {
    using namespace sigil::protocol::groups;
    const auto group = DistributionIdFromString("6ba7b810-9dad-11d1-80b4-00c04fd430c8").Unwrap();
    const auto other_group = DistributionIdFromString("6ba7b811-9dad-11d1-80b4-00c04fd430c8").Unwrap();
    const SenderKeyName alice_name{ProtocolAddress("alice", 1), group};

    InMemorySenderKeyStore store;
    REQUIRE_FALSE(store.LoadSenderKey(alice_name).Unwrap().has_value());

    const auto fresh = std::move(SenderKeyRecord::NewFresh()).Unwrap();
    REQUIRE(store.StoreSenderKey(alice_name, fresh).IsOk());
    REQUIRE(store.ContainsSenderKey(alice_name));
    REQUIRE_FALSE(store.ContainsSenderKey(SenderKeyName{ProtocolAddress("alice", 1), other_group}));
    REQUIRE_FALSE(store.ContainsSenderKey(SenderKeyName{ProtocolAddress("alice", 2), group}));

    auto loaded = store.LoadSenderKey(alice_name);
    REQUIRE(loaded.IsOk());
    REQUIRE(loaded.Unwrap().has_value());
    REQUIRE(loaded.Unwrap()->Serialize().Unwrap().empty());

    store.Clear();
    REQUIRE(store.Size() == 0);
}
