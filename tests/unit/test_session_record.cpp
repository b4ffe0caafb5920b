#include <catch2/catch_test_macros.hpp>
#include "sigil/session/protocol_address.hpp"
#include "sigil/session/session_record.hpp"
#include "helpers/binding_fixtures.hpp"
#include "helpers/session_fixtures.hpp"
#include <unordered_set>
#include <vector>
using namespace sigil::protocol;
using namespace sigil::protocol::session;
using namespace sigil::protocol::test_helpers;

TEST_CASE("ProtocolAddress - Identity", "[session][address]") {
    const ProtocolAddress alice("alice", 1);

    REQUIRE(alice.GetName() == "alice");
    REQUIRE(alice.GetDeviceId() == 1);
    REQUIRE(alice.ToString() == "alice.1");

    SECTION("Equality covers name and device") {
        REQUIRE(alice == ProtocolAddress("alice", 1));
        REQUIRE(alice != ProtocolAddress("alice", 2));
        REQUIRE(alice != ProtocolAddress("bob", 1));
    }
    SECTION("Ordering groups devices under one name") {
        REQUIRE(ProtocolAddress("alice", 1) < ProtocolAddress("alice", 2));
        REQUIRE(ProtocolAddress("alice", 9) < ProtocolAddress("bob", 0));
    }
    SECTION("Usable as a hash key") {
        std::unordered_set<ProtocolAddress> seen;
        seen.insert(alice);
        seen.insert(ProtocolAddress("alice", 1));
        seen.insert(ProtocolAddress("alice", 2));
        REQUIRE(seen.size() == 2);
    }
}

TEST_CASE("SessionRecord - Fresh record", "[session][record]") {
    auto record = SessionRecord::NewFresh();
    REQUIRE(record.IsOk());
    auto& fresh = record.Unwrap();

    REQUIRE_FALSE(fresh.HasCurrentState().Unwrap());
    REQUIRE_FALSE(fresh.HasUsableSenderChain(0).Unwrap());
    REQUIRE(fresh.GetPreviousSessionCount().Unwrap() == 0);
    REQUIRE(fresh.Serialize().Unwrap().empty());

    SECTION("Registration ids need a current session") {
        REQUIRE(FailedWith(fresh.GetLocalRegistrationId(), SigilFailureType::Native));
    }
    SECTION("Archiving an empty record is a no-op") {
        REQUIRE(fresh.ArchiveCurrentState().IsOk());
        REQUIRE(fresh.GetPreviousSessionCount().Unwrap() == 0);
    }
    SECTION("Empty bytes are never deserialized") {
        REQUIRE(RejectedWith(SessionRecord::Deserialize({}), ValidationReason::EmptyInput));
    }
}

TEST_CASE("SessionRecord - Stored record", "[session][record]") {
    auto ratchet_private = GeneratePrivateKey();
    auto ratchet_public = std::move(ratchet_private.GetPublicKey()).Unwrap();

    StoredSessionShape shape;
    shape.sender_ratchet_key = ratchet_public.Serialize().Unwrap();
    const auto bytes = StoredSessionRecord(shape);

    auto record = std::move(SessionRecord::Deserialize(bytes)).Unwrap();
    REQUIRE(record.HasCurrentState().Unwrap());
    REQUIRE(record.GetLocalRegistrationId().Unwrap() == 111);
    REQUIRE(record.GetRemoteRegistrationId().Unwrap() == 222);

    SECTION("Serialization preserves the bytes") {
        REQUIRE(record.Serialize().Unwrap() == bytes);
    }
    SECTION("Ratchet key match") {
        REQUIRE(record.CurrentRatchetKeyMatches(ratchet_public).Unwrap());
        auto other = GeneratePrivateKey();
        auto other_public = std::move(other.GetPublicKey()).Unwrap();
        REQUIRE_FALSE(record.CurrentRatchetKeyMatches(other_public).Unwrap());
    }
    SECTION("Archive moves the current state into history") {
        REQUIRE(record.ArchiveCurrentState().IsOk());
        REQUIRE_FALSE(record.HasCurrentState().Unwrap());
        REQUIRE(record.GetPreviousSessionCount().Unwrap() == 1);
        REQUIRE_FALSE(record.CurrentRatchetKeyMatches(ratchet_public).Unwrap());
    }
    SECTION("Archive keeps at most forty previous states") {
        shape.previous_sessions = SessionConstants::ARCHIVED_STATES_MAX_LENGTH;
        auto full = std::move(SessionRecord::Deserialize(StoredSessionRecord(shape))).Unwrap();
        REQUIRE(full.ArchiveCurrentState().IsOk());
        REQUIRE(full.GetPreviousSessionCount().Unwrap() == SessionConstants::ARCHIVED_STATES_MAX_LENGTH);
    }
    SECTION("Clone is independent") {
        auto clone = std::move(record.Clone()).Unwrap();
        REQUIRE(record.ArchiveCurrentState().IsOk());
        REQUIRE(clone.HasCurrentState().Unwrap());
    }
    SECTION("Disposed record refuses every operation") {
        record.Dispose();
        REQUIRE(record.IsDisposed());
        REQUIRE(FailedWith(record.HasCurrentState(), SigilFailureType::Disposed));
        REQUIRE(FailedWith(record.ArchiveCurrentState(), SigilFailureType::Disposed));
    }
}

TEST_CASE("SessionRecord - Sender chain usability", "[session][record]") {
    constexpr uint64_t created = 1'700'000'000'000ULL;
    StoredSessionShape shape;
    shape.sender_ratchet_key = SerializedPublicKey(0x31);

    SECTION("Chain without a pending pre-key is usable") {
        auto record = std::move(SessionRecord::Deserialize(StoredSessionRecord(shape))).Unwrap();
        REQUIRE(record.HasUsableSenderChain(created).Unwrap());
    }
    SECTION("Unacknowledged session expires after thirty days") {
        shape.with_pending_pre_key = true;
        shape.pending_pre_key_timestamp = created;
        auto record = std::move(SessionRecord::Deserialize(StoredSessionRecord(shape))).Unwrap();
        const uint64_t limit = created + SessionConstants::MAX_UNACKNOWLEDGED_SESSION_AGE_MS;
        REQUIRE(record.HasUsableSenderChain(limit).Unwrap());
        REQUIRE_FALSE(record.HasUsableSenderChain(limit + 1).Unwrap());
    }
    SECTION("No sender chain") {
        shape.with_sender_chain = false;
        auto record = std::move(SessionRecord::Deserialize(StoredSessionRecord(shape))).Unwrap();
        REQUIRE_FALSE(record.HasUsableSenderChain(created).Unwrap());
    }
}

TEST_CASE("SessionRecord - Malformed input", "[session][record]") {
    SECTION("Leading tag outside the record layout") {
        std::vector<uint8_t> garbage(64, 0x00);
        garbage[0] = 0x08;
        REQUIRE(RejectedWith(SessionRecord::Deserialize(garbage), ValidationReason::InvalidStructureTag));
    }
    SECTION("Structurally plausible but unparsable") {
        std::vector<uint8_t> truncated(64, 0xFF);
        truncated[0] = 0x0a;
        REQUIRE(FailedWith(SessionRecord::Deserialize(truncated), SigilFailureType::Serialization));
    }
}
