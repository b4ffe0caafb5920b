#include <catch2/catch_test_macros.hpp>
#include "sigil/crypto/fingerprint.hpp"
#include "helpers/binding_fixtures.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>
using namespace sigil::protocol;
using namespace sigil::protocol::crypto;
using namespace sigil::protocol::test_helpers;

namespace {
const std::string kAliceId = "+14152222222";
const std::string kBobId = "+14153333333";

std::vector<uint8_t> Bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

PublicKey KeyFilledWith(const uint8_t fill) {
    auto key = PublicKey::Deserialize(SerializedPublicKey(fill));
    REQUIRE(key.IsOk());
    return std::move(key).Unwrap();
}

Fingerprint Make(
    const std::string& local_id,
    const PublicKey& local_key,
    const std::string& remote_id,
    const PublicKey& remote_key,
    const uint32_t iterations = FingerprintConstants::DEFAULT_ITERATIONS,
    const uint32_t version = FingerprintConstants::DEFAULT_VERSION) {
    auto fingerprint = Fingerprint::Create(
        Bytes(local_id), local_key, Bytes(remote_id), remote_key, iterations, version);
    REQUIRE(fingerprint.IsOk());
    return std::move(fingerprint).Unwrap();
}
}

TEST_CASE("Fingerprint - Display string", "[crypto][fingerprint]") {
    const auto alice_key = KeyFilledWith(0x11);
    const auto bob_key = KeyFilledWith(0x22);

    SECTION("Known digits at the default iteration count") {
        auto alice = Make(kAliceId, alice_key, kBobId, bob_key);
        const auto display = alice.DisplayString().Unwrap();
        REQUIRE(display.size() == FingerprintConstants::DISPLAY_STRING_LENGTH);
        REQUIRE(std::all_of(display.begin(), display.end(), [](const char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }));
        REQUIRE(display == "182942087055773282292872958385442225949165033614176996820774");
    }
    SECTION("Smaller half comes first whichever side is local") {
        auto alice = Make(kAliceId, alice_key, kBobId, bob_key, 2);
        auto bob = Make(kBobId, bob_key, kAliceId, alice_key, 2);
        REQUIRE(alice.DisplayString().Unwrap() == "070839715205084768280754275633375728446205530410008323950008");
        REQUIRE(bob.DisplayString().Unwrap() == alice.DisplayString().Unwrap());
    }
    SECTION("Changing either identity changes the digits") {
        auto original = Make(kAliceId, alice_key, kBobId, bob_key, 2);
        auto other_key = Make(kAliceId, KeyFilledWith(0x33), kBobId, bob_key, 2);
        auto other_id = Make("+14154444444", alice_key, kBobId, bob_key, 2);
        REQUIRE(other_key.DisplayString().Unwrap() != original.DisplayString().Unwrap());
        REQUIRE(other_id.DisplayString().Unwrap() != original.DisplayString().Unwrap());
    }
}

TEST_CASE("Fingerprint - Scannable comparison", "[crypto][fingerprint]") {
    const auto alice_key = KeyFilledWith(0x11);
    const auto bob_key = KeyFilledWith(0x22);
    auto alice = Make(kAliceId, alice_key, kBobId, bob_key, 16);
    auto bob = Make(kBobId, bob_key, kAliceId, alice_key, 16);
    const auto alice_scan = alice.ScannableEncoding().Unwrap();
    const auto bob_scan = bob.ScannableEncoding().Unwrap();

    SECTION("Encoding carries the version and two 32-byte halves") {
        REQUIRE(alice_scan.size() == 74);
        REQUIRE(alice_scan[0] == 0x08);
        REQUIRE(alice_scan[1] == FingerprintConstants::DEFAULT_VERSION);
        REQUIRE(alice_scan != bob_scan);
    }
    SECTION("The other party's view matches in both directions") {
        REQUIRE(Fingerprint::Compare(alice_scan, bob_scan).Unwrap());
        REQUIRE(Fingerprint::Compare(bob_scan, alice_scan).Unwrap());
    }
    SECTION("Our own view does not match itself") {
        REQUIRE_FALSE(Fingerprint::Compare(alice_scan, alice_scan).Unwrap());
    }
    SECTION("A different remote key does not match") {
        auto mallory = Make(kBobId, KeyFilledWith(0x44), kAliceId, alice_key, 16);
        REQUIRE_FALSE(Fingerprint::Compare(alice_scan, mallory.ScannableEncoding().Unwrap()).Unwrap());
    }
    SECTION("Version mismatch is an argument error") {
        auto old_bob = Make(kBobId, bob_key, kAliceId, alice_key, 16, 1);
        auto result = Fingerprint::Compare(alice_scan, old_bob.ScannableEncoding().Unwrap());
        REQUIRE(FailedWith(result, SigilFailureType::InvalidArgument));
        REQUIRE(result.UnwrapErr().native_code
            == static_cast<uint32_t>(SGL_ERROR_CODE_FINGERPRINT_VERSION_MISMATCH));
    }
    SECTION("Garbage fails to parse") {
        const std::vector<uint8_t> garbage{0xff, 0xff};
        REQUIRE(FailedWith(Fingerprint::Compare(alice_scan, garbage), SigilFailureType::Serialization));
        REQUIRE(FailedWith(Fingerprint::Compare({}, bob_scan), SigilFailureType::Serialization));
    }
}

TEST_CASE("Fingerprint - Iteration bounds", "[crypto][fingerprint][validation]") {
    const auto alice_key = KeyFilledWith(0x11);
    const auto bob_key = KeyFilledWith(0x22);
    const auto baseline = LiveObjects();
    for (const uint32_t iterations : {0u, 1u, FingerprintConstants::MAX_ITERATIONS + 1}) {
        INFO("iterations = " << iterations);
        auto result = Fingerprint::Create(Bytes(kAliceId), alice_key, Bytes(kBobId), bob_key, iterations);
        REQUIRE(FailedWith(result, SigilFailureType::InvalidArgument));
    }
    REQUIRE(LiveObjects() == baseline);
}

TEST_CASE("Fingerprint - Lifecycle", "[crypto][fingerprint][lifecycle]") {
    const auto alice_key = KeyFilledWith(0x11);
    const auto bob_key = KeyFilledWith(0x22);
    auto fingerprint = Make(kAliceId, alice_key, kBobId, bob_key, 2);
    auto copy = std::move(fingerprint.Clone()).Unwrap();
    fingerprint.Dispose();
    REQUIRE(fingerprint.IsDisposed());
    REQUIRE(FailedWith(fingerprint.DisplayString(), SigilFailureType::Disposed));
    REQUIRE(copy.DisplayString().Unwrap().size() == FingerprintConstants::DISPLAY_STRING_LENGTH);

    SECTION("Disposed key is refused") {
        auto key = KeyFilledWith(0x55);
        key.Dispose();
        REQUIRE(FailedWith(Fingerprint::Create(Bytes(kAliceId), key, Bytes(kBobId), bob_key),
            SigilFailureType::Disposed));
    }
}
