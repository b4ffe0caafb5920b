#include <catch2/catch_test_macros.hpp>
#include "sigil/validation/serialization_validator.hpp"
#include <vector>
using namespace sigil::protocol;
using sigil::protocol::validation::SerializationValidator;

namespace {
bool RejectedFor(const SerializationValidator::Check& check, const ValidationReason reason) {
    return check.IsErr() && check.UnwrapErr().reason == reason;
}

std::vector<uint8_t> Record(const uint8_t tag, const size_t length) {
    std::vector<uint8_t> data(length, 0x42);
    data[0] = tag;
    return data;
}
}

TEST_CASE("SerializationValidator - Public keys", "[validation]") {
    SECTION("Well-formed key passes") {
        std::vector<uint8_t> key(KeyConstants::PUBLIC_KEY_SIZE, 0x09);
        key[0] = KeyConstants::CURVE_25519_KEY_TYPE;
        REQUIRE(SerializationValidator::ValidatePublicKey(key).IsOk());
    }
    SECTION("Every blocklisted point is rejected") {
        STATIC_REQUIRE(SerializationValidator::LOW_ORDER_POINT_COUNT == 7);
        std::vector<uint8_t> point;
        SECTION("Zero") {
            point = std::vector<uint8_t>(32, 0x00);
        }
        SECTION("One") {
            point = std::vector<uint8_t>(32, 0x00);
            point[0] = 0x01;
        }
        SECTION("Order eight, first encoding") {
            point = {0xe0, 0xeb, 0x7a, 0x7c, 0x3b, 0x41, 0xb8, 0xae, 0x16, 0x56, 0xe3, 0xfa, 0xf1, 0x9f, 0xc4, 0x6a,
                     0xda, 0x09, 0x8d, 0xeb, 0x9c, 0x32, 0xb1, 0xfd, 0x86, 0x62, 0x05, 0x16, 0x5f, 0x49, 0xb8, 0x00};
        }
        SECTION("Order eight, second encoding") {
            point = {0x5f, 0x9c, 0x95, 0xbc, 0xa3, 0x50, 0x8c, 0x24, 0xb1, 0xd0, 0xb1, 0x55, 0x9c, 0x83, 0xef, 0x5b,
                     0x04, 0x44, 0x5c, 0xc4, 0x58, 0x1c, 0x8e, 0x86, 0xd8, 0x22, 0x4e, 0xdd, 0xd0, 0x9f, 0x11, 0x57};
        }
        SECTION("p - 1") {
            point = std::vector<uint8_t>(32, 0xff);
            point[0] = 0xec;
            point[31] = 0x7f;
        }
        SECTION("p") {
            point = std::vector<uint8_t>(32, 0xff);
            point[0] = 0xed;
            point[31] = 0x7f;
        }
        SECTION("p + 1") {
            point = std::vector<uint8_t>(32, 0xff);
            point[0] = 0xee;
            point[31] = 0x7f;
        }

        REQUIRE(point.size() == KeyConstants::CURVE_25519_KEY_SIZE);
        REQUIRE(SerializationValidator::IsLowOrderPoint(point));
        std::vector<uint8_t> key;
        key.push_back(KeyConstants::CURVE_25519_KEY_TYPE);
        key.insert(key.end(), point.begin(), point.end());
        REQUIRE(RejectedFor(SerializationValidator::ValidatePublicKey(key), ValidationReason::LowOrderPoint));
    }
    SECTION("Neighbours of blocklisted points pass") {
        std::vector<uint8_t> key(KeyConstants::PUBLIC_KEY_SIZE, 0xff);
        key[0] = KeyConstants::CURVE_25519_KEY_TYPE;
        key[1] = 0xef;
        key[32] = 0x7f;
        REQUIRE(SerializationValidator::ValidatePublicKey(key).IsOk());
        std::vector<uint8_t> two(KeyConstants::PUBLIC_KEY_SIZE, 0x00);
        two[0] = KeyConstants::CURVE_25519_KEY_TYPE;
        two[1] = 0x02;
        REQUIRE(SerializationValidator::ValidatePublicKey(two).IsOk());
    }
    SECTION("Zero and identity encodings") {
        std::vector<uint8_t> zero(33, 0x00);
        zero[0] = 0x05;
        REQUIRE(RejectedFor(SerializationValidator::ValidatePublicKey(zero), ValidationReason::LowOrderPoint));
        auto one = zero;
        one[1] = 0x01;
        REQUIRE(RejectedFor(SerializationValidator::ValidatePublicKey(one), ValidationReason::LowOrderPoint));
    }
    SECTION("Wrong type byte") {
        std::vector<uint8_t> key(33, 0x09);
        key[0] = 0x06;
        REQUIRE(RejectedFor(SerializationValidator::ValidatePublicKey(key), ValidationReason::InvalidKeyType));
    }
    SECTION("Wrong length and empty input") {
        REQUIRE(RejectedFor(SerializationValidator::ValidatePublicKey(std::vector<uint8_t>(32, 0x05)),
            ValidationReason::InvalidLength));
        REQUIRE(RejectedFor(SerializationValidator::ValidatePublicKey({}), ValidationReason::EmptyInput));
    }
    SECTION("Blocklist ignores other lengths") {
        REQUIRE_FALSE(SerializationValidator::IsLowOrderPoint(std::vector<uint8_t>(31, 0x00)));
    }
}

TEST_CASE("SerializationValidator - Fixed-size keys", "[validation]") {
    SECTION("Private key is exactly 32 bytes") {
        REQUIRE(SerializationValidator::ValidatePrivateKey(std::vector<uint8_t>(32, 0x01)).IsOk());
        REQUIRE(RejectedFor(SerializationValidator::ValidatePrivateKey(std::vector<uint8_t>(33, 0x01)),
            ValidationReason::InvalidLength));
    }
    SECTION("Identity key pair needs its leading tag") {
        auto pair = Record(KeyConstants::IDENTITY_KEY_PAIR_TAG, KeyConstants::IDENTITY_KEY_PAIR_SIZE);
        REQUIRE(SerializationValidator::ValidateIdentityKeyPair(pair).IsOk());
        pair[0] = 0x12;
        REQUIRE(RejectedFor(SerializationValidator::ValidateIdentityKeyPair(pair), ValidationReason::InvalidKeyType));
    }
    SECTION("Kyber public key type byte") {
        auto key = Record(KeyConstants::KYBER_1024_KEY_TYPE, KeyConstants::SERIALIZED_KYBER_PUBLIC_KEY_SIZE);
        REQUIRE(SerializationValidator::ValidateKyberPublicKey(key).IsOk());
        key[0] = KeyConstants::CURVE_25519_KEY_TYPE;
        REQUIRE(RejectedFor(SerializationValidator::ValidateKyberPublicKey(key), ValidationReason::InvalidKeyType));
    }
    SECTION("Kyber secret key length") {
        REQUIRE(RejectedFor(
            SerializationValidator::ValidateKyberSecretKey(std::vector<uint8_t>(KeyConstants::KYBER_1024_SECRET_KEY_SIZE, 0)),
            ValidationReason::InvalidLength));
    }
}

TEST_CASE("SerializationValidator - Records", "[validation]") {
    SECTION("Minimum lengths") {
        REQUIRE(RejectedFor(SerializationValidator::ValidatePreKeyRecord(Record(0x08, 68)), ValidationReason::TooShort));
        REQUIRE(SerializationValidator::ValidatePreKeyRecord(Record(0x08, 69)).IsOk());
        REQUIRE(RejectedFor(SerializationValidator::ValidateSignedPreKeyRecord(Record(0x08, 134)), ValidationReason::TooShort));
        REQUIRE(SerializationValidator::ValidateSignedPreKeyRecord(Record(0x08, 135)).IsOk());
        REQUIRE(RejectedFor(SerializationValidator::ValidateSessionRecord(Record(0x0a, 49)), ValidationReason::TooShort));
        REQUIRE(RejectedFor(SerializationValidator::ValidateSenderKeyRecord(Record(0x0a, 19)), ValidationReason::TooShort));
    }
    SECTION("Leading protobuf tags") {
        REQUIRE(SerializationValidator::ValidatePreKeyRecord(Record(0x12, 80)).IsOk());
        REQUIRE(RejectedFor(SerializationValidator::ValidatePreKeyRecord(Record(0x10, 80)), ValidationReason::InvalidStructureTag));
        REQUIRE(SerializationValidator::ValidateKyberPreKeyRecord(Record(0x10, 200)).IsOk());
        REQUIRE(SerializationValidator::ValidateSessionRecord(Record(0x12, 60)).IsOk());
        REQUIRE(RejectedFor(SerializationValidator::ValidateSessionRecord(Record(0x08, 60)), ValidationReason::InvalidStructureTag));
        REQUIRE(RejectedFor(SerializationValidator::ValidateSenderCertificate(Record(0x12, 60)), ValidationReason::InvalidStructureTag));
        REQUIRE(SerializationValidator::ValidateServerCertificate(Record(0x0a, 60)).IsOk());
    }
    SECTION("Input above the ceiling") {
        const std::vector<uint8_t> huge(LimitConstants::MAX_INPUT_SIZE + 1, 0x0a);
        REQUIRE(RejectedFor(SerializationValidator::ValidateSessionRecord(huge), ValidationReason::TooLong));
    }
    SECTION("Empty input") {
        REQUIRE(RejectedFor(SerializationValidator::ValidateSenderKeyRecord({}), ValidationReason::EmptyInput));
    }
}

TEST_CASE("SerializationValidator - Messages", "[validation]") {
    SECTION("Versions two through four are accepted") {
        for (const uint8_t version : {uint8_t{2}, uint8_t{3}, uint8_t{4}}) {
            const auto message = Record(static_cast<uint8_t>((version << 4) | version), 20);
            REQUIRE(SerializationValidator::ValidateSignalMessage(message).IsOk());
            REQUIRE(SerializationValidator::ValidateSenderKeyMessage(message).IsOk());
        }
    }
    SECTION("Other versions are rejected") {
        REQUIRE(RejectedFor(SerializationValidator::ValidateSignalMessage(Record(0x11, 20)), ValidationReason::InvalidVersion));
        REQUIRE(RejectedFor(SerializationValidator::ValidateSenderKeyDistributionMessage(Record(0x53, 20)), ValidationReason::InvalidVersion));
    }
    SECTION("Short messages fail on length first") {
        REQUIRE(RejectedFor(SerializationValidator::ValidateSenderKeyMessage(Record(0x33, 9)), ValidationReason::TooShort));
    }
    SECTION("Decryption error wire type") {
        REQUIRE(SerializationValidator::ValidateDecryptionErrorMessage(Record(0x0a, 20)).IsOk());
        REQUIRE(RejectedFor(SerializationValidator::ValidateDecryptionErrorMessage(Record(0x0e, 20)), ValidationReason::InvalidWireType));
    }
}

TEST_CASE("SerializationValidator - Enforce", "[validation]") {
    const auto lifted = validation::Enforce(
        SerializationValidator::ValidatePrivateKey({}), "PrivateKey.Deserialize");
    REQUIRE(lifted.IsErr());
    REQUIRE(lifted.UnwrapErr().type == SigilFailureType::InvalidArgument);
    REQUIRE(lifted.UnwrapErr().validation_reason == ValidationReason::EmptyInput);
    REQUIRE(lifted.UnwrapErr().context == "PrivateKey.Deserialize");
}
