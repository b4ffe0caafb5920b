#include "sigil/validation/serialization_validator.hpp"
#include "sigil/core/format.hpp"
#include "sigil/debug/lifecycle_log.hpp"

#include <algorithm>

namespace sigil::protocol::validation {

namespace {

using Point = std::array<uint8_t, KeyConstants::CURVE_25519_KEY_SIZE>;

constexpr std::array<Point, SerializationValidator::LOW_ORDER_POINT_COUNT> kLowOrderPoints = {{
    // 0 (order 4)
    {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
     0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
     0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
     0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
    // 1 (order 1)
    {0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
     0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
     0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
     0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
    // order 8
    {0xe0, 0xeb, 0x7a, 0x7c, 0x3b, 0x41, 0xb8, 0xae,
     0x16, 0x56, 0xe3, 0xfa, 0xf1, 0x9f, 0xc4, 0x6a,
     0xda, 0x09, 0x8d, 0xeb, 0x9c, 0x32, 0xb1, 0xfd,
     0x86, 0x62, 0x05, 0x16, 0x5f, 0x49, 0xb8, 0x00},
    // order 8
    {0x5f, 0x9c, 0x95, 0xbc, 0xa3, 0x50, 0x8c, 0x24,
     0xb1, 0xd0, 0xb1, 0x55, 0x9c, 0x83, 0xef, 0x5b,
     0x04, 0x44, 0x5c, 0xc4, 0x58, 0x1c, 0x8e, 0x86,
     0xd8, 0x22, 0x4e, 0xdd, 0xd0, 0x9f, 0x11, 0x57},
    // p - 1 (order 2)
    {0xec, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
    // p, non-canonical 0
    {0xed, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
    // p + 1, non-canonical 1
    {0xee, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
}};

constexpr std::array<uint8_t, 2> kPreKeyRecordTags = {
    RecordConstants::TAG_FIELD_1_VARINT, RecordConstants::TAG_FIELD_2_BYTES};

constexpr std::array<uint8_t, 3> kSignedRecordTags = {
    RecordConstants::TAG_FIELD_1_VARINT,
    RecordConstants::TAG_FIELD_2_VARINT,
    RecordConstants::TAG_FIELD_2_BYTES};

constexpr std::array<uint8_t, 2> kSessionRecordTags = {
    RecordConstants::TAG_FIELD_1_BYTES, RecordConstants::TAG_FIELD_2_BYTES};

constexpr std::array<uint8_t, 1> kLengthDelimitedFirstField = {
    RecordConstants::TAG_FIELD_1_BYTES};

}

const std::array<std::array<uint8_t, KeyConstants::CURVE_25519_KEY_SIZE>, SerializationValidator::LOW_ORDER_POINT_COUNT>&
SerializationValidator::LowOrderPoints() noexcept {
    return kLowOrderPoints;
}

bool SerializationValidator::IsLowOrderPoint(std::span<const uint8_t> key_bytes) noexcept {
    if (key_bytes.size() != KeyConstants::CURVE_25519_KEY_SIZE) {
        return false;
    }
    return std::any_of(kLowOrderPoints.begin(), kLowOrderPoints.end(), [key_bytes](const Point& blocked) {
        return std::equal(blocked.begin(), blocked.end(), key_bytes.begin());
    });
}

SerializationValidator::Check SerializationValidator::Reject(
    const ValidationReason reason,
    const std::string_view type_name,
    std::string message,
    const size_t length) {
    SIGIL_LOG_VALIDATION(type_name, ToString(reason), length);
    (void)length;
    return Check::Err(ValidationFailure(
        reason, compat::format("{}: {}", type_name, message)));
}

SerializationValidator::Check SerializationValidator::ValidateExactLength(
    std::span<const uint8_t> data,
    const size_t expected_length,
    const std::string_view type_name) {
    if (data.empty()) {
        return Reject(ValidationReason::EmptyInput, type_name, "cannot be empty", 0);
    }
    if (data.size() != expected_length) {
        return Reject(ValidationReason::InvalidLength, type_name,
            compat::format("expected {} bytes, got {}", expected_length, data.size()),
            data.size());
    }
    return Check::Ok(unit);
}

SerializationValidator::Check SerializationValidator::ValidateLength(
    std::span<const uint8_t> data,
    const size_t min_length,
    const std::string_view type_name) {
    if (data.empty()) {
        return Reject(ValidationReason::EmptyInput, type_name, "cannot be empty", 0);
    }
    if (data.size() > LimitConstants::MAX_INPUT_SIZE) {
        return Reject(ValidationReason::TooLong, type_name,
            compat::format("at most {} bytes allowed, got {}", LimitConstants::MAX_INPUT_SIZE, data.size()),
            data.size());
    }
    if (data.size() < min_length) {
        return Reject(ValidationReason::TooShort, type_name,
            compat::format("expected at least {} bytes, got {}", min_length, data.size()),
            data.size());
    }
    return Check::Ok(unit);
}

SerializationValidator::Check SerializationValidator::ValidateLeadingTag(
    std::span<const uint8_t> data,
    std::span<const uint8_t> allowed_tags,
    const std::string_view type_name) {
    const uint8_t tag = data[0];
    if (std::find(allowed_tags.begin(), allowed_tags.end(), tag) == allowed_tags.end()) {
        return Reject(ValidationReason::InvalidStructureTag, type_name,
            compat::format("unexpected leading protobuf tag 0x{:02x}", tag),
            data.size());
    }
    return Check::Ok(unit);
}

SerializationValidator::Check SerializationValidator::ValidateMessageVersion(
    std::span<const uint8_t> data,
    const std::string_view type_name) {
    if (auto length = ValidateLength(data, RecordConstants::MESSAGE_MIN_SIZE, type_name); length.IsErr()) {
        return length;
    }
    const uint8_t version = (data[0] >> 4) & 0x0f;
    if (version < RecordConstants::MIN_MESSAGE_VERSION || version > RecordConstants::MAX_MESSAGE_VERSION) {
        return Reject(ValidationReason::InvalidVersion, type_name,
            compat::format("message version must be {}-{}, got {}",
                RecordConstants::MIN_MESSAGE_VERSION, RecordConstants::MAX_MESSAGE_VERSION, version),
            data.size());
    }
    return Check::Ok(unit);
}

SerializationValidator::Check SerializationValidator::ValidatePublicKey(std::span<const uint8_t> data) {
    if (auto length = ValidateExactLength(data, KeyConstants::PUBLIC_KEY_SIZE, "PublicKey"); length.IsErr()) {
        return length;
    }
    if (data[0] != KeyConstants::CURVE_25519_KEY_TYPE) {
        return Reject(ValidationReason::InvalidKeyType, "PublicKey",
            compat::format("expected key type 0x{:02x}, got 0x{:02x}",
                KeyConstants::CURVE_25519_KEY_TYPE, data[0]),
            data.size());
    }
    if (IsLowOrderPoint(data.subspan(1))) {
        return Reject(ValidationReason::LowOrderPoint, "PublicKey",
            "low-order point", data.size());
    }
    return Check::Ok(unit);
}

SerializationValidator::Check SerializationValidator::ValidatePrivateKey(std::span<const uint8_t> data) {
    return ValidateExactLength(data, KeyConstants::PRIVATE_KEY_SIZE, "PrivateKey");
}

SerializationValidator::Check SerializationValidator::ValidateIdentityKeyPair(std::span<const uint8_t> data) {
    if (auto length = ValidateExactLength(data, KeyConstants::IDENTITY_KEY_PAIR_SIZE, "IdentityKeyPair"); length.IsErr()) {
        return length;
    }
    if (data[0] != KeyConstants::IDENTITY_KEY_PAIR_TAG) {
        return Reject(ValidationReason::InvalidKeyType, "IdentityKeyPair",
            compat::format("expected leading byte 0x{:02x}, got 0x{:02x}",
                KeyConstants::IDENTITY_KEY_PAIR_TAG, data[0]),
            data.size());
    }
    return Check::Ok(unit);
}

SerializationValidator::Check SerializationValidator::ValidateKyberPublicKey(std::span<const uint8_t> data) {
    if (auto length = ValidateExactLength(data, KeyConstants::SERIALIZED_KYBER_PUBLIC_KEY_SIZE, "KyberPublicKey"); length.IsErr()) {
        return length;
    }
    if (data[0] != KeyConstants::KYBER_1024_KEY_TYPE) {
        return Reject(ValidationReason::InvalidKeyType, "KyberPublicKey",
            compat::format("expected key type 0x{:02x}, got 0x{:02x}",
                KeyConstants::KYBER_1024_KEY_TYPE, data[0]),
            data.size());
    }
    return Check::Ok(unit);
}

SerializationValidator::Check SerializationValidator::ValidateKyberSecretKey(std::span<const uint8_t> data) {
    return ValidateExactLength(data, KeyConstants::SERIALIZED_KYBER_SECRET_KEY_SIZE, "KyberSecretKey");
}

SerializationValidator::Check SerializationValidator::ValidatePreKeyRecord(std::span<const uint8_t> data) {
    if (auto length = ValidateLength(data, RecordConstants::PRE_KEY_RECORD_MIN_SIZE, "PreKeyRecord"); length.IsErr()) {
        return length;
    }
    return ValidateLeadingTag(data, kPreKeyRecordTags, "PreKeyRecord");
}

SerializationValidator::Check SerializationValidator::ValidateSignedPreKeyRecord(std::span<const uint8_t> data) {
    if (auto length = ValidateLength(data, RecordConstants::SIGNED_PRE_KEY_RECORD_MIN_SIZE, "SignedPreKeyRecord"); length.IsErr()) {
        return length;
    }
    return ValidateLeadingTag(data, kSignedRecordTags, "SignedPreKeyRecord");
}

SerializationValidator::Check SerializationValidator::ValidateKyberPreKeyRecord(std::span<const uint8_t> data) {
    if (auto length = ValidateLength(data, RecordConstants::KYBER_PRE_KEY_RECORD_MIN_SIZE, "KyberPreKeyRecord"); length.IsErr()) {
        return length;
    }
    return ValidateLeadingTag(data, kSignedRecordTags, "KyberPreKeyRecord");
}

SerializationValidator::Check SerializationValidator::ValidateSessionRecord(std::span<const uint8_t> data) {
    if (auto length = ValidateLength(data, RecordConstants::SESSION_RECORD_MIN_SIZE, "SessionRecord"); length.IsErr()) {
        return length;
    }
    return ValidateLeadingTag(data, kSessionRecordTags, "SessionRecord");
}

SerializationValidator::Check SerializationValidator::ValidateSenderKeyRecord(std::span<const uint8_t> data) {
    if (auto length = ValidateLength(data, RecordConstants::SENDER_KEY_RECORD_MIN_SIZE, "SenderKeyRecord"); length.IsErr()) {
        return length;
    }
    return ValidateLeadingTag(data, kLengthDelimitedFirstField, "SenderKeyRecord");
}

SerializationValidator::Check SerializationValidator::ValidateSenderCertificate(std::span<const uint8_t> data) {
    if (auto length = ValidateLength(data, RecordConstants::CERTIFICATE_MIN_SIZE, "SenderCertificate"); length.IsErr()) {
        return length;
    }
    return ValidateLeadingTag(data, kLengthDelimitedFirstField, "SenderCertificate");
}

SerializationValidator::Check SerializationValidator::ValidateServerCertificate(std::span<const uint8_t> data) {
    if (auto length = ValidateLength(data, RecordConstants::CERTIFICATE_MIN_SIZE, "ServerCertificate"); length.IsErr()) {
        return length;
    }
    return ValidateLeadingTag(data, kLengthDelimitedFirstField, "ServerCertificate");
}

SerializationValidator::Check SerializationValidator::ValidateSignalMessage(std::span<const uint8_t> data) {
    return ValidateMessageVersion(data, "SignalMessage");
}

SerializationValidator::Check SerializationValidator::ValidateSenderKeyMessage(std::span<const uint8_t> data) {
    return ValidateMessageVersion(data, "SenderKeyMessage");
}

SerializationValidator::Check SerializationValidator::ValidateSenderKeyDistributionMessage(std::span<const uint8_t> data) {
    return ValidateMessageVersion(data, "SenderKeyDistributionMessage");
}

SerializationValidator::Check SerializationValidator::ValidateDecryptionErrorMessage(std::span<const uint8_t> data) {
    if (auto length = ValidateLength(data, RecordConstants::MESSAGE_MIN_SIZE, "DecryptionErrorMessage"); length.IsErr()) {
        return length;
    }
    const uint8_t wire_type = data[0] & 0x07;
    if (wire_type > RecordConstants::MAX_WIRE_TYPE) {
        return Reject(ValidationReason::InvalidWireType, "DecryptionErrorMessage",
            compat::format("protobuf wire type {} is not valid", wire_type),
            data.size());
    }
    return Check::Ok(unit);
}

}
