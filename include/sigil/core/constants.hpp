#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace sigil::protocol {
struct KeyConstants {
    static constexpr uint8_t CURVE_25519_KEY_TYPE = 0x05;
    static constexpr size_t CURVE_25519_KEY_SIZE = 32;
    static constexpr size_t PUBLIC_KEY_SIZE = 33;
    static constexpr size_t PRIVATE_KEY_SIZE = 32;
    static constexpr size_t SIGNATURE_SIZE = 64;
    static constexpr size_t AGREEMENT_SIZE = 32;
    static constexpr uint8_t IDENTITY_KEY_PAIR_TAG = 0x0a;
    static constexpr uint8_t IDENTITY_KEY_PAIR_PRIVATE_TAG = 0x12;
    static constexpr size_t IDENTITY_KEY_PAIR_SIZE = 69;
    static constexpr uint8_t KYBER_1024_KEY_TYPE = 0x08;
    static constexpr size_t KYBER_1024_PUBLIC_KEY_SIZE = 1568;
    static constexpr size_t KYBER_1024_SECRET_KEY_SIZE = 3168;
    static constexpr size_t KYBER_1024_CIPHERTEXT_SIZE = 1568;
    static constexpr size_t KYBER_1024_SHARED_SECRET_SIZE = 32;
    static constexpr size_t SERIALIZED_KYBER_PUBLIC_KEY_SIZE = KYBER_1024_PUBLIC_KEY_SIZE + 1;
    static constexpr size_t SERIALIZED_KYBER_SECRET_KEY_SIZE = KYBER_1024_SECRET_KEY_SIZE + 1;
    static constexpr size_t ALTERNATE_IDENTITY_PADDING_SIZE = 32;
    static constexpr std::string_view ALTERNATE_IDENTITY_CONTEXT = "Signal_PNI_Signature";
};
struct RecordConstants {
    static constexpr size_t PRE_KEY_RECORD_MIN_SIZE = 69;
    static constexpr size_t SIGNED_PRE_KEY_RECORD_MIN_SIZE = 135;
    static constexpr size_t KYBER_PRE_KEY_RECORD_MIN_SIZE = 100;
    static constexpr size_t SESSION_RECORD_MIN_SIZE = 50;
    static constexpr size_t SENDER_KEY_RECORD_MIN_SIZE = 20;
    static constexpr size_t CERTIFICATE_MIN_SIZE = 10;
    static constexpr size_t MESSAGE_MIN_SIZE = 10;
    static constexpr uint8_t TAG_FIELD_1_VARINT = 0x08;
    static constexpr uint8_t TAG_FIELD_1_BYTES = 0x0a;
    static constexpr uint8_t TAG_FIELD_2_VARINT = 0x10;
    static constexpr uint8_t TAG_FIELD_2_BYTES = 0x12;
    static constexpr uint8_t MIN_MESSAGE_VERSION = 2;
    static constexpr uint8_t MAX_MESSAGE_VERSION = 4;
    static constexpr uint8_t MAX_WIRE_TYPE = 5;
};
struct LimitConstants {
    static constexpr size_t MAX_INPUT_SIZE = 10 * 1024 * 1024;
    static constexpr size_t CONSTRAINED_INPUT_SIZE = 64 * 1024;
};
struct CipherConstants {
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t HKDF_HASH_SIZE = 32;
    static constexpr size_t HKDF_MAX_OUTPUT_SIZE = 255 * HKDF_HASH_SIZE;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct GroupConstants {
    static constexpr size_t DISTRIBUTION_ID_SIZE = 16;
    static constexpr uint8_t SENDER_KEY_MESSAGE_VERSION = 3;
    static constexpr size_t MAX_SENDER_KEY_STATES = 5;
    static constexpr size_t MAX_MESSAGE_KEYS = 2000;
    static constexpr uint32_t MAX_FORWARD_JUMPS = 25000;
    static constexpr size_t CHAIN_KEY_SIZE = 32;
    static constexpr uint8_t MESSAGE_KEY_SEED = 0x01;
    static constexpr uint8_t CHAIN_KEY_SEED = 0x02;
    static constexpr std::string_view MESSAGE_KEYS_INFO = "WhisperGroup";
    static constexpr uint64_t OPERATION_COUNTER_LIMIT = 0x7FFFFFFFFFFFFFFULL;
};
struct MessageConstants {
    static constexpr uint8_t CIPHERTEXT_MESSAGE_CURRENT_VERSION = 4;
    static constexpr uint8_t CIPHERTEXT_MESSAGE_PRE_KYBER_VERSION = 3;
    static constexpr size_t MAC_SIZE = 8;
    static constexpr size_t MAC_KEY_SIZE = 32;
    static constexpr uint8_t PADDING_BOUNDARY_BYTE = 0x80;
};
struct FingerprintConstants {
    static constexpr uint32_t DEFAULT_ITERATIONS = 5200;
    static constexpr uint32_t DEFAULT_VERSION = 2;
    static constexpr uint32_t MIN_ITERATIONS = 2;
    static constexpr uint32_t MAX_ITERATIONS = 1000000;
    static constexpr size_t DISPLAY_CHUNKS = 6;
    static constexpr size_t DISPLAY_CHUNK_BYTES = 5;
    static constexpr uint64_t DISPLAY_CHUNK_MODULUS = 100000;
    static constexpr size_t DISPLAY_STRING_LENGTH = 60;
    static constexpr size_t SCANNABLE_CONTENT_SIZE = 32;
};
struct SessionConstants {
    static constexpr size_t ARCHIVED_STATES_MAX_LENGTH = 40;
    static constexpr uint64_t MAX_UNACKNOWLEDGED_SESSION_AGE_MS = 30ULL * 24 * 60 * 60 * 1000;
};
struct CertificateConstants {
    static constexpr std::array<uint32_t, 1> REVOKED_SERVER_KEY_IDS = {0xDEADC357};
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view OQS_KEM_UNAVAILABLE = "Kyber-1024 is not enabled in liboqs";
    static constexpr std::string_view NULL_OUTPUT = "Output pointer is null";
    static constexpr std::string_view NULL_HANDLE = "Object pointer is null";
    static constexpr std::string_view NULL_BUFFER = "Buffer base is null but length is non-zero";
    static constexpr std::string_view ALLOCATION_FAILED = "Failed to allocate output buffer";
    static constexpr std::string_view NATIVE_RETURNED_NULL = "Native call reported success but returned a null pointer";
};
}
