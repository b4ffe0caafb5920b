#pragma once

#include "curve25519.hpp"
#include "live_objects.hpp"
#include "secure_memory_handle.hpp"

#include "sigil/c_api/sgl_ffi.h"
#include "sigil/storage.pb.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sigil::engine {

using DistributionId = std::array<uint8_t, 16>;

struct ServerCertificateData {
    std::vector<uint8_t> serialized;
    std::vector<uint8_t> certificate;
    std::vector<uint8_t> signature;
    uint32_t key_id = 0;
    Curve25519PublicBytes key{};
};

}

// Definitions of the opaque types declared in sgl_ffi.h.

struct SglFfiError : sigil::engine::Tracked {
    SglErrorCode code;
    std::string message;
    SglFfiError(SglErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

struct SglPublicKey : sigil::engine::Tracked {
    sigil::engine::Curve25519PublicBytes key{};
};

struct SglPrivateKey : sigil::engine::Tracked {
    sigil::engine::SecureMemoryHandle key;
};

struct SglKyberPublicKey : sigil::engine::Tracked {
    std::vector<uint8_t> key;
};

struct SglKyberSecretKey : sigil::engine::Tracked {
    sigil::engine::SecureMemoryHandle key;
};

struct SglKyberKeyPair : sigil::engine::Tracked {
    std::vector<uint8_t> public_key;
    sigil::engine::SecureMemoryHandle secret_key;
};

struct SglPreKeyRecord : sigil::engine::Tracked {
    uint32_t id = 0;
    sigil::engine::Curve25519PublicBytes public_key{};
    sigil::engine::SecureMemoryHandle private_key;
};

struct SglSignedPreKeyRecord : sigil::engine::Tracked {
    uint32_t id = 0;
    uint64_t timestamp = 0;
    sigil::engine::Curve25519PublicBytes public_key{};
    sigil::engine::SecureMemoryHandle private_key;
    std::vector<uint8_t> signature;
};

struct SglKyberPreKeyRecord : sigil::engine::Tracked {
    uint32_t id = 0;
    uint64_t timestamp = 0;
    std::vector<uint8_t> public_key;
    sigil::engine::SecureMemoryHandle secret_key;
    std::vector<uint8_t> signature;
};

struct SglPreKeyBundle : sigil::engine::Tracked {
    uint32_t registration_id = 0;
    uint32_t device_id = 0;
    std::optional<uint32_t> pre_key_id;
    std::optional<sigil::engine::Curve25519PublicBytes> pre_key;
    uint32_t signed_pre_key_id = 0;
    sigil::engine::Curve25519PublicBytes signed_pre_key{};
    std::vector<uint8_t> signed_pre_key_signature;
    sigil::engine::Curve25519PublicBytes identity_key{};
    uint32_t kyber_pre_key_id = 0;
    std::vector<uint8_t> kyber_pre_key;
    std::vector<uint8_t> kyber_pre_key_signature;
};

struct SglSessionRecord : sigil::engine::Tracked {
    sigil::proto::storage::RecordStructure record;
};

struct SglSenderKeyRecord : sigil::engine::Tracked {
    sigil::proto::storage::SenderKeyRecordStructure record;
};

struct SglSenderKeyMessage : sigil::engine::Tracked {
    sigil::engine::DistributionId distribution_id{};
    uint32_t chain_id = 0;
    uint32_t iteration = 0;
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> serialized;
};

struct SglSenderKeyDistributionMessage : sigil::engine::Tracked {
    sigil::engine::DistributionId distribution_id{};
    uint32_t chain_id = 0;
    uint32_t iteration = 0;
    std::vector<uint8_t> chain_key;
    sigil::engine::Curve25519PublicBytes signing_key{};
    std::vector<uint8_t> serialized;
};

struct SglServerCertificate : sigil::engine::Tracked {
    sigil::engine::ServerCertificateData data;
};

struct SglSenderCertificate : sigil::engine::Tracked {
    std::vector<uint8_t> serialized;
    std::vector<uint8_t> certificate;
    std::vector<uint8_t> signature;
    std::string sender_uuid;
    std::optional<std::string> sender_e164;
    uint32_t device_id = 0;
    uint64_t expiration = 0;
    sigil::engine::Curve25519PublicBytes key{};
    sigil::engine::ServerCertificateData signer;
};

struct SglSignalMessage : sigil::engine::Tracked {
    uint8_t message_version = 0;
    sigil::engine::Curve25519PublicBytes sender_ratchet_key{};
    uint32_t counter = 0;
    uint32_t previous_counter = 0;
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> pq_ratchet;
    std::vector<uint8_t> serialized;
};

struct SglDecryptionErrorMessage : sigil::engine::Tracked {
    std::optional<sigil::engine::Curve25519PublicBytes> ratchet_key;
    uint64_t timestamp = 0;
    uint32_t device_id = 0;
    std::vector<uint8_t> serialized;
};

struct SglFingerprint : sigil::engine::Tracked {
    std::string display;
    std::vector<uint8_t> scannable;
};

struct SglAes256GcmCipher : sigil::engine::Tracked {
    sigil::engine::SecureMemoryHandle key;
};
