#pragma once

#include "engine_failure.hpp"
#include "native_objects.hpp"

#include "sigil/storage.pb.h"

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace sigil::engine {

using proto::storage::SenderKeyRecordStructure;
using proto::storage::SenderKeyStateStructure;

/**
 * @brief Wire codec for sender key messages.
 *
 * A SenderKeyMessage is version || protobuf || XEdDSA signature, the
 * signature covering everything before it. A distribution message is
 * version || protobuf. The version byte carries the message version in both
 * nibbles.
 */
class SenderKeyMessages {
public:
    static Result<std::unique_ptr<SglSenderKeyMessage>, EngineFailure> Create(
        const DistributionId& distribution_id,
        uint32_t chain_id,
        uint32_t iteration,
        std::span<const uint8_t> ciphertext,
        const SecureMemoryHandle& signing_key);

    static Result<std::unique_ptr<SglSenderKeyMessage>, EngineFailure> Parse(std::span<const uint8_t> data);

    static Result<bool, EngineFailure> VerifySignature(
        const SglSenderKeyMessage& message,
        const Curve25519PublicBytes& signing_key);

    static Result<std::unique_ptr<SglSenderKeyDistributionMessage>, EngineFailure> CreateDistribution(
        const DistributionId& distribution_id,
        uint32_t chain_id,
        uint32_t iteration,
        std::span<const uint8_t> chain_key,
        const Curve25519PublicBytes& signing_key);

    static Result<std::unique_ptr<SglSenderKeyDistributionMessage>, EngineFailure> ParseDistribution(
        std::span<const uint8_t> data);
};

/**
 * @brief Sender key chain ratchet over a SenderKeyRecordStructure.
 *
 * Chain step: message seed = HMAC(chain key, 0x01), next chain key =
 * HMAC(chain key, 0x02). The seed expands through HKDF("WhisperGroup") into
 * a 12-byte nonce followed by a 32-byte AES-256-GCM key. A record holds at
 * most five states, newest first; a state caches at most 2000 skipped
 * message seeds.
 *
 * Decrypt works on a copy of the matching state and writes it back only
 * after the message authenticates, so a rejected message leaves the record
 * unchanged.
 */
class GroupCipher {
public:
    static Result<std::unique_ptr<SglSenderKeyDistributionMessage>, EngineFailure> CreateDistributionMessage(
        SenderKeyRecordStructure& record,
        const DistributionId& distribution_id);

    static Result<Unit, EngineFailure> ProcessDistributionMessage(
        SenderKeyRecordStructure& record,
        const SglSenderKeyDistributionMessage& message);

    static Result<std::vector<uint8_t>, EngineFailure> Encrypt(
        SenderKeyRecordStructure& record,
        const DistributionId& distribution_id,
        std::span<const uint8_t> plaintext);

    static Result<std::vector<uint8_t>, EngineFailure> Decrypt(
        SenderKeyRecordStructure& record,
        std::span<const uint8_t> ciphertext);

private:
    struct MessageKeys {
        uint32_t iteration = 0;
        std::vector<uint8_t> nonce;
        std::vector<uint8_t> cipher_key;
        MessageKeys() = default;
        MessageKeys(MessageKeys&&) noexcept = default;
        MessageKeys& operator=(MessageKeys&&) noexcept = default;
        ~MessageKeys();
    };

    static Result<MessageKeys, EngineFailure> DeriveMessageKeys(uint32_t iteration, std::span<const uint8_t> seed);

    static std::vector<uint8_t> MessageSeed(std::span<const uint8_t> chain_key);

    static std::vector<uint8_t> NextChainKey(std::span<const uint8_t> chain_key);

    static Result<MessageKeys, EngineFailure> MessageKeysFor(SenderKeyStateStructure& state, uint32_t iteration);

    static void AddState(
        SenderKeyRecordStructure& record,
        uint32_t chain_id,
        uint32_t iteration,
        std::span<const uint8_t> chain_key,
        const Curve25519PublicBytes& signing_public,
        const SecureMemoryHandle* signing_private);
};

}
