#include "group_cipher.hpp"
#include "aes_gcm.hpp"
#include "curve25519.hpp"
#include "hkdf.hpp"
#include "sodium_interop.hpp"

#include "sigil/core/constants.hpp"
#include "sigil/core/format.hpp"
#include "sigil/wire.pb.h"

#include <algorithm>
#include <limits>
#include <optional>
#include <string>

namespace sigil::engine {

using protocol::CipherConstants;
using protocol::GroupConstants;
using protocol::KeyConstants;

namespace {
    constexpr uint8_t VERSION_BYTE =
        (GroupConstants::SENDER_KEY_MESSAGE_VERSION << 4) | GroupConstants::SENDER_KEY_MESSAGE_VERSION;

    std::span<const uint8_t> AsBytes(const std::string& value) {
        return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
    }

    std::string ToProto(std::span<const uint8_t> value) {
        return {value.begin(), value.end()};
    }

    void WipeString(std::string& value) {
        if (!value.empty()) {
            SodiumInterop::SecureWipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(value.data()), value.size()));
        }
    }

    Result<Unit, EngineFailure> CheckVersion(const uint8_t version_byte) {
        const uint8_t version = version_byte >> 4;
        if (version < GroupConstants::SENDER_KEY_MESSAGE_VERSION) {
            return Result<Unit, EngineFailure>::Err(EngineFailure::InvalidMessage(
                compat::format("Legacy sender key message version {}", version)));
        }
        if (version > GroupConstants::SENDER_KEY_MESSAGE_VERSION) {
            return Result<Unit, EngineFailure>::Err(EngineFailure::InvalidMessage(
                compat::format("Unrecognized sender key message version {}", version)));
        }
        return Result<Unit, EngineFailure>::Ok(unit);
    }

    Result<DistributionId, EngineFailure> ParseDistributionId(const std::string& bytes) {
        if (bytes.size() != GroupConstants::DISTRIBUTION_ID_SIZE) {
            return Result<DistributionId, EngineFailure>::Err(EngineFailure::InvalidMessage(
                compat::format("Distribution id must be {} bytes, got {}",
                    GroupConstants::DISTRIBUTION_ID_SIZE, bytes.size())));
        }
        DistributionId id{};
        std::copy(bytes.begin(), bytes.end(), id.begin());
        return Result<DistributionId, EngineFailure>::Ok(id);
    }
}

// ============================================================================
// SenderKeyMessages
// ============================================================================

Result<std::unique_ptr<SglSenderKeyMessage>, EngineFailure> SenderKeyMessages::Create(
    const DistributionId& distribution_id,
    const uint32_t chain_id,
    const uint32_t iteration,
    std::span<const uint8_t> ciphertext,
    const SecureMemoryHandle& signing_key) {
    using ResultType = Result<std::unique_ptr<SglSenderKeyMessage>, EngineFailure>;

    proto::wire::SenderKeyMessage body;
    body.set_distribution_uuid(ToProto(distribution_id));
    body.set_chain_id(chain_id);
    body.set_iteration(iteration);
    body.set_ciphertext(ToProto(ciphertext));
    std::string encoded_body;
    if (!body.SerializeToString(&encoded_body)) {
        return ResultType::Err(EngineFailure::Protobuf("Failed to encode sender key message"));
    }

    auto message = std::make_unique<SglSenderKeyMessage>();
    message->serialized.reserve(1 + encoded_body.size() + KeyConstants::SIGNATURE_SIZE);
    message->serialized.push_back(VERSION_BYTE);
    message->serialized.insert(message->serialized.end(), encoded_body.begin(), encoded_body.end());
    SGL_TRY_ASSIGN(signature, Curve25519::Sign(signing_key, message->serialized));
    message->serialized.insert(message->serialized.end(), signature.begin(), signature.end());

    message->distribution_id = distribution_id;
    message->chain_id = chain_id;
    message->iteration = iteration;
    message->ciphertext.assign(ciphertext.begin(), ciphertext.end());
    return ResultType::Ok(std::move(message));
}

Result<std::unique_ptr<SglSenderKeyMessage>, EngineFailure> SenderKeyMessages::Parse(std::span<const uint8_t> data) {
    using ResultType = Result<std::unique_ptr<SglSenderKeyMessage>, EngineFailure>;

    if (data.size() < 1 + KeyConstants::SIGNATURE_SIZE) {
        return ResultType::Err(EngineFailure::InvalidMessage(
            compat::format("Sender key message too short: {} bytes", data.size())));
    }
    SGL_TRY(CheckVersion(data[0]));

    const auto body_bytes = data.subspan(1, data.size() - 1 - KeyConstants::SIGNATURE_SIZE);
    proto::wire::SenderKeyMessage body;
    if (!body.ParseFromArray(body_bytes.data(), static_cast<int>(body_bytes.size()))) {
        return ResultType::Err(EngineFailure::Protobuf("Failed to parse sender key message"));
    }
    SGL_TRY_ASSIGN(distribution_id, ParseDistributionId(body.distribution_uuid()));

    auto message = std::make_unique<SglSenderKeyMessage>();
    message->distribution_id = distribution_id;
    message->chain_id = body.chain_id();
    message->iteration = body.iteration();
    message->ciphertext = std::vector<uint8_t>(body.ciphertext().begin(), body.ciphertext().end());
    message->serialized.assign(data.begin(), data.end());
    return ResultType::Ok(std::move(message));
}

Result<bool, EngineFailure> SenderKeyMessages::VerifySignature(
    const SglSenderKeyMessage& message,
    const Curve25519PublicBytes& signing_key) {
    const std::span<const uint8_t> serialized(message.serialized);
    if (serialized.size() < 1 + KeyConstants::SIGNATURE_SIZE) {
        return Result<bool, EngineFailure>::Ok(false);
    }
    const size_t signed_length = serialized.size() - KeyConstants::SIGNATURE_SIZE;
    return Curve25519::Verify(
        signing_key,
        serialized.first(signed_length),
        serialized.subspan(signed_length));
}

Result<std::unique_ptr<SglSenderKeyDistributionMessage>, EngineFailure> SenderKeyMessages::CreateDistribution(
    const DistributionId& distribution_id,
    const uint32_t chain_id,
    const uint32_t iteration,
    std::span<const uint8_t> chain_key,
    const Curve25519PublicBytes& signing_key) {
    using ResultType = Result<std::unique_ptr<SglSenderKeyDistributionMessage>, EngineFailure>;

    if (chain_key.size() != GroupConstants::CHAIN_KEY_SIZE) {
        return ResultType::Err(EngineFailure::InvalidArgument(
            compat::format("Chain key must be {} bytes, got {}", GroupConstants::CHAIN_KEY_SIZE, chain_key.size())));
    }

    proto::wire::SenderKeyDistributionMessage body;
    body.set_distribution_uuid(ToProto(distribution_id));
    body.set_chain_id(chain_id);
    body.set_iteration(iteration);
    body.set_chain_key(ToProto(chain_key));
    body.set_signing_key(ToProto(Curve25519::SerializePublicKey(signing_key)));
    std::string encoded_body;
    const bool encoded = body.SerializeToString(&encoded_body);
    WipeString(*body.mutable_chain_key());
    if (!encoded) {
        return ResultType::Err(EngineFailure::Protobuf("Failed to encode sender key distribution message"));
    }

    auto message = std::make_unique<SglSenderKeyDistributionMessage>();
    message->serialized.reserve(1 + encoded_body.size());
    message->serialized.push_back(VERSION_BYTE);
    message->serialized.insert(message->serialized.end(), encoded_body.begin(), encoded_body.end());
    WipeString(encoded_body);

    message->distribution_id = distribution_id;
    message->chain_id = chain_id;
    message->iteration = iteration;
    message->chain_key.assign(chain_key.begin(), chain_key.end());
    message->signing_key = signing_key;
    return ResultType::Ok(std::move(message));
}

Result<std::unique_ptr<SglSenderKeyDistributionMessage>, EngineFailure> SenderKeyMessages::ParseDistribution(
    std::span<const uint8_t> data) {
    using ResultType = Result<std::unique_ptr<SglSenderKeyDistributionMessage>, EngineFailure>;

    if (data.empty()) {
        return ResultType::Err(EngineFailure::InvalidMessage("Sender key distribution message is empty"));
    }
    SGL_TRY(CheckVersion(data[0]));

    proto::wire::SenderKeyDistributionMessage body;
    if (!body.ParseFromArray(data.data() + 1, static_cast<int>(data.size() - 1))) {
        return ResultType::Err(EngineFailure::Protobuf("Failed to parse sender key distribution message"));
    }
    SGL_TRY_ASSIGN(distribution_id, ParseDistributionId(body.distribution_uuid()));
    if (body.chain_key().size() != GroupConstants::CHAIN_KEY_SIZE) {
        WipeString(*body.mutable_chain_key());
        return ResultType::Err(EngineFailure::InvalidMessage(
            compat::format("Chain key must be {} bytes, got {}", GroupConstants::CHAIN_KEY_SIZE, body.chain_key().size())));
    }
    SGL_TRY_ASSIGN(signing_key, Curve25519::ParsePublicKey(AsBytes(body.signing_key())));

    auto message = std::make_unique<SglSenderKeyDistributionMessage>();
    message->distribution_id = distribution_id;
    message->chain_id = body.chain_id();
    message->iteration = body.iteration();
    message->chain_key.assign(body.chain_key().begin(), body.chain_key().end());
    message->signing_key = signing_key;
    message->serialized.assign(data.begin(), data.end());
    WipeString(*body.mutable_chain_key());
    return ResultType::Ok(std::move(message));
}

// ============================================================================
// GroupCipher
// ============================================================================

GroupCipher::MessageKeys::~MessageKeys() {
    SodiumInterop::SecureWipe(nonce);
    SodiumInterop::SecureWipe(cipher_key);
}

std::vector<uint8_t> GroupCipher::MessageSeed(std::span<const uint8_t> chain_key) {
    const uint8_t input[] = {GroupConstants::MESSAGE_KEY_SEED};
    return SodiumInterop::HmacSha256(chain_key, input);
}

std::vector<uint8_t> GroupCipher::NextChainKey(std::span<const uint8_t> chain_key) {
    const uint8_t input[] = {GroupConstants::CHAIN_KEY_SEED};
    return SodiumInterop::HmacSha256(chain_key, input);
}

Result<GroupCipher::MessageKeys, EngineFailure> GroupCipher::DeriveMessageKeys(
    const uint32_t iteration,
    std::span<const uint8_t> seed) {
    const std::span<const uint8_t> info(
        reinterpret_cast<const uint8_t*>(GroupConstants::MESSAGE_KEYS_INFO.data()),
        GroupConstants::MESSAGE_KEYS_INFO.size());
    SGL_TRY_ASSIGN(derived, Hkdf::DeriveKeyBytes(
        seed, CipherConstants::AES_GCM_NONCE_SIZE + CipherConstants::AES_KEY_SIZE, {}, info));

    MessageKeys keys;
    keys.iteration = iteration;
    keys.nonce.assign(derived.begin(), derived.begin() + CipherConstants::AES_GCM_NONCE_SIZE);
    keys.cipher_key.assign(derived.begin() + CipherConstants::AES_GCM_NONCE_SIZE, derived.end());
    SodiumInterop::SecureWipe(derived);
    return Result<MessageKeys, EngineFailure>::Ok(std::move(keys));
}

Result<GroupCipher::MessageKeys, EngineFailure> GroupCipher::MessageKeysFor(
    SenderKeyStateStructure& state,
    const uint32_t iteration) {
    auto* chain = state.mutable_sender_chain_key();
    if (chain->seed().size() != GroupConstants::CHAIN_KEY_SIZE) {
        return Result<MessageKeys, EngineFailure>::Err(
            EngineFailure::InvalidState("Sender chain key is corrupt"));
    }
    const uint32_t current = chain->iteration();

    if (current > iteration) {
        auto* cached = state.mutable_sender_message_keys();
        for (int i = 0; i < cached->size(); ++i) {
            if (cached->Get(i).iteration() != iteration) {
                continue;
            }
            std::string seed = cached->Get(i).seed();
            cached->DeleteSubrange(i, 1);
            auto keys = DeriveMessageKeys(iteration, AsBytes(seed));
            WipeString(seed);
            return keys;
        }
        return Result<MessageKeys, EngineFailure>::Err(EngineFailure::DuplicatedMessage(
            compat::format("Received message with old counter: {}, {}", current, iteration)));
    }

    if (iteration - current > GroupConstants::MAX_FORWARD_JUMPS) {
        return Result<MessageKeys, EngineFailure>::Err(EngineFailure::InvalidMessage(
            compat::format("Message from too far into the future: {} ahead", iteration - current)));
    }
    if (iteration == std::numeric_limits<uint32_t>::max()) {
        return Result<MessageKeys, EngineFailure>::Err(
            EngineFailure::InvalidMessage("Sender chain iteration overflow"));
    }

    std::vector<uint8_t> chain_key(chain->seed().begin(), chain->seed().end());
    for (uint32_t position = current; position < iteration; ++position) {
        auto seed = MessageSeed(chain_key);
        auto* stored = state.add_sender_message_keys();
        stored->set_iteration(position);
        stored->set_seed(ToProto(seed));
        SodiumInterop::SecureWipe(seed);
        if (static_cast<size_t>(state.sender_message_keys_size()) > GroupConstants::MAX_MESSAGE_KEYS) {
            state.mutable_sender_message_keys()->DeleteSubrange(0, 1);
        }
        auto next = NextChainKey(chain_key);
        SodiumInterop::SecureWipe(chain_key);
        chain_key = std::move(next);
    }

    auto seed = MessageSeed(chain_key);
    auto next = NextChainKey(chain_key);
    chain->set_iteration(iteration + 1);
    chain->set_seed(ToProto(next));
    SodiumInterop::SecureWipe(next);
    SodiumInterop::SecureWipe(chain_key);

    auto keys = DeriveMessageKeys(iteration, seed);
    SodiumInterop::SecureWipe(seed);
    return keys;
}

void GroupCipher::AddState(
    SenderKeyRecordStructure& record,
    const uint32_t chain_id,
    const uint32_t iteration,
    std::span<const uint8_t> chain_key,
    const Curve25519PublicBytes& signing_public,
    const SecureMemoryHandle* signing_private) {
    auto* states = record.mutable_sender_key_states();
    const std::string serialized_public = ToProto(Curve25519::SerializePublicKey(signing_public));

    std::optional<SenderKeyStateStructure> existing;
    for (int i = states->size() - 1; i >= 0; --i) {
        if (states->Get(i).chain_id() != chain_id) {
            continue;
        }
        if (!existing.has_value() && states->Get(i).sender_signing_key().public_key() == serialized_public) {
            existing = states->Get(i);
        }
        states->DeleteSubrange(i, 1);
    }

    SenderKeyStateStructure state;
    if (existing.has_value()) {
        state = std::move(*existing);
    } else {
        state.set_message_version(GroupConstants::SENDER_KEY_MESSAGE_VERSION);
        state.set_chain_id(chain_id);
        state.mutable_sender_chain_key()->set_iteration(iteration);
        state.mutable_sender_chain_key()->set_seed(ToProto(chain_key));
        state.mutable_sender_signing_key()->set_public_key(serialized_public);
        if (signing_private != nullptr) {
            state.mutable_sender_signing_key()->set_private_key(
                signing_private->WithReadAccess([](std::span<const uint8_t> scalar) { return ToProto(scalar); }));
        }
    }

    while (static_cast<size_t>(states->size()) >= GroupConstants::MAX_SENDER_KEY_STATES) {
        states->RemoveLast();
    }
    *states->Add() = std::move(state);
    for (int i = states->size() - 1; i > 0; --i) {
        states->SwapElements(i, i - 1);
    }
}

Result<std::unique_ptr<SglSenderKeyDistributionMessage>, EngineFailure> GroupCipher::CreateDistributionMessage(
    SenderKeyRecordStructure& record,
    const DistributionId& distribution_id) {
    if (record.sender_key_states_size() == 0) {
        const uint32_t chain_id = SodiumInterop::GenerateRandomUInt32() >> 1;
        auto chain_key = SodiumInterop::GetRandomBytes(GroupConstants::CHAIN_KEY_SIZE);
        SGL_TRY_ASSIGN(signing_private, Curve25519::GeneratePrivateKey());
        SGL_TRY_ASSIGN(signing_public, Curve25519::DerivePublicKey(signing_private));
        AddState(record, chain_id, 0, chain_key, signing_public, &signing_private);
        SodiumInterop::SecureWipe(chain_key);
    }

    const auto& state = record.sender_key_states(0);
    SGL_TRY_ASSIGN(state_public, Curve25519::ParsePublicKey(AsBytes(state.sender_signing_key().public_key())));
    return SenderKeyMessages::CreateDistribution(
        distribution_id,
        state.chain_id(),
        state.sender_chain_key().iteration(),
        AsBytes(state.sender_chain_key().seed()),
        state_public);
}

Result<Unit, EngineFailure> GroupCipher::ProcessDistributionMessage(
    SenderKeyRecordStructure& record,
    const SglSenderKeyDistributionMessage& message) {
    AddState(record, message.chain_id, message.iteration, message.chain_key, message.signing_key, nullptr);
    return Result<Unit, EngineFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, EngineFailure> GroupCipher::Encrypt(
    SenderKeyRecordStructure& record,
    const DistributionId& distribution_id,
    std::span<const uint8_t> plaintext) {
    using ResultType = Result<std::vector<uint8_t>, EngineFailure>;

    if (record.sender_key_states_size() == 0) {
        return ResultType::Err(EngineFailure::NoSenderKeyState("No sender key state for distribution"));
    }
    auto* state = record.mutable_sender_key_states(0);
    if (state->sender_signing_key().private_key().empty()) {
        return ResultType::Err(EngineFailure::InvalidState("Sender key state has no signing key"));
    }
    const uint32_t iteration = state->sender_chain_key().iteration();
    if (iteration == std::numeric_limits<uint32_t>::max()) {
        return ResultType::Err(EngineFailure::InvalidState("Sender chain iteration overflow"));
    }
    const auto chain_key = AsBytes(state->sender_chain_key().seed());
    if (chain_key.size() != GroupConstants::CHAIN_KEY_SIZE) {
        return ResultType::Err(EngineFailure::InvalidState("Sender chain key is corrupt"));
    }

    auto seed = MessageSeed(chain_key);
    auto keys_result = DeriveMessageKeys(iteration, seed);
    SodiumInterop::SecureWipe(seed);
    SGL_TRY(keys_result);
    const auto& keys = keys_result.Unwrap();

    SGL_TRY_ASSIGN(ciphertext, AesGcm::Encrypt(keys.cipher_key, keys.nonce, plaintext));
    SGL_TRY_ASSIGN(signing_key, Curve25519::PrivateKeyFromBytes(AsBytes(state->sender_signing_key().private_key())));
    SGL_TRY_ASSIGN(message, SenderKeyMessages::Create(
        distribution_id, state->chain_id(), iteration, ciphertext, signing_key));

    auto next = NextChainKey(chain_key);
    state->mutable_sender_chain_key()->set_iteration(iteration + 1);
    state->mutable_sender_chain_key()->set_seed(ToProto(next));
    SodiumInterop::SecureWipe(next);
    return ResultType::Ok(std::move(message->serialized));
}

Result<std::vector<uint8_t>, EngineFailure> GroupCipher::Decrypt(
    SenderKeyRecordStructure& record,
    std::span<const uint8_t> ciphertext) {
    using ResultType = Result<std::vector<uint8_t>, EngineFailure>;

    SGL_TRY_ASSIGN(message, SenderKeyMessages::Parse(ciphertext));

    int index = -1;
    for (int i = 0; i < record.sender_key_states_size(); ++i) {
        if (record.sender_key_states(i).chain_id() == message->chain_id) {
            index = i;
            break;
        }
    }
    if (index < 0) {
        return ResultType::Err(EngineFailure::NoSenderKeyState(
            compat::format("No sender key state for chain {}", message->chain_id)));
    }

    SenderKeyStateStructure state = record.sender_key_states(index);
    SGL_TRY_ASSIGN(signing_public, Curve25519::ParsePublicKey(AsBytes(state.sender_signing_key().public_key())));
    SGL_TRY_ASSIGN(valid, SenderKeyMessages::VerifySignature(*message, signing_public));
    if (!valid) {
        return ResultType::Err(EngineFailure::InvalidSignature("Sender key message signature did not verify"));
    }

    SGL_TRY_ASSIGN(keys, MessageKeysFor(state, message->iteration));
    auto plaintext = AesGcm::Decrypt(keys.cipher_key, keys.nonce, message->ciphertext);
    if (plaintext.IsErr()) {
        return ResultType::Err(EngineFailure::InvalidMessage("Failed to decrypt sender key message"));
    }

    *record.mutable_sender_key_states(index) = std::move(state);
    return ResultType::Ok(std::move(plaintext).Unwrap());
}

}
