#include "signal_message.hpp"
#include "curve25519.hpp"
#include "sodium_interop.hpp"

#include "sigil/core/constants.hpp"
#include "sigil/core/format.hpp"
#include "sigil/wire.pb.h"

#include <optional>
#include <string>

namespace sigil::engine {

using protocol::KeyConstants;
using protocol::MessageConstants;

namespace {
    std::span<const uint8_t> AsBytes(const std::string& value) {
        return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
    }

    std::string ToProto(std::span<const uint8_t> value) {
        return {value.begin(), value.end()};
    }

    Result<Unit, EngineFailure> CheckMacKey(std::span<const uint8_t> mac_key) {
        if (mac_key.size() != MessageConstants::MAC_KEY_SIZE) {
            return Result<Unit, EngineFailure>::Err(EngineFailure::InvalidArgument(
                compat::format("MAC key must be {} bytes, got {}", MessageConstants::MAC_KEY_SIZE, mac_key.size())));
        }
        return Result<Unit, EngineFailure>::Ok(unit);
    }
}

// ============================================================================
// SignalMessages
// ============================================================================

Result<Unit, EngineFailure> SignalMessages::CheckVersion(const uint8_t version_byte) {
    const uint8_t version = version_byte >> 4;
    if (version < MessageConstants::CIPHERTEXT_MESSAGE_PRE_KYBER_VERSION) {
        return Result<Unit, EngineFailure>::Err(EngineFailure::InvalidMessage(
            compat::format("Legacy ciphertext version {}", version)));
    }
    if (version > MessageConstants::CIPHERTEXT_MESSAGE_CURRENT_VERSION) {
        return Result<Unit, EngineFailure>::Err(EngineFailure::InvalidMessage(
            compat::format("Unrecognized ciphertext version {}", version)));
    }
    return Result<Unit, EngineFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, EngineFailure> SignalMessages::ComputeMac(
    std::span<const uint8_t> mac_key,
    const Curve25519PublicBytes& sender_identity_key,
    const Curve25519PublicBytes& receiver_identity_key,
    std::span<const uint8_t> message) {
    SGL_TRY(CheckMacKey(mac_key));
    std::vector<uint8_t> input = Curve25519::SerializePublicKey(sender_identity_key);
    const auto receiver = Curve25519::SerializePublicKey(receiver_identity_key);
    input.insert(input.end(), receiver.begin(), receiver.end());
    input.insert(input.end(), message.begin(), message.end());
    auto mac = SodiumInterop::HmacSha256(mac_key, input);
    mac.resize(MessageConstants::MAC_SIZE);
    return Result<std::vector<uint8_t>, EngineFailure>::Ok(std::move(mac));
}

Result<std::unique_ptr<SglSignalMessage>, EngineFailure> SignalMessages::Create(
    const uint8_t message_version,
    std::span<const uint8_t> mac_key,
    const Curve25519PublicBytes& sender_ratchet_key,
    const uint32_t counter,
    const uint32_t previous_counter,
    std::span<const uint8_t> ciphertext,
    const Curve25519PublicBytes& sender_identity_key,
    const Curve25519PublicBytes& receiver_identity_key,
    std::span<const uint8_t> pq_ratchet) {
    using ResultType = Result<std::unique_ptr<SglSignalMessage>, EngineFailure>;

    if (message_version < MessageConstants::CIPHERTEXT_MESSAGE_PRE_KYBER_VERSION
        || message_version > MessageConstants::CIPHERTEXT_MESSAGE_CURRENT_VERSION) {
        return ResultType::Err(EngineFailure::InvalidArgument(
            compat::format("Unsupported message version {}", message_version)));
    }
    if (ciphertext.empty()) {
        return ResultType::Err(EngineFailure::InvalidArgument("Ciphertext cannot be empty"));
    }

    proto::wire::SignalMessage body;
    body.set_ratchet_key(ToProto(Curve25519::SerializePublicKey(sender_ratchet_key)));
    body.set_counter(counter);
    body.set_previous_counter(previous_counter);
    body.set_ciphertext(ToProto(ciphertext));
    if (!pq_ratchet.empty()) {
        body.set_pq_ratchet(ToProto(pq_ratchet));
    }
    std::string encoded_body;
    if (!body.SerializeToString(&encoded_body)) {
        return ResultType::Err(EngineFailure::Protobuf("Failed to encode signal message"));
    }

    auto message = std::make_unique<SglSignalMessage>();
    message->serialized.reserve(1 + encoded_body.size() + MessageConstants::MAC_SIZE);
    message->serialized.push_back(static_cast<uint8_t>(
        (message_version << 4) | MessageConstants::CIPHERTEXT_MESSAGE_CURRENT_VERSION));
    message->serialized.insert(message->serialized.end(), encoded_body.begin(), encoded_body.end());
    SGL_TRY_ASSIGN(mac, ComputeMac(mac_key, sender_identity_key, receiver_identity_key, message->serialized));
    message->serialized.insert(message->serialized.end(), mac.begin(), mac.end());

    message->message_version = message_version;
    message->sender_ratchet_key = sender_ratchet_key;
    message->counter = counter;
    message->previous_counter = previous_counter;
    message->ciphertext.assign(ciphertext.begin(), ciphertext.end());
    message->pq_ratchet.assign(pq_ratchet.begin(), pq_ratchet.end());
    return ResultType::Ok(std::move(message));
}

Result<std::unique_ptr<SglSignalMessage>, EngineFailure> SignalMessages::Parse(std::span<const uint8_t> data) {
    using ResultType = Result<std::unique_ptr<SglSignalMessage>, EngineFailure>;

    if (data.size() < 1 + MessageConstants::MAC_SIZE) {
        return ResultType::Err(EngineFailure::InvalidMessage(
            compat::format("Signal message too short: {} bytes", data.size())));
    }
    SGL_TRY(CheckVersion(data[0]));

    const auto body_bytes = data.subspan(1, data.size() - 1 - MessageConstants::MAC_SIZE);
    proto::wire::SignalMessage body;
    if (!body.ParseFromArray(body_bytes.data(), static_cast<int>(body_bytes.size()))) {
        return ResultType::Err(EngineFailure::Protobuf("Failed to parse signal message"));
    }
    if (body.ciphertext().empty()) {
        return ResultType::Err(EngineFailure::InvalidMessage("Signal message has no ciphertext"));
    }
    SGL_TRY_ASSIGN(ratchet_key, Curve25519::ParsePublicKey(AsBytes(body.ratchet_key())));

    auto message = std::make_unique<SglSignalMessage>();
    message->message_version = static_cast<uint8_t>(data[0] >> 4);
    message->sender_ratchet_key = ratchet_key;
    message->counter = body.counter();
    message->previous_counter = body.previous_counter();
    message->ciphertext.assign(body.ciphertext().begin(), body.ciphertext().end());
    message->pq_ratchet.assign(body.pq_ratchet().begin(), body.pq_ratchet().end());
    message->serialized.assign(data.begin(), data.end());
    return ResultType::Ok(std::move(message));
}

Result<bool, EngineFailure> SignalMessages::VerifyMac(
    const SglSignalMessage& message,
    const Curve25519PublicBytes& sender_identity_key,
    const Curve25519PublicBytes& receiver_identity_key,
    std::span<const uint8_t> mac_key) {
    const std::span<const uint8_t> serialized(message.serialized);
    if (serialized.size() < 1 + MessageConstants::MAC_SIZE) {
        return Result<bool, EngineFailure>::Ok(false);
    }
    const size_t mac_offset = serialized.size() - MessageConstants::MAC_SIZE;
    SGL_TRY_ASSIGN(expected, ComputeMac(
        mac_key, sender_identity_key, receiver_identity_key, serialized.first(mac_offset)));
    return Result<bool, EngineFailure>::Ok(
        SodiumInterop::ConstantTimeEquals(expected, serialized.subspan(mac_offset)));
}

Result<Curve25519PublicBytes, EngineFailure> SignalMessages::PreKeyMessageRatchetKey(std::span<const uint8_t> data) {
    using ResultType = Result<Curve25519PublicBytes, EngineFailure>;

    if (data.empty()) {
        return ResultType::Err(EngineFailure::InvalidMessage("Pre-key message is empty"));
    }
    SGL_TRY(CheckVersion(data[0]));
    proto::wire::PreKeySignalMessage body;
    if (!body.ParseFromArray(data.data() + 1, static_cast<int>(data.size() - 1))) {
        return ResultType::Err(EngineFailure::Protobuf("Failed to parse pre-key message"));
    }
    SGL_TRY_ASSIGN(inner, Parse(AsBytes(body.message())));
    return ResultType::Ok(inner->sender_ratchet_key);
}

// ============================================================================
// DecryptionErrorMessages
// ============================================================================

Result<std::unique_ptr<SglDecryptionErrorMessage>, EngineFailure> DecryptionErrorMessages::ForOriginal(
    std::span<const uint8_t> original_bytes,
    const uint8_t original_type,
    const uint64_t timestamp,
    const uint32_t original_sender_device_id) {
    using ResultType = Result<std::unique_ptr<SglDecryptionErrorMessage>, EngineFailure>;

    std::optional<Curve25519PublicBytes> ratchet_key;
    switch (original_type) {
        case SGL_CIPHERTEXT_MESSAGE_TYPE_WHISPER: {
            SGL_TRY_ASSIGN(original, SignalMessages::Parse(original_bytes));
            ratchet_key = original->sender_ratchet_key;
            break;
        }
        case SGL_CIPHERTEXT_MESSAGE_TYPE_PRE_KEY: {
            SGL_TRY_ASSIGN(key, SignalMessages::PreKeyMessageRatchetKey(original_bytes));
            ratchet_key = key;
            break;
        }
        case SGL_CIPHERTEXT_MESSAGE_TYPE_SENDER_KEY:
        case SGL_CIPHERTEXT_MESSAGE_TYPE_PLAINTEXT:
            break;
        default:
            return ResultType::Err(EngineFailure::InvalidArgument(
                compat::format("Unknown ciphertext message type {}", original_type)));
    }

    proto::wire::DecryptionErrorMessage body;
    if (ratchet_key.has_value()) {
        body.set_ratchet_key(ToProto(Curve25519::SerializePublicKey(*ratchet_key)));
    }
    body.set_timestamp(timestamp);
    body.set_device_id(original_sender_device_id);
    std::string encoded;
    if (!body.SerializeToString(&encoded)) {
        return ResultType::Err(EngineFailure::Protobuf("Failed to encode decryption error message"));
    }

    auto message = std::make_unique<SglDecryptionErrorMessage>();
    message->ratchet_key = ratchet_key;
    message->timestamp = timestamp;
    message->device_id = original_sender_device_id;
    message->serialized.assign(encoded.begin(), encoded.end());
    return ResultType::Ok(std::move(message));
}

Result<std::unique_ptr<SglDecryptionErrorMessage>, EngineFailure> DecryptionErrorMessages::Parse(
    std::span<const uint8_t> data) {
    using ResultType = Result<std::unique_ptr<SglDecryptionErrorMessage>, EngineFailure>;

    if (data.empty()) {
        return ResultType::Err(EngineFailure::InvalidArgument("Decryption error message is empty"));
    }
    proto::wire::DecryptionErrorMessage body;
    if (!body.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        return ResultType::Err(EngineFailure::Protobuf("Failed to parse decryption error message"));
    }

    auto message = std::make_unique<SglDecryptionErrorMessage>();
    if (!body.ratchet_key().empty()) {
        SGL_TRY_ASSIGN(ratchet_key, Curve25519::ParsePublicKey(AsBytes(body.ratchet_key())));
        message->ratchet_key = ratchet_key;
    }
    message->timestamp = body.timestamp();
    message->device_id = body.device_id();
    message->serialized.assign(data.begin(), data.end());
    return ResultType::Ok(std::move(message));
}

Result<std::unique_ptr<SglDecryptionErrorMessage>, EngineFailure> DecryptionErrorMessages::ExtractFromContent(
    std::span<const uint8_t> data) {
    using ResultType = Result<std::unique_ptr<SglDecryptionErrorMessage>, EngineFailure>;

    if (data.empty() || data.back() != MessageConstants::PADDING_BOUNDARY_BYTE) {
        return ResultType::Err(EngineFailure::InvalidMessage("Content is not terminated by the padding boundary"));
    }
    const auto unpadded = data.first(data.size() - 1);
    proto::wire::Content content;
    if (!content.ParseFromArray(unpadded.data(), static_cast<int>(unpadded.size()))) {
        return ResultType::Err(EngineFailure::Protobuf("Failed to parse content"));
    }
    if (content.decryption_error_message().empty()) {
        return ResultType::Err(EngineFailure::InvalidMessage("Content carries no decryption error message"));
    }
    return Parse(AsBytes(content.decryption_error_message()));
}

}
