#include "sigil/groups/sender_key_distribution_message.hpp"
#include "sigil/core/format.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::groups {
using ffi::Borrow;
using keys::PublicKeyHandle;
using validation::SerializationValidator;

SenderKeyDistributionMessage::SenderKeyDistributionMessage(SenderKeyDistributionMessageHandle handle) noexcept
    : handle_(std::move(handle)) {}

SenderKeyDistributionMessage SenderKeyDistributionMessage::FromHandle(
    SenderKeyDistributionMessageHandle handle) noexcept {
    return SenderKeyDistributionMessage(std::move(handle));
}

Result<SenderKeyDistributionMessage, SigilFailure> SenderKeyDistributionMessage::Create(
    const DistributionId& distribution_id,
    const uint32_t chain_id,
    const uint32_t iteration,
    std::span<const uint8_t> chain_key,
    const PublicKey& signing_key) {
    if (chain_key.size() != GroupConstants::CHAIN_KEY_SIZE) {
        return Result<SenderKeyDistributionMessage, SigilFailure>::Err(
            SigilFailure::InvalidArgument("SenderKeyDistributionMessage.Create",
                compat::format("Chain key must be {} bytes, got {}",
                    GroupConstants::CHAIN_KEY_SIZE, chain_key.size())));
    }
    SIGIL_TRY_ASSIGN(key, signing_key.Handle().Use());
    const SglUuid uuid = ToNativeUuid(distribution_id);
    SIGIL_TRY_ASSIGN(handle, SenderKeyDistributionMessageHandle::Create("SenderKeyDistributionMessage.Create",
        [&](SglMutPointerSenderKeyDistributionMessage* out) {
            return sgl_sender_key_distribution_message_new(
                out, uuid, chain_id, iteration, Borrow(chain_key), key);
        }));
    return Result<SenderKeyDistributionMessage, SigilFailure>::Ok(
        SenderKeyDistributionMessage(std::move(handle)));
}

Result<SenderKeyDistributionMessage, SigilFailure> SenderKeyDistributionMessage::Deserialize(
    std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateSenderKeyDistributionMessage(data),
        "SenderKeyDistributionMessage.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, SenderKeyDistributionMessageHandle::Create("SenderKeyDistributionMessage.Deserialize",
        [data](SglMutPointerSenderKeyDistributionMessage* out) {
            return sgl_sender_key_distribution_message_deserialize(out, Borrow(data));
        }));
    return Result<SenderKeyDistributionMessage, SigilFailure>::Ok(
        SenderKeyDistributionMessage(std::move(handle)));
}

Result<std::vector<uint8_t>, SigilFailure> SenderKeyDistributionMessage::Serialize() const {
    return handle_.With([](const SglConstPointerSenderKeyDistributionMessage message) {
        return ffi::CallForBytes("SenderKeyDistributionMessage.Serialize", [message](SglOwnedBuffer* out) {
            return sgl_sender_key_distribution_message_serialize(out, message);
        });
    });
}

Result<SecureBytes, SigilFailure> SenderKeyDistributionMessage::GetChainKey() const {
    return handle_.With([](const SglConstPointerSenderKeyDistributionMessage message) {
        return ffi::CallForSecret("SenderKeyDistributionMessage.GetChainKey", [message](SglOwnedBuffer* out) {
            return sgl_sender_key_distribution_message_get_chain_key(out, message);
        });
    });
}

Result<DistributionId, SigilFailure> SenderKeyDistributionMessage::GetDistributionId() const {
    SIGIL_TRY_ASSIGN(message, handle_.Use());
    SIGIL_TRY_ASSIGN(uuid, ffi::CallForValue<SglUuid>("SenderKeyDistributionMessage.GetDistributionId",
        [message](SglUuid* out) {
            return sgl_sender_key_distribution_message_get_distribution_id(out, message);
        }));
    return Result<DistributionId, SigilFailure>::Ok(FromNativeUuid(uuid));
}

Result<uint32_t, SigilFailure> SenderKeyDistributionMessage::GetChainId() const {
    return handle_.With([](const SglConstPointerSenderKeyDistributionMessage message) {
        return ffi::CallForValue<uint32_t>("SenderKeyDistributionMessage.GetChainId", [message](uint32_t* out) {
            return sgl_sender_key_distribution_message_get_chain_id(out, message);
        });
    });
}

Result<uint32_t, SigilFailure> SenderKeyDistributionMessage::GetIteration() const {
    return handle_.With([](const SglConstPointerSenderKeyDistributionMessage message) {
        return ffi::CallForValue<uint32_t>("SenderKeyDistributionMessage.GetIteration", [message](uint32_t* out) {
            return sgl_sender_key_distribution_message_get_iteration(out, message);
        });
    });
}

Result<PublicKey, SigilFailure> SenderKeyDistributionMessage::GetSignatureKey() const {
    SIGIL_TRY_ASSIGN(message, handle_.Use());
    SIGIL_TRY_ASSIGN(key, PublicKeyHandle::Create("SenderKeyDistributionMessage.GetSignatureKey",
        [message](SglMutPointerPublicKey* out) {
            return sgl_sender_key_distribution_message_get_signature_key(out, message);
        }));
    return Result<PublicKey, SigilFailure>::Ok(PublicKey::FromHandle(std::move(key)));
}

Result<SenderKeyDistributionMessage, SigilFailure> SenderKeyDistributionMessage::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<SenderKeyDistributionMessage, SigilFailure>::Ok(
        SenderKeyDistributionMessage(std::move(copy)));
}

void SenderKeyDistributionMessage::Dispose() noexcept {
    handle_.Dispose();
}

bool SenderKeyDistributionMessage::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
