#include "sigil/groups/sender_key_message.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::groups {
using ffi::Borrow;
using validation::SerializationValidator;

SenderKeyMessage::SenderKeyMessage(SenderKeyMessageHandle handle) noexcept
    : handle_(std::move(handle)) {}

Result<SenderKeyMessage, SigilFailure> SenderKeyMessage::Create(
    const DistributionId& distribution_id,
    const uint32_t chain_id,
    const uint32_t iteration,
    std::span<const uint8_t> ciphertext,
    const PrivateKey& signing_key) {
    SIGIL_TRY_ASSIGN(key, signing_key.Handle().Use());
    const SglUuid uuid = ToNativeUuid(distribution_id);
    SIGIL_TRY_ASSIGN(handle, SenderKeyMessageHandle::Create("SenderKeyMessage.Create",
        [&](SglMutPointerSenderKeyMessage* out) {
            return sgl_sender_key_message_new(out, uuid, chain_id, iteration, Borrow(ciphertext), key);
        }));
    return Result<SenderKeyMessage, SigilFailure>::Ok(SenderKeyMessage(std::move(handle)));
}

Result<SenderKeyMessage, SigilFailure> SenderKeyMessage::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateSenderKeyMessage(data), "SenderKeyMessage.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, SenderKeyMessageHandle::Create("SenderKeyMessage.Deserialize",
        [data](SglMutPointerSenderKeyMessage* out) {
            return sgl_sender_key_message_deserialize(out, Borrow(data));
        }));
    return Result<SenderKeyMessage, SigilFailure>::Ok(SenderKeyMessage(std::move(handle)));
}

Result<std::vector<uint8_t>, SigilFailure> SenderKeyMessage::Serialize() const {
    return handle_.With([](const SglConstPointerSenderKeyMessage message) {
        return ffi::CallForBytes("SenderKeyMessage.Serialize", [message](SglOwnedBuffer* out) {
            return sgl_sender_key_message_serialize(out, message);
        });
    });
}

Result<std::vector<uint8_t>, SigilFailure> SenderKeyMessage::GetCipherText() const {
    return handle_.With([](const SglConstPointerSenderKeyMessage message) {
        return ffi::CallForBytes("SenderKeyMessage.GetCipherText", [message](SglOwnedBuffer* out) {
            return sgl_sender_key_message_get_cipher_text(out, message);
        });
    });
}

Result<DistributionId, SigilFailure> SenderKeyMessage::GetDistributionId() const {
    SIGIL_TRY_ASSIGN(message, handle_.Use());
    SIGIL_TRY_ASSIGN(uuid, ffi::CallForValue<SglUuid>("SenderKeyMessage.GetDistributionId",
        [message](SglUuid* out) {
            return sgl_sender_key_message_get_distribution_id(out, message);
        }));
    return Result<DistributionId, SigilFailure>::Ok(FromNativeUuid(uuid));
}

Result<uint32_t, SigilFailure> SenderKeyMessage::GetChainId() const {
    return handle_.With([](const SglConstPointerSenderKeyMessage message) {
        return ffi::CallForValue<uint32_t>("SenderKeyMessage.GetChainId", [message](uint32_t* out) {
            return sgl_sender_key_message_get_chain_id(out, message);
        });
    });
}

Result<uint32_t, SigilFailure> SenderKeyMessage::GetIteration() const {
    return handle_.With([](const SglConstPointerSenderKeyMessage message) {
        return ffi::CallForValue<uint32_t>("SenderKeyMessage.GetIteration", [message](uint32_t* out) {
            return sgl_sender_key_message_get_iteration(out, message);
        });
    });
}

Result<bool, SigilFailure> SenderKeyMessage::VerifySignature(const PublicKey& signing_key) const {
    SIGIL_TRY_ASSIGN(message, handle_.Use());
    SIGIL_TRY_ASSIGN(key, signing_key.Handle().Use());
    return ffi::CallForValue<bool>("SenderKeyMessage.VerifySignature", [message, key](bool* out) {
        return sgl_sender_key_message_verify_signature(out, message, key);
    });
}

Result<SenderKeyMessage, SigilFailure> SenderKeyMessage::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<SenderKeyMessage, SigilFailure>::Ok(SenderKeyMessage(std::move(copy)));
}

void SenderKeyMessage::Dispose() noexcept {
    handle_.Dispose();
}

bool SenderKeyMessage::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
