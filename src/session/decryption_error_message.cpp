#include "sigil/session/decryption_error_message.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::session {
using ffi::Borrow;
using keys::PublicKeyHandle;
using validation::SerializationValidator;

DecryptionErrorMessage::DecryptionErrorMessage(DecryptionErrorMessageHandle handle) noexcept
    : handle_(std::move(handle)) {}

Result<DecryptionErrorMessage, SigilFailure> DecryptionErrorMessage::ForOriginalMessage(
    std::span<const uint8_t> original_bytes,
    const CiphertextMessageType original_type,
    const uint64_t timestamp,
    const uint32_t original_sender_device_id) {
    if (original_bytes.empty()) {
        return Result<DecryptionErrorMessage, SigilFailure>::Err(SigilFailure::InvalidArgument(
            "DecryptionErrorMessage.ForOriginalMessage", "original message is empty"));
    }
    SIGIL_TRY_ASSIGN(handle, DecryptionErrorMessageHandle::Create("DecryptionErrorMessage.ForOriginalMessage",
        [&](SglMutPointerDecryptionErrorMessage* out) {
            return sgl_decryption_error_message_for_original_message(out, Borrow(original_bytes),
                static_cast<uint8_t>(original_type), timestamp, original_sender_device_id);
        }));
    return Result<DecryptionErrorMessage, SigilFailure>::Ok(DecryptionErrorMessage(std::move(handle)));
}

Result<DecryptionErrorMessage, SigilFailure> DecryptionErrorMessage::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateDecryptionErrorMessage(data), "DecryptionErrorMessage.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, DecryptionErrorMessageHandle::Create("DecryptionErrorMessage.Deserialize",
        [data](SglMutPointerDecryptionErrorMessage* out) {
            return sgl_decryption_error_message_deserialize(out, Borrow(data));
        }));
    return Result<DecryptionErrorMessage, SigilFailure>::Ok(DecryptionErrorMessage(std::move(handle)));
}

Result<DecryptionErrorMessage, SigilFailure> DecryptionErrorMessage::ExtractFromSerializedContent(
    std::span<const uint8_t> data) {
    SIGIL_TRY_ASSIGN(handle, DecryptionErrorMessageHandle::Create(
        "DecryptionErrorMessage.ExtractFromSerializedContent",
        [data](SglMutPointerDecryptionErrorMessage* out) {
            return sgl_decryption_error_message_extract_from_serialized_content(out, Borrow(data));
        }));
    return Result<DecryptionErrorMessage, SigilFailure>::Ok(DecryptionErrorMessage(std::move(handle)));
}

Result<std::vector<uint8_t>, SigilFailure> DecryptionErrorMessage::Serialize() const {
    return handle_.With([](const SglConstPointerDecryptionErrorMessage message) {
        return ffi::CallForBytes("DecryptionErrorMessage.Serialize", [message](SglOwnedBuffer* out) {
            return sgl_decryption_error_message_serialize(out, message);
        });
    });
}

Result<uint64_t, SigilFailure> DecryptionErrorMessage::GetTimestamp() const {
    return handle_.With([](const SglConstPointerDecryptionErrorMessage message) {
        return ffi::CallForValue<uint64_t>("DecryptionErrorMessage.GetTimestamp", [message](uint64_t* out) {
            return sgl_decryption_error_message_get_timestamp(out, message);
        });
    });
}

Result<uint32_t, SigilFailure> DecryptionErrorMessage::GetDeviceId() const {
    return handle_.With([](const SglConstPointerDecryptionErrorMessage message) {
        return ffi::CallForValue<uint32_t>("DecryptionErrorMessage.GetDeviceId", [message](uint32_t* out) {
            return sgl_decryption_error_message_get_device_id(out, message);
        });
    });
}

Result<std::optional<PublicKey>, SigilFailure> DecryptionErrorMessage::GetRatchetKey() const {
    SIGIL_TRY_ASSIGN(message, handle_.Use());
    SglMutPointerPublicKey out{nullptr};
    SIGIL_TRY(ffi::CheckNativeError(
        sgl_decryption_error_message_get_ratchet_key(&out, message), "DecryptionErrorMessage.GetRatchetKey"));
    if (out.raw == nullptr) {
        return Result<std::optional<PublicKey>, SigilFailure>::Ok(std::nullopt);
    }
    SIGIL_TRY_ASSIGN(key, PublicKeyHandle::Adopt(out, "DecryptionErrorMessage.GetRatchetKey"));
    return Result<std::optional<PublicKey>, SigilFailure>::Ok(PublicKey::FromHandle(std::move(key)));
}

Result<DecryptionErrorMessage, SigilFailure> DecryptionErrorMessage::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<DecryptionErrorMessage, SigilFailure>::Ok(DecryptionErrorMessage(std::move(copy)));
}

void DecryptionErrorMessage::Dispose() noexcept {
    handle_.Dispose();
}

bool DecryptionErrorMessage::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
