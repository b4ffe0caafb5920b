#include "sigil/session/signal_message.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::session {
using ffi::Borrow;
using keys::PublicKeyHandle;
using validation::SerializationValidator;

SignalMessage::SignalMessage(SignalMessageHandle handle) noexcept
    : handle_(std::move(handle)) {}

Result<SignalMessage, SigilFailure> SignalMessage::Create(
    const uint8_t message_version,
    std::span<const uint8_t> mac_key,
    const PublicKey& sender_ratchet_key,
    const uint32_t counter,
    const uint32_t previous_counter,
    std::span<const uint8_t> ciphertext,
    const PublicKey& sender_identity_key,
    const PublicKey& receiver_identity_key,
    std::span<const uint8_t> pq_ratchet) {
    SIGIL_TRY_ASSIGN(ratchet_key, sender_ratchet_key.Handle().Use());
    SIGIL_TRY_ASSIGN(sender, sender_identity_key.Handle().Use());
    SIGIL_TRY_ASSIGN(receiver, receiver_identity_key.Handle().Use());
    SIGIL_TRY_ASSIGN(handle, SignalMessageHandle::Create("SignalMessage.Create",
        [&](SglMutPointerSignalMessage* out) {
            return sgl_signal_message_new(out, message_version, Borrow(mac_key), ratchet_key,
                counter, previous_counter, Borrow(ciphertext), sender, receiver, Borrow(pq_ratchet));
        }));
    return Result<SignalMessage, SigilFailure>::Ok(SignalMessage(std::move(handle)));
}

Result<SignalMessage, SigilFailure> SignalMessage::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateSignalMessage(data), "SignalMessage.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, SignalMessageHandle::Create("SignalMessage.Deserialize",
        [data](SglMutPointerSignalMessage* out) {
            return sgl_signal_message_deserialize(out, Borrow(data));
        }));
    return Result<SignalMessage, SigilFailure>::Ok(SignalMessage(std::move(handle)));
}

Result<std::vector<uint8_t>, SigilFailure> SignalMessage::Serialize() const {
    return handle_.With([](const SglConstPointerSignalMessage message) {
        return ffi::CallForBytes("SignalMessage.Serialize", [message](SglOwnedBuffer* out) {
            return sgl_signal_message_get_serialized(out, message);
        });
    });
}

Result<std::vector<uint8_t>, SigilFailure> SignalMessage::GetBody() const {
    return handle_.With([](const SglConstPointerSignalMessage message) {
        return ffi::CallForBytes("SignalMessage.GetBody", [message](SglOwnedBuffer* out) {
            return sgl_signal_message_get_body(out, message);
        });
    });
}

Result<uint32_t, SigilFailure> SignalMessage::GetCounter() const {
    return handle_.With([](const SglConstPointerSignalMessage message) {
        return ffi::CallForValue<uint32_t>("SignalMessage.GetCounter", [message](uint32_t* out) {
            return sgl_signal_message_get_counter(out, message);
        });
    });
}

Result<uint32_t, SigilFailure> SignalMessage::GetMessageVersion() const {
    return handle_.With([](const SglConstPointerSignalMessage message) {
        return ffi::CallForValue<uint32_t>("SignalMessage.GetMessageVersion", [message](uint32_t* out) {
            return sgl_signal_message_get_message_version(out, message);
        });
    });
}

Result<PublicKey, SigilFailure> SignalMessage::GetSenderRatchetKey() const {
    SIGIL_TRY_ASSIGN(message, handle_.Use());
    SIGIL_TRY_ASSIGN(key, PublicKeyHandle::Create("SignalMessage.GetSenderRatchetKey",
        [message](SglMutPointerPublicKey* out) {
            return sgl_signal_message_get_sender_ratchet_key(out, message);
        }));
    return Result<PublicKey, SigilFailure>::Ok(PublicKey::FromHandle(std::move(key)));
}

Result<std::optional<std::vector<uint8_t>>, SigilFailure> SignalMessage::GetPqRatchet() const {
    SIGIL_TRY_ASSIGN(message, handle_.Use());
    SIGIL_TRY_ASSIGN(bytes, ffi::CallForBytes("SignalMessage.GetPqRatchet", [message](SglOwnedBuffer* out) {
        return sgl_signal_message_get_pq_ratchet(out, message);
    }));
    if (bytes.empty()) {
        return Result<std::optional<std::vector<uint8_t>>, SigilFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<std::vector<uint8_t>>, SigilFailure>::Ok(std::move(bytes));
}

Result<bool, SigilFailure> SignalMessage::VerifyMac(
    const PublicKey& sender_identity_key,
    const PublicKey& receiver_identity_key,
    std::span<const uint8_t> mac_key) const {
    SIGIL_TRY_ASSIGN(message, handle_.Use());
    SIGIL_TRY_ASSIGN(sender, sender_identity_key.Handle().Use());
    SIGIL_TRY_ASSIGN(receiver, receiver_identity_key.Handle().Use());
    return ffi::CallForValue<bool>("SignalMessage.VerifyMac", [&](bool* out) {
        return sgl_signal_message_verify_mac(out, message, sender, receiver, Borrow(mac_key));
    });
}

Result<SignalMessage, SigilFailure> SignalMessage::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<SignalMessage, SigilFailure>::Ok(SignalMessage(std::move(copy)));
}

void SignalMessage::Dispose() noexcept {
    handle_.Dispose();
}

bool SignalMessage::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
