#include "sigil/groups/group_session.hpp"
#include "sigil/core/constants.hpp"
#include "sigil/core/format.hpp"
#include "sigil/debug/lifecycle_log.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::groups {
using ffi::Borrow;
using validation::SerializationValidator;

GroupSession::GroupSession(
    ProtocolAddress sender_address,
    const DistributionId& distribution_id,
    ISenderKeyStore& store,
    const BindingConfig config)
    : sender_address_(std::move(sender_address))
    , distribution_id_(distribution_id)
    , store_(&store)
    , config_(config) {}

Result<GroupSession, SigilFailure> GroupSession::Create(
    ProtocolAddress sender_address,
    std::span<const uint8_t> distribution_id,
    ISenderKeyStore& store,
    const BindingConfig config) {
    SIGIL_TRY_ASSIGN(id, DistributionIdFromBytes(distribution_id));
    return Result<GroupSession, SigilFailure>::Ok(
        GroupSession(std::move(sender_address), id, store, config));
}

uint64_t GroupSession::NextOperationId() noexcept {
    ++operation_counter_;
    if (operation_counter_ > GroupConstants::OPERATION_COUNTER_LIMIT) {
        operation_counter_ = 1;
    }
    return operation_counter_;
}

Result<SenderKeyRecord, SigilFailure> GroupSession::LoadOrCreate(const SenderKeyName& name) {
    SIGIL_TRY_ASSIGN(stored, store_->LoadSenderKey(name));
    if (stored.has_value()) {
        return Result<SenderKeyRecord, SigilFailure>::Ok(std::move(*stored));
    }
    return SenderKeyRecord::NewFresh();
}

Result<Unit, SigilFailure> GroupSession::CheckPayloadSize(
    std::span<const uint8_t> payload,
    const char* context) const {
    if (!config_.Accepts(payload.size())) {
        return Result<Unit, SigilFailure>::Err(SigilFailure::InvalidArgument(context,
            compat::format("Payload of {} bytes exceeds the configured limit of {} bytes",
                payload.size(), config_.GetMaxPayloadSize())));
    }
    return Result<Unit, SigilFailure>::Ok(Unit{});
}

Result<SenderKeyDistributionMessage, SigilFailure> GroupSession::CreateDistributionMessage() {
    [[maybe_unused]] const uint64_t operation_id = NextOperationId();
    SIGIL_LOG_LIFECYCLE("GroupSession", compat::format("op {} create distribution message", operation_id));
    const SenderKeyName name{sender_address_, distribution_id_};
    SIGIL_TRY_ASSIGN(record, LoadOrCreate(name));
    SIGIL_TRY_ASSIGN(record_ptr, record.Handle().UseMut());
    const SglUuid uuid = ToNativeUuid(distribution_id_);
    SIGIL_TRY_ASSIGN(handle, SenderKeyDistributionMessageHandle::Create("GroupSession.CreateDistributionMessage",
        [record_ptr, uuid](SglMutPointerSenderKeyDistributionMessage* out) {
            return sgl_group_create_distribution_message(out, record_ptr, uuid);
        }));
    SIGIL_TRY(store_->StoreSenderKey(name, record));
    return Result<SenderKeyDistributionMessage, SigilFailure>::Ok(
        SenderKeyDistributionMessage::FromHandle(std::move(handle)));
}

Result<Unit, SigilFailure> GroupSession::ProcessDistributionMessage(
    const ProtocolAddress& sender,
    const SenderKeyDistributionMessage& message) {
    [[maybe_unused]] const uint64_t operation_id = NextOperationId();
    SIGIL_LOG_LIFECYCLE("GroupSession", compat::format("op {} process distribution message from {}",
        operation_id, sender.ToString()));
    SIGIL_TRY_ASSIGN(message_ptr, message.Handle().Use());
    const SenderKeyName name{sender, distribution_id_};
    SIGIL_TRY_ASSIGN(record, LoadOrCreate(name));
    SIGIL_TRY_ASSIGN(record_ptr, record.Handle().UseMut());
    SIGIL_TRY(ffi::CallForStatus("GroupSession.ProcessDistributionMessage", [record_ptr, message_ptr]() {
        return sgl_group_process_distribution_message(record_ptr, message_ptr);
    }));
    return store_->StoreSenderKey(name, record);
}

Result<std::vector<uint8_t>, SigilFailure> GroupSession::Encrypt(std::span<const uint8_t> plaintext) {
    SIGIL_TRY(CheckPayloadSize(plaintext, "GroupSession.Encrypt"));
    [[maybe_unused]] const uint64_t operation_id = NextOperationId();
    SIGIL_LOG_LIFECYCLE("GroupSession", compat::format("op {} encrypt {} bytes", operation_id, plaintext.size()));
    const SenderKeyName name{sender_address_, distribution_id_};
    SIGIL_TRY_ASSIGN(record, LoadOrCreate(name));
    SIGIL_TRY_ASSIGN(record_ptr, record.Handle().UseMut());
    const SglUuid uuid = ToNativeUuid(distribution_id_);
    SIGIL_TRY_ASSIGN(ciphertext, ffi::CallForBytes("GroupSession.Encrypt",
        [record_ptr, uuid, plaintext](SglOwnedBuffer* out) {
            return sgl_group_encrypt(out, record_ptr, uuid, Borrow(plaintext));
        }));
    SIGIL_TRY(store_->StoreSenderKey(name, record));
    return Result<std::vector<uint8_t>, SigilFailure>::Ok(std::move(ciphertext));
}

Result<std::vector<uint8_t>, SigilFailure> GroupSession::Decrypt(
    const ProtocolAddress& sender,
    std::span<const uint8_t> ciphertext) {
    SIGIL_TRY(CheckPayloadSize(ciphertext, "GroupSession.Decrypt"));
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateSenderKeyMessage(ciphertext), "GroupSession.Decrypt"));
    [[maybe_unused]] const uint64_t operation_id = NextOperationId();
    SIGIL_LOG_LIFECYCLE("GroupSession", compat::format("op {} decrypt {} bytes from {}",
        operation_id, ciphertext.size(), sender.ToString()));
    const SenderKeyName name{sender, distribution_id_};
    SIGIL_TRY_ASSIGN(record, LoadOrCreate(name));
    SIGIL_TRY_ASSIGN(record_ptr, record.Handle().UseMut());
    SIGIL_TRY_ASSIGN(plaintext, ffi::CallForBytes("GroupSession.Decrypt",
        [record_ptr, ciphertext](SglOwnedBuffer* out) {
            return sgl_group_decrypt(out, record_ptr, Borrow(ciphertext));
        }));
    SIGIL_TRY(store_->StoreSenderKey(name, record));
    return Result<std::vector<uint8_t>, SigilFailure>::Ok(std::move(plaintext));
}

}
