#include "sigil/groups/sender_key_record.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::groups {
using ffi::Borrow;
using validation::SerializationValidator;

SenderKeyRecord::SenderKeyRecord(SenderKeyRecordHandle handle) noexcept
    : handle_(std::move(handle)) {}

Result<SenderKeyRecord, SigilFailure> SenderKeyRecord::NewFresh() {
    SIGIL_TRY_ASSIGN(handle, SenderKeyRecordHandle::Create("SenderKeyRecord.NewFresh",
        [](SglMutPointerSenderKeyRecord* out) {
            return sgl_sender_key_record_new_fresh(out);
        }));
    return Result<SenderKeyRecord, SigilFailure>::Ok(SenderKeyRecord(std::move(handle)));
}

Result<SenderKeyRecord, SigilFailure> SenderKeyRecord::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateSenderKeyRecord(data), "SenderKeyRecord.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, SenderKeyRecordHandle::Create("SenderKeyRecord.Deserialize",
        [data](SglMutPointerSenderKeyRecord* out) {
            return sgl_sender_key_record_deserialize(out, Borrow(data));
        }));
    return Result<SenderKeyRecord, SigilFailure>::Ok(SenderKeyRecord(std::move(handle)));
}

Result<std::vector<uint8_t>, SigilFailure> SenderKeyRecord::Serialize() const {
    return handle_.With([](const SglConstPointerSenderKeyRecord record) {
        return ffi::CallForBytes("SenderKeyRecord.Serialize", [record](SglOwnedBuffer* out) {
            return sgl_sender_key_record_serialize(out, record);
        });
    });
}

Result<SenderKeyRecord, SigilFailure> SenderKeyRecord::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<SenderKeyRecord, SigilFailure>::Ok(SenderKeyRecord(std::move(copy)));
}

void SenderKeyRecord::Dispose() noexcept {
    handle_.Dispose();
}

bool SenderKeyRecord::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
