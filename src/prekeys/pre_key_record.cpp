#include "sigil/prekeys/pre_key_record.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::prekeys {
using ffi::Borrow;
using keys::PrivateKeyHandle;
using keys::PublicKeyHandle;
using validation::SerializationValidator;

PreKeyRecord::PreKeyRecord(PreKeyRecordHandle handle) noexcept
    : handle_(std::move(handle)) {}

Result<PreKeyRecord, SigilFailure> PreKeyRecord::Create(
    const uint32_t id,
    const PublicKey& public_key,
    const PrivateKey& private_key) {
    SIGIL_TRY_ASSIGN(public_ptr, public_key.Handle().Use());
    SIGIL_TRY_ASSIGN(private_ptr, private_key.Handle().Use());
    SIGIL_TRY_ASSIGN(handle, PreKeyRecordHandle::Create("PreKeyRecord.Create",
        [id, public_ptr, private_ptr](SglMutPointerPreKeyRecord* out) {
            return sgl_pre_key_record_new(out, id, public_ptr, private_ptr);
        }));
    return Result<PreKeyRecord, SigilFailure>::Ok(PreKeyRecord(std::move(handle)));
}

Result<PreKeyRecord, SigilFailure> PreKeyRecord::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidatePreKeyRecord(data), "PreKeyRecord.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, PreKeyRecordHandle::Create("PreKeyRecord.Deserialize",
        [data](SglMutPointerPreKeyRecord* out) {
            return sgl_pre_key_record_deserialize(out, Borrow(data));
        }));
    return Result<PreKeyRecord, SigilFailure>::Ok(PreKeyRecord(std::move(handle)));
}

Result<SecureBytes, SigilFailure> PreKeyRecord::Serialize() const {
    return handle_.With([](const SglConstPointerPreKeyRecord record) {
        return ffi::CallForSecret("PreKeyRecord.Serialize", [record](SglOwnedBuffer* out) {
            return sgl_pre_key_record_serialize(out, record);
        });
    });
}

Result<uint32_t, SigilFailure> PreKeyRecord::GetId() const {
    return handle_.With([](const SglConstPointerPreKeyRecord record) {
        return ffi::CallForValue<uint32_t>("PreKeyRecord.GetId", [record](uint32_t* out) {
            return sgl_pre_key_record_get_id(out, record);
        });
    });
}

Result<PublicKey, SigilFailure> PreKeyRecord::GetPublicKey() const {
    SIGIL_TRY_ASSIGN(record, handle_.Use());
    SIGIL_TRY_ASSIGN(key, PublicKeyHandle::Create("PreKeyRecord.GetPublicKey",
        [record](SglMutPointerPublicKey* out) {
            return sgl_pre_key_record_get_public_key(out, record);
        }));
    return Result<PublicKey, SigilFailure>::Ok(PublicKey::FromHandle(std::move(key)));
}

Result<PrivateKey, SigilFailure> PreKeyRecord::GetPrivateKey() const {
    SIGIL_TRY_ASSIGN(record, handle_.Use());
    SIGIL_TRY_ASSIGN(key, PrivateKeyHandle::Create("PreKeyRecord.GetPrivateKey",
        [record](SglMutPointerPrivateKey* out) {
            return sgl_pre_key_record_get_private_key(out, record);
        }));
    return Result<PrivateKey, SigilFailure>::Ok(PrivateKey::FromHandle(std::move(key)));
}

Result<PreKeyRecord, SigilFailure> PreKeyRecord::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<PreKeyRecord, SigilFailure>::Ok(PreKeyRecord(std::move(copy)));
}

void PreKeyRecord::Dispose() noexcept {
    handle_.Dispose();
}

bool PreKeyRecord::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
