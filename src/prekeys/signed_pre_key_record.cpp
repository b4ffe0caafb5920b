#include "sigil/prekeys/signed_pre_key_record.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::prekeys {
using ffi::Borrow;
using keys::PrivateKeyHandle;
using keys::PublicKeyHandle;
using validation::SerializationValidator;

SignedPreKeyRecord::SignedPreKeyRecord(SignedPreKeyRecordHandle handle) noexcept
    : handle_(std::move(handle)) {}

Result<SignedPreKeyRecord, SigilFailure> SignedPreKeyRecord::Create(
    const uint32_t id,
    const uint64_t timestamp,
    const PublicKey& public_key,
    const PrivateKey& private_key,
    std::span<const uint8_t> signature) {
    if (signature.size() != KeyConstants::SIGNATURE_SIZE) {
        return Result<SignedPreKeyRecord, SigilFailure>::Err(SigilFailure::InvalidArgument(
            "SignedPreKeyRecord.Create",
            "signature must be " + std::to_string(KeyConstants::SIGNATURE_SIZE) + " bytes"));
    }
    SIGIL_TRY_ASSIGN(public_ptr, public_key.Handle().Use());
    SIGIL_TRY_ASSIGN(private_ptr, private_key.Handle().Use());
    SIGIL_TRY_ASSIGN(handle, SignedPreKeyRecordHandle::Create("SignedPreKeyRecord.Create",
        [&](SglMutPointerSignedPreKeyRecord* out) {
            return sgl_signed_pre_key_record_new(out, id, timestamp, public_ptr, private_ptr, Borrow(signature));
        }));
    return Result<SignedPreKeyRecord, SigilFailure>::Ok(SignedPreKeyRecord(std::move(handle)));
}

Result<SignedPreKeyRecord, SigilFailure> SignedPreKeyRecord::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateSignedPreKeyRecord(data), "SignedPreKeyRecord.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, SignedPreKeyRecordHandle::Create("SignedPreKeyRecord.Deserialize",
        [data](SglMutPointerSignedPreKeyRecord* out) {
            return sgl_signed_pre_key_record_deserialize(out, Borrow(data));
        }));
    return Result<SignedPreKeyRecord, SigilFailure>::Ok(SignedPreKeyRecord(std::move(handle)));
}

Result<SecureBytes, SigilFailure> SignedPreKeyRecord::Serialize() const {
    return handle_.With([](const SglConstPointerSignedPreKeyRecord record) {
        return ffi::CallForSecret("SignedPreKeyRecord.Serialize", [record](SglOwnedBuffer* out) {
            return sgl_signed_pre_key_record_serialize(out, record);
        });
    });
}

Result<uint32_t, SigilFailure> SignedPreKeyRecord::GetId() const {
    return handle_.With([](const SglConstPointerSignedPreKeyRecord record) {
        return ffi::CallForValue<uint32_t>("SignedPreKeyRecord.GetId", [record](uint32_t* out) {
            return sgl_signed_pre_key_record_get_id(out, record);
        });
    });
}

Result<uint64_t, SigilFailure> SignedPreKeyRecord::GetTimestamp() const {
    return handle_.With([](const SglConstPointerSignedPreKeyRecord record) {
        return ffi::CallForValue<uint64_t>("SignedPreKeyRecord.GetTimestamp", [record](uint64_t* out) {
            return sgl_signed_pre_key_record_get_timestamp(out, record);
        });
    });
}

Result<PublicKey, SigilFailure> SignedPreKeyRecord::GetPublicKey() const {
    SIGIL_TRY_ASSIGN(record, handle_.Use());
    SIGIL_TRY_ASSIGN(key, PublicKeyHandle::Create("SignedPreKeyRecord.GetPublicKey",
        [record](SglMutPointerPublicKey* out) {
            return sgl_signed_pre_key_record_get_public_key(out, record);
        }));
    return Result<PublicKey, SigilFailure>::Ok(PublicKey::FromHandle(std::move(key)));
}

Result<PrivateKey, SigilFailure> SignedPreKeyRecord::GetPrivateKey() const {
    SIGIL_TRY_ASSIGN(record, handle_.Use());
    SIGIL_TRY_ASSIGN(key, PrivateKeyHandle::Create("SignedPreKeyRecord.GetPrivateKey",
        [record](SglMutPointerPrivateKey* out) {
            return sgl_signed_pre_key_record_get_private_key(out, record);
        }));
    return Result<PrivateKey, SigilFailure>::Ok(PrivateKey::FromHandle(std::move(key)));
}

Result<std::vector<uint8_t>, SigilFailure> SignedPreKeyRecord::GetSignature() const {
    return handle_.With([](const SglConstPointerSignedPreKeyRecord record) {
        return ffi::CallForBytes("SignedPreKeyRecord.GetSignature", [record](SglOwnedBuffer* out) {
            return sgl_signed_pre_key_record_get_signature(out, record);
        });
    });
}

Result<SignedPreKeyRecord, SigilFailure> SignedPreKeyRecord::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<SignedPreKeyRecord, SigilFailure>::Ok(SignedPreKeyRecord(std::move(copy)));
}

void SignedPreKeyRecord::Dispose() noexcept {
    handle_.Dispose();
}

bool SignedPreKeyRecord::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
