#include "sigil/prekeys/kyber_pre_key_record.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::prekeys {
using ffi::Borrow;
using kyber::KyberKeyPairHandle;
using kyber::KyberPublicKeyHandle;
using kyber::KyberSecretKeyHandle;
using validation::SerializationValidator;

KyberPreKeyRecord::KyberPreKeyRecord(KyberPreKeyRecordHandle handle) noexcept
    : handle_(std::move(handle)) {}

Result<KyberPreKeyRecord, SigilFailure> KyberPreKeyRecord::Create(
    const uint32_t id,
    const uint64_t timestamp,
    const KyberKeyPair& key_pair,
    std::span<const uint8_t> signature) {
    if (signature.size() != KeyConstants::SIGNATURE_SIZE) {
        return Result<KyberPreKeyRecord, SigilFailure>::Err(SigilFailure::InvalidArgument(
            "KyberPreKeyRecord.Create",
            "signature must be " + std::to_string(KeyConstants::SIGNATURE_SIZE) + " bytes"));
    }
    SIGIL_TRY_ASSIGN(pair, key_pair.Handle().Use());
    SIGIL_TRY_ASSIGN(handle, KyberPreKeyRecordHandle::Create("KyberPreKeyRecord.Create",
        [&](SglMutPointerKyberPreKeyRecord* out) {
            return sgl_kyber_pre_key_record_new(out, id, timestamp, pair, Borrow(signature));
        }));
    return Result<KyberPreKeyRecord, SigilFailure>::Ok(KyberPreKeyRecord(std::move(handle)));
}

Result<KyberPreKeyRecord, SigilFailure> KyberPreKeyRecord::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateKyberPreKeyRecord(data), "KyberPreKeyRecord.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, KyberPreKeyRecordHandle::Create("KyberPreKeyRecord.Deserialize",
        [data](SglMutPointerKyberPreKeyRecord* out) {
            return sgl_kyber_pre_key_record_deserialize(out, Borrow(data));
        }));
    return Result<KyberPreKeyRecord, SigilFailure>::Ok(KyberPreKeyRecord(std::move(handle)));
}

Result<SecureBytes, SigilFailure> KyberPreKeyRecord::Serialize() const {
    return handle_.With([](const SglConstPointerKyberPreKeyRecord record) {
        return ffi::CallForSecret("KyberPreKeyRecord.Serialize", [record](SglOwnedBuffer* out) {
            return sgl_kyber_pre_key_record_serialize(out, record);
        });
    });
}

Result<uint32_t, SigilFailure> KyberPreKeyRecord::GetId() const {
    return handle_.With([](const SglConstPointerKyberPreKeyRecord record) {
        return ffi::CallForValue<uint32_t>("KyberPreKeyRecord.GetId", [record](uint32_t* out) {
            return sgl_kyber_pre_key_record_get_id(out, record);
        });
    });
}

Result<uint64_t, SigilFailure> KyberPreKeyRecord::GetTimestamp() const {
    return handle_.With([](const SglConstPointerKyberPreKeyRecord record) {
        return ffi::CallForValue<uint64_t>("KyberPreKeyRecord.GetTimestamp", [record](uint64_t* out) {
            return sgl_kyber_pre_key_record_get_timestamp(out, record);
        });
    });
}

Result<KyberPublicKey, SigilFailure> KyberPreKeyRecord::GetPublicKey() const {
    SIGIL_TRY_ASSIGN(record, handle_.Use());
    SIGIL_TRY_ASSIGN(key, KyberPublicKeyHandle::Create("KyberPreKeyRecord.GetPublicKey",
        [record](SglMutPointerKyberPublicKey* out) {
            return sgl_kyber_pre_key_record_get_public_key(out, record);
        }));
    return Result<KyberPublicKey, SigilFailure>::Ok(KyberPublicKey::FromHandle(std::move(key)));
}

Result<KyberSecretKey, SigilFailure> KyberPreKeyRecord::GetSecretKey() const {
    SIGIL_TRY_ASSIGN(record, handle_.Use());
    SIGIL_TRY_ASSIGN(key, KyberSecretKeyHandle::Create("KyberPreKeyRecord.GetSecretKey",
        [record](SglMutPointerKyberSecretKey* out) {
            return sgl_kyber_pre_key_record_get_secret_key(out, record);
        }));
    return Result<KyberSecretKey, SigilFailure>::Ok(KyberSecretKey::FromHandle(std::move(key)));
}

Result<KyberKeyPair, SigilFailure> KyberPreKeyRecord::GetKeyPair() const {
    SIGIL_TRY_ASSIGN(record, handle_.Use());
    SIGIL_TRY_ASSIGN(pair, KyberKeyPairHandle::Create("KyberPreKeyRecord.GetKeyPair",
        [record](SglMutPointerKyberKeyPair* out) {
            return sgl_kyber_pre_key_record_get_key_pair(out, record);
        }));
    return Result<KyberKeyPair, SigilFailure>::Ok(KyberKeyPair::FromHandle(std::move(pair)));
}

Result<std::vector<uint8_t>, SigilFailure> KyberPreKeyRecord::GetSignature() const {
    return handle_.With([](const SglConstPointerKyberPreKeyRecord record) {
        return ffi::CallForBytes("KyberPreKeyRecord.GetSignature", [record](SglOwnedBuffer* out) {
            return sgl_kyber_pre_key_record_get_signature(out, record);
        });
    });
}

Result<KyberPreKeyRecord, SigilFailure> KyberPreKeyRecord::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<KyberPreKeyRecord, SigilFailure>::Ok(KyberPreKeyRecord(std::move(copy)));
}

void KyberPreKeyRecord::Dispose() noexcept {
    handle_.Dispose();
}

bool KyberPreKeyRecord::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
