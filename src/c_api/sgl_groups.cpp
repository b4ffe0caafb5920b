/**
 * @file sgl_groups.cpp
 * @brief Sender key records, sender key messages and group encryption
 */

#include "sigil/c_api/sgl_ffi.h"
#include "sgl_internal.hpp"

#include "engine/group_cipher.hpp"
#include "sigil/storage.pb.h"

#include <algorithm>
#include <memory>

using namespace sigil::engine;
using namespace sigil::engine::capi;
using sigil::proto::storage::SenderKeyRecordStructure;

namespace {

DistributionId FromUuid(const SglUuid& uuid) {
    DistributionId id{};
    std::copy(std::begin(uuid.bytes), std::end(uuid.bytes), id.begin());
    return id;
}

ApiResult WriteUuid(SglUuid* out, const DistributionId& id) {
    SGL_TRY(RequireOut(out));
    std::copy(id.begin(), id.end(), std::begin(out->bytes));
    return Success();
}

ApiResult WriteU32(uint32_t* out, const uint32_t value) {
    SGL_TRY(RequireOut(out));
    *out = value;
    return Success();
}

} // namespace

// ============================================================================
// Sender key records
// ============================================================================

SglFfiError* sgl_sender_key_record_new_fresh(SglMutPointerSenderKeyRecord* out) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        out->raw = new SglSenderKeyRecord();
        return Success();
    });
}

SglFfiError* sgl_sender_key_record_deserialize(SglMutPointerSenderKeyRecord* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        if (bytes.empty()) {
            return ApiResult::Err(EngineFailure::InvalidArgument("Sender key record is empty"));
        }
        SGL_TRY_ASSIGN(message, ParseProto<SenderKeyRecordStructure>(bytes, "sender key record"));
        auto record = std::make_unique<SglSenderKeyRecord>();
        record->record = std::move(message);
        out->raw = record.release();
        return Success();
    });
}

SglFfiError* sgl_sender_key_record_serialize(SglOwnedBuffer* out, const SglConstPointerSenderKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        auto bytes = SerializeProto(object->record);
        auto written = WriteOwned(out, bytes);
        SodiumInterop::SecureWipe(bytes);
        return written;
    });
}

SglFfiError* sgl_sender_key_record_clone(SglMutPointerSenderKeyRecord* out, const SglConstPointerSenderKeyRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        out->raw = new SglSenderKeyRecord(*object);
        return Success();
    });
}

SglFfiError* sgl_sender_key_record_destroy(const SglMutPointerSenderKeyRecord record) {
    return Guard([&]() { return Destroy(record.raw); });
}

// ============================================================================
// Sender key messages
// ============================================================================

SglFfiError* sgl_sender_key_message_new(
    SglMutPointerSenderKeyMessage* out,
    const SglUuid distribution_id,
    const uint32_t chain_id,
    const uint32_t iteration,
    const SglBorrowedBuffer ciphertext,
    const SglConstPointerPrivateKey signing_key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(ciphertext_bytes, Borrow(ciphertext));
        SGL_TRY_ASSIGN(key, Deref(signing_key.raw));
        SGL_TRY_ASSIGN(message, SenderKeyMessages::Create(
            FromUuid(distribution_id), chain_id, iteration, ciphertext_bytes, key->key));
        out->raw = message.release();
        return Success();
    });
}

SglFfiError* sgl_sender_key_message_deserialize(SglMutPointerSenderKeyMessage* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        SGL_TRY_ASSIGN(message, SenderKeyMessages::Parse(bytes));
        out->raw = message.release();
        return Success();
    });
}

SglFfiError* sgl_sender_key_message_serialize(SglOwnedBuffer* out, const SglConstPointerSenderKeyMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteOwned(out, object->serialized);
    });
}

SglFfiError* sgl_sender_key_message_get_cipher_text(SglOwnedBuffer* out, const SglConstPointerSenderKeyMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteOwned(out, object->ciphertext);
    });
}

SglFfiError* sgl_sender_key_message_get_distribution_id(SglUuid* out, const SglConstPointerSenderKeyMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteUuid(out, object->distribution_id);
    });
}

SglFfiError* sgl_sender_key_message_get_chain_id(uint32_t* out, const SglConstPointerSenderKeyMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteU32(out, object->chain_id);
    });
}

SglFfiError* sgl_sender_key_message_get_iteration(uint32_t* out, const SglConstPointerSenderKeyMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteU32(out, object->iteration);
    });
}

SglFfiError* sgl_sender_key_message_verify_signature(
    bool* out,
    const SglConstPointerSenderKeyMessage message,
    const SglConstPointerPublicKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        SGL_TRY_ASSIGN(public_key, Deref(key.raw));
        SGL_TRY_ASSIGN(valid, SenderKeyMessages::VerifySignature(*object, public_key->key));
        *out = valid;
        return Success();
    });
}

SglFfiError* sgl_sender_key_message_clone(SglMutPointerSenderKeyMessage* out, const SglConstPointerSenderKeyMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        out->raw = new SglSenderKeyMessage(*object);
        return Success();
    });
}

SglFfiError* sgl_sender_key_message_destroy(const SglMutPointerSenderKeyMessage message) {
    return Guard([&]() { return Destroy(message.raw); });
}

// ============================================================================
// Sender key distribution messages
// ============================================================================

SglFfiError* sgl_sender_key_distribution_message_new(
    SglMutPointerSenderKeyDistributionMessage* out,
    const SglUuid distribution_id,
    const uint32_t chain_id,
    const uint32_t iteration,
    const SglBorrowedBuffer chain_key,
    const SglConstPointerPublicKey signing_key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(chain_key_bytes, Borrow(chain_key));
        SGL_TRY_ASSIGN(key, Deref(signing_key.raw));
        SGL_TRY_ASSIGN(message, SenderKeyMessages::CreateDistribution(
            FromUuid(distribution_id), chain_id, iteration, chain_key_bytes, key->key));
        out->raw = message.release();
        return Success();
    });
}

SglFfiError* sgl_sender_key_distribution_message_deserialize(
    SglMutPointerSenderKeyDistributionMessage* out,
    const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        SGL_TRY_ASSIGN(message, SenderKeyMessages::ParseDistribution(bytes));
        out->raw = message.release();
        return Success();
    });
}

SglFfiError* sgl_sender_key_distribution_message_serialize(
    SglOwnedBuffer* out,
    const SglConstPointerSenderKeyDistributionMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteOwned(out, object->serialized);
    });
}

SglFfiError* sgl_sender_key_distribution_message_get_chain_key(
    SglOwnedBuffer* out,
    const SglConstPointerSenderKeyDistributionMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteOwned(out, object->chain_key);
    });
}

SglFfiError* sgl_sender_key_distribution_message_get_distribution_id(
    SglUuid* out,
    const SglConstPointerSenderKeyDistributionMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteUuid(out, object->distribution_id);
    });
}

SglFfiError* sgl_sender_key_distribution_message_get_chain_id(
    uint32_t* out,
    const SglConstPointerSenderKeyDistributionMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteU32(out, object->chain_id);
    });
}

SglFfiError* sgl_sender_key_distribution_message_get_iteration(
    uint32_t* out,
    const SglConstPointerSenderKeyDistributionMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        return WriteU32(out, object->iteration);
    });
}

SglFfiError* sgl_sender_key_distribution_message_get_signature_key(
    SglMutPointerPublicKey* out,
    const SglConstPointerSenderKeyDistributionMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        out->raw = NewPublicKey(object->signing_key);
        return Success();
    });
}

SglFfiError* sgl_sender_key_distribution_message_clone(
    SglMutPointerSenderKeyDistributionMessage* out,
    const SglConstPointerSenderKeyDistributionMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(message.raw));
        out->raw = new SglSenderKeyDistributionMessage(*object);
        return Success();
    });
}

SglFfiError* sgl_sender_key_distribution_message_destroy(const SglMutPointerSenderKeyDistributionMessage message) {
    return Guard([&]() { return Destroy(message.raw); });
}

// ============================================================================
// Group operations
// ============================================================================

SglFfiError* sgl_group_create_distribution_message(
    SglMutPointerSenderKeyDistributionMessage* out,
    const SglMutPointerSenderKeyRecord record,
    const SglUuid distribution_id) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, DerefMut(record.raw));
        SGL_TRY_ASSIGN(message, GroupCipher::CreateDistributionMessage(object->record, FromUuid(distribution_id)));
        out->raw = message.release();
        return Success();
    });
}

SglFfiError* sgl_group_process_distribution_message(
    const SglMutPointerSenderKeyRecord record,
    const SglConstPointerSenderKeyDistributionMessage message) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, DerefMut(record.raw));
        SGL_TRY_ASSIGN(distribution, Deref(message.raw));
        return GroupCipher::ProcessDistributionMessage(object->record, *distribution);
    });
}

SglFfiError* sgl_group_encrypt(
    SglOwnedBuffer* out,
    const SglMutPointerSenderKeyRecord record,
    const SglUuid distribution_id,
    const SglBorrowedBuffer plaintext) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, DerefMut(record.raw));
        SGL_TRY_ASSIGN(plaintext_bytes, Borrow(plaintext));
        SGL_TRY_ASSIGN(ciphertext, GroupCipher::Encrypt(object->record, FromUuid(distribution_id), plaintext_bytes));
        return WriteOwned(out, ciphertext);
    });
}

SglFfiError* sgl_group_decrypt(
    SglOwnedBuffer* out,
    const SglMutPointerSenderKeyRecord record,
    const SglBorrowedBuffer ciphertext) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, DerefMut(record.raw));
        SGL_TRY_ASSIGN(ciphertext_bytes, Borrow(ciphertext));
        SGL_TRY_ASSIGN(plaintext, GroupCipher::Decrypt(object->record, ciphertext_bytes));
        auto written = WriteOwned(out, plaintext);
        SodiumInterop::SecureWipe(plaintext);
        return written;
    });
}
