#include "sigil/session/session_record.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/validation/serialization_validator.hpp"

namespace sigil::protocol::session {
using ffi::Borrow;
using validation::SerializationValidator;

SessionRecord::SessionRecord(SessionRecordHandle handle) noexcept
    : handle_(std::move(handle)) {}

Result<SessionRecord, SigilFailure> SessionRecord::NewFresh() {
    SIGIL_TRY_ASSIGN(handle, SessionRecordHandle::Create("SessionRecord.NewFresh",
        [](SglMutPointerSessionRecord* out) {
            return sgl_session_record_new_fresh(out);
        }));
    return Result<SessionRecord, SigilFailure>::Ok(SessionRecord(std::move(handle)));
}

Result<SessionRecord, SigilFailure> SessionRecord::Deserialize(std::span<const uint8_t> data) {
    SIGIL_TRY(validation::Enforce(
        SerializationValidator::ValidateSessionRecord(data), "SessionRecord.Deserialize"));
    SIGIL_TRY_ASSIGN(handle, SessionRecordHandle::Create("SessionRecord.Deserialize",
        [data](SglMutPointerSessionRecord* out) {
            return sgl_session_record_deserialize(out, Borrow(data));
        }));
    return Result<SessionRecord, SigilFailure>::Ok(SessionRecord(std::move(handle)));
}

Result<std::vector<uint8_t>, SigilFailure> SessionRecord::Serialize() const {
    return handle_.With([](const SglConstPointerSessionRecord record) {
        return ffi::CallForBytes("SessionRecord.Serialize", [record](SglOwnedBuffer* out) {
            return sgl_session_record_serialize(out, record);
        });
    });
}

Result<Unit, SigilFailure> SessionRecord::ArchiveCurrentState() {
    return handle_.WithMut([](const SglMutPointerSessionRecord record) {
        return ffi::CallForStatus("SessionRecord.ArchiveCurrentState", [record]() {
            return sgl_session_record_archive_current_state(record);
        });
    });
}

Result<bool, SigilFailure> SessionRecord::HasCurrentState() const {
    return handle_.With([](const SglConstPointerSessionRecord record) {
        return ffi::CallForValue<bool>("SessionRecord.HasCurrentState", [record](bool* out) {
            return sgl_session_record_has_current_state(out, record);
        });
    });
}

Result<bool, SigilFailure> SessionRecord::HasUsableSenderChain(const uint64_t now_millis) const {
    return handle_.With([now_millis](const SglConstPointerSessionRecord record) {
        return ffi::CallForValue<bool>("SessionRecord.HasUsableSenderChain", [record, now_millis](bool* out) {
            return sgl_session_record_has_usable_sender_chain(out, record, now_millis);
        });
    });
}

Result<bool, SigilFailure> SessionRecord::CurrentRatchetKeyMatches(const PublicKey& key) const {
    SIGIL_TRY_ASSIGN(record, handle_.Use());
    SIGIL_TRY_ASSIGN(key_ptr, key.Handle().Use());
    return ffi::CallForValue<bool>("SessionRecord.CurrentRatchetKeyMatches", [record, key_ptr](bool* out) {
        return sgl_session_record_current_ratchet_key_matches(out, record, key_ptr);
    });
}

Result<uint32_t, SigilFailure> SessionRecord::GetLocalRegistrationId() const {
    return handle_.With([](const SglConstPointerSessionRecord record) {
        return ffi::CallForValue<uint32_t>("SessionRecord.GetLocalRegistrationId", [record](uint32_t* out) {
            return sgl_session_record_get_local_registration_id(out, record);
        });
    });
}

Result<uint32_t, SigilFailure> SessionRecord::GetRemoteRegistrationId() const {
    return handle_.With([](const SglConstPointerSessionRecord record) {
        return ffi::CallForValue<uint32_t>("SessionRecord.GetRemoteRegistrationId", [record](uint32_t* out) {
            return sgl_session_record_get_remote_registration_id(out, record);
        });
    });
}

Result<uint32_t, SigilFailure> SessionRecord::GetPreviousSessionCount() const {
    return handle_.With([](const SglConstPointerSessionRecord record) {
        return ffi::CallForValue<uint32_t>("SessionRecord.GetPreviousSessionCount", [record](uint32_t* out) {
            return sgl_session_record_get_previous_session_count(out, record);
        });
    });
}

Result<SessionRecord, SigilFailure> SessionRecord::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<SessionRecord, SigilFailure>::Ok(SessionRecord(std::move(copy)));
}

void SessionRecord::Dispose() noexcept {
    handle_.Dispose();
}

bool SessionRecord::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
