/**
 * @file sgl_session.cpp
 * @brief Session records as persisted protobuf state
 *
 * The engine does not run the pairwise ratchet here. A record is parsed,
 * inspected, archived and re-serialized; the session state itself is opaque.
 */

#include "sigil/c_api/sgl_ffi.h"
#include "sgl_internal.hpp"

#include "sigil/core/constants.hpp"
#include "sigil/storage.pb.h"

#include <memory>

using namespace sigil::engine;
using namespace sigil::engine::capi;
using sigil::protocol::SessionConstants;
using sigil::proto::storage::RecordStructure;

namespace {

Result<const sigil::proto::storage::SessionStructure*, EngineFailure> CurrentSession(const SglSessionRecord& record) {
    using ResultType = Result<const sigil::proto::storage::SessionStructure*, EngineFailure>;
    if (!record.record.has_current_session()) {
        return ResultType::Err(EngineFailure::InvalidState("No current session state"));
    }
    return ResultType::Ok(&record.record.current_session());
}

} // namespace

SglFfiError* sgl_session_record_new_fresh(SglMutPointerSessionRecord* out) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        out->raw = new SglSessionRecord();
        return Success();
    });
}

SglFfiError* sgl_session_record_deserialize(SglMutPointerSessionRecord* out, const SglBorrowedBuffer data) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(bytes, Borrow(data));
        if (bytes.empty()) {
            return ApiResult::Err(EngineFailure::InvalidArgument("Session record is empty"));
        }
        SGL_TRY_ASSIGN(message, ParseProto<RecordStructure>(bytes, "session record"));
        auto record = std::make_unique<SglSessionRecord>();
        record->record = std::move(message);
        out->raw = record.release();
        return Success();
    });
}

SglFfiError* sgl_session_record_serialize(SglOwnedBuffer* out, const SglConstPointerSessionRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        auto bytes = SerializeProto(object->record);
        auto written = WriteOwned(out, bytes);
        SodiumInterop::SecureWipe(bytes);
        return written;
    });
}

SglFfiError* sgl_session_record_archive_current_state(const SglMutPointerSessionRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY_ASSIGN(object, DerefMut(record.raw));
        auto& structure = object->record;
        if (!structure.has_current_session()) {
            return Success();
        }
        std::string archived;
        if (!structure.current_session().SerializeToString(&archived)) {
            return ApiResult::Err(EngineFailure::Protobuf("Failed to serialize current session"));
        }
        auto* previous = structure.mutable_previous_sessions();
        *previous->Add() = std::move(archived);
        for (int i = previous->size() - 1; i > 0; --i) {
            previous->SwapElements(i, i - 1);
        }
        while (static_cast<size_t>(previous->size()) > SessionConstants::ARCHIVED_STATES_MAX_LENGTH) {
            previous->RemoveLast();
        }
        structure.clear_current_session();
        return Success();
    });
}

SglFfiError* sgl_session_record_has_current_state(bool* out, const SglConstPointerSessionRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        *out = object->record.has_current_session();
        return Success();
    });
}

SglFfiError* sgl_session_record_has_usable_sender_chain(
    bool* out,
    const SglConstPointerSessionRecord record,
    const uint64_t now_millis) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        *out = false;
        if (!object->record.has_current_session()) {
            return Success();
        }
        const auto& session = object->record.current_session();
        if (!session.has_sender_chain()) {
            return Success();
        }
        if (session.has_pending_pre_key()) {
            const uint64_t created = session.pending_pre_key().timestamp();
            if (created + SessionConstants::MAX_UNACKNOWLEDGED_SESSION_AGE_MS < now_millis) {
                return Success();
            }
        }
        *out = true;
        return Success();
    });
}

SglFfiError* sgl_session_record_current_ratchet_key_matches(
    bool* out,
    const SglConstPointerSessionRecord record,
    const SglConstPointerPublicKey key) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        SGL_TRY_ASSIGN(public_key, Deref(key.raw));
        *out = false;
        if (!object->record.has_current_session() || !object->record.current_session().has_sender_chain()) {
            return Success();
        }
        const auto& stored = object->record.current_session().sender_chain().sender_ratchet_key();
        const auto expected = SerializePublicKey(public_key->key);
        *out = stored.size() == expected.size()
            && SodiumInterop::ConstantTimeEquals(
                std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(stored.data()), stored.size()),
                expected);
        return Success();
    });
}

SglFfiError* sgl_session_record_get_local_registration_id(uint32_t* out, const SglConstPointerSessionRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        SGL_TRY_ASSIGN(session, CurrentSession(*object));
        *out = session->local_registration_id();
        return Success();
    });
}

SglFfiError* sgl_session_record_get_remote_registration_id(uint32_t* out, const SglConstPointerSessionRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        SGL_TRY_ASSIGN(session, CurrentSession(*object));
        *out = session->remote_registration_id();
        return Success();
    });
}

SglFfiError* sgl_session_record_get_previous_session_count(uint32_t* out, const SglConstPointerSessionRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        *out = static_cast<uint32_t>(object->record.previous_sessions_size());
        return Success();
    });
}

SglFfiError* sgl_session_record_clone(SglMutPointerSessionRecord* out, const SglConstPointerSessionRecord record) {
    return Guard([&]() -> ApiResult {
        SGL_TRY(RequireOut(out));
        SGL_TRY_ASSIGN(object, Deref(record.raw));
        out->raw = new SglSessionRecord(*object);
        return Success();
    });
}

SglFfiError* sgl_session_record_destroy(const SglMutPointerSessionRecord record) {
    return Guard([&]() { return Destroy(record.raw); });
}
