#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/keys/public_key.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::session {
using protocol::Result;
using protocol::SigilFailure;
using keys::PublicKey;
using SessionRecordHandle = ffi::ResourceHandle<ffi::SessionRecordTraits>;
/**
 * @brief Persisted pairwise session state for one peer device.
 *
 * Opaque to the binding: it can be archived, queried and round-tripped,
 * but pairwise encryption itself happens elsewhere. A fresh record has no
 * current session and serializes to an empty buffer.
 */
class SessionRecord {
public:
    [[nodiscard]] static Result<SessionRecord, SigilFailure> NewFresh();
    [[nodiscard]] static Result<SessionRecord, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Serialize() const;
    /// Moves the current session to the front of the previous sessions (at most 40 are kept).
    [[nodiscard]] Result<Unit, SigilFailure> ArchiveCurrentState();
    [[nodiscard]] Result<bool, SigilFailure> HasCurrentState() const;
    /// False when there is no sender chain or an unacknowledged pre-key is older than 30 days.
    [[nodiscard]] Result<bool, SigilFailure> HasUsableSenderChain(uint64_t now_millis) const;
    [[nodiscard]] Result<bool, SigilFailure> CurrentRatchetKeyMatches(const PublicKey& key) const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetLocalRegistrationId() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetRemoteRegistrationId() const;
    [[nodiscard]] Result<uint32_t, SigilFailure> GetPreviousSessionCount() const;
    [[nodiscard]] Result<SessionRecord, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    SessionRecord(SessionRecord&&) noexcept = default;
    SessionRecord& operator=(SessionRecord&&) noexcept = default;
    SessionRecord(const SessionRecord&) = delete;
    SessionRecord& operator=(const SessionRecord&) = delete;
    ~SessionRecord() = default;
private:
    explicit SessionRecord(SessionRecordHandle handle) noexcept;
    SessionRecordHandle handle_;
};
}
