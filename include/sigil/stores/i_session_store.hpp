#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/session/protocol_address.hpp"
#include "sigil/session/session_record.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
namespace sigil::protocol::stores {
using protocol::Result;
using protocol::SigilFailure;
using protocol::Unit;
using session::ProtocolAddress;
using session::SessionRecord;
class ISessionStore {
public:
    virtual ~ISessionStore() = default;
    [[nodiscard]] virtual Result<std::optional<SessionRecord>, SigilFailure> LoadSession(const ProtocolAddress& address) = 0;
    [[nodiscard]] virtual Result<Unit, SigilFailure> StoreSession(const ProtocolAddress& address, const SessionRecord& record) = 0;
    [[nodiscard]] virtual bool ContainsSession(const ProtocolAddress& address) const = 0;
    virtual void DeleteSession(const ProtocolAddress& address) = 0;
    /// Removes every device session stored under name.
    virtual void DeleteAllSessions(const std::string& name) = 0;
    /// Device ids with a stored session for name.
    [[nodiscard]] virtual std::vector<uint32_t> GetSubDeviceSessions(const std::string& name) const = 0;
};
}
