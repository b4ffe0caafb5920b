#pragma once
#include "sigil/stores/i_session_store.hpp"
#include <cstddef>
#include <map>
#include <vector>
namespace sigil::protocol::stores {
/// Keeps serialized records, so every load hands out an independent copy.
class InMemorySessionStore final : public ISessionStore {
public:
    [[nodiscard]] Result<std::optional<SessionRecord>, SigilFailure> LoadSession(const ProtocolAddress& address) override;
    [[nodiscard]] Result<Unit, SigilFailure> StoreSession(const ProtocolAddress& address, const SessionRecord& record) override;
    [[nodiscard]] bool ContainsSession(const ProtocolAddress& address) const override;
    void DeleteSession(const ProtocolAddress& address) override;
    void DeleteAllSessions(const std::string& name) override;
    [[nodiscard]] std::vector<uint32_t> GetSubDeviceSessions(const std::string& name) const override;
    void Clear() noexcept { sessions_.clear(); }
    [[nodiscard]] size_t Size() const noexcept { return sessions_.size(); }
private:
    std::map<ProtocolAddress, std::vector<uint8_t>> sessions_;
};
}
