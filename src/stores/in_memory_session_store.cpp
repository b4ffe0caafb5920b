#include "sigil/stores/in_memory/in_memory_session_store.hpp"

namespace sigil::protocol::stores {

Result<std::optional<SessionRecord>, SigilFailure> InMemorySessionStore::LoadSession(const ProtocolAddress& address) {
    using LoadResult = Result<std::optional<SessionRecord>, SigilFailure>;
    const auto it = sessions_.find(address);
    if (it == sessions_.end()) {
        return LoadResult::Ok(std::nullopt);
    }
    // A record with no sessions serializes to nothing and cannot be parsed back.
    if (it->second.empty()) {
        SIGIL_TRY_ASSIGN(fresh, SessionRecord::NewFresh());
        return LoadResult::Ok(std::optional<SessionRecord>(std::move(fresh)));
    }
    SIGIL_TRY_ASSIGN(record, SessionRecord::Deserialize(it->second));
    return LoadResult::Ok(std::optional<SessionRecord>(std::move(record)));
}

Result<Unit, SigilFailure> InMemorySessionStore::StoreSession(const ProtocolAddress& address, const SessionRecord& record) {
    SIGIL_TRY_ASSIGN(bytes, record.Serialize());
    sessions_.insert_or_assign(address, std::move(bytes));
    return Result<Unit, SigilFailure>::Ok(Unit{});
}

bool InMemorySessionStore::ContainsSession(const ProtocolAddress& address) const {
    return sessions_.contains(address);
}

void InMemorySessionStore::DeleteSession(const ProtocolAddress& address) {
    sessions_.erase(address);
}

void InMemorySessionStore::DeleteAllSessions(const std::string& name) {
    auto it = sessions_.lower_bound(ProtocolAddress(name, 0));
    while (it != sessions_.end() && it->first.GetName() == name) {
        it = sessions_.erase(it);
    }
}

std::vector<uint32_t> InMemorySessionStore::GetSubDeviceSessions(const std::string& name) const {
    std::vector<uint32_t> device_ids;
    for (auto it = sessions_.lower_bound(ProtocolAddress(name, 0));
         it != sessions_.end() && it->first.GetName() == name; ++it) {
        device_ids.push_back(it->first.GetDeviceId());
    }
    return device_ids;
}

}
