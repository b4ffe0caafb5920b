#include "sigil/stores/in_memory/in_memory_sender_key_store.hpp"

namespace sigil::protocol::stores {

Result<std::optional<SenderKeyRecord>, SigilFailure> InMemorySenderKeyStore::LoadSenderKey(const SenderKeyName& name) {
    using LoadResult = Result<std::optional<SenderKeyRecord>, SigilFailure>;
    const auto it = sender_keys_.find(name);
    if (it == sender_keys_.end()) {
        return LoadResult::Ok(std::nullopt);
    }
    if (it->second.empty()) {
        SIGIL_TRY_ASSIGN(fresh, SenderKeyRecord::NewFresh());
        return LoadResult::Ok(std::optional<SenderKeyRecord>(std::move(fresh)));
    }
    SIGIL_TRY_ASSIGN(record, SenderKeyRecord::Deserialize(it->second));
    return LoadResult::Ok(std::optional<SenderKeyRecord>(std::move(record)));
}

Result<Unit, SigilFailure> InMemorySenderKeyStore::StoreSenderKey(const SenderKeyName& name, const SenderKeyRecord& record) {
    SIGIL_TRY_ASSIGN(bytes, record.Serialize());
    sender_keys_.insert_or_assign(name, std::move(bytes));
    return Result<Unit, SigilFailure>::Ok(Unit{});
}

bool InMemorySenderKeyStore::ContainsSenderKey(const SenderKeyName& name) const {
    return sender_keys_.contains(name);
}

}
