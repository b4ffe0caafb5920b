#include "sigil/stores/in_memory/in_memory_pre_key_store.hpp"

namespace sigil::protocol::stores {

Result<std::optional<PreKeyRecord>, SigilFailure> InMemoryPreKeyStore::LoadPreKey(const uint32_t pre_key_id) {
    using LoadResult = Result<std::optional<PreKeyRecord>, SigilFailure>;
    const auto it = pre_keys_.find(pre_key_id);
    if (it == pre_keys_.end()) {
        return LoadResult::Ok(std::nullopt);
    }
    SIGIL_TRY_ASSIGN(bytes, it->second.Expose());
    SIGIL_TRY_ASSIGN(record, PreKeyRecord::Deserialize(bytes));
    return LoadResult::Ok(std::optional<PreKeyRecord>(std::move(record)));
}

Result<Unit, SigilFailure> InMemoryPreKeyStore::StorePreKey(const uint32_t pre_key_id, const PreKeyRecord& record) {
    SIGIL_TRY_ASSIGN(bytes, record.Serialize());
    pre_keys_.insert_or_assign(pre_key_id, std::move(bytes));
    return Result<Unit, SigilFailure>::Ok(Unit{});
}

bool InMemoryPreKeyStore::ContainsPreKey(const uint32_t pre_key_id) const {
    return pre_keys_.contains(pre_key_id);
}

void InMemoryPreKeyStore::RemovePreKey(const uint32_t pre_key_id) {
    pre_keys_.erase(pre_key_id);
}

std::vector<uint32_t> InMemoryPreKeyStore::GetAllPreKeyIds() const {
    std::vector<uint32_t> ids;
    ids.reserve(pre_keys_.size());
    for (const auto& [id, bytes] : pre_keys_) {
        ids.push_back(id);
    }
    return ids;
}

}
