#include "sigil/stores/in_memory/in_memory_signed_pre_key_store.hpp"

namespace sigil::protocol::stores {

Result<std::optional<SignedPreKeyRecord>, SigilFailure> InMemorySignedPreKeyStore::LoadSignedPreKey(
    const uint32_t signed_pre_key_id) {
    using LoadResult = Result<std::optional<SignedPreKeyRecord>, SigilFailure>;
    const auto it = signed_pre_keys_.find(signed_pre_key_id);
    if (it == signed_pre_keys_.end()) {
        return LoadResult::Ok(std::nullopt);
    }
    SIGIL_TRY_ASSIGN(bytes, it->second.Expose());
    SIGIL_TRY_ASSIGN(record, SignedPreKeyRecord::Deserialize(bytes));
    return LoadResult::Ok(std::optional<SignedPreKeyRecord>(std::move(record)));
}

Result<Unit, SigilFailure> InMemorySignedPreKeyStore::StoreSignedPreKey(
    const uint32_t signed_pre_key_id,
    const SignedPreKeyRecord& record) {
    SIGIL_TRY_ASSIGN(bytes, record.Serialize());
    signed_pre_keys_.insert_or_assign(signed_pre_key_id, std::move(bytes));
    return Result<Unit, SigilFailure>::Ok(Unit{});
}

bool InMemorySignedPreKeyStore::ContainsSignedPreKey(const uint32_t signed_pre_key_id) const {
    return signed_pre_keys_.contains(signed_pre_key_id);
}

void InMemorySignedPreKeyStore::RemoveSignedPreKey(const uint32_t signed_pre_key_id) {
    signed_pre_keys_.erase(signed_pre_key_id);
}

std::vector<uint32_t> InMemorySignedPreKeyStore::GetAllSignedPreKeyIds() const {
    std::vector<uint32_t> ids;
    ids.reserve(signed_pre_keys_.size());
    for (const auto& [id, bytes] : signed_pre_keys_) {
        ids.push_back(id);
    }
    return ids;
}

}
