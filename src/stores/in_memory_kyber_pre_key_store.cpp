#include "sigil/stores/in_memory/in_memory_kyber_pre_key_store.hpp"

namespace sigil::protocol::stores {

Result<std::optional<KyberPreKeyRecord>, SigilFailure> InMemoryKyberPreKeyStore::LoadKyberPreKey(
    const uint32_t kyber_pre_key_id) {
    using LoadResult = Result<std::optional<KyberPreKeyRecord>, SigilFailure>;
    const auto it = kyber_pre_keys_.find(kyber_pre_key_id);
    if (it == kyber_pre_keys_.end()) {
        return LoadResult::Ok(std::nullopt);
    }
    SIGIL_TRY_ASSIGN(bytes, it->second.Expose());
    SIGIL_TRY_ASSIGN(record, KyberPreKeyRecord::Deserialize(bytes));
    return LoadResult::Ok(std::optional<KyberPreKeyRecord>(std::move(record)));
}

Result<Unit, SigilFailure> InMemoryKyberPreKeyStore::StoreKyberPreKey(
    const uint32_t kyber_pre_key_id,
    const KyberPreKeyRecord& record) {
    SIGIL_TRY_ASSIGN(bytes, record.Serialize());
    kyber_pre_keys_.insert_or_assign(kyber_pre_key_id, std::move(bytes));
    return Result<Unit, SigilFailure>::Ok(Unit{});
}

bool InMemoryKyberPreKeyStore::ContainsKyberPreKey(const uint32_t kyber_pre_key_id) const {
    return kyber_pre_keys_.contains(kyber_pre_key_id);
}

void InMemoryKyberPreKeyStore::MarkKyberPreKeyUsed(const uint32_t kyber_pre_key_id) {
    used_.insert(kyber_pre_key_id);
}

void InMemoryKyberPreKeyStore::RemoveKyberPreKey(const uint32_t kyber_pre_key_id) {
    kyber_pre_keys_.erase(kyber_pre_key_id);
    used_.erase(kyber_pre_key_id);
}

std::vector<uint32_t> InMemoryKyberPreKeyStore::GetAllKyberPreKeyIds() const {
    std::vector<uint32_t> ids;
    ids.reserve(kyber_pre_keys_.size());
    for (const auto& [id, bytes] : kyber_pre_keys_) {
        ids.push_back(id);
    }
    return ids;
}

bool InMemoryKyberPreKeyStore::IsKyberPreKeyUsed(const uint32_t kyber_pre_key_id) const {
    return used_.contains(kyber_pre_key_id);
}

void InMemoryKyberPreKeyStore::Clear() noexcept {
    kyber_pre_keys_.clear();
    used_.clear();
}

}
