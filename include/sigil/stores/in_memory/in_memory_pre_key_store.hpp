#pragma once
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/stores/i_pre_key_store.hpp"
#include <cstddef>
#include <map>
namespace sigil::protocol::stores {
class InMemoryPreKeyStore final : public IPreKeyStore {
public:
    [[nodiscard]] Result<std::optional<PreKeyRecord>, SigilFailure> LoadPreKey(uint32_t pre_key_id) override;
    [[nodiscard]] Result<Unit, SigilFailure> StorePreKey(uint32_t pre_key_id, const PreKeyRecord& record) override;
    [[nodiscard]] bool ContainsPreKey(uint32_t pre_key_id) const override;
    void RemovePreKey(uint32_t pre_key_id) override;
    [[nodiscard]] std::vector<uint32_t> GetAllPreKeyIds() const override;
    void Clear() noexcept { pre_keys_.clear(); }
    [[nodiscard]] size_t Size() const noexcept { return pre_keys_.size(); }
private:
    std::map<uint32_t, crypto::SecureBytes> pre_keys_;
};
}
