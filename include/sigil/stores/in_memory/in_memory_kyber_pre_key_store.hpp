#pragma once
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/stores/i_kyber_pre_key_store.hpp"
#include <cstddef>
#include <map>
#include <set>
namespace sigil::protocol::stores {
class InMemoryKyberPreKeyStore final : public IKyberPreKeyStore {
public:
    [[nodiscard]] Result<std::optional<KyberPreKeyRecord>, SigilFailure> LoadKyberPreKey(uint32_t kyber_pre_key_id) override;
    [[nodiscard]] Result<Unit, SigilFailure> StoreKyberPreKey(uint32_t kyber_pre_key_id, const KyberPreKeyRecord& record) override;
    [[nodiscard]] bool ContainsKyberPreKey(uint32_t kyber_pre_key_id) const override;
    void MarkKyberPreKeyUsed(uint32_t kyber_pre_key_id) override;
    void RemoveKyberPreKey(uint32_t kyber_pre_key_id) override;
    [[nodiscard]] std::vector<uint32_t> GetAllKyberPreKeyIds() const override;
    [[nodiscard]] bool IsKyberPreKeyUsed(uint32_t kyber_pre_key_id) const;
    void Clear() noexcept;
    [[nodiscard]] size_t Size() const noexcept { return kyber_pre_keys_.size(); }
private:
    std::map<uint32_t, crypto::SecureBytes> kyber_pre_keys_;
    std::set<uint32_t> used_;
};
}
