#pragma once
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/stores/i_signed_pre_key_store.hpp"
#include <cstddef>
#include <map>
namespace sigil::protocol::stores {
class InMemorySignedPreKeyStore final : public ISignedPreKeyStore {
public:
    [[nodiscard]] Result<std::optional<SignedPreKeyRecord>, SigilFailure> LoadSignedPreKey(uint32_t signed_pre_key_id) override;
    [[nodiscard]] Result<Unit, SigilFailure> StoreSignedPreKey(uint32_t signed_pre_key_id, const SignedPreKeyRecord& record) override;
    [[nodiscard]] bool ContainsSignedPreKey(uint32_t signed_pre_key_id) const override;
    void RemoveSignedPreKey(uint32_t signed_pre_key_id) override;
    [[nodiscard]] std::vector<uint32_t> GetAllSignedPreKeyIds() const override;
    void Clear() noexcept { signed_pre_keys_.clear(); }
    [[nodiscard]] size_t Size() const noexcept { return signed_pre_keys_.size(); }
private:
    std::map<uint32_t, crypto::SecureBytes> signed_pre_keys_;
};
}
