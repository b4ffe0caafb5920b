#pragma once
#include "sigil/stores/i_sender_key_store.hpp"
#include <cstddef>
#include <map>
#include <vector>
namespace sigil::protocol::stores {
class InMemorySenderKeyStore final : public ISenderKeyStore {
public:
    [[nodiscard]] Result<std::optional<SenderKeyRecord>, SigilFailure> LoadSenderKey(const SenderKeyName& name) override;
    [[nodiscard]] Result<Unit, SigilFailure> StoreSenderKey(const SenderKeyName& name, const SenderKeyRecord& record) override;
    [[nodiscard]] bool ContainsSenderKey(const SenderKeyName& name) const;
    void Clear() noexcept { sender_keys_.clear(); }
    [[nodiscard]] size_t Size() const noexcept { return sender_keys_.size(); }
private:
    std::map<SenderKeyName, std::vector<uint8_t>> sender_keys_;
};
}
