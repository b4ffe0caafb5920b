#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/prekeys/kyber_pre_key_record.hpp"
#include <cstdint>
#include <optional>
#include <vector>
namespace sigil::protocol::stores {
using protocol::Result;
using protocol::SigilFailure;
using protocol::Unit;
using prekeys::KyberPreKeyRecord;
class IKyberPreKeyStore {
public:
    virtual ~IKyberPreKeyStore() = default;
    [[nodiscard]] virtual Result<std::optional<KyberPreKeyRecord>, SigilFailure> LoadKyberPreKey(uint32_t kyber_pre_key_id) = 0;
    [[nodiscard]] virtual Result<Unit, SigilFailure> StoreKyberPreKey(uint32_t kyber_pre_key_id, const KyberPreKeyRecord& record) = 0;
    [[nodiscard]] virtual bool ContainsKyberPreKey(uint32_t kyber_pre_key_id) const = 0;
    /// Last-resort keys stay stored after use; the flag lets the host rotate them.
    virtual void MarkKyberPreKeyUsed(uint32_t kyber_pre_key_id) = 0;
    virtual void RemoveKyberPreKey(uint32_t kyber_pre_key_id) = 0;
    [[nodiscard]] virtual std::vector<uint32_t> GetAllKyberPreKeyIds() const = 0;
};
}
