#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/prekeys/pre_key_record.hpp"
#include <cstdint>
#include <optional>
#include <vector>
namespace sigil::protocol::stores {
using protocol::Result;
using protocol::SigilFailure;
using protocol::Unit;
using prekeys::PreKeyRecord;
class IPreKeyStore {
public:
    virtual ~IPreKeyStore() = default;
    [[nodiscard]] virtual Result<std::optional<PreKeyRecord>, SigilFailure> LoadPreKey(uint32_t pre_key_id) = 0;
    [[nodiscard]] virtual Result<Unit, SigilFailure> StorePreKey(uint32_t pre_key_id, const PreKeyRecord& record) = 0;
    [[nodiscard]] virtual bool ContainsPreKey(uint32_t pre_key_id) const = 0;
    virtual void RemovePreKey(uint32_t pre_key_id) = 0;
    [[nodiscard]] virtual std::vector<uint32_t> GetAllPreKeyIds() const = 0;
};
}
