#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/prekeys/signed_pre_key_record.hpp"
#include <cstdint>
#include <optional>
#include <vector>
namespace sigil::protocol::stores {
using protocol::Result;
using protocol::SigilFailure;
using protocol::Unit;
using prekeys::SignedPreKeyRecord;
class ISignedPreKeyStore {
public:
    virtual ~ISignedPreKeyStore() = default;
    [[nodiscard]] virtual Result<std::optional<SignedPreKeyRecord>, SigilFailure> LoadSignedPreKey(uint32_t signed_pre_key_id) = 0;
    [[nodiscard]] virtual Result<Unit, SigilFailure> StoreSignedPreKey(uint32_t signed_pre_key_id, const SignedPreKeyRecord& record) = 0;
    [[nodiscard]] virtual bool ContainsSignedPreKey(uint32_t signed_pre_key_id) const = 0;
    virtual void RemoveSignedPreKey(uint32_t signed_pre_key_id) = 0;
    [[nodiscard]] virtual std::vector<uint32_t> GetAllSignedPreKeyIds() const = 0;
};
}
