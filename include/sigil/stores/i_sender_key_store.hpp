#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/groups/sender_key_name.hpp"
#include "sigil/groups/sender_key_record.hpp"
#include <optional>
namespace sigil::protocol::stores {
using protocol::Result;
using protocol::SigilFailure;
using protocol::Unit;
using groups::SenderKeyName;
using groups::SenderKeyRecord;
class ISenderKeyStore {
public:
    virtual ~ISenderKeyStore() = default;
    [[nodiscard]] virtual Result<std::optional<SenderKeyRecord>, SigilFailure> LoadSenderKey(const SenderKeyName& name) = 0;
    [[nodiscard]] virtual Result<Unit, SigilFailure> StoreSenderKey(const SenderKeyName& name, const SenderKeyRecord& record) = 0;
};
}
