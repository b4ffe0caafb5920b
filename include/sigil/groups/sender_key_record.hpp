#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::groups {
using SenderKeyRecordHandle = ffi::ResourceHandle<ffi::SenderKeyRecordTraits>;
/// Sender key chains for one (sender, distribution id). At most five states are kept.
class SenderKeyRecord {
public:
    [[nodiscard]] static Result<SenderKeyRecord, SigilFailure> NewFresh();
    [[nodiscard]] static Result<SenderKeyRecord, SigilFailure> Deserialize(std::span<const uint8_t> data);
    /// Empty for a record with no states.
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Serialize() const;
    [[nodiscard]] Result<SenderKeyRecord, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    [[nodiscard]] const SenderKeyRecordHandle& Handle() const noexcept { return handle_; }
    [[nodiscard]] SenderKeyRecordHandle& Handle() noexcept { return handle_; }
    SenderKeyRecord(SenderKeyRecord&&) noexcept = default;
    SenderKeyRecord& operator=(SenderKeyRecord&&) noexcept = default;
    SenderKeyRecord(const SenderKeyRecord&) = delete;
    SenderKeyRecord& operator=(const SenderKeyRecord&) = delete;
    ~SenderKeyRecord() = default;
private:
    explicit SenderKeyRecord(SenderKeyRecordHandle handle) noexcept;
    SenderKeyRecordHandle handle_;
};
}
