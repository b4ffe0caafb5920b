#pragma once
#include "sigil/c_api/sgl_ffi.h"
#include "sigil/core/constants.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/core/result.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
namespace sigil::protocol::groups {
using protocol::Result;
using protocol::SigilFailure;
/// 16-byte group identifier, conventionally a random UUID.
using DistributionId = std::array<uint8_t, GroupConstants::DISTRIBUTION_ID_SIZE>;
/// Fails with InvalidArgument unless exactly 16 bytes are given.
[[nodiscard]] Result<DistributionId, SigilFailure> DistributionIdFromBytes(std::span<const uint8_t> bytes);
/// Lower-case 8-4-4-4-12 form.
[[nodiscard]] std::string DistributionIdToString(const DistributionId& id);
/// Accepts the hyphenated or bare 32-digit form, either case.
[[nodiscard]] Result<DistributionId, SigilFailure> DistributionIdFromString(std::string_view uuid);
[[nodiscard]] SglUuid ToNativeUuid(const DistributionId& id) noexcept;
[[nodiscard]] DistributionId FromNativeUuid(const SglUuid& uuid) noexcept;
}
