#include "sigil/groups/distribution_id.hpp"
#include "sigil/core/format.hpp"

#include <algorithm>

namespace sigil::protocol::groups {
namespace {

int HexValue(const char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}

Result<DistributionId, SigilFailure> DistributionIdFromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != GroupConstants::DISTRIBUTION_ID_SIZE) {
        return Result<DistributionId, SigilFailure>::Err(
            SigilFailure::InvalidArgument("DistributionId",
                compat::format("Distribution id must be {} bytes, got {}",
                    GroupConstants::DISTRIBUTION_ID_SIZE, bytes.size())));
    }
    DistributionId id{};
    std::copy(bytes.begin(), bytes.end(), id.begin());
    return Result<DistributionId, SigilFailure>::Ok(id);
}

std::string DistributionIdToString(const DistributionId& id) {
    static constexpr char HEX_DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(HEX_DIGITS[id[i] >> 4]);
        out.push_back(HEX_DIGITS[id[i] & 0x0F]);
    }
    return out;
}

Result<DistributionId, SigilFailure> DistributionIdFromString(std::string_view uuid) {
    std::string digits;
    digits.reserve(32);
    for (const char c : uuid) {
        if (c != '-') {
            digits.push_back(c);
        }
    }
    if (digits.size() != GroupConstants::DISTRIBUTION_ID_SIZE * 2) {
        return Result<DistributionId, SigilFailure>::Err(
            SigilFailure::InvalidArgument("DistributionId",
                compat::format("Invalid UUID string: {}", uuid)));
    }
    DistributionId id{};
    for (size_t i = 0; i < id.size(); ++i) {
        const int high = HexValue(digits[i * 2]);
        const int low = HexValue(digits[i * 2 + 1]);
        if (high < 0 || low < 0) {
            return Result<DistributionId, SigilFailure>::Err(
                SigilFailure::InvalidArgument("DistributionId",
                    compat::format("Invalid UUID string: {}", uuid)));
        }
        id[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return Result<DistributionId, SigilFailure>::Ok(id);
}

SglUuid ToNativeUuid(const DistributionId& id) noexcept {
    SglUuid uuid{};
    std::copy(id.begin(), id.end(), uuid.bytes);
    return uuid;
}

DistributionId FromNativeUuid(const SglUuid& uuid) noexcept {
    DistributionId id{};
    std::copy(std::begin(uuid.bytes), std::end(uuid.bytes), id.begin());
    return id;
}

}
