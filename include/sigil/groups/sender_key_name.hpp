#pragma once
#include "sigil/groups/distribution_id.hpp"
#include "sigil/session/protocol_address.hpp"
#include <compare>
#include <functional>
#include <string>
namespace sigil::protocol::groups {
using session::ProtocolAddress;
/// Store key for a sender key record: who sends, in which group.
struct SenderKeyName {
    ProtocolAddress sender;
    DistributionId distribution_id;
    [[nodiscard]] std::string ToString() const {
        return sender.ToString() + "::" + DistributionIdToString(distribution_id);
    }
    friend bool operator==(const SenderKeyName&, const SenderKeyName&) = default;
    friend std::strong_ordering operator<=>(const SenderKeyName&, const SenderKeyName&) = default;
};
}
template<>
struct std::hash<sigil::protocol::groups::SenderKeyName> {
    size_t operator()(const sigil::protocol::groups::SenderKeyName& name) const noexcept {
        size_t seed = std::hash<sigil::protocol::session::ProtocolAddress>{}(name.sender);
        for (const uint8_t b : name.distribution_id) {
            seed ^= b + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};
