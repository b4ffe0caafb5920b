#pragma once
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
namespace sigil::protocol::session {
/// A recipient: account name plus device id. Plain value, no engine state.
class ProtocolAddress {
public:
    ProtocolAddress(std::string name, uint32_t device_id);
    [[nodiscard]] const std::string& GetName() const noexcept { return name_; }
    [[nodiscard]] uint32_t GetDeviceId() const noexcept { return device_id_; }
    /// "name.device_id"
    [[nodiscard]] std::string ToString() const;
    friend bool operator==(const ProtocolAddress&, const ProtocolAddress&) = default;
    friend std::strong_ordering operator<=>(const ProtocolAddress&, const ProtocolAddress&) = default;
private:
    std::string name_;
    uint32_t device_id_;
};
}
template<>
struct std::hash<sigil::protocol::session::ProtocolAddress> {
    size_t operator()(const sigil::protocol::session::ProtocolAddress& address) const noexcept {
        const size_t name_hash = std::hash<std::string>{}(address.GetName());
        return name_hash ^ (std::hash<uint32_t>{}(address.GetDeviceId()) + 0x9e3779b9 + (name_hash << 6) + (name_hash >> 2));
    }
};
