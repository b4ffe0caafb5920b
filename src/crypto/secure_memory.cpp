#include "sigil/crypto/secure_memory.hpp"

#include <sodium.h>

namespace sigil::protocol::crypto {

void SecureMemory::Zero(std::span<uint8_t> buffer) noexcept {
    if (buffer.empty()) {
        return;
    }
    sodium_memzero(buffer.data(), buffer.size());
}

void SecureMemory::Zero(std::vector<uint8_t>& buffer) noexcept {
    Zero(std::span<uint8_t>(buffer));
}

bool SecureMemory::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {

    const size_t longest = a.size() > b.size() ? a.size() : b.size();
    volatile uint8_t diff = a.size() == b.size() ? 0 : 1;
    for (size_t i = 0; i < longest; ++i) {
        const uint8_t lhs = i < a.size() ? a[i] : 0;
        const uint8_t rhs = i < b.size() ? b[i] : 0;
        diff = static_cast<uint8_t>(diff | (lhs ^ rhs));
    }
    return diff == 0;
}

}
