#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/crypto/secure_memory.hpp"

namespace sigil::protocol::crypto {

SecureBytes::SecureBytes(std::vector<uint8_t> bytes) noexcept
    : bytes_(std::move(bytes)) {}

SecureBytes::~SecureBytes() {
    Dispose();
}

SecureBytes SecureBytes::CopyFrom(std::span<const uint8_t> bytes) {
    return SecureBytes(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept
    : bytes_(std::move(other.bytes_))
    , disposed_(other.disposed_) {
    other.bytes_.clear();
    other.disposed_ = true;
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        Dispose();
        bytes_ = std::move(other.bytes_);
        disposed_ = other.disposed_;
        other.bytes_.clear();
        other.disposed_ = true;
    }
    return *this;
}

Result<std::span<const uint8_t>, SigilFailure> SecureBytes::Expose() const {
    if (disposed_) {
        return Result<std::span<const uint8_t>, SigilFailure>::Err(
            SigilFailure::Disposed("SecureBytes"));
    }
    return Result<std::span<const uint8_t>, SigilFailure>::Ok(
        std::span<const uint8_t>(bytes_));
}

void SecureBytes::Dispose() noexcept {
    SecureMemory::Zero(bytes_);
    std::vector<uint8_t>().swap(bytes_);
    disposed_ = true;
}

}
