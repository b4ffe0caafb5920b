#pragma once
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::keys {
using protocol::Result;
using protocol::SigilFailure;
using PublicKeyHandle = ffi::ResourceHandle<ffi::PublicKeyTraits>;
/**
 * @brief Curve25519 public key held by the engine.
 *
 * Serialized form is 33 bytes: the 0x05 type byte followed by the
 * Montgomery u-coordinate.
 */
class PublicKey {
public:
    [[nodiscard]] static Result<PublicKey, SigilFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] static PublicKey FromHandle(PublicKeyHandle handle) noexcept;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Serialize() const;
    /// The 32 key bytes without the type prefix.
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> GetPublicKeyBytes() const;
    /// XEdDSA verification. A bad signature is false, not a failure.
    [[nodiscard]] Result<bool, SigilFailure> Verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) const;
    [[nodiscard]] Result<bool, SigilFailure> Equals(const PublicKey& other) const;
    /// Byte-wise ordering of the serialized keys: -1, 0 or 1.
    [[nodiscard]] Result<int32_t, SigilFailure> Compare(const PublicKey& other) const;
    [[nodiscard]] Result<PublicKey, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    [[nodiscard]] const PublicKeyHandle& Handle() const noexcept { return handle_; }
    PublicKey(PublicKey&&) noexcept = default;
    PublicKey& operator=(PublicKey&&) noexcept = default;
    PublicKey(const PublicKey&) = delete;
    PublicKey& operator=(const PublicKey&) = delete;
    ~PublicKey() = default;
private:
    explicit PublicKey(PublicKeyHandle handle) noexcept;
    PublicKeyHandle handle_;
};
}
