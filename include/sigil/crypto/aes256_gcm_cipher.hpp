#pragma once
#include "sigil/configuration/binding_config.hpp"
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::crypto {
using configuration::BindingConfig;
using Aes256GcmCipherHandle = ffi::ResourceHandle<ffi::Aes256GcmCipherTraits>;
/**
 * @brief AES-256-GCM context keyed once, used for many messages.
 *
 * The caller owns nonce uniqueness: reusing a (key, nonce) pair breaks both
 * confidentiality and integrity.
 */
class Aes256GcmCipher {
public:
    /// key must be 32 bytes.
    [[nodiscard]] static Result<Aes256GcmCipher, SigilFailure> New(
        std::span<const uint8_t> key,
        BindingConfig config = BindingConfig::Default());
    /// Returns ciphertext followed by the 16-byte tag.
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data = {}) const;
    /// Fails with CryptoError when the tag does not verify.
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Decrypt(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data = {}) const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    Aes256GcmCipher(Aes256GcmCipher&&) noexcept = default;
    Aes256GcmCipher& operator=(Aes256GcmCipher&&) noexcept = default;
    Aes256GcmCipher(const Aes256GcmCipher&) = delete;
    Aes256GcmCipher& operator=(const Aes256GcmCipher&) = delete;
    ~Aes256GcmCipher() = default;
private:
    Aes256GcmCipher(Aes256GcmCipherHandle handle, BindingConfig config) noexcept;
    [[nodiscard]] Result<Unit, SigilFailure> CheckInputs(
        std::span<const uint8_t> payload,
        std::span<const uint8_t> nonce,
        const char* context) const;
    Aes256GcmCipherHandle handle_;
    BindingConfig config_;
};
}
