#pragma once
#include "sigil/core/constants.hpp"
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/ffi/resource_handle.hpp"
#include "sigil/keys/public_key.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>
namespace sigil::protocol::crypto {
using keys::PublicKey;
using FingerprintHandle = ffi::ResourceHandle<ffi::FingerprintTraits>;
/**
 * @brief Safety number for a pair of identities.
 *
 * Both parties compute the same 60-digit display string. The scannable
 * encoding is per side: Compare() accepts when the second argument is the
 * other party's encoding of the same pair.
 */
class Fingerprint {
public:
    /// iterations must be in [2, 1000000].
    [[nodiscard]] static Result<Fingerprint, SigilFailure> Create(
        std::span<const uint8_t> local_identifier,
        const PublicKey& local_key,
        std::span<const uint8_t> remote_identifier,
        const PublicKey& remote_key,
        uint32_t iterations = FingerprintConstants::DEFAULT_ITERATIONS,
        uint32_t version = FingerprintConstants::DEFAULT_VERSION);
    [[nodiscard]] Result<std::string, SigilFailure> DisplayString() const;
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> ScannableEncoding() const;
    /// Fails with InvalidArgument when the two encodings carry different versions.
    [[nodiscard]] static Result<bool, SigilFailure> Compare(
        std::span<const uint8_t> ours,
        std::span<const uint8_t> theirs);
    [[nodiscard]] Result<Fingerprint, SigilFailure> Clone() const;
    void Dispose() noexcept;
    [[nodiscard]] bool IsDisposed() const noexcept;
    Fingerprint(Fingerprint&&) noexcept = default;
    Fingerprint& operator=(Fingerprint&&) noexcept = default;
    Fingerprint(const Fingerprint&) = delete;
    Fingerprint& operator=(const Fingerprint&) = delete;
    ~Fingerprint() = default;
private:
    explicit Fingerprint(FingerprintHandle handle) noexcept;
    FingerprintHandle handle_;
};
}
