#include "sigil/crypto/fingerprint.hpp"
#include "sigil/ffi/ffi_helpers.hpp"

namespace sigil::protocol::crypto {
using ffi::Borrow;

Fingerprint::Fingerprint(FingerprintHandle handle) noexcept
    : handle_(std::move(handle)) {}

Result<Fingerprint, SigilFailure> Fingerprint::Create(
    std::span<const uint8_t> local_identifier,
    const PublicKey& local_key,
    std::span<const uint8_t> remote_identifier,
    const PublicKey& remote_key,
    const uint32_t iterations,
    const uint32_t version) {
    SIGIL_TRY_ASSIGN(local, local_key.Handle().Use());
    SIGIL_TRY_ASSIGN(remote, remote_key.Handle().Use());
    SIGIL_TRY_ASSIGN(handle, FingerprintHandle::Create("Fingerprint.Create",
        [&](SglMutPointerFingerprint* out) {
            return sgl_fingerprint_new(out, iterations, version,
                Borrow(local_identifier), local, Borrow(remote_identifier), remote);
        }));
    return Result<Fingerprint, SigilFailure>::Ok(Fingerprint(std::move(handle)));
}

Result<std::string, SigilFailure> Fingerprint::DisplayString() const {
    SIGIL_TRY_ASSIGN(fingerprint, handle_.Use());
    SIGIL_TRY_ASSIGN(display, ffi::CallForString("Fingerprint.DisplayString", [fingerprint](const char** out) {
        return sgl_fingerprint_display_string(out, fingerprint);
    }));
    if (!display.has_value()) {
        return Result<std::string, SigilFailure>::Err(SigilFailure::NullPointer(
            "Fingerprint.DisplayString", std::string(ErrorMessages::NATIVE_RETURNED_NULL)));
    }
    return Result<std::string, SigilFailure>::Ok(std::move(*display));
}

Result<std::vector<uint8_t>, SigilFailure> Fingerprint::ScannableEncoding() const {
    return handle_.With([](const SglConstPointerFingerprint fingerprint) {
        return ffi::CallForBytes("Fingerprint.ScannableEncoding", [fingerprint](SglOwnedBuffer* out) {
            return sgl_fingerprint_scannable_encoding(out, fingerprint);
        });
    });
}

Result<bool, SigilFailure> Fingerprint::Compare(std::span<const uint8_t> ours, std::span<const uint8_t> theirs) {
    return ffi::CallForValue<bool>("Fingerprint.Compare", [ours, theirs](bool* out) {
        return sgl_fingerprint_compare(out, Borrow(ours), Borrow(theirs));
    });
}

Result<Fingerprint, SigilFailure> Fingerprint::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<Fingerprint, SigilFailure>::Ok(Fingerprint(std::move(copy)));
}

void Fingerprint::Dispose() noexcept {
    handle_.Dispose();
}

bool Fingerprint::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
