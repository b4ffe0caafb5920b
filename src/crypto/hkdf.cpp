#include "sigil/crypto/hkdf.hpp"
#include "sigil/c_api/sgl_ffi.h"
#include "sigil/core/constants.hpp"
#include "sigil/core/format.hpp"
#include "sigil/crypto/secure_memory.hpp"
#include "sigil/ffi/ffi_helpers.hpp"

#include <vector>

namespace sigil::protocol::crypto {

Result<SecureBytes, SigilFailure> Hkdf::DeriveSecrets(
    std::span<const uint8_t> input_key_material,
    std::span<const uint8_t> info,
    std::span<const uint8_t> salt,
    const size_t output_length) {
    if (output_length == 0 || output_length > CipherConstants::HKDF_MAX_OUTPUT_SIZE) {
        return Result<SecureBytes, SigilFailure>::Err(
            SigilFailure::InvalidArgument("Hkdf.DeriveSecrets",
                compat::format("Output length must be between 1 and {}, got {}",
                    CipherConstants::HKDF_MAX_OUTPUT_SIZE, output_length)));
    }
    std::vector<uint8_t> output(output_length);
    auto status = ffi::CheckNativeError(
        sgl_hkdf_derive(ffi::BorrowMutable(output), ffi::Borrow(input_key_material),
            ffi::Borrow(info), ffi::Borrow(salt)),
        "Hkdf.DeriveSecrets");
    if (status.IsErr()) {
        SecureMemory::Zero(output);
        return Result<SecureBytes, SigilFailure>::Err(std::move(status).UnwrapErr());
    }
    return Result<SecureBytes, SigilFailure>::Ok(SecureBytes(std::move(output)));
}

}
