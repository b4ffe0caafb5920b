#include "hkdf.hpp"
#include "sodium_interop.hpp"

#include "sigil/core/constants.hpp"
#include "sigil/core/format.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <memory>

namespace sigil::engine {

using protocol::CipherConstants;

namespace {
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const { EVP_KDF_CTX_free(ctx); }
    };
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
}

Result<Unit, EngineFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    if (output.empty()) {
        return Result<Unit, EngineFailure>::Err(
            EngineFailure::InvalidArgument("HKDF output length must be positive"));
    }
    if (output.size() > CipherConstants::HKDF_MAX_OUTPUT_SIZE) {
        return Result<Unit, EngineFailure>::Err(EngineFailure::InvalidArgument(
            compat::format("HKDF output size exceeds maximum allowed: {} > {}",
                output.size(), CipherConstants::HKDF_MAX_OUTPUT_SIZE)));
    }
    if (ikm.empty()) {
        return Result<Unit, EngineFailure>::Err(
            EngineFailure::InvalidArgument("HKDF input key material cannot be empty"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
    if (!kdf) {
        return Result<Unit, EngineFailure>::Err(
            EngineFailure::Internal("Failed to fetch HKDF algorithm"));
    }
    EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);
    if (!kctx) {
        return Result<Unit, EngineFailure>::Err(
            EngineFailure::Internal("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != 1) {
        SodiumInterop::SecureWipe(output);
        return Result<Unit, EngineFailure>::Err(
            EngineFailure::Internal("HKDF key derivation failed"));
    }
    return Result<Unit, EngineFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, EngineFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    const size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, EngineFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, EngineFailure>::Ok(std::move(output));
}

}
