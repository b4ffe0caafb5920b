#include "aes_gcm.hpp"
#include "sodium_interop.hpp"

#include "sigil/core/constants.hpp"
#include "sigil/core/format.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>

namespace sigil::engine {

using protocol::CipherConstants;

namespace {
    constexpr int OPENSSL_SUCCESS = 1;

    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == 0) {
            return "Unknown OpenSSL error";
        }
        char buffer[CipherConstants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    Result<Unit, EngineFailure> CheckParameters(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != CipherConstants::AES_KEY_SIZE) {
            return Result<Unit, EngineFailure>::Err(EngineFailure::InvalidArgument(
                compat::format("AES-256-GCM key must be {} bytes, got {}",
                    CipherConstants::AES_KEY_SIZE, key.size())));
        }
        if (nonce.size() != CipherConstants::AES_GCM_NONCE_SIZE) {
            return Result<Unit, EngineFailure>::Err(EngineFailure::InvalidArgument(
                compat::format("AES-GCM nonce must be {} bytes, got {}",
                    CipherConstants::AES_GCM_NONCE_SIZE, nonce.size())));
        }
        return Result<Unit, EngineFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, EngineFailure> CipherFailure(std::string_view what) {
        return Result<std::vector<uint8_t>, EngineFailure>::Err(
            EngineFailure::Internal(compat::format("{}: {}", what, GetOpenSSLError())));
    }
}

Result<std::vector<uint8_t>, EngineFailure> AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = CheckParameters(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, EngineFailure>::Err(std::move(check).UnwrapErr());
    }

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return CipherFailure("Failed to create cipher context");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OPENSSL_SUCCESS ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OPENSSL_SUCCESS ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OPENSSL_SUCCESS) {
        return CipherFailure("Failed to initialize AES-256-GCM");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen, associated_data.data(),
                              static_cast<int>(associated_data.size())) != OPENSSL_SUCCESS) {
            return CipherFailure("Failed to add associated data");
        }
    }

    std::vector<uint8_t> output(plaintext.size() + CipherConstants::AES_GCM_TAG_SIZE);
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != OPENSSL_SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return CipherFailure("Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OPENSSL_SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return CipherFailure("Encryption finalization failed");
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(CipherConstants::AES_GCM_TAG_SIZE),
                            output.data() + ciphertext_len) != OPENSSL_SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return CipherFailure("Failed to get authentication tag");
    }
    output.resize(static_cast<size_t>(ciphertext_len) + CipherConstants::AES_GCM_TAG_SIZE);
    return Result<std::vector<uint8_t>, EngineFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, EngineFailure> AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = CheckParameters(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, EngineFailure>::Err(std::move(check).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < CipherConstants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, EngineFailure>::Err(EngineFailure::InvalidMessage(
            compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                ciphertext_with_tag.size(), CipherConstants::AES_GCM_TAG_SIZE)));
    }

    const size_t ciphertext_len = ciphertext_with_tag.size() - CipherConstants::AES_GCM_TAG_SIZE;
    const auto ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                             ciphertext_with_tag.end());

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return CipherFailure("Failed to create cipher context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OPENSSL_SUCCESS ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OPENSSL_SUCCESS ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OPENSSL_SUCCESS) {
        return CipherFailure("Failed to initialize AES-256-GCM");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen, associated_data.data(),
                              static_cast<int>(associated_data.size())) != OPENSSL_SUCCESS) {
            return CipherFailure("Failed to add associated data");
        }
    }

    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != OPENSSL_SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return CipherFailure("Decryption failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(CipherConstants::AES_GCM_TAG_SIZE), tag.data()) != OPENSSL_SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return CipherFailure("Failed to set authentication tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OPENSSL_SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return Result<std::vector<uint8_t>, EngineFailure>::Err(
            EngineFailure::VerificationFailed("Authentication tag verification failed"));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, EngineFailure>::Ok(std::move(output));
}

}
