#include "kyber_interop.hpp"
#include "sodium_interop.hpp"

#include "sigil/core/constants.hpp"
#include "sigil/core/format.hpp"

#include <oqs/oqs.h>

namespace sigil::engine {

using protocol::ErrorMessages;
using protocol::KeyConstants;

Result<void*, EngineFailure> KyberInterop::CreateInstance() {
    OQS_KEM* kem = OQS_KEM_new(OQS_KEM_alg_kyber_1024);
    if (kem == nullptr) {
        return Result<void*, EngineFailure>::Err(
            EngineFailure::Unsupported(std::string(ErrorMessages::OQS_KEM_UNAVAILABLE)));
    }
    if (kem->length_public_key != KeyConstants::KYBER_1024_PUBLIC_KEY_SIZE ||
        kem->length_secret_key != KeyConstants::KYBER_1024_SECRET_KEY_SIZE ||
        kem->length_ciphertext != KeyConstants::KYBER_1024_CIPHERTEXT_SIZE ||
        kem->length_shared_secret != KeyConstants::KYBER_1024_SHARED_SECRET_SIZE) {
        OQS_KEM_free(kem);
        return Result<void*, EngineFailure>::Err(
            EngineFailure::Internal("Kyber-1024 parameter sizes do not match"));
    }
    return Result<void*, EngineFailure>::Ok(kem);
}

void KyberInterop::FreeInstance(void* kem) {
    if (kem != nullptr) {
        OQS_KEM_free(static_cast<OQS_KEM*>(kem));
    }
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, EngineFailure> KyberInterop::GenerateKeyPair() {
    using ResultType = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, EngineFailure>;

    auto kem_result = CreateInstance();
    if (kem_result.IsErr()) {
        return ResultType::Err(std::move(kem_result).UnwrapErr());
    }
    auto* kem = static_cast<OQS_KEM*>(kem_result.Unwrap());

    auto sk_result = SecureMemoryHandle::Allocate(KeyConstants::KYBER_1024_SECRET_KEY_SIZE);
    if (sk_result.IsErr()) {
        FreeInstance(kem);
        return ResultType::Err(std::move(sk_result).UnwrapErr());
    }
    auto sk_handle = std::move(sk_result).Unwrap();

    std::vector<uint8_t> pk(KeyConstants::KYBER_1024_PUBLIC_KEY_SIZE);
    const OQS_STATUS status = sk_handle.WithWriteAccess([&](std::span<uint8_t> sk) {
        return OQS_KEM_keypair(kem, pk.data(), sk.data());
    });
    FreeInstance(kem);

    if (status != OQS_SUCCESS) {
        return ResultType::Err(EngineFailure::Internal("Kyber-1024 key generation failed"));
    }
    return ResultType::Ok(std::make_pair(std::move(sk_handle), std::move(pk)));
}

Result<std::pair<std::vector<uint8_t>, SecureMemoryHandle>, EngineFailure> KyberInterop::Encapsulate(
    std::span<const uint8_t> public_key) {
    using ResultType = Result<std::pair<std::vector<uint8_t>, SecureMemoryHandle>, EngineFailure>;

    if (public_key.size() != KeyConstants::KYBER_1024_PUBLIC_KEY_SIZE) {
        return ResultType::Err(EngineFailure::InvalidKey(
            compat::format("Kyber-1024 public key must be {} bytes, got {}",
                KeyConstants::KYBER_1024_PUBLIC_KEY_SIZE, public_key.size())));
    }

    auto kem_result = CreateInstance();
    if (kem_result.IsErr()) {
        return ResultType::Err(std::move(kem_result).UnwrapErr());
    }
    auto* kem = static_cast<OQS_KEM*>(kem_result.Unwrap());

    auto ss_result = SecureMemoryHandle::Allocate(KeyConstants::KYBER_1024_SHARED_SECRET_SIZE);
    if (ss_result.IsErr()) {
        FreeInstance(kem);
        return ResultType::Err(std::move(ss_result).UnwrapErr());
    }
    auto ss_handle = std::move(ss_result).Unwrap();

    std::vector<uint8_t> ciphertext(KeyConstants::KYBER_1024_CIPHERTEXT_SIZE);
    const OQS_STATUS status = ss_handle.WithWriteAccess([&](std::span<uint8_t> ss) {
        return OQS_KEM_encaps(kem, ciphertext.data(), ss.data(), public_key.data());
    });
    FreeInstance(kem);

    if (status != OQS_SUCCESS) {
        return ResultType::Err(EngineFailure::InvalidKey("Kyber-1024 encapsulation failed"));
    }
    return ResultType::Ok(std::make_pair(std::move(ciphertext), std::move(ss_handle)));
}

Result<SecureMemoryHandle, EngineFailure> KyberInterop::Decapsulate(
    std::span<const uint8_t> ciphertext,
    const SecureMemoryHandle& secret_key) {
    if (ciphertext.size() != KeyConstants::KYBER_1024_CIPHERTEXT_SIZE) {
        return Result<SecureMemoryHandle, EngineFailure>::Err(EngineFailure::InvalidMessage(
            compat::format("Kyber-1024 ciphertext must be {} bytes, got {}",
                KeyConstants::KYBER_1024_CIPHERTEXT_SIZE, ciphertext.size())));
    }
    if (secret_key.Size() != KeyConstants::KYBER_1024_SECRET_KEY_SIZE) {
        return Result<SecureMemoryHandle, EngineFailure>::Err(
            EngineFailure::InvalidKey("Kyber-1024 secret key has the wrong size"));
    }

    auto kem_result = CreateInstance();
    if (kem_result.IsErr()) {
        return Result<SecureMemoryHandle, EngineFailure>::Err(std::move(kem_result).UnwrapErr());
    }
    auto* kem = static_cast<OQS_KEM*>(kem_result.Unwrap());

    auto ss_result = SecureMemoryHandle::Allocate(KeyConstants::KYBER_1024_SHARED_SECRET_SIZE);
    if (ss_result.IsErr()) {
        FreeInstance(kem);
        return ss_result;
    }
    auto ss_handle = std::move(ss_result).Unwrap();

    const OQS_STATUS status = secret_key.WithReadAccess([&](std::span<const uint8_t> sk) {
        return ss_handle.WithWriteAccess([&](std::span<uint8_t> ss) {
            return OQS_KEM_decaps(kem, ss.data(), ciphertext.data(), sk.data());
        });
    });
    FreeInstance(kem);

    if (status != OQS_SUCCESS) {
        return Result<SecureMemoryHandle, EngineFailure>::Err(
            EngineFailure::InvalidMessage("Kyber-1024 decapsulation failed"));
    }
    return Result<SecureMemoryHandle, EngineFailure>::Ok(std::move(ss_handle));
}

}
