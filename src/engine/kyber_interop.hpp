#pragma once

#include "engine_failure.hpp"
#include "secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace sigil::engine {

/// Kyber-1024 key encapsulation through liboqs. Secret keys and shared
/// secrets are returned in sodium-backed secure memory.
class KyberInterop {
public:
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, EngineFailure> GenerateKeyPair();

    static Result<std::pair<std::vector<uint8_t>, SecureMemoryHandle>, EngineFailure> Encapsulate(
        std::span<const uint8_t> public_key);

    static Result<SecureMemoryHandle, EngineFailure> Decapsulate(
        std::span<const uint8_t> ciphertext,
        const SecureMemoryHandle& secret_key);

private:
    static Result<void*, EngineFailure> CreateInstance();
    static void FreeInstance(void* kem);
};

}
