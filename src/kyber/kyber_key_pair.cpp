#include "sigil/kyber/kyber_key_pair.hpp"
#include "sigil/ffi/ffi_helpers.hpp"

namespace sigil::protocol::kyber {

KyberKeyPair::KyberKeyPair(KyberKeyPairHandle handle) noexcept
    : handle_(std::move(handle)) {}

KyberKeyPair KyberKeyPair::FromHandle(KyberKeyPairHandle handle) noexcept {
    return KyberKeyPair(std::move(handle));
}

Result<KyberKeyPair, SigilFailure> KyberKeyPair::Generate() {
    SIGIL_TRY_ASSIGN(handle, KyberKeyPairHandle::Create("KyberKeyPair.Generate",
        [](SglMutPointerKyberKeyPair* out) {
            return sgl_kyber_key_pair_generate(out);
        }));
    return Result<KyberKeyPair, SigilFailure>::Ok(KyberKeyPair(std::move(handle)));
}

Result<KyberPublicKey, SigilFailure> KyberKeyPair::GetPublicKey() const {
    SIGIL_TRY_ASSIGN(pair, handle_.Use());
    SIGIL_TRY_ASSIGN(public_handle, KyberPublicKeyHandle::Create("KyberKeyPair.GetPublicKey",
        [pair](SglMutPointerKyberPublicKey* out) {
            return sgl_kyber_key_pair_get_public_key(out, pair);
        }));
    return Result<KyberPublicKey, SigilFailure>::Ok(KyberPublicKey::FromHandle(std::move(public_handle)));
}

Result<KyberSecretKey, SigilFailure> KyberKeyPair::GetSecretKey() const {
    SIGIL_TRY_ASSIGN(pair, handle_.Use());
    SIGIL_TRY_ASSIGN(secret_handle, KyberSecretKeyHandle::Create("KyberKeyPair.GetSecretKey",
        [pair](SglMutPointerKyberSecretKey* out) {
            return sgl_kyber_key_pair_get_secret_key(out, pair);
        }));
    return Result<KyberSecretKey, SigilFailure>::Ok(KyberSecretKey::FromHandle(std::move(secret_handle)));
}

Result<KyberKeyPair, SigilFailure> KyberKeyPair::Clone() const {
    SIGIL_TRY_ASSIGN(copy, handle_.Clone());
    return Result<KyberKeyPair, SigilFailure>::Ok(KyberKeyPair(std::move(copy)));
}

void KyberKeyPair::Dispose() noexcept {
    handle_.Dispose();
}

bool KyberKeyPair::IsDisposed() const noexcept {
    return handle_.IsDisposed();
}

}
