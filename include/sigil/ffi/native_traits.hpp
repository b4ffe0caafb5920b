#pragma once

#include "sigil/c_api/sgl_ffi.h"

#include <string_view>

namespace sigil::protocol::ffi {

/*
 * One traits struct per engine object type. ResourceHandle<Traits> reads:
 *   Native        the opaque engine struct
 *   MutPointer    SglMutPointerX, passed to destroy and mutating calls
 *   ConstPointer  SglConstPointerX, passed to every read-only call
 *   Name          type name used in Disposed failures and lifecycle logs
 *   Destroy       the engine destructor
 *   Clone         the engine copy function, where one exists
 */

#define SIGIL_NATIVE_TRAITS_BODY(TypeName, prefix) \
    using Native = Sgl##TypeName; \
    using MutPointer = SglMutPointer##TypeName; \
    using ConstPointer = SglConstPointer##TypeName; \
    static constexpr std::string_view Name = #TypeName; \
    static SglFfiError* Destroy(const MutPointer ptr) noexcept { \
        return prefix##_destroy(ptr); \
    }

#define SIGIL_DECLARE_NATIVE_TRAITS(TypeName, prefix) \
    struct TypeName##Traits { \
        SIGIL_NATIVE_TRAITS_BODY(TypeName, prefix) \
    };

#define SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(TypeName, prefix) \
    struct TypeName##Traits { \
        SIGIL_NATIVE_TRAITS_BODY(TypeName, prefix) \
        static SglFfiError* Clone(MutPointer* out, const ConstPointer ptr) noexcept { \
            return prefix##_clone(out, ptr); \
        } \
    };

SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(PublicKey, sgl_publickey)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(PrivateKey, sgl_privatekey)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(KyberPublicKey, sgl_kyber_public_key)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(KyberSecretKey, sgl_kyber_secret_key)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(KyberKeyPair, sgl_kyber_key_pair)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(PreKeyRecord, sgl_pre_key_record)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(SignedPreKeyRecord, sgl_signed_pre_key_record)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(KyberPreKeyRecord, sgl_kyber_pre_key_record)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(PreKeyBundle, sgl_pre_key_bundle)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(SessionRecord, sgl_session_record)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(SenderKeyRecord, sgl_sender_key_record)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(SenderKeyMessage, sgl_sender_key_message)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(SenderKeyDistributionMessage, sgl_sender_key_distribution_message)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(ServerCertificate, sgl_server_certificate)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(SenderCertificate, sgl_sender_certificate)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(SignalMessage, sgl_signal_message)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(DecryptionErrorMessage, sgl_decryption_error_message)
SIGIL_DECLARE_CLONABLE_NATIVE_TRAITS(Fingerprint, sgl_fingerprint)
SIGIL_DECLARE_NATIVE_TRAITS(Aes256GcmCipher, sgl_aes256_gcm_cipher)

}
