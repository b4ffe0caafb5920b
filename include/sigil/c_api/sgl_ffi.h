#pragma once

#include "sigil/c_api/sgl_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define SGL_API_VERSION_MAJOR 1
#define SGL_API_VERSION_MINOR 0
#define SGL_API_VERSION_PATCH 0

typedef enum {
    SGL_ERROR_CODE_UNKNOWN_ERROR = 1,
    SGL_ERROR_CODE_INVALID_STATE = 2,
    SGL_ERROR_CODE_INTERNAL_ERROR = 3,
    SGL_ERROR_CODE_NULL_PARAMETER = 4,
    SGL_ERROR_CODE_INVALID_ARGUMENT = 5,
    SGL_ERROR_CODE_INVALID_TYPE = 6,
    SGL_ERROR_CODE_UNSUPPORTED = 7,
    SGL_ERROR_CODE_PROTOBUF_ERROR = 10,
    SGL_ERROR_CODE_INVALID_KEY = 20,
    SGL_ERROR_CODE_INVALID_SIGNATURE = 21,
    SGL_ERROR_CODE_INVALID_MESSAGE = 30,
    SGL_ERROR_CODE_DUPLICATED_MESSAGE = 31,
    SGL_ERROR_CODE_NO_SENDER_KEY_STATE = 32,
    SGL_ERROR_CODE_VERIFICATION_FAILED = 40,
    SGL_ERROR_CODE_FINGERPRINT_VERSION_MISMATCH = 41,
    SGL_ERROR_CODE_OUT_OF_MEMORY = 50
} SglErrorCode;

typedef enum {
    SGL_CIPHERTEXT_MESSAGE_TYPE_WHISPER = 2,
    SGL_CIPHERTEXT_MESSAGE_TYPE_PRE_KEY = 3,
    SGL_CIPHERTEXT_MESSAGE_TYPE_SENDER_KEY = 7,
    SGL_CIPHERTEXT_MESSAGE_TYPE_PLAINTEXT = 8
} SglCiphertextMessageType;

typedef struct SglFfiError SglFfiError;

// Caller-owned input, valid for the duration of one call.
typedef struct SglBorrowedBuffer {
    const uint8_t* base;
    size_t length;
} SglBorrowedBuffer;

// Caller-owned output area the engine writes into.
typedef struct SglBorrowedMutableBuffer {
    uint8_t* base;
    size_t length;
} SglBorrowedMutableBuffer;

// Engine-owned result. Release with sgl_free_buffer(base, length) exactly once.
typedef struct SglOwnedBuffer {
    uint8_t* base;
    size_t length;
} SglOwnedBuffer;

typedef struct SglUuid {
    uint8_t bytes[16];
} SglUuid;

#define SGL_DECLARE_POINTER_TYPES(Name) \
    typedef struct Sgl##Name Sgl##Name; \
    typedef struct SglMutPointer##Name { Sgl##Name* raw; } SglMutPointer##Name; \
    typedef struct SglConstPointer##Name { const Sgl##Name* raw; } SglConstPointer##Name;

SGL_DECLARE_POINTER_TYPES(PublicKey)
SGL_DECLARE_POINTER_TYPES(PrivateKey)
SGL_DECLARE_POINTER_TYPES(KyberPublicKey)
SGL_DECLARE_POINTER_TYPES(KyberSecretKey)
SGL_DECLARE_POINTER_TYPES(KyberKeyPair)
SGL_DECLARE_POINTER_TYPES(PreKeyRecord)
SGL_DECLARE_POINTER_TYPES(SignedPreKeyRecord)
SGL_DECLARE_POINTER_TYPES(KyberPreKeyRecord)
SGL_DECLARE_POINTER_TYPES(PreKeyBundle)
SGL_DECLARE_POINTER_TYPES(SessionRecord)
SGL_DECLARE_POINTER_TYPES(SenderKeyRecord)
SGL_DECLARE_POINTER_TYPES(SenderKeyMessage)
SGL_DECLARE_POINTER_TYPES(SenderKeyDistributionMessage)
SGL_DECLARE_POINTER_TYPES(ServerCertificate)
SGL_DECLARE_POINTER_TYPES(SenderCertificate)
SGL_DECLARE_POINTER_TYPES(SignalMessage)
SGL_DECLARE_POINTER_TYPES(DecryptionErrorMessage)
SGL_DECLARE_POINTER_TYPES(Fingerprint)
SGL_DECLARE_POINTER_TYPES(Aes256GcmCipher)

// Every function returning SglFfiError* returns NULL on success. A non-NULL
// error is owned by the caller and must be released with sgl_error_free.

// ----------------------------------------------------------------------------
// Library, errors and memory
// ----------------------------------------------------------------------------

SGL_API const char* sgl_version(void);

SGL_API SglFfiError* sgl_init(void);

SGL_API uint32_t sgl_error_get_type(const SglFfiError* err);

// On success *out is a caller-owned string released with sgl_free_string.
SGL_API SglFfiError* sgl_error_get_message(const SglFfiError* err, const char** out);

SGL_API void sgl_error_free(SglFfiError* err);

SGL_API void sgl_free_buffer(const uint8_t* base, size_t length);

SGL_API void sgl_free_string(const char* str);

// Number of engine allocations (objects, owned buffers, strings, errors) not yet released.
SGL_API size_t sgl_debug_live_object_count(void);

// ----------------------------------------------------------------------------
// Curve25519 keys
// ----------------------------------------------------------------------------

SGL_API SglFfiError* sgl_publickey_deserialize(SglMutPointerPublicKey* out, SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_publickey_serialize(SglOwnedBuffer* out, SglConstPointerPublicKey key);

SGL_API SglFfiError* sgl_publickey_get_public_key_bytes(SglOwnedBuffer* out, SglConstPointerPublicKey key);

SGL_API SglFfiError* sgl_publickey_verify(
    bool* out,
    SglConstPointerPublicKey key,
    SglBorrowedBuffer message,
    SglBorrowedBuffer signature);

SGL_API SglFfiError* sgl_publickey_equals(bool* out, SglConstPointerPublicKey lhs, SglConstPointerPublicKey rhs);

SGL_API SglFfiError* sgl_publickey_compare(int32_t* out, SglConstPointerPublicKey lhs, SglConstPointerPublicKey rhs);

SGL_API SglFfiError* sgl_publickey_clone(SglMutPointerPublicKey* out, SglConstPointerPublicKey key);

SGL_API SglFfiError* sgl_publickey_destroy(SglMutPointerPublicKey key);

SGL_API SglFfiError* sgl_privatekey_generate(SglMutPointerPrivateKey* out);

SGL_API SglFfiError* sgl_privatekey_deserialize(SglMutPointerPrivateKey* out, SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_privatekey_serialize(SglOwnedBuffer* out, SglConstPointerPrivateKey key);

SGL_API SglFfiError* sgl_privatekey_get_public_key(SglMutPointerPublicKey* out, SglConstPointerPrivateKey key);

SGL_API SglFfiError* sgl_privatekey_sign(SglOwnedBuffer* out, SglConstPointerPrivateKey key, SglBorrowedBuffer message);

SGL_API SglFfiError* sgl_privatekey_agree(
    SglOwnedBuffer* out,
    SglConstPointerPrivateKey key,
    SglConstPointerPublicKey their_key);

SGL_API SglFfiError* sgl_privatekey_clone(SglMutPointerPrivateKey* out, SglConstPointerPrivateKey key);

SGL_API SglFfiError* sgl_privatekey_destroy(SglMutPointerPrivateKey key);

// Layout: 0x0a 0x21 <33-byte public key> 0x12 0x20 <32-byte private key>.
SGL_API SglFfiError* sgl_identitykeypair_serialize(
    SglOwnedBuffer* out,
    SglConstPointerPublicKey public_key,
    SglConstPointerPrivateKey private_key);

SGL_API SglFfiError* sgl_identitykeypair_deserialize(
    SglMutPointerPublicKey* out_public,
    SglMutPointerPrivateKey* out_private,
    SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_identitykeypair_sign_alternate_identity(
    SglOwnedBuffer* out,
    SglConstPointerPublicKey public_key,
    SglConstPointerPrivateKey private_key,
    SglConstPointerPublicKey other_identity);

SGL_API SglFfiError* sgl_identitykey_verify_alternate_identity(
    bool* out,
    SglConstPointerPublicKey identity,
    SglConstPointerPublicKey other_identity,
    SglBorrowedBuffer signature);

// ----------------------------------------------------------------------------
// Kyber-1024
// ----------------------------------------------------------------------------

SGL_API SglFfiError* sgl_kyber_key_pair_generate(SglMutPointerKyberKeyPair* out);

SGL_API SglFfiError* sgl_kyber_key_pair_get_public_key(SglMutPointerKyberPublicKey* out, SglConstPointerKyberKeyPair pair);

SGL_API SglFfiError* sgl_kyber_key_pair_get_secret_key(SglMutPointerKyberSecretKey* out, SglConstPointerKyberKeyPair pair);

SGL_API SglFfiError* sgl_kyber_key_pair_clone(SglMutPointerKyberKeyPair* out, SglConstPointerKyberKeyPair pair);

SGL_API SglFfiError* sgl_kyber_key_pair_destroy(SglMutPointerKyberKeyPair pair);

SGL_API SglFfiError* sgl_kyber_public_key_deserialize(SglMutPointerKyberPublicKey* out, SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_kyber_public_key_serialize(SglOwnedBuffer* out, SglConstPointerKyberPublicKey key);

SGL_API SglFfiError* sgl_kyber_public_key_equals(
    bool* out,
    SglConstPointerKyberPublicKey lhs,
    SglConstPointerKyberPublicKey rhs);

SGL_API SglFfiError* sgl_kyber_public_key_encapsulate(
    SglOwnedBuffer* out_ciphertext,
    SglOwnedBuffer* out_shared_secret,
    SglConstPointerKyberPublicKey key);

SGL_API SglFfiError* sgl_kyber_public_key_clone(SglMutPointerKyberPublicKey* out, SglConstPointerKyberPublicKey key);

SGL_API SglFfiError* sgl_kyber_public_key_destroy(SglMutPointerKyberPublicKey key);

SGL_API SglFfiError* sgl_kyber_secret_key_deserialize(SglMutPointerKyberSecretKey* out, SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_kyber_secret_key_serialize(SglOwnedBuffer* out, SglConstPointerKyberSecretKey key);

SGL_API SglFfiError* sgl_kyber_secret_key_decapsulate(
    SglOwnedBuffer* out_shared_secret,
    SglConstPointerKyberSecretKey key,
    SglBorrowedBuffer ciphertext);

SGL_API SglFfiError* sgl_kyber_secret_key_clone(SglMutPointerKyberSecretKey* out, SglConstPointerKyberSecretKey key);

SGL_API SglFfiError* sgl_kyber_secret_key_destroy(SglMutPointerKyberSecretKey key);

// ----------------------------------------------------------------------------
// Pre-keys
// ----------------------------------------------------------------------------

SGL_API SglFfiError* sgl_pre_key_record_new(
    SglMutPointerPreKeyRecord* out,
    uint32_t id,
    SglConstPointerPublicKey public_key,
    SglConstPointerPrivateKey private_key);

SGL_API SglFfiError* sgl_pre_key_record_deserialize(SglMutPointerPreKeyRecord* out, SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_pre_key_record_serialize(SglOwnedBuffer* out, SglConstPointerPreKeyRecord record);

SGL_API SglFfiError* sgl_pre_key_record_get_id(uint32_t* out, SglConstPointerPreKeyRecord record);

SGL_API SglFfiError* sgl_pre_key_record_get_public_key(SglMutPointerPublicKey* out, SglConstPointerPreKeyRecord record);

SGL_API SglFfiError* sgl_pre_key_record_get_private_key(SglMutPointerPrivateKey* out, SglConstPointerPreKeyRecord record);

SGL_API SglFfiError* sgl_pre_key_record_clone(SglMutPointerPreKeyRecord* out, SglConstPointerPreKeyRecord record);

SGL_API SglFfiError* sgl_pre_key_record_destroy(SglMutPointerPreKeyRecord record);

SGL_API SglFfiError* sgl_signed_pre_key_record_new(
    SglMutPointerSignedPreKeyRecord* out,
    uint32_t id,
    uint64_t timestamp,
    SglConstPointerPublicKey public_key,
    SglConstPointerPrivateKey private_key,
    SglBorrowedBuffer signature);

SGL_API SglFfiError* sgl_signed_pre_key_record_deserialize(
    SglMutPointerSignedPreKeyRecord* out,
    SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_signed_pre_key_record_serialize(SglOwnedBuffer* out, SglConstPointerSignedPreKeyRecord record);

SGL_API SglFfiError* sgl_signed_pre_key_record_get_id(uint32_t* out, SglConstPointerSignedPreKeyRecord record);

SGL_API SglFfiError* sgl_signed_pre_key_record_get_timestamp(uint64_t* out, SglConstPointerSignedPreKeyRecord record);

SGL_API SglFfiError* sgl_signed_pre_key_record_get_public_key(
    SglMutPointerPublicKey* out,
    SglConstPointerSignedPreKeyRecord record);

SGL_API SglFfiError* sgl_signed_pre_key_record_get_private_key(
    SglMutPointerPrivateKey* out,
    SglConstPointerSignedPreKeyRecord record);

SGL_API SglFfiError* sgl_signed_pre_key_record_get_signature(SglOwnedBuffer* out, SglConstPointerSignedPreKeyRecord record);

SGL_API SglFfiError* sgl_signed_pre_key_record_clone(
    SglMutPointerSignedPreKeyRecord* out,
    SglConstPointerSignedPreKeyRecord record);

SGL_API SglFfiError* sgl_signed_pre_key_record_destroy(SglMutPointerSignedPreKeyRecord record);

SGL_API SglFfiError* sgl_kyber_pre_key_record_new(
    SglMutPointerKyberPreKeyRecord* out,
    uint32_t id,
    uint64_t timestamp,
    SglConstPointerKyberKeyPair key_pair,
    SglBorrowedBuffer signature);

SGL_API SglFfiError* sgl_kyber_pre_key_record_deserialize(
    SglMutPointerKyberPreKeyRecord* out,
    SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_kyber_pre_key_record_serialize(SglOwnedBuffer* out, SglConstPointerKyberPreKeyRecord record);

SGL_API SglFfiError* sgl_kyber_pre_key_record_get_id(uint32_t* out, SglConstPointerKyberPreKeyRecord record);

SGL_API SglFfiError* sgl_kyber_pre_key_record_get_timestamp(uint64_t* out, SglConstPointerKyberPreKeyRecord record);

SGL_API SglFfiError* sgl_kyber_pre_key_record_get_public_key(
    SglMutPointerKyberPublicKey* out,
    SglConstPointerKyberPreKeyRecord record);

SGL_API SglFfiError* sgl_kyber_pre_key_record_get_secret_key(
    SglMutPointerKyberSecretKey* out,
    SglConstPointerKyberPreKeyRecord record);

SGL_API SglFfiError* sgl_kyber_pre_key_record_get_key_pair(
    SglMutPointerKyberKeyPair* out,
    SglConstPointerKyberPreKeyRecord record);

SGL_API SglFfiError* sgl_kyber_pre_key_record_get_signature(SglOwnedBuffer* out, SglConstPointerKyberPreKeyRecord record);

SGL_API SglFfiError* sgl_kyber_pre_key_record_clone(
    SglMutPointerKyberPreKeyRecord* out,
    SglConstPointerKyberPreKeyRecord record);

SGL_API SglFfiError* sgl_kyber_pre_key_record_destroy(SglMutPointerKyberPreKeyRecord record);

// pre_key.raw may be NULL when the bundle carries no one-time pre-key.
SGL_API SglFfiError* sgl_pre_key_bundle_new(
    SglMutPointerPreKeyBundle* out,
    uint32_t registration_id,
    uint32_t device_id,
    uint32_t pre_key_id,
    SglConstPointerPublicKey pre_key,
    uint32_t signed_pre_key_id,
    SglConstPointerPublicKey signed_pre_key,
    SglBorrowedBuffer signed_pre_key_signature,
    SglConstPointerPublicKey identity_key,
    uint32_t kyber_pre_key_id,
    SglConstPointerKyberPublicKey kyber_pre_key,
    SglBorrowedBuffer kyber_pre_key_signature);

SGL_API SglFfiError* sgl_pre_key_bundle_get_registration_id(uint32_t* out, SglConstPointerPreKeyBundle bundle);

SGL_API SglFfiError* sgl_pre_key_bundle_get_device_id(uint32_t* out, SglConstPointerPreKeyBundle bundle);

SGL_API SglFfiError* sgl_pre_key_bundle_get_pre_key_id(
    uint32_t* out,
    bool* out_present,
    SglConstPointerPreKeyBundle bundle);

// out->raw is NULL when the bundle carries no one-time pre-key.
SGL_API SglFfiError* sgl_pre_key_bundle_get_pre_key_public(SglMutPointerPublicKey* out, SglConstPointerPreKeyBundle bundle);

SGL_API SglFfiError* sgl_pre_key_bundle_get_signed_pre_key_id(uint32_t* out, SglConstPointerPreKeyBundle bundle);

SGL_API SglFfiError* sgl_pre_key_bundle_get_signed_pre_key_public(
    SglMutPointerPublicKey* out,
    SglConstPointerPreKeyBundle bundle);

SGL_API SglFfiError* sgl_pre_key_bundle_get_signed_pre_key_signature(
    SglOwnedBuffer* out,
    SglConstPointerPreKeyBundle bundle);

SGL_API SglFfiError* sgl_pre_key_bundle_get_identity_key(SglMutPointerPublicKey* out, SglConstPointerPreKeyBundle bundle);

SGL_API SglFfiError* sgl_pre_key_bundle_get_kyber_pre_key_id(uint32_t* out, SglConstPointerPreKeyBundle bundle);

SGL_API SglFfiError* sgl_pre_key_bundle_get_kyber_pre_key_public(
    SglMutPointerKyberPublicKey* out,
    SglConstPointerPreKeyBundle bundle);

SGL_API SglFfiError* sgl_pre_key_bundle_get_kyber_pre_key_signature(
    SglOwnedBuffer* out,
    SglConstPointerPreKeyBundle bundle);

// Checks both pre-key signatures against the bundle's identity key.
SGL_API SglFfiError* sgl_pre_key_bundle_verify_signatures(bool* out, SglConstPointerPreKeyBundle bundle);

SGL_API SglFfiError* sgl_pre_key_bundle_clone(SglMutPointerPreKeyBundle* out, SglConstPointerPreKeyBundle bundle);

SGL_API SglFfiError* sgl_pre_key_bundle_destroy(SglMutPointerPreKeyBundle bundle);

// ----------------------------------------------------------------------------
// Session records
// ----------------------------------------------------------------------------

SGL_API SglFfiError* sgl_session_record_new_fresh(SglMutPointerSessionRecord* out);

SGL_API SglFfiError* sgl_session_record_deserialize(SglMutPointerSessionRecord* out, SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_session_record_serialize(SglOwnedBuffer* out, SglConstPointerSessionRecord record);

SGL_API SglFfiError* sgl_session_record_archive_current_state(SglMutPointerSessionRecord record);

SGL_API SglFfiError* sgl_session_record_has_current_state(bool* out, SglConstPointerSessionRecord record);

SGL_API SglFfiError* sgl_session_record_has_usable_sender_chain(
    bool* out,
    SglConstPointerSessionRecord record,
    uint64_t now_millis);

SGL_API SglFfiError* sgl_session_record_current_ratchet_key_matches(
    bool* out,
    SglConstPointerSessionRecord record,
    SglConstPointerPublicKey key);

SGL_API SglFfiError* sgl_session_record_get_local_registration_id(uint32_t* out, SglConstPointerSessionRecord record);

SGL_API SglFfiError* sgl_session_record_get_remote_registration_id(uint32_t* out, SglConstPointerSessionRecord record);

SGL_API SglFfiError* sgl_session_record_get_previous_session_count(uint32_t* out, SglConstPointerSessionRecord record);

SGL_API SglFfiError* sgl_session_record_clone(SglMutPointerSessionRecord* out, SglConstPointerSessionRecord record);

SGL_API SglFfiError* sgl_session_record_destroy(SglMutPointerSessionRecord record);

// ----------------------------------------------------------------------------
// Pairwise messages
// ----------------------------------------------------------------------------

// message_version is 3 or 4. mac_key is 32 bytes. pq_ratchet may be empty.
SGL_API SglFfiError* sgl_signal_message_new(
    SglMutPointerSignalMessage* out,
    uint8_t message_version,
    SglBorrowedBuffer mac_key,
    SglConstPointerPublicKey sender_ratchet_key,
    uint32_t counter,
    uint32_t previous_counter,
    SglBorrowedBuffer ciphertext,
    SglConstPointerPublicKey sender_identity_key,
    SglConstPointerPublicKey receiver_identity_key,
    SglBorrowedBuffer pq_ratchet);

SGL_API SglFfiError* sgl_signal_message_deserialize(SglMutPointerSignalMessage* out, SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_signal_message_get_serialized(SglOwnedBuffer* out, SglConstPointerSignalMessage message);

SGL_API SglFfiError* sgl_signal_message_get_body(SglOwnedBuffer* out, SglConstPointerSignalMessage message);

SGL_API SglFfiError* sgl_signal_message_get_counter(uint32_t* out, SglConstPointerSignalMessage message);

SGL_API SglFfiError* sgl_signal_message_get_message_version(uint32_t* out, SglConstPointerSignalMessage message);

SGL_API SglFfiError* sgl_signal_message_get_sender_ratchet_key(
    SglMutPointerPublicKey* out,
    SglConstPointerSignalMessage message);

// An empty buffer means the message carries no post-quantum ratchet state.
SGL_API SglFfiError* sgl_signal_message_get_pq_ratchet(SglOwnedBuffer* out, SglConstPointerSignalMessage message);

SGL_API SglFfiError* sgl_signal_message_verify_mac(
    bool* out,
    SglConstPointerSignalMessage message,
    SglConstPointerPublicKey sender_identity_key,
    SglConstPointerPublicKey receiver_identity_key,
    SglBorrowedBuffer mac_key);

SGL_API SglFfiError* sgl_signal_message_clone(SglMutPointerSignalMessage* out, SglConstPointerSignalMessage message);

SGL_API SglFfiError* sgl_signal_message_destroy(SglMutPointerSignalMessage message);

// original_type is an SglCiphertextMessageType value.
SGL_API SglFfiError* sgl_decryption_error_message_for_original_message(
    SglMutPointerDecryptionErrorMessage* out,
    SglBorrowedBuffer original_bytes,
    uint8_t original_type,
    uint64_t timestamp,
    uint32_t original_sender_device_id);

SGL_API SglFfiError* sgl_decryption_error_message_deserialize(
    SglMutPointerDecryptionErrorMessage* out,
    SglBorrowedBuffer data);

// data is a decrypted plaintext content body ending in the 0x80 padding boundary.
SGL_API SglFfiError* sgl_decryption_error_message_extract_from_serialized_content(
    SglMutPointerDecryptionErrorMessage* out,
    SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_decryption_error_message_serialize(
    SglOwnedBuffer* out,
    SglConstPointerDecryptionErrorMessage message);

SGL_API SglFfiError* sgl_decryption_error_message_get_timestamp(
    uint64_t* out,
    SglConstPointerDecryptionErrorMessage message);

SGL_API SglFfiError* sgl_decryption_error_message_get_device_id(
    uint32_t* out,
    SglConstPointerDecryptionErrorMessage message);

// out->raw is NULL when the original message carried no ratchet key.
SGL_API SglFfiError* sgl_decryption_error_message_get_ratchet_key(
    SglMutPointerPublicKey* out,
    SglConstPointerDecryptionErrorMessage message);

SGL_API SglFfiError* sgl_decryption_error_message_clone(
    SglMutPointerDecryptionErrorMessage* out,
    SglConstPointerDecryptionErrorMessage message);

SGL_API SglFfiError* sgl_decryption_error_message_destroy(SglMutPointerDecryptionErrorMessage message);

// ----------------------------------------------------------------------------
// Sender keys and group messaging
// ----------------------------------------------------------------------------

SGL_API SglFfiError* sgl_sender_key_record_new_fresh(SglMutPointerSenderKeyRecord* out);

SGL_API SglFfiError* sgl_sender_key_record_deserialize(SglMutPointerSenderKeyRecord* out, SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_sender_key_record_serialize(SglOwnedBuffer* out, SglConstPointerSenderKeyRecord record);

SGL_API SglFfiError* sgl_sender_key_record_clone(SglMutPointerSenderKeyRecord* out, SglConstPointerSenderKeyRecord record);

SGL_API SglFfiError* sgl_sender_key_record_destroy(SglMutPointerSenderKeyRecord record);

SGL_API SglFfiError* sgl_sender_key_message_new(
    SglMutPointerSenderKeyMessage* out,
    SglUuid distribution_id,
    uint32_t chain_id,
    uint32_t iteration,
    SglBorrowedBuffer ciphertext,
    SglConstPointerPrivateKey signing_key);

SGL_API SglFfiError* sgl_sender_key_message_deserialize(SglMutPointerSenderKeyMessage* out, SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_sender_key_message_serialize(SglOwnedBuffer* out, SglConstPointerSenderKeyMessage message);

SGL_API SglFfiError* sgl_sender_key_message_get_cipher_text(SglOwnedBuffer* out, SglConstPointerSenderKeyMessage message);

SGL_API SglFfiError* sgl_sender_key_message_get_distribution_id(SglUuid* out, SglConstPointerSenderKeyMessage message);

SGL_API SglFfiError* sgl_sender_key_message_get_chain_id(uint32_t* out, SglConstPointerSenderKeyMessage message);

SGL_API SglFfiError* sgl_sender_key_message_get_iteration(uint32_t* out, SglConstPointerSenderKeyMessage message);

SGL_API SglFfiError* sgl_sender_key_message_verify_signature(
    bool* out,
    SglConstPointerSenderKeyMessage message,
    SglConstPointerPublicKey key);

SGL_API SglFfiError* sgl_sender_key_message_clone(SglMutPointerSenderKeyMessage* out, SglConstPointerSenderKeyMessage message);

SGL_API SglFfiError* sgl_sender_key_message_destroy(SglMutPointerSenderKeyMessage message);

SGL_API SglFfiError* sgl_sender_key_distribution_message_new(
    SglMutPointerSenderKeyDistributionMessage* out,
    SglUuid distribution_id,
    uint32_t chain_id,
    uint32_t iteration,
    SglBorrowedBuffer chain_key,
    SglConstPointerPublicKey signing_key);

SGL_API SglFfiError* sgl_sender_key_distribution_message_deserialize(
    SglMutPointerSenderKeyDistributionMessage* out,
    SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_sender_key_distribution_message_serialize(
    SglOwnedBuffer* out,
    SglConstPointerSenderKeyDistributionMessage message);

SGL_API SglFfiError* sgl_sender_key_distribution_message_get_chain_key(
    SglOwnedBuffer* out,
    SglConstPointerSenderKeyDistributionMessage message);

SGL_API SglFfiError* sgl_sender_key_distribution_message_get_distribution_id(
    SglUuid* out,
    SglConstPointerSenderKeyDistributionMessage message);

SGL_API SglFfiError* sgl_sender_key_distribution_message_get_chain_id(
    uint32_t* out,
    SglConstPointerSenderKeyDistributionMessage message);

SGL_API SglFfiError* sgl_sender_key_distribution_message_get_iteration(
    uint32_t* out,
    SglConstPointerSenderKeyDistributionMessage message);

SGL_API SglFfiError* sgl_sender_key_distribution_message_get_signature_key(
    SglMutPointerPublicKey* out,
    SglConstPointerSenderKeyDistributionMessage message);

SGL_API SglFfiError* sgl_sender_key_distribution_message_clone(
    SglMutPointerSenderKeyDistributionMessage* out,
    SglConstPointerSenderKeyDistributionMessage message);

SGL_API SglFfiError* sgl_sender_key_distribution_message_destroy(SglMutPointerSenderKeyDistributionMessage message);

// The group functions operate on the sender key record the caller loaded for
// (sender, distribution id) and leave it updated for the caller to persist.
SGL_API SglFfiError* sgl_group_create_distribution_message(
    SglMutPointerSenderKeyDistributionMessage* out,
    SglMutPointerSenderKeyRecord record,
    SglUuid distribution_id);

SGL_API SglFfiError* sgl_group_process_distribution_message(
    SglMutPointerSenderKeyRecord record,
    SglConstPointerSenderKeyDistributionMessage message);

SGL_API SglFfiError* sgl_group_encrypt(
    SglOwnedBuffer* out,
    SglMutPointerSenderKeyRecord record,
    SglUuid distribution_id,
    SglBorrowedBuffer plaintext);

SGL_API SglFfiError* sgl_group_decrypt(
    SglOwnedBuffer* out,
    SglMutPointerSenderKeyRecord record,
    SglBorrowedBuffer ciphertext);

// ----------------------------------------------------------------------------
// Sealed sender certificates
// ----------------------------------------------------------------------------

SGL_API SglFfiError* sgl_server_certificate_new(
    SglMutPointerServerCertificate* out,
    uint32_t key_id,
    SglConstPointerPublicKey server_key,
    SglConstPointerPrivateKey trust_root);

SGL_API SglFfiError* sgl_server_certificate_deserialize(SglMutPointerServerCertificate* out, SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_server_certificate_serialize(SglOwnedBuffer* out, SglConstPointerServerCertificate cert);

SGL_API SglFfiError* sgl_server_certificate_get_certificate(SglOwnedBuffer* out, SglConstPointerServerCertificate cert);

SGL_API SglFfiError* sgl_server_certificate_get_signature(SglOwnedBuffer* out, SglConstPointerServerCertificate cert);

SGL_API SglFfiError* sgl_server_certificate_get_key_id(uint32_t* out, SglConstPointerServerCertificate cert);

SGL_API SglFfiError* sgl_server_certificate_get_key(SglMutPointerPublicKey* out, SglConstPointerServerCertificate cert);

SGL_API SglFfiError* sgl_server_certificate_clone(SglMutPointerServerCertificate* out, SglConstPointerServerCertificate cert);

SGL_API SglFfiError* sgl_server_certificate_destroy(SglMutPointerServerCertificate cert);

// sender_e164 may be NULL.
SGL_API SglFfiError* sgl_sender_certificate_new(
    SglMutPointerSenderCertificate* out,
    const char* sender_uuid,
    const char* sender_e164,
    uint32_t device_id,
    SglConstPointerPublicKey sender_key,
    uint64_t expiration,
    SglConstPointerServerCertificate signer_cert,
    SglConstPointerPrivateKey signer_key);

SGL_API SglFfiError* sgl_sender_certificate_deserialize(SglMutPointerSenderCertificate* out, SglBorrowedBuffer data);

SGL_API SglFfiError* sgl_sender_certificate_serialize(SglOwnedBuffer* out, SglConstPointerSenderCertificate cert);

SGL_API SglFfiError* sgl_sender_certificate_get_certificate(SglOwnedBuffer* out, SglConstPointerSenderCertificate cert);

SGL_API SglFfiError* sgl_sender_certificate_get_signature(SglOwnedBuffer* out, SglConstPointerSenderCertificate cert);

SGL_API SglFfiError* sgl_sender_certificate_get_sender_uuid(const char** out, SglConstPointerSenderCertificate cert);

// *out is NULL when the certificate carries no phone number.
SGL_API SglFfiError* sgl_sender_certificate_get_sender_e164(const char** out, SglConstPointerSenderCertificate cert);

SGL_API SglFfiError* sgl_sender_certificate_get_device_id(uint32_t* out, SglConstPointerSenderCertificate cert);

SGL_API SglFfiError* sgl_sender_certificate_get_expiration(uint64_t* out, SglConstPointerSenderCertificate cert);

SGL_API SglFfiError* sgl_sender_certificate_get_key(SglMutPointerPublicKey* out, SglConstPointerSenderCertificate cert);

SGL_API SglFfiError* sgl_sender_certificate_get_server_certificate(
    SglMutPointerServerCertificate* out,
    SglConstPointerSenderCertificate cert);

SGL_API SglFfiError* sgl_sender_certificate_validate(
    bool* out,
    SglConstPointerSenderCertificate cert,
    SglConstPointerPublicKey trust_root,
    uint64_t now_millis);

SGL_API SglFfiError* sgl_sender_certificate_clone(SglMutPointerSenderCertificate* out, SglConstPointerSenderCertificate cert);

SGL_API SglFfiError* sgl_sender_certificate_destroy(SglMutPointerSenderCertificate cert);

// ----------------------------------------------------------------------------
// Symmetric primitives
// ----------------------------------------------------------------------------

SGL_API SglFfiError* sgl_aes256_gcm_cipher_new(SglMutPointerAes256GcmCipher* out, SglBorrowedBuffer key);

// Output is ciphertext || 16-byte tag.
SGL_API SglFfiError* sgl_aes256_gcm_cipher_encrypt(
    SglOwnedBuffer* out,
    SglConstPointerAes256GcmCipher cipher,
    SglBorrowedBuffer plaintext,
    SglBorrowedBuffer nonce,
    SglBorrowedBuffer associated_data);

SGL_API SglFfiError* sgl_aes256_gcm_cipher_decrypt(
    SglOwnedBuffer* out,
    SglConstPointerAes256GcmCipher cipher,
    SglBorrowedBuffer ciphertext,
    SglBorrowedBuffer nonce,
    SglBorrowedBuffer associated_data);

SGL_API SglFfiError* sgl_aes256_gcm_cipher_destroy(SglMutPointerAes256GcmCipher cipher);

// ----------------------------------------------------------------------------
// Safety number fingerprints
// ----------------------------------------------------------------------------

// iterations must be in [2, 1000000].
SGL_API SglFfiError* sgl_fingerprint_new(
    SglMutPointerFingerprint* out,
    uint32_t iterations,
    uint32_t version,
    SglBorrowedBuffer local_identifier,
    SglConstPointerPublicKey local_key,
    SglBorrowedBuffer remote_identifier,
    SglConstPointerPublicKey remote_key);

// 60 decimal digits.
SGL_API SglFfiError* sgl_fingerprint_display_string(const char** out, SglConstPointerFingerprint fingerprint);

SGL_API SglFfiError* sgl_fingerprint_scannable_encoding(SglOwnedBuffer* out, SglConstPointerFingerprint fingerprint);

// True when fprint2 is the other party's view of fprint1.
SGL_API SglFfiError* sgl_fingerprint_compare(bool* out, SglBorrowedBuffer fprint1, SglBorrowedBuffer fprint2);

SGL_API SglFfiError* sgl_fingerprint_clone(SglMutPointerFingerprint* out, SglConstPointerFingerprint fingerprint);

SGL_API SglFfiError* sgl_fingerprint_destroy(SglMutPointerFingerprint fingerprint);

// ----------------------------------------------------------------------------
// Key derivation
// ----------------------------------------------------------------------------

// HKDF-SHA256. Fills output completely.
SGL_API SglFfiError* sgl_hkdf_derive(
    SglBorrowedMutableBuffer output,
    SglBorrowedBuffer input_key_material,
    SglBorrowedBuffer label,
    SglBorrowedBuffer salt);

#ifdef __cplusplus
}
#endif
