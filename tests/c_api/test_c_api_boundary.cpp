#include <catch2/catch_test_macros.hpp>
#include "sigil/c_api/sgl_ffi.h"
#include <cstring>
#include <string>
#include <vector>

namespace {
    /// Error code of a returned error, 0 for success. Frees the error.
    uint32_t Consume(SglFfiError* error) {
        const uint32_t code = sgl_error_get_type(error);
        sgl_error_free(error);
        return code;
    }

    std::string MessageOf(const SglFfiError* error) {
        const char* raw = nullptr;
        REQUIRE(Consume(sgl_error_get_message(error, &raw)) == 0);
        REQUIRE(raw != nullptr);
        std::string message(raw);
        sgl_free_string(raw);
        return message;
    }

    SglBorrowedBuffer Borrowed(const std::vector<uint8_t>& bytes) {
        return SglBorrowedBuffer{bytes.data(), bytes.size()};
    }

    std::vector<uint8_t> TakeOwned(SglOwnedBuffer& buffer) {
        std::vector<uint8_t> bytes(buffer.base, buffer.base + buffer.length);
        sgl_free_buffer(buffer.base, buffer.length);
        buffer = SglOwnedBuffer{nullptr, 0};
        return bytes;
    }
}

TEST_CASE("C API - Library", "[c_api][boundary][init]") {
    SECTION("Version string") {
        const char* version = sgl_version();
        REQUIRE(version != nullptr);
        REQUIRE(std::strcmp(version, SIGIL_EXPECTED_VERSION) == 0);
        REQUIRE(SGL_API_VERSION_MAJOR == 1);
    }
    SECTION("Repeated initialization is safe") {
        REQUIRE(sgl_init() == nullptr);
        REQUIRE(sgl_init() == nullptr);
    }
}

TEST_CASE("C API - Error objects", "[c_api][boundary][errors]") {
    const size_t baseline = sgl_debug_live_object_count();
    SglMutPointerPublicKey key{nullptr};
    const std::vector<uint8_t> truncated = {0x05, 0x01, 0x02};

    SglFfiError* error = sgl_publickey_deserialize(&key, Borrowed(truncated));
    REQUIRE(error != nullptr);
    REQUIRE(key.raw == nullptr);
    REQUIRE(sgl_debug_live_object_count() == baseline + 1);

    SECTION("Code and message") {
        REQUIRE(sgl_error_get_type(error) == SGL_ERROR_CODE_INVALID_KEY);
        REQUIRE_FALSE(MessageOf(error).empty());
        sgl_error_free(error);
        REQUIRE(sgl_debug_live_object_count() == baseline);
    }
    SECTION("Message of a null error is itself an error") {
        const char* raw = nullptr;
        REQUIRE(Consume(sgl_error_get_message(nullptr, &raw)) == SGL_ERROR_CODE_NULL_PARAMETER);
        REQUIRE(raw == nullptr);
        sgl_error_free(error);
    }
    SECTION("Null error has no type and frees as a no-op") {
        REQUIRE(sgl_error_get_type(nullptr) == 0);
        sgl_error_free(nullptr);
        sgl_error_free(error);
        REQUIRE(sgl_debug_live_object_count() == baseline);
    }
}

TEST_CASE("C API - Null parameters", "[c_api][boundary][null]") {
    const size_t baseline = sgl_debug_live_object_count();
    const std::vector<uint8_t> key_bytes(33, 0x09);

    SECTION("Null output pointer") {
        REQUIRE(Consume(sgl_publickey_deserialize(nullptr, Borrowed(key_bytes))) == SGL_ERROR_CODE_NULL_PARAMETER);
        REQUIRE(Consume(sgl_privatekey_generate(nullptr)) == SGL_ERROR_CODE_NULL_PARAMETER);
        REQUIRE(Consume(sgl_kyber_key_pair_generate(nullptr)) == SGL_ERROR_CODE_NULL_PARAMETER);
        REQUIRE(Consume(sgl_session_record_new_fresh(nullptr)) == SGL_ERROR_CODE_NULL_PARAMETER);
    }
    SECTION("Null object pointer") {
        SglOwnedBuffer out{nullptr, 0};
        REQUIRE(Consume(sgl_publickey_serialize(&out, SglConstPointerPublicKey{nullptr})) == SGL_ERROR_CODE_NULL_PARAMETER);
        REQUIRE(out.base == nullptr);

        uint32_t id = 0;
        REQUIRE(Consume(sgl_pre_key_record_get_id(&id, SglConstPointerPreKeyRecord{nullptr})) == SGL_ERROR_CODE_NULL_PARAMETER);
        bool present = true;
        REQUIRE(Consume(sgl_pre_key_bundle_get_pre_key_id(&id, &present, SglConstPointerPreKeyBundle{nullptr}))
            == SGL_ERROR_CODE_NULL_PARAMETER);
    }
    SECTION("Null buffer with a length") {
        SglMutPointerPublicKey key{nullptr};
        REQUIRE(Consume(sgl_publickey_deserialize(&key, SglBorrowedBuffer{nullptr, 33})) == SGL_ERROR_CODE_NULL_PARAMETER);
        REQUIRE(key.raw == nullptr);
    }
    SECTION("Null HKDF output") {
        const std::vector<uint8_t> ikm(32, 0x0b);
        REQUIRE(Consume(sgl_hkdf_derive(SglBorrowedMutableBuffer{nullptr, 32}, Borrowed(ikm), {}, {}))
            == SGL_ERROR_CODE_NULL_PARAMETER);
    }
    SECTION("Sender certificate without a uuid") {
        SglMutPointerSenderCertificate cert{nullptr};
        REQUIRE(Consume(sgl_sender_certificate_new(
            &cert, nullptr, nullptr, 1, SglConstPointerPublicKey{nullptr}, 0,
            SglConstPointerServerCertificate{nullptr}, SglConstPointerPrivateKey{nullptr}))
            == SGL_ERROR_CODE_NULL_PARAMETER);
    }
    SECTION("Destroying null is a no-op") {
        REQUIRE(sgl_publickey_destroy(SglMutPointerPublicKey{nullptr}) == nullptr);
        REQUIRE(sgl_session_record_destroy(SglMutPointerSessionRecord{nullptr}) == nullptr);
        sgl_free_buffer(nullptr, 0);
        sgl_free_string(nullptr);
    }

    REQUIRE(sgl_debug_live_object_count() == baseline);
}

TEST_CASE("C API - Object and buffer ownership", "[c_api][boundary][memory]") {
    const size_t baseline = sgl_debug_live_object_count();

    SglMutPointerPrivateKey private_key{nullptr};
    REQUIRE(sgl_privatekey_generate(&private_key) == nullptr);
    SglMutPointerPublicKey public_key{nullptr};
    REQUIRE(sgl_privatekey_get_public_key(&public_key, SglConstPointerPrivateKey{private_key.raw}) == nullptr);
    REQUIRE(sgl_debug_live_object_count() == baseline + 2);

    SECTION("Owned buffers count until freed") {
        SglOwnedBuffer serialized{nullptr, 0};
        REQUIRE(sgl_publickey_serialize(&serialized, SglConstPointerPublicKey{public_key.raw}) == nullptr);
        REQUIRE(serialized.length == 33);
        REQUIRE(serialized.base[0] == 0x05);
        REQUIRE(sgl_debug_live_object_count() == baseline + 3);
        const auto bytes = TakeOwned(serialized);
        REQUIRE(sgl_debug_live_object_count() == baseline + 2);

        SglMutPointerPublicKey restored{nullptr};
        REQUIRE(sgl_publickey_deserialize(&restored, Borrowed(bytes)) == nullptr);
        bool equal = false;
        REQUIRE(sgl_publickey_equals(&equal, SglConstPointerPublicKey{public_key.raw},
            SglConstPointerPublicKey{restored.raw}) == nullptr);
        REQUIRE(equal);
        int32_t order = 7;
        REQUIRE(sgl_publickey_compare(&order, SglConstPointerPublicKey{public_key.raw},
            SglConstPointerPublicKey{restored.raw}) == nullptr);
        REQUIRE(order == 0);
        REQUIRE(sgl_publickey_destroy(restored) == nullptr);
    }
    SECTION("Sign and verify across the boundary") {
        const std::vector<uint8_t> message = {'h', 'e', 'l', 'l', 'o'};
        SglOwnedBuffer signature{nullptr, 0};
        REQUIRE(sgl_privatekey_sign(&signature, SglConstPointerPrivateKey{private_key.raw}, Borrowed(message)) == nullptr);
        auto signature_bytes = TakeOwned(signature);
        REQUIRE(signature_bytes.size() == 64);

        bool valid = false;
        REQUIRE(sgl_publickey_verify(&valid, SglConstPointerPublicKey{public_key.raw},
            Borrowed(message), Borrowed(signature_bytes)) == nullptr);
        REQUIRE(valid);

        signature_bytes[10] ^= 0x01;
        REQUIRE(sgl_publickey_verify(&valid, SglConstPointerPublicKey{public_key.raw},
            Borrowed(message), Borrowed(signature_bytes)) == nullptr);
        REQUIRE_FALSE(valid);
    }
    SECTION("Clones are separate objects") {
        SglMutPointerPublicKey clone{nullptr};
        REQUIRE(sgl_publickey_clone(&clone, SglConstPointerPublicKey{public_key.raw}) == nullptr);
        REQUIRE(clone.raw != public_key.raw);
        REQUIRE(sgl_debug_live_object_count() == baseline + 3);
        REQUIRE(sgl_publickey_destroy(clone) == nullptr);
    }

    REQUIRE(sgl_publickey_destroy(public_key) == nullptr);
    REQUIRE(sgl_privatekey_destroy(private_key) == nullptr);
    REQUIRE(sgl_debug_live_object_count() == baseline);
}

TEST_CASE("C API - Engine error codes", "[c_api][boundary][errors]") {
    const size_t baseline = sgl_debug_live_object_count();

    SECTION("AES key length") {
        SglMutPointerAes256GcmCipher cipher{nullptr};
        const std::vector<uint8_t> short_key(16, 0x01);
        REQUIRE(Consume(sgl_aes256_gcm_cipher_new(&cipher, Borrowed(short_key))) == SGL_ERROR_CODE_INVALID_ARGUMENT);
        REQUIRE(cipher.raw == nullptr);
    }
    SECTION("Empty session record bytes") {
        SglMutPointerSessionRecord record{nullptr};
        REQUIRE(Consume(sgl_session_record_deserialize(&record, SglBorrowedBuffer{nullptr, 0}))
            == SGL_ERROR_CODE_INVALID_ARGUMENT);
        REQUIRE(record.raw == nullptr);
    }
    SECTION("Fresh session record has no registration id") {
        SglMutPointerSessionRecord record{nullptr};
        REQUIRE(sgl_session_record_new_fresh(&record) == nullptr);
        uint32_t id = 0;
        REQUIRE(Consume(sgl_session_record_get_local_registration_id(&id, SglConstPointerSessionRecord{record.raw}))
            == SGL_ERROR_CODE_INVALID_STATE);
        REQUIRE(sgl_session_record_destroy(record) == nullptr);
    }
    SECTION("Group encrypt without a sender chain") {
        SglMutPointerSenderKeyRecord record{nullptr};
        REQUIRE(sgl_sender_key_record_new_fresh(&record) == nullptr);
        SglOwnedBuffer out{nullptr, 0};
        const std::vector<uint8_t> plaintext = {1, 2, 3};
        REQUIRE(Consume(sgl_group_encrypt(&out, record, SglUuid{}, Borrowed(plaintext)))
            == SGL_ERROR_CODE_NO_SENDER_KEY_STATE);
        REQUIRE(out.base == nullptr);
        REQUIRE(sgl_sender_key_record_destroy(record) == nullptr);
    }

    REQUIRE(sgl_debug_live_object_count() == baseline);
}

TEST_CASE("C API - Pairwise messages", "[c_api][boundary][message]") {
    const size_t baseline = sgl_debug_live_object_count();
    const std::vector<uint8_t> mac_key(32, 0x2a);
    const std::vector<uint8_t> ciphertext = {9, 8, 7, 6};

    SglMutPointerPrivateKey identity{nullptr};
    REQUIRE(sgl_privatekey_generate(&identity) == nullptr);
    SglMutPointerPublicKey identity_public{nullptr};
    REQUIRE(sgl_privatekey_get_public_key(&identity_public, SglConstPointerPrivateKey{identity.raw}) == nullptr);
    const SglConstPointerPublicKey key{identity_public.raw};

    SglMutPointerSignalMessage message{nullptr};
    REQUIRE(sgl_signal_message_new(&message, 4, Borrowed(mac_key), key, 1, 0, Borrowed(ciphertext),
        key, key, SglBorrowedBuffer{nullptr, 0}) == nullptr);
    const SglConstPointerSignalMessage view{message.raw};

    SECTION("MAC verifies and the decryption error names the ratchet key") {
        bool valid = false;
        REQUIRE(sgl_signal_message_verify_mac(&valid, view, key, key, Borrowed(mac_key)) == nullptr);
        REQUIRE(valid);

        SglOwnedBuffer serialized{nullptr, 0};
        REQUIRE(sgl_signal_message_get_serialized(&serialized, view) == nullptr);
        const auto bytes = TakeOwned(serialized);

        SglMutPointerDecryptionErrorMessage dem{nullptr};
        REQUIRE(sgl_decryption_error_message_for_original_message(
            &dem, Borrowed(bytes), SGL_CIPHERTEXT_MESSAGE_TYPE_WHISPER, 1234, 2) == nullptr);
        SglMutPointerPublicKey ratchet{nullptr};
        REQUIRE(sgl_decryption_error_message_get_ratchet_key(
            &ratchet, SglConstPointerDecryptionErrorMessage{dem.raw}) == nullptr);
        REQUIRE(ratchet.raw != nullptr);
        REQUIRE(sgl_publickey_destroy(ratchet) == nullptr);
        REQUIRE(sgl_decryption_error_message_destroy(dem) == nullptr);
    }
    SECTION("Sender key originals carry no ratchet key") {
        SglMutPointerDecryptionErrorMessage dem{nullptr};
        REQUIRE(sgl_decryption_error_message_for_original_message(
            &dem, Borrowed(ciphertext), SGL_CIPHERTEXT_MESSAGE_TYPE_SENDER_KEY, 1234, 2) == nullptr);
        SglMutPointerPublicKey ratchet{nullptr};
        REQUIRE(sgl_decryption_error_message_get_ratchet_key(
            &ratchet, SglConstPointerDecryptionErrorMessage{dem.raw}) == nullptr);
        REQUIRE(ratchet.raw == nullptr);
        REQUIRE(sgl_decryption_error_message_destroy(dem) == nullptr);
    }
    SECTION("Unknown original type and legacy versions") {
        SglMutPointerDecryptionErrorMessage dem{nullptr};
        REQUIRE(Consume(sgl_decryption_error_message_for_original_message(
            &dem, Borrowed(ciphertext), 5, 1234, 2)) == SGL_ERROR_CODE_INVALID_ARGUMENT);
        REQUIRE(dem.raw == nullptr);

        const std::vector<uint8_t> legacy(20, 0x22);
        SglMutPointerSignalMessage parsed{nullptr};
        REQUIRE(Consume(sgl_signal_message_deserialize(&parsed, Borrowed(legacy))) == SGL_ERROR_CODE_INVALID_MESSAGE);
        REQUIRE(parsed.raw == nullptr);
    }

    REQUIRE(sgl_signal_message_destroy(message) == nullptr);
    REQUIRE(sgl_publickey_destroy(identity_public) == nullptr);
    REQUIRE(sgl_privatekey_destroy(identity) == nullptr);
    REQUIRE(sgl_debug_live_object_count() == baseline);
}

TEST_CASE("C API - Fingerprints", "[c_api][boundary][fingerprint]") {
    const size_t baseline = sgl_debug_live_object_count();
    std::vector<uint8_t> key_bytes(33, 0x11);
    key_bytes[0] = 0x05;
    SglMutPointerPublicKey key{nullptr};
    REQUIRE(sgl_publickey_deserialize(&key, Borrowed(key_bytes)) == nullptr);
    const SglConstPointerPublicKey view{key.raw};
    const std::vector<uint8_t> alice = {'a'};
    const std::vector<uint8_t> bob = {'b'};

    SECTION("Display string is sixty digits") {
        SglMutPointerFingerprint fingerprint{nullptr};
        REQUIRE(sgl_fingerprint_new(&fingerprint, 2, 2, Borrowed(alice), view, Borrowed(bob), view) == nullptr);
        const char* display = nullptr;
        REQUIRE(sgl_fingerprint_display_string(&display, SglConstPointerFingerprint{fingerprint.raw}) == nullptr);
        REQUIRE(std::strlen(display) == 60);
        sgl_free_string(display);
        REQUIRE(sgl_fingerprint_destroy(fingerprint) == nullptr);
    }
    SECTION("Iterations out of range") {
        SglMutPointerFingerprint fingerprint{nullptr};
        REQUIRE(Consume(sgl_fingerprint_new(&fingerprint, 1, 2, Borrowed(alice), view, Borrowed(bob), view))
            == SGL_ERROR_CODE_INVALID_ARGUMENT);
        REQUIRE(fingerprint.raw == nullptr);
    }
    SECTION("Version mismatch has its own code") {
        SglMutPointerFingerprint v1{nullptr};
        SglMutPointerFingerprint v2{nullptr};
        REQUIRE(sgl_fingerprint_new(&v1, 2, 1, Borrowed(alice), view, Borrowed(bob), view) == nullptr);
        REQUIRE(sgl_fingerprint_new(&v2, 2, 2, Borrowed(bob), view, Borrowed(alice), view) == nullptr);
        SglOwnedBuffer scan1{nullptr, 0};
        SglOwnedBuffer scan2{nullptr, 0};
        REQUIRE(sgl_fingerprint_scannable_encoding(&scan1, SglConstPointerFingerprint{v1.raw}) == nullptr);
        REQUIRE(sgl_fingerprint_scannable_encoding(&scan2, SglConstPointerFingerprint{v2.raw}) == nullptr);
        const auto bytes1 = TakeOwned(scan1);
        const auto bytes2 = TakeOwned(scan2);
        bool matches = true;
        REQUIRE(Consume(sgl_fingerprint_compare(&matches, Borrowed(bytes1), Borrowed(bytes2)))
            == SGL_ERROR_CODE_FINGERPRINT_VERSION_MISMATCH);
        REQUIRE(sgl_fingerprint_destroy(v1) == nullptr);
        REQUIRE(sgl_fingerprint_destroy(v2) == nullptr);
    }

    REQUIRE(sgl_publickey_destroy(key) == nullptr);
    REQUIRE(sgl_debug_live_object_count() == baseline);
}
