#pragma once
#include "sigil/c_api/sgl_ffi.h"
#include <cstdint>
namespace sigil::protocol::session {
/// Envelope type of a delivered ciphertext, as carried on the wire.
enum class CiphertextMessageType : uint8_t {
    Whisper = SGL_CIPHERTEXT_MESSAGE_TYPE_WHISPER,
    PreKey = SGL_CIPHERTEXT_MESSAGE_TYPE_PRE_KEY,
    SenderKey = SGL_CIPHERTEXT_MESSAGE_TYPE_SENDER_KEY,
    Plaintext = SGL_CIPHERTEXT_MESSAGE_TYPE_PLAINTEXT,
};
}
