#include <catch2/catch_test_macros.hpp>
#include "sigil/crypto/secure_bytes.hpp"
#include "sigil/crypto/secure_memory.hpp"
#include <algorithm>
#include <array>
#include <vector>
using namespace sigil::protocol;
using namespace sigil::protocol::crypto;

TEST_CASE("SecureMemory - Zero", "[secure_memory][crypto]") {
    SECTION("Every byte is cleared") {
        std::vector<uint8_t> buffer(64, 0xAB);
        SecureMemory::Zero(buffer);
        REQUIRE(buffer.size() == 64);
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Only the span is cleared") {
        std::array<uint8_t, 8> buffer{};
        buffer.fill(0xFF);
        SecureMemory::Zero(std::span<uint8_t>(buffer).subspan(2, 4));
        REQUIRE(buffer[0] == 0xFF);
        REQUIRE(buffer[1] == 0xFF);
        REQUIRE(buffer[2] == 0x00);
        REQUIRE(buffer[5] == 0x00);
        REQUIRE(buffer[6] == 0xFF);
    }
    SECTION("Empty buffer is a no-op") {
        std::vector<uint8_t> empty;
        SecureMemory::Zero(empty);
        REQUIRE(empty.empty());
    }
}

TEST_CASE("SecureMemory - ConstantTimeEquals", "[secure_memory][crypto]") {
    SECTION("Equal buffers of common lengths") {
        for (const size_t length : {size_t{0}, size_t{1}, size_t{32}, size_t{64}}) {
            std::vector<uint8_t> a(length);
            for (size_t i = 0; i < length; ++i) {
                a[i] = static_cast<uint8_t>(i * 7 + 3);
            }
            const std::vector<uint8_t> b = a;
            REQUIRE(SecureMemory::ConstantTimeEquals(a, b));
        }
    }
    SECTION("Single bit flips are detected at every position") {
        for (const size_t length : {size_t{1}, size_t{32}, size_t{64}}) {
            const std::vector<uint8_t> reference(length, 0x5A);
            for (size_t i = 0; i < length; ++i) {
                for (int bit = 0; bit < 8; ++bit) {
                    auto flipped = reference;
                    flipped[i] = static_cast<uint8_t>(flipped[i] ^ (1u << bit));
                    INFO("length " << length << ", byte " << i << ", bit " << bit);
                    REQUIRE_FALSE(SecureMemory::ConstantTimeEquals(flipped, reference));
                    REQUIRE_FALSE(SecureMemory::ConstantTimeEquals(reference, flipped));
                }
            }
        }
    }
    SECTION("Length mismatch is never equal") {
        const std::vector<uint8_t> shorter(31, 0x00);
        const std::vector<uint8_t> longer(32, 0x00);
        REQUIRE_FALSE(SecureMemory::ConstantTimeEquals(shorter, longer));
        REQUIRE_FALSE(SecureMemory::ConstantTimeEquals(longer, shorter));
        REQUIRE_FALSE(SecureMemory::ConstantTimeEquals({}, longer));
    }
}

TEST_CASE("SecureBytes - Ownership", "[secure_memory][crypto]") {
    SECTION("Expose returns the copied bytes") {
        const std::vector<uint8_t> source = {1, 2, 3, 4};
        auto secret = SecureBytes::CopyFrom(source);
        REQUIRE(secret.Size() == 4);
        auto view = secret.Expose();
        REQUIRE(view.IsOk());
        REQUIRE(std::equal(view.Unwrap().begin(), view.Unwrap().end(), source.begin(), source.end()));
    }
    SECTION("Dispose is idempotent and blocks Expose") {
        auto secret = SecureBytes::CopyFrom(std::vector<uint8_t>(32, 0x11));
        secret.Dispose();
        secret.Dispose();
        REQUIRE(secret.IsDisposed());
        REQUIRE(secret.Size() == 0);
        auto view = secret.Expose();
        REQUIRE(view.IsErr());
        REQUIRE(view.UnwrapErr().type == SigilFailureType::Disposed);
    }
    SECTION("Moved-from value reads as disposed") {
        auto original = SecureBytes::CopyFrom(std::vector<uint8_t>(16, 0x22));
        SecureBytes moved = std::move(original);
        REQUIRE(moved.Expose().IsOk());
        REQUIRE(moved.Size() == 16);
        REQUIRE(original.IsDisposed());
    }
}
