#include <catch2/catch_test_macros.hpp>
#include "sigil/ffi/resource_handle.hpp"
#include "helpers/binding_fixtures.hpp"
#include <vector>
using namespace sigil::protocol;
using namespace sigil::protocol::test_helpers;
using PublicKeyHandle = ffi::ResourceHandle<ffi::PublicKeyTraits>;

namespace {
Result<PublicKeyHandle, SigilFailure> DeserializeHandle(const std::vector<uint8_t>& bytes) {
    return PublicKeyHandle::Create("test.publickey", [&bytes](SglMutPointerPublicKey* out) {
        return sgl_publickey_deserialize(out, ffi::Borrow(bytes));
    });
}
}

TEST_CASE("ResourceHandle - Adoption", "[ffi][handle]") {
    SECTION("Null pointer is never adopted") {
        auto adopted = PublicKeyHandle::Adopt(SglMutPointerPublicKey{nullptr}, "test.adopt");
        REQUIRE(FailedWith(adopted, SigilFailureType::NullPointer));
    }
    SECTION("Failing engine call leaves nothing behind") {
        const size_t before = LiveObjects();
        auto created = DeserializeHandle({0x05, 0x01});
        REQUIRE(FailedWith(created, SigilFailureType::CryptoError));
        REQUIRE(created.UnwrapErr().native_code == static_cast<uint32_t>(SGL_ERROR_CODE_INVALID_KEY));
        REQUIRE(LiveObjects() == before);
    }
    SECTION("Created handle owns exactly one engine object") {
        const size_t before = LiveObjects();
        {
            auto created = DeserializeHandle(SerializedPublicKey(0x09));
            REQUIRE(created.IsOk());
            REQUIRE_FALSE(created.Unwrap().IsDisposed());
            REQUIRE(LiveObjects() == before + 1);
        }
        REQUIRE(LiveObjects() == before);
    }
}

TEST_CASE("ResourceHandle - Disposal", "[ffi][handle][lifecycle]") {
    const size_t before = LiveObjects();
    auto handle = std::move(DeserializeHandle(SerializedPublicKey(0x0B))).Unwrap();

    SECTION("Dispose is idempotent") {
        handle.Dispose();
        handle.Dispose();
        REQUIRE(handle.IsDisposed());
        REQUIRE(LiveObjects() == before);
    }
    SECTION("Use after dispose fails without reaching the engine") {
        handle.Dispose();
        REQUIRE(FailedWith(handle.Use(), SigilFailureType::Disposed));
        REQUIRE(FailedWith(handle.UseMut(), SigilFailureType::Disposed));
        auto scoped = handle.With([](SglConstPointerPublicKey) {
            FAIL("callback ran on a disposed handle");
            return Result<Unit, SigilFailure>::Ok(unit);
        });
        REQUIRE(FailedWith(scoped, SigilFailureType::Disposed));
        REQUIRE(scoped.UnwrapErr().context == "PublicKey");
    }
    SECTION("Move transfers ownership") {
        PublicKeyHandle moved = std::move(handle);
        REQUIRE(handle.IsDisposed());
        REQUIRE_FALSE(moved.IsDisposed());
        REQUIRE(LiveObjects() == before + 1);
        handle.Dispose();
        REQUIRE(LiveObjects() == before + 1);
    }
    SECTION("Move assignment releases the previous object") {
        auto other = std::move(DeserializeHandle(SerializedPublicKey(0x0C))).Unwrap();
        REQUIRE(LiveObjects() == before + 2);
        handle = std::move(other);
        REQUIRE(LiveObjects() == before + 1);
    }
    SECTION("Clone is independent of the source") {
        auto clone = handle.Clone();
        REQUIRE(clone.IsOk());
        REQUIRE(LiveObjects() == before + 2);
        handle.Dispose();
        REQUIRE(clone.Unwrap().Use().IsOk());
        clone.Unwrap().Dispose();
        REQUIRE(LiveObjects() == before);
    }
    SECTION("Clone of a disposed handle fails") {
        handle.Dispose();
        REQUIRE(FailedWith(handle.Clone(), SigilFailureType::Disposed));
    }
}
