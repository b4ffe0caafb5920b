#pragma once

#include "sigil/core/constants.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/core/result.hpp"
#include "sigil/debug/lifecycle_log.hpp"
#include "sigil/ffi/ffi_helpers.hpp"
#include "sigil/ffi/native_traits.hpp"

#include <atomic>
#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace sigil::protocol::ffi {

template<typename Traits>
concept ClonableNative = requires(typename Traits::MutPointer* out, typename Traits::ConstPointer ptr) {
    { Traits::Clone(out, ptr) } -> std::same_as<SglFfiError*>;
};

/**
 * @brief Sole owner of one engine object.
 *
 * Two states: Live (pointer set) and Disposed (pointer null). Every access
 * goes through Use()/UseMut(), which fail with Disposed once the handle has
 * been released, so no path can hand a freed pointer to the engine.
 *
 * Dispose() swaps the pointer out before calling the engine destructor. A
 * second Dispose(), the destructor, or a move-assignment that runs later
 * all see null and do nothing, so the destructor runs at most once.
 *
 * Not synchronised for concurrent use of the object itself; the atomic only
 * makes the detach step indivisible.
 */
template<typename Traits>
class ResourceHandle {
public:
    using Native = typename Traits::Native;
    using MutPointer = typename Traits::MutPointer;
    using ConstPointer = typename Traits::ConstPointer;

    /// Takes ownership of a pointer the engine just returned.
    [[nodiscard]] static Result<ResourceHandle, SigilFailure> Adopt(
        const MutPointer ptr,
        const std::string_view context) {
        if (ptr.raw == nullptr) {
            return Result<ResourceHandle, SigilFailure>::Err(
                SigilFailure::NullPointer(std::string(context),
                    std::string(ErrorMessages::NATIVE_RETURNED_NULL)));
        }
        SIGIL_LOG_LIFECYCLE(Traits::Name, "adopted");
        return Result<ResourceHandle, SigilFailure>::Ok(ResourceHandle(ptr.raw));
    }

    /**
     * @brief Runs an engine call that writes a new object, then adopts it.
     *
     * @param call Callable taking MutPointer* and returning SglFfiError*
     */
    template<typename Call>
    [[nodiscard]] static Result<ResourceHandle, SigilFailure> Create(
        const std::string_view context,
        Call&& call) {
        MutPointer out{nullptr};
        auto status = CheckNativeError(std::forward<Call>(call)(&out), context);
        if (status.IsErr()) {
            return Result<ResourceHandle, SigilFailure>::Err(std::move(status).UnwrapErr());
        }
        return Adopt(out, context);
    }

    ResourceHandle() noexcept : ptr_(nullptr) {}

    ~ResourceHandle() {
        Dispose();
    }

    ResourceHandle(ResourceHandle&& other) noexcept
        : ptr_(other.ptr_.exchange(nullptr)) {}

    ResourceHandle& operator=(ResourceHandle&& other) noexcept {
        if (this != &other) {
            Dispose();
            ptr_.store(other.ptr_.exchange(nullptr));
        }
        return *this;
    }

    ResourceHandle(const ResourceHandle&) = delete;
    ResourceHandle& operator=(const ResourceHandle&) = delete;

    [[nodiscard]] Result<ConstPointer, SigilFailure> Use() const {
        Native* raw = ptr_.load();
        if (raw == nullptr) {
            return Result<ConstPointer, SigilFailure>::Err(
                SigilFailure::Disposed(std::string(Traits::Name)));
        }
        return Result<ConstPointer, SigilFailure>::Ok(ConstPointer{raw});
    }

    [[nodiscard]] Result<MutPointer, SigilFailure> UseMut() {
        Native* raw = ptr_.load();
        if (raw == nullptr) {
            return Result<MutPointer, SigilFailure>::Err(
                SigilFailure::Disposed(std::string(Traits::Name)));
        }
        return Result<MutPointer, SigilFailure>::Ok(MutPointer{raw});
    }

    /// Scopes the const pointer to one call. fn must return a Result.
    template<typename F>
    auto With(F&& fn) const -> std::invoke_result_t<F, ConstPointer> {
        using R = std::invoke_result_t<F, ConstPointer>;
        auto ptr = Use();
        if (ptr.IsErr()) {
            return R::Err(std::move(ptr).UnwrapErr());
        }
        return std::forward<F>(fn)(ptr.Unwrap());
    }

    template<typename F>
    auto WithMut(F&& fn) -> std::invoke_result_t<F, MutPointer> {
        using R = std::invoke_result_t<F, MutPointer>;
        auto ptr = UseMut();
        if (ptr.IsErr()) {
            return R::Err(std::move(ptr).UnwrapErr());
        }
        return std::forward<F>(fn)(ptr.Unwrap());
    }

    [[nodiscard]] Result<ResourceHandle, SigilFailure> Clone() const
        requires ClonableNative<Traits> {
        auto ptr = Use();
        if (ptr.IsErr()) {
            return Result<ResourceHandle, SigilFailure>::Err(std::move(ptr).UnwrapErr());
        }
        const ConstPointer source = ptr.Unwrap();
        return Create(Traits::Name, [source](MutPointer* out) {
            return Traits::Clone(out, source);
        });
    }

    /// Idempotent. Safe on a moved-from or default-constructed handle.
    void Dispose() noexcept {
        Native* raw = ptr_.exchange(nullptr);
        if (raw == nullptr) {
            return;
        }
        SIGIL_LOG_LIFECYCLE(Traits::Name, "disposed");
        if (SglFfiError* error = Traits::Destroy(MutPointer{raw}); error != nullptr) {
            SIGIL_LOG_NATIVE_ERROR(Traits::Name, sgl_error_get_type(error));
            sgl_error_free(error);
        }
    }

    [[nodiscard]] bool IsDisposed() const noexcept {
        return ptr_.load() == nullptr;
    }

private:
    explicit ResourceHandle(Native* raw) noexcept : ptr_(raw) {}

    std::atomic<Native*> ptr_;
};

}
