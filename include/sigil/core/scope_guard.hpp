#pragma once

#include <type_traits>
#include <utility>

namespace sigil::protocol {

/**
 * @brief Runs a callable on scope exit unless dismissed.
 *
 * Used to zero scratch buffers holding secret bytes and to release native
 * objects on every early return.
 */
template<typename F>
class ScopeGuard {
public:
    explicit ScopeGuard(F&& fn) noexcept
        : fn_(std::move(fn)), active_(true) {}

    ScopeGuard(ScopeGuard&& other) noexcept
        : fn_(std::move(other.fn_)), active_(other.active_) {
        other.active_ = false;
    }

    ~ScopeGuard() {
        if (active_) {
            fn_();
        }
    }

    void Dismiss() noexcept { active_ = false; }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;
    ScopeGuard& operator=(ScopeGuard&&) = delete;

private:
    F fn_;
    bool active_;
};

template<typename F>
[[nodiscard]] ScopeGuard<std::decay_t<F>> MakeScopeGuard(F&& fn) noexcept {
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(fn));
}

}
