#pragma once
#include <concepts>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
namespace sigil::protocol {
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};
/**
 * @brief Value or error, never both.
 *
 * Every fallible binding call returns one of these. Unwrap() on the wrong
 * alternative is a programming error and throws std::logic_error; when the
 * error type has Describe(), its text is carried in the exception.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;

    static Result Ok(T value) {
        return Result(std::in_place_index<VALUE_INDEX>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<ERROR_INDEX>, std::move(error));
    }
    static Result FromOptional(std::optional<T> value, E error_if_empty) {
        if (value.has_value()) {
            return Ok(std::move(*value));
        }
        return Err(std::move(error_if_empty));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == VALUE_INDEX; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == ERROR_INDEX; }

    template<typename Pred>
    [[nodiscard]] bool IsErrAnd(Pred&& pred) const {
        return IsErr() && std::forward<Pred>(pred)(std::get<ERROR_INDEX>(storage_));
    }

    [[nodiscard]] T& Unwrap() & {
        RequireOk("Unwrap");
        return std::get<VALUE_INDEX>(storage_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk("Unwrap");
        return std::get<VALUE_INDEX>(storage_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk("Unwrap");
        return std::get<VALUE_INDEX>(std::move(storage_));
    }
    /// As Unwrap(), naming what the caller expected in the exception.
    [[nodiscard]] T&& Expect(const std::string_view what) && {
        RequireOk(what);
        return std::get<VALUE_INDEX>(std::move(storage_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<ERROR_INDEX>(storage_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<ERROR_INDEX>(storage_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<ERROR_INDEX>(std::move(storage_));
    }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        if (IsOk()) {
            return std::get<VALUE_INDEX>(std::move(storage_));
        }
        return fallback;
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<ERROR_INDEX>(std::move(storage_)));
        }
        return Result<U, E>::Ok(std::forward<F>(func)(std::get<VALUE_INDEX>(std::move(storage_))));
    }
    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsOk()) {
            return Result<T, U>::Ok(std::get<VALUE_INDEX>(std::move(storage_)));
        }
        return Result<T, U>::Err(std::forward<F>(func)(std::get<ERROR_INDEX>(std::move(storage_))));
    }
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind continuation must keep the error type");
        if (IsErr()) {
            return Next::Err(std::get<ERROR_INDEX>(std::move(storage_)));
        }
        return std::forward<F>(func)(std::get<VALUE_INDEX>(std::move(storage_)));
    }

private:
    static constexpr std::size_t VALUE_INDEX = 0;
    static constexpr std::size_t ERROR_INDEX = 1;

    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : storage_(index, std::forward<Arg>(arg)) {}

    void RequireOk(const std::string_view what) const {
        if (IsOk()) {
            return;
        }
        std::string message(what);
        message += " on an Err result";
        if constexpr (requires(const E& e) { { e.Describe() } -> std::convertible_to<std::string>; }) {
            message += ": " + std::get<ERROR_INDEX>(storage_).Describe();
        }
        throw std::logic_error(message);
    }
    void RequireErr() const {
        if (IsErr()) {
            return;
        }
        throw std::logic_error("UnwrapErr on an Ok result");
    }

    std::variant<T, E> storage_;
};
}
