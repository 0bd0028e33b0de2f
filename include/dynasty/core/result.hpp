#pragma once
#include <variant>
#include <utility>
#include <type_traits>
#include <stdexcept>
#include <optional>

namespace dynasty::e2ee {

struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};
inline constexpr Unit unit{};

/// Error payload that converts into any Result<T, E> sharing the error type.
/// Produced by MakeErr() and used by DYNASTY_TRY to forward failures across
/// functions with different success types.
template<typename E>
struct ErrValue {
    E error;
};

template<typename E>
[[nodiscard]] ErrValue<std::decay_t<E>> MakeErr(E&& error) {
    return ErrValue<std::decay_t<E>>{std::forward<E>(error)};
}

template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(ErrValue<E> err)
        : value_(std::in_place_index<1>, std::move(err.error)) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;

    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == 1; }

    [[nodiscard]] T& Unwrap() & {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
        return std::get<0>(value_);
    }

    [[nodiscard]] const T& Unwrap() const& {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
        return std::get<0>(value_);
    }

    [[nodiscard]] T&& Unwrap() && {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
        return std::get<0>(std::move(value_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
        return std::get<1>(value_);
    }

    [[nodiscard]] const E& UnwrapErr() const& {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
        return std::get<1>(value_);
    }

    [[nodiscard]] E&& UnwrapErr() && {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
        return std::get<1>(std::move(value_));
    }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        if (IsOk()) {
            return std::get<0>(std::move(value_));
        }
        return fallback;
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<F>(func)(std::get<0>(std::move(value_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(value_)));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsErr()) {
            return Result<T, U>::Err(std::forward<F>(func)(std::get<1>(std::move(value_))));
        }
        return Result<T, U>::Ok(std::get<0>(std::move(value_)));
    }

    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using ResultType = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename ResultType::error_type, E>,
                      "Bind function must return Result with same error type");
        if (IsOk()) {
            return std::forward<F>(func)(std::get<0>(std::move(value_)));
        }
        return ResultType::Err(std::get<1>(std::move(value_)));
    }

    [[nodiscard]] std::optional<T> ToOptional() && {
        if (IsOk()) {
            return std::get<0>(std::move(value_));
        }
        return std::nullopt;
    }

private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}

    std::variant<T, E> value_;
};

}

#define DYNASTY_TRY(result_expr) \
    do { \
        auto&& _dynasty_try_result = (result_expr); \
        if (_dynasty_try_result.IsErr()) { \
            return ::dynasty::e2ee::MakeErr( \
                std::move(_dynasty_try_result).UnwrapErr()); \
        } \
    } while (0)
