#pragma once
#include <variant>
#include <utility>
#include <type_traits>
#include <stdexcept>
namespace chachamir {
template<typename T, typename E>
class Result;
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};

/// Error carrier that converts into any Result<U, E>. Produced by PropagateErr
/// so an error can cross functions with different success types.
template<typename E>
struct PropagatedErr {
    E error;
};
template<typename E>
[[nodiscard]] PropagatedErr<std::decay_t<E>> PropagateErr(E&& error) {
    return PropagatedErr<std::decay_t<E>>{std::forward<E>(error)};
}

template<typename T, typename E>
class Result {
private:
    std::variant<T, E> value_;
    bool is_ok_;
public:
    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;
    Result(PropagatedErr<E> propagated)
        : value_(std::in_place_index<1>, std::move(propagated.error))
        , is_ok_(false) {}
    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }
    [[nodiscard]] bool IsOk() const noexcept { return is_ok_; }
    [[nodiscard]] bool IsErr() const noexcept { return !is_ok_; }
    [[nodiscard]] T& Unwrap() & {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
        return std::get<0>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
        return std::get<0>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
        return std::get<0>(std::move(value_));
    }
    [[nodiscard]] E& UnwrapErr() & {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(value_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(std::move(value_));
    }
    using value_type = T;
    using error_type = E;
private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...)
        , is_ok_(I == 0) {}
};

// Returns early from the enclosing function with the error of result_expr.
// The enclosing function must return a Result with the same error type.
#define CHACHAMIR_TRY(result_expr) \
    do { \
        auto&& chachamir_try_result_ = (result_expr); \
        if (chachamir_try_result_.IsErr()) { \
            return ::chachamir::PropagateErr(std::move(chachamir_try_result_).UnwrapErr()); \
        } \
    } while(0)
}
