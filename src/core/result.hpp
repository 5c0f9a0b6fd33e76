#pragma once

#include <concepts>
#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace braid {

/**
 * Error - generic failure carried by Result when no richer error type applies.
 *
 * `code` holds a library status code where one exists (SQLite return codes
 * for storage errors), otherwise 0.
 */
struct Error {
    std::string message;
    int code{0};

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

namespace detail {

template<typename E>
[[noreturn]] inline void throw_unwrap_failure(const E& error) {
    if constexpr (std::is_same_v<E, Error>) {
        throw std::runtime_error("Result::unwrap() called on error: " + error.message);
    } else if constexpr (requires(const E& e) { { e.to_string() } -> std::convertible_to<std::string>; }) {
        throw std::runtime_error("Result::unwrap() called on error: " + error.to_string());
    } else {
        throw std::runtime_error("Result::unwrap() called on error");
    }
}

} // namespace detail

/**
 * Result<T, E> - either a value (ok) or an error (err).
 *
 * Every fallible operation in braid returns a Result; exceptions only escape
 * when a caller unwraps the wrong side.
 *
 *   auto key = EncryptionKey::from_bytes(bytes);
 *   if (key.is_err()) return SyncResult<void>::err(key.unwrap_err());
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    [[nodiscard]] T& unwrap() & {
        if (is_err()) detail::throw_unwrap_failure(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) detail::throw_unwrap_failure(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) detail::throw_unwrap_failure(std::get<1>(data_));
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    [[nodiscard]] T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * map_err : Result<T, E> -> (E -> G) -> Result<T, G>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using G = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<T, G>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
        }
        return Result<T, G>::ok(std::get<0>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    // Index-based access so T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value, or an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(); }
    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_err()) detail::throw_unwrap_failure(error_);
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const -> Result<void, std::invoke_result_t<F, const E&>> {
        using G = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<void, G>::err(std::invoke(std::forward<F>(f), error_));
        }
        return Result<void, G>::ok();
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

private:
    Result() : is_ok_(true) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace braid
