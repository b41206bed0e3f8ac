#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace jitstreamer {

/**
 * ErrorCode - Failure taxonomy shared by every module.
 *
 * The first block mirrors the statuses reported to clients; the last
 * three are local faults (bad input, SQLite, anything else).
 */
enum class ErrorCode : int {
    NotFound = 1,
    AlreadyRegistered,
    PoolExhausted,
    UpstreamUnavailable,
    TooSoon,
    WorkerFailed,
    TimedOut,
    Cancelled,
    RegistrationDisabled,
    InvalidArgument,
    Storage,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::AlreadyRegistered: return "already_registered";
        case ErrorCode::PoolExhausted: return "pool_exhausted";
        case ErrorCode::UpstreamUnavailable: return "upstream_unavailable";
        case ErrorCode::TooSoon: return "too_soon";
        case ErrorCode::WorkerFailed: return "failed";
        case ErrorCode::TimedOut: return "timed_out";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::RegistrationDisabled: return "registration_disabled";
        case ErrorCode::InvalidArgument: return "invalid_request";
        case ErrorCode::Storage: return "internal_error";
        case ErrorCode::Internal: return "internal_error";
    }
    return "internal_error";
}

/**
 * Error - A failure with a message, a taxonomy code, and the native code
 * reported by the library underneath (SQLite result code, exit status).
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Internal};
    int native{0};

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::Internal, int native_code = 0)
        : message(std::move(msg)), code(c), native(native_code) {}

    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code && native == other.native;
    }
};

/**
 * Result<T, E> - Either a value (Ok) or an error (Err).
 *
 * Usage:
 *   Res<Device> lookup(const std::string& id) {
 *       if (id.empty()) return Res<Device>::err(Error{"empty id", ErrorCode::InvalidArgument});
 *       ...
 *   }
 *
 *   auto address = registry.lookup(id).map([](const Device& d) { return d.address; });
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

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the value, throwing if this is an error.
     * Tests use this freely; production code checks is_ok() first.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
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

    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<1>(std::move(data_)));
    }

    /**
     * map_err : Result<T, E> -> (E -> F) -> Result<T, F>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<T, NewE>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
        }
        return Result<T, NewE>::ok(std::get<0>(data_));
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

    /**
     * Run a side effect on the error (logging), returning this Result unchanged.
     */
    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - Success without a value, or an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

    template<typename F>
    const Result& inspect_err(F&& f) const {
        if (is_err()) {
            std::invoke(std::forward<F>(f), error_);
        }
        return *this;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

/**
 * Shorthand for building an Err with a taxonomy code.
 */
template<typename T>
[[nodiscard]] Res<T> fail(ErrorCode code, std::string message, int native = 0) {
    return Res<T>::err(Error{std::move(message), code, native});
}

} // namespace jitstreamer
