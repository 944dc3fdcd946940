#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace uuidstamp {

/**
 * ErrorCode - Failure classes surfaced by the core.
 *
 * "No match" is deliberately absent: an empty match sequence is a
 * successful result, not an error.
 */
enum class ErrorCode {
    Unknown = 0,
    MalformedUuid,
    MalformedInstant,
    InvalidArgument,
    Io
};

[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::MalformedUuid: return "malformed_uuid";
        case ErrorCode::MalformedInstant: return "malformed_instant";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::Io: return "io";
    }
    return "unknown";
}

/**
 * Error type for Result - represents a failure with a message and a code.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Unknown};

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::Unknown)
        : message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

/**
 * Result<T, E> - Either a successful value (Ok) or an error (Err).
 *
 * Usage:
 *   Result<int64_t> seconds = decode_seconds(text);
 *   auto label = seconds
 *       .map([](int64_t s) { return format_iso8601(s); })
 *       .value_or("?");
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
     * Get the success value, throwing if this is an error.
     * Use sparingly - prefer map/and_then for safe access.
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

    template<typename OnOk, typename OnErr>
    [[nodiscard]] auto match(OnOk&& on_ok, OnErr&& on_err) const& {
        if (is_ok()) {
            return std::invoke(std::forward<OnOk>(on_ok), std::get<0>(data_));
        }
        return std::invoke(std::forward<OnErr>(on_err), std::get<1>(data_));
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

    std::variant<T, E> data_;
};

template<typename T>
using Res = Result<T, Error>;

} // namespace uuidstamp
