#pragma once
// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ErrorCode: categorized error codes for the bytewire stack
enum class ErrorCode : uint16_t {
    NONE                = 0,
    // Codec (100-199)
    INSUFFICIENT_BYTES  = 100, VARINT_TOO_LARGE    = 101,
    VARLONG_TOO_LARGE   = 102, OFFSET_OUT_OF_RANGE = 103,
    // Field layouts (200-299)
    LAYOUT_ERROR        = 200, VALUE_ERROR         = 201,
    // Tooling (300-399)
    CONFIG_ERROR        = 300, IO_ERROR            = 301,
    // Internal (900-999)
    INTERNAL_ERROR      = 900,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// Error: rich error value carrying code, message, and origin location
class Error {
public:
    Error() noexcept : code_(ErrorCode::NONE) {}

    explicit Error(
        ErrorCode code,
        std::string message = {},
        std::source_location loc = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode          code()    const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }
    [[nodiscard]] bool is_ok() const noexcept { return code_ == ErrorCode::NONE; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_ok(); }
    [[nodiscard]] std::string format() const;

    /// Same code, message prefixed with "context: ". The location of the
    /// wrapped error is kept so diagnostics point at the failing read.
    [[nodiscard]] Error wrap(std::string_view context) const;

    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }
    bool operator!=(const Error& o) const noexcept { return code_ != o.code_; }

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

// Result<T, E>: a sum type holding either a value T or an error E
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(std::move(storage_));
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

    [[nodiscard]] T value_or(T default_val) const {
        return ok() ? std::get<T>(storage_) : std::move(default_val);
    }

    // map: Result<T,E> -> (T -> U) -> Result<U,E>
    template <typename F>
    [[nodiscard]] auto map(F&& func) const&
        -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (ok()) return Result<U, E>{func(std::get<T>(storage_))};
        return Result<U, E>{std::get<E>(storage_)};
    }
    template <typename F>
    [[nodiscard]] auto map(F&& func) &&
        -> Result<std::invoke_result_t<F, T&&>, E> {
        using U = std::invoke_result_t<F, T&&>;
        if (ok()) return Result<U, E>{func(std::get<T>(std::move(storage_)))};
        return Result<U, E>{std::get<E>(std::move(storage_))};
    }

    // and_then: Result<T,E> -> (T -> Result<U,E>) -> Result<U,E>
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const&
        -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        if (ok()) return func(std::get<T>(storage_));
        return R{std::get<E>(storage_)};
    }
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) &&
        -> std::invoke_result_t<F, T&&> {
        using R = std::invoke_result_t<F, T&&>;
        if (ok()) return func(std::get<T>(std::move(storage_)));
        return R{std::get<E>(std::move(storage_))};
    }

private:
    std::variant<T, E> storage_;
};

// Void-specialization: Result<void, E> for side-effect-only operations
template <typename E>
class Result<void, E> {
public:
    Result() noexcept : storage_(Void{}) {}
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<Void>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (!ok()) throw std::runtime_error("Result::value() on error");
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

private:
    struct Void {};
    std::variant<Void, E> storage_;
};

// Factory helpers
[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location loc = std::source_location::current()) noexcept {
    return Error(code, std::move(message), loc);
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// BYTEWIRE_TRY_ASSIGN: propagate the error or bind the value
// Usage:  BYTEWIRE_TRY_ASSIGN(val, some_result_expr);
#define BYTEWIRE_TRY_ASSIGN(var, expr)                                    \
    auto _bw_tmp_##var = (expr);                                          \
    if (!_bw_tmp_##var.ok())                                              \
        return std::move(_bw_tmp_##var).error();                          \
    auto var = std::move(_bw_tmp_##var).value()

// BYTEWIRE_TRY_VOID: propagate errors from Result<void> expressions
#define BYTEWIRE_TRY_VOID(expr)                                           \
    do {                                                                  \
        auto _bw_tmp = (expr);                                            \
        if (!_bw_tmp.ok()) return std::move(_bw_tmp).error();             \
    } while (false)

} // namespace core
