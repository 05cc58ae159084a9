#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

/// Error codes, grouped by the layer that raises them.
enum class ErrorCode : uint16_t {
    NONE = 0,

    PARSE_ERROR      = 100,
    PARSE_OVERFLOW   = 101,
    PARSE_BAD_FORMAT = 102,

    VALIDATION_ERROR = 200,
    VALIDATION_RANGE = 201,

    NETWORK_ERROR   = 300,
    NETWORK_TIMEOUT = 301,

    STORAGE_ERROR     = 500,
    STORAGE_NOT_FOUND = 501,

    // coin selection and plan assembly
    INSUFFICIENT_FUNDS           = 601,
    NO_CHANGE_FREE_SOLUTION      = 602,
    DUST_CHANGE_REJECTED         = 603,
    CONSOLIDATION_NOT_BENEFICIAL = 604,
    FEE_LIMIT_EXCEEDED           = 605,

    // calls into the ledger node
    INVENTORY_UNAVAILABLE = 701,
    SIGNING_FAILED        = 702,
    BROADCAST_FAILED      = 703,

    UTXO_LOCK_CONFLICT = 800,

    INTERNAL_ERROR = 900,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

/// True for failures that may succeed on a later attempt (node unreachable,
/// lock contention). Selection outcomes are never transient.
[[nodiscard]] bool is_transient(ErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

class Error {
public:
    Error() noexcept = default;

    explicit Error(ErrorCode code, std::string message = {},
                   std::source_location where =
                       std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), where_(where) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept {
        return message_;
    }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return where_;
    }

    /// "CODE(n): message [file:line]"
    [[nodiscard]] std::string format() const;

private:
    ErrorCode code_ = ErrorCode::NONE;
    std::string message_;
    std::source_location where_;
};

[[nodiscard]] inline Error make_error(
    ErrorCode code, std::string message = {},
    std::source_location where = std::source_location::current()) noexcept {
    return Error(code, std::move(message), where);
}

namespace detail {
[[noreturn]] void throw_bad_result_access(bool wanted_value);
} // namespace detail

// ---------------------------------------------------------------------------
// Result<T, E>
// ---------------------------------------------------------------------------
// Holds either a value or an error. Both constructors are implicit so a
// function can `return value;` or `return Error(...);` directly. Reading the
// wrong side throws std::logic_error.

template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>, "value and error types must differ");

public:
    Result(const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool has_value() const noexcept { return ok(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & { return std::get<0>(checked(true)); }
    [[nodiscard]] const T& value() const& {
        return std::get<0>(checked(true));
    }
    [[nodiscard]] T&& value() && {
        return std::get<0>(std::move(checked(true)));
    }

    [[nodiscard]] E& error() & { return std::get<1>(checked(false)); }
    [[nodiscard]] const E& error() const& {
        return std::get<1>(checked(false));
    }
    [[nodiscard]] E&& error() && {
        return std::get<1>(std::move(checked(false)));
    }

    [[nodiscard]] T value_or(T fallback) const {
        return ok() ? std::get<0>(storage_) : std::move(fallback);
    }

    /// Chain a step that itself returns a Result with the same error type.
    template <typename F>
    [[nodiscard]] auto and_then(F&& step) const
        -> std::invoke_result_t<F, const T&> {
        if (ok()) return std::forward<F>(step)(std::get<0>(storage_));
        return std::get<1>(storage_);
    }

private:
    std::variant<T, E>& checked(bool want_value) {
        if (ok() != want_value) detail::throw_bad_result_access(want_value);
        return storage_;
    }
    const std::variant<T, E>& checked(bool want_value) const {
        if (ok() != want_value) detail::throw_bad_result_access(want_value);
        return storage_;
    }

    std::variant<T, E> storage_;
};

/// Result of an operation that only succeeds or fails.
template <typename E>
class Result<void, E> {
public:
    Result() noexcept = default;
    Result(const E& error) : error_(error), failed_(true) {}
    Result(E&& error) : error_(std::move(error)), failed_(true) {}

    [[nodiscard]] bool ok() const noexcept { return !failed_; }
    [[nodiscard]] bool has_value() const noexcept { return ok(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (failed_) detail::throw_bad_result_access(true);
    }
    [[nodiscard]] E& error() & {
        if (!failed_) detail::throw_bad_result_access(false);
        return error_;
    }
    [[nodiscard]] const E& error() const& {
        if (!failed_) detail::throw_bad_result_access(false);
        return error_;
    }
    [[nodiscard]] E&& error() && {
        if (!failed_) detail::throw_bad_result_access(false);
        return std::move(error_);
    }

    template <typename F>
    [[nodiscard]] auto and_then(F&& step) const -> std::invoke_result_t<F> {
        if (ok()) return std::forward<F>(step)();
        return error_;
    }

private:
    E error_{};
    bool failed_ = false;
};

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

} // namespace core

// ---------------------------------------------------------------------------
// Propagation helpers
// ---------------------------------------------------------------------------

/// Declare @p var from the value of @p expr, or return its error.
#define TXP_TRY_ASSIGN(var, expr)                                         \
    auto txp_try_##var = (expr);                                          \
    if (!txp_try_##var.ok()) return std::move(txp_try_##var).error();     \
    auto var = std::move(txp_try_##var).value()

/// Return the error of @p expr, if any.
#define TXP_TRY_VOID(expr)                                                \
    do {                                                                  \
        auto txp_try_void = (expr);                                       \
        if (!txp_try_void.ok()) return std::move(txp_try_void).error();   \
    } while (false)
