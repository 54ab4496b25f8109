/**
 * @file result.hpp
 * @brief Monadic error handling type for PlanScope.
 *
 * Result<T, E> is the error channel at the edges of the system (config and
 * plan-file loading). The analysis core itself never fails: it degrades to
 * empty or clamped reports instead.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace plan_scope {

// ─────────────────────────────────────────────
// Error
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    NotFound,       ///< File or entity does not exist
    Parse,          ///< Input could not be parsed
    InvalidInput,   ///< Input parsed but violates a field constraint
    DuplicateId,    ///< Two tasks share the same identifier
    Io              ///< Read/write failure
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound:     return "not_found";
        case ErrorCode::Parse:        return "parse";
        case ErrorCode::InvalidInput: return "invalid_input";
        case ErrorCode::DuplicateId:  return "duplicate_id";
        case ErrorCode::Io:           return "io";
    }
    return "unknown";
}

/**
 * @brief Error carrying a category and a descriptive message.
 */
struct Error {
    ErrorCode code = ErrorCode::InvalidInput;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

// ─────────────────────────────────────────────
// Result<T, E>
// ─────────────────────────────────────────────

/**
 * @brief Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_message());
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_message());
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_message());
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) return func(value());
        return error();
    }

    /// Chain with a function that itself returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) return func(value());
        return error();
    }

    [[nodiscard]] T value_or(T fallback) const& {
        if (has_value()) return value();
        return fallback;
    }

private:
    [[nodiscard]] std::string error_message() const {
        if constexpr (std::is_same_v<E, Error>) {
            return std::get<E>(storage_).message;
        } else {
            return {};
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that succeed without a value.
 */
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
};

/// Convenience factory for error results.
template <typename T>
Result<T> make_error(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

}  // namespace plan_scope
