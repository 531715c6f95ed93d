/**
 * @file result.hpp
 * @brief Monadic error handling type for DynamicScheduler.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Structural
 * graph errors, execution failures and deadlocks all travel as an Error
 * tagged with an ErrorCode so callers can branch without parsing messages.
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

namespace dynamic_scheduler {

/**
 * @brief Error categories reported by the graph, the context and the scheduler.
 */
enum class ErrorCode : uint8_t {
    Generic,
    UnknownDependency,    ///< add_task / add_dependency referenced an unknown id
    CircularDependency,   ///< edge would close a cycle
    MissingDependency,    ///< wait_for referenced an id absent from the graph
    TaskExecution,        ///< executor reported failure or threw
    Deadlock,             ///< no ready or running tasks, some still waiting
    CycleDetected,        ///< topological sort found a cycle
    DependencyFailed,     ///< failed by cascade from a failed dependency
    DuplicateTask,
    UnknownTask,
    InvalidTransition,
    InvalidArgument,
    AlreadyRunning,
    Config
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Generic:            return "generic";
        case ErrorCode::UnknownDependency:  return "unknown_dependency";
        case ErrorCode::CircularDependency: return "circular_dependency";
        case ErrorCode::MissingDependency:  return "missing_dependency";
        case ErrorCode::TaskExecution:      return "task_execution";
        case ErrorCode::Deadlock:           return "deadlock";
        case ErrorCode::CycleDetected:      return "cycle_detected";
        case ErrorCode::DependencyFailed:   return "dependency_failed";
        case ErrorCode::DuplicateTask:      return "duplicate_task";
        case ErrorCode::UnknownTask:        return "unknown_task";
        case ErrorCode::InvalidTransition:  return "invalid_transition";
        case ErrorCode::InvalidArgument:    return "invalid_argument";
        case ErrorCode::AlreadyRunning:     return "already_running";
        case ErrorCode::Config:             return "config";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a category and a descriptive message.
 */
struct Error {
    ErrorCode code = ErrorCode::Generic;
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }

    bool operator==(const Error&) const = default;
};

/**
 * @brief Result<T, E>, a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    [[nodiscard]] std::string error_text() const {
        if constexpr (std::is_same_v<E, Error>) {
            return std::get<E>(storage_).message;
        } else {
            return "error";
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 *
 * Used when an operation can fail but has no return value on success.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace dynamic_scheduler
