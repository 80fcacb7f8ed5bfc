/**
 * @file result.hpp
 * @brief Monadic error handling type for the task dispatch engine.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Errors carry
 * an ErrorCode drawn from the dispatcher's error taxonomy so callers can tell
 * structural failures (abort the dispatch) from per-task ones (retry).
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

namespace task_dispatch {

/**
 * @brief Error taxonomy.
 */
enum class ErrorCode : uint8_t {
    Unknown,
    DecompositionError,     ///< Unparseable or empty specification
    CycleDetected,          ///< Structural: graph is not a DAG
    GraphFrozen,            ///< Structural mutation after freeze()
    TaskExecution,          ///< Agent-reported failure
    Timeout,                ///< Deadline exceeded
    ResourceExhausted,      ///< No agent available within the wait bound
    CheckpointCorrupt,      ///< Restore failure
    InvalidArgument,
    NotFound,
    InvalidTransition,
    ExternalService,        ///< Language-model call failed
    Config,
    Io,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown:            return "unknown";
        case ErrorCode::DecompositionError: return "decomposition_error";
        case ErrorCode::CycleDetected:      return "cycle_detected";
        case ErrorCode::GraphFrozen:        return "graph_frozen";
        case ErrorCode::TaskExecution:      return "task_execution_error";
        case ErrorCode::Timeout:            return "timeout";
        case ErrorCode::ResourceExhausted:  return "resource_exhausted";
        case ErrorCode::CheckpointCorrupt:  return "checkpoint_corrupt";
        case ErrorCode::InvalidArgument:    return "invalid_argument";
        case ErrorCode::NotFound:           return "not_found";
        case ErrorCode::InvalidTransition:  return "invalid_transition";
        case ErrorCode::ExternalService:    return "external_service";
        case ErrorCode::Config:             return "config";
        case ErrorCode::Io:                 return "io";
        case ErrorCode::Cancelled:          return "cancelled";
    }
    return "unknown";
}

/// Structural errors abort a dispatch before execution starts.
[[nodiscard]] constexpr bool is_structural(ErrorCode code) noexcept {
    return code == ErrorCode::CycleDetected || code == ErrorCode::GraphFrozen
        || code == ErrorCode::DecompositionError;
}

/**
 * @brief Error type carrying a code and a descriptive message.
 */
struct Error {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E> — a monadic error type.
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
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }
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
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
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

}  // namespace task_dispatch
