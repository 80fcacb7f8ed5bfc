/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 * @author Dimitris Kafetzis
 *
 * Provides ILogSink (virtual interface for runtime-configurable log destinations)
 * and a thread-safe Logger front-end. Components log through a ComponentLogger
 * view so every NDJSON record carries the emitting component's name.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace task_dispatch {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

// ─────────────────────────────────────────────
// ILogSink (Virtual — runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message) { log(LogLevel::Debug, {}, message); }
    void info(std::string_view message)  { log(LogLevel::Info, {}, message); }
    void warn(std::string_view message)  { log(LogLevel::Warn, {}, message); }
    void error(std::string_view message) { log(LogLevel::Error, {}, message); }

    void log(LogLevel level, std::string_view component, std::string_view message);
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    mutable std::mutex mutex_;
};

/**
 * @brief Lightweight per-component handle onto a shared Logger.
 */
class ComponentLogger {
public:
    ComponentLogger(Logger& logger, std::string component)
        : logger_(&logger), component_(std::move(component)) {}

    void debug(std::string_view message) const { logger_->log(LogLevel::Debug, component_, message); }
    void info(std::string_view message) const  { logger_->log(LogLevel::Info, component_, message); }
    void warn(std::string_view message) const  { logger_->log(LogLevel::Warn, component_, message); }
    void error(std::string_view message) const { logger_->log(LogLevel::Error, component_, message); }

    [[nodiscard]] Logger& base() const noexcept { return *logger_; }

private:
    Logger* logger_;
    std::string component_;
};

/// Escape a string for embedding in a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view text);

}  // namespace task_dispatch
