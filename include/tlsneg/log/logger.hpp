#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <mutex>
#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace tlsneg::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

/// Convert log level to string
constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        default:             return "UNKNOWN";
    }
}

/// Convert log level to ANSI color code
constexpr const char* level_to_color(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "\033[36m";  // Cyan
        case level::info:    return "\033[32m";  // Green
        case level::warning: return "\033[33m";  // Yellow
        case level::error:   return "\033[31m";  // Red
        default:             return "\033[0m";   // Reset
    }
}

/// One emitted log record
struct record {
    level lvl;
    std::string_view message;
    std::string_view reason;  ///< Failure reason or error kind ("version_mismatch"), empty for plain records
    const char* file;
    int line;
};

/// Receives records instead of stderr once installed
using sink_func = std::function<void(const record&)>;

/// Singleton logger class
class logger {
public:
    /// Get singleton instance
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    /// Get current minimum log level
    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    /// Route records to a custom sink
    void set_sink(sink_func sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    /// Restore stderr output
    void reset_sink() {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = nullptr;
    }

    /// Log a message with formatting
    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (lvl < min_level_.load(std::memory_order_relaxed)) {
            return;
        }
        emit(lvl, {}, file, line, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    /// Log a negotiation or bind failure tagged with its reason
    template<typename... Args>
    void log_failure(level lvl, std::string_view reason, const char* file, int line,
                     fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (lvl < min_level_.load(std::memory_order_relaxed)) {
            return;
        }
        emit(lvl, reason, file, line, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

private:
    logger() noexcept : min_level_(level::info) {}
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    void emit(level lvl, std::string_view reason, const char* file, int line, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) {
            sink_(record{lvl, msg, reason, file, line});
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::string tag;
        if (!reason.empty()) {
            tag = fmt::format("[{}] ", reason);
        }

        // Format: [TIMESTAMP] [LEVEL] [file:line] [reason] message
        fmt::print(stderr,
            "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [{}:{}] {}{}\033[0m\n",
            level_to_color(lvl),
            fmt::localtime(time),
            ms.count(),
            level_to_string(lvl),
            file,
            line,
            tag,
            msg
        );
    }

    std::atomic<level> min_level_;
    std::mutex mutex_;  // Serializes sink and stderr writes
    sink_func sink_;
};

} // namespace tlsneg::log
