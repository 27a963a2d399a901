#pragma once

#include "common/types.h"
#include <atomic>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

namespace vaultsim {
namespace common {

/**
 * @brief Severity of a log entry
 *
 * Packet hops and vault decisions log at TRACE/DEBUG so that test runs stay
 * quiet unless a finer level is requested.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5  // Harness contract violations
};

const char* level_name(LogLevel level);

/**
 * @brief Parse a level name (trace/debug/info/warn/error/critical)
 */
Result<LogLevel> parse_log_level(const std::string& name);

using LogContext = std::map<std::string, std::string>;

/**
 * @brief One line of simulation log output
 *
 * Stamped with the virtual clock of the simulated network rather than the
 * wall clock, so two runs with the same seed produce the same log.
 */
struct LogEntry {
    uint64_t sim_time_ms = 0;
    LogLevel level = LogLevel::INFO;
    std::string module;
    std::string message;
    std::string error_code;
    LogContext context;
};

/**
 * @brief Process-wide logger shared by the network, the vaults and the harness
 *
 * Output goes to stderr unless redirected with set_output(), which tests use
 * to capture what a failing scenario reported.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) noexcept {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel level() const noexcept {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /// One JSON object per line instead of the bracketed text form
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Redirect output; nullptr restores stderr
    void set_output(std::ostream* out) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        output_ = out ? out : &std::cerr;
    }

    /// Updated by the mock network whenever its clock moves
    void set_sim_time(uint64_t ms) noexcept {
        sim_time_ms_.store(ms, std::memory_order_relaxed);
    }

    uint64_t sim_time() const noexcept {
        return sim_time_ms_.load(std::memory_order_relaxed);
    }

    /// Streams every argument after the module tag into the message
    template<typename... Args>
    void log(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream message;
        (message << ... << args);
        emit(make_entry(level, module, message.str(), "", {}));
    }

    void log_structured(LogLevel level, const std::string& module,
                        const std::string& message, const std::string& error_code = "",
                        const LogContext& context = {}) {
        if (!is_enabled(level)) return;
        emit(make_entry(level, module, message, error_code, context));
    }

    /// Always emitted, whatever the level, and counted
    void log_critical_failure(const std::string& module, const std::string& message,
                              const std::string& error_code = "",
                              const LogContext& context = {}) {
        critical_failures_.fetch_add(1, std::memory_order_relaxed);
        emit(make_entry(LogLevel::CRITICAL, module, message, error_code, context));
    }

    uint64_t critical_failures() const noexcept {
        return critical_failures_.load(std::memory_order_relaxed);
    }

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;

private:
    Logger() = default;

    LogEntry make_entry(LogLevel level, const std::string& module, std::string message,
                        const std::string& error_code, const LogContext& context) const {
        return LogEntry{sim_time(), level, module, std::move(message), error_code, context};
    }

    void emit(const LogEntry& entry);

    std::atomic<int> level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<bool> json_format_{false};
    std::atomic<uint64_t> sim_time_ms_{0};
    std::atomic<uint64_t> critical_failures_{0};

    std::mutex output_mutex_;
    std::ostream* output_ = &std::cerr;
};

} // namespace common
} // namespace vaultsim

/**
 * @brief Logging macros
 *
 * The first argument is the module tag. Message arguments are only formatted
 * when the level is enabled.
 */
#define VAULTSIM_LOG_AT(level, ...) \
    do { \
        auto& vaultsim_logger_ = vaultsim::common::Logger::instance(); \
        if (vaultsim_logger_.is_enabled(level)) { \
            vaultsim_logger_.log(level, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_TRACE(...) VAULTSIM_LOG_AT(vaultsim::common::LogLevel::TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) VAULTSIM_LOG_AT(vaultsim::common::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...) VAULTSIM_LOG_AT(vaultsim::common::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) VAULTSIM_LOG_AT(vaultsim::common::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) VAULTSIM_LOG_AT(vaultsim::common::LogLevel::ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) VAULTSIM_LOG_AT(vaultsim::common::LogLevel::CRITICAL, __VA_ARGS__)

#define LOG_STRUCTURED(level, module, message, ...) \
    vaultsim::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)

#define LOG_CRITICAL_FAILURE(module, message, ...) \
    vaultsim::common::Logger::instance().log_critical_failure(module, message, ##__VA_ARGS__)

// Per-component critical failures
#define LOG_NETWORK_ERROR(message, ...) \
    LOG_CRITICAL_FAILURE("network", message, ##__VA_ARGS__)

#define LOG_VAULT_ERROR(message, ...) \
    LOG_CRITICAL_FAILURE("vault", message, ##__VA_ARGS__)

#define LOG_HARNESS_ERROR(message, ...) \
    LOG_CRITICAL_FAILURE("harness", message, ##__VA_ARGS__)
