/**
 * QueryCache - Prefix-invalidating query cache
 * Logger - Component-tagged logging with spdlog
 *
 * Provides:
 * - Structured logging with levels (TRACE .. CRITICAL)
 * - Log format: timestamp, level, [component] message
 * - Configurable log level via config/environment
 * - Log rotation support (or stdout only)
 */

#ifndef QUERYCACHE_UTIL_LOGGER_HPP
#define QUERYCACHE_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace querycache::util {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logging configuration
 */
struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for stdout only
    std::size_t max_file_size_mb{100}; // Max size before rotation
    std::size_t max_files{5};          // Number of rotated files to keep
    bool enable_console{true};         // Log to stdout
    bool enable_colors{true};          // Colored console output
};

/**
 * Logger class - centralized logging with component tagging
 *
 * Thread-safe singleton that manages application-wide logging.
 * The singleton pattern is maintained by keeping the constructor private.
 */
class Logger {
public:
    /**
     * Initialize the logger with configuration.
     * Later calls replace the sinks and level of the running logger.
     */
    static void init(const LogConfig& config);

    /**
     * Get the logger instance (creates default if not initialized)
     */
    static Logger& instance();

    ~Logger();

    /**
     * Parse a level name (case-insensitive); accepts the spdlog short forms
     * ("warning", "err", "crit") as well as trace..off
     */
    static std::optional<LogLevel> parse_level(std::string_view name);

    // Component-tagged logging methods
    template<typename... Args>
    void trace(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, component, fmt, std::forward<Args>(args)...);
    }

    /**
     * Flush all sinks
     */
    void flush();

private:
    Logger() = default;

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    template<typename... Args>
    void log(LogLevel level, std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!logger_) return;
        if (level < current_level_.load(std::memory_order_relaxed)) return;

        logger_->log(to_spdlog_level(level), "[{}] {}", component,
                     fmt::format(fmt, std::forward<Args>(args)...));
    }

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<LogLevel> current_level_{LogLevel::Info};
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

// Convenience macros for logging with automatic component tagging
#define QUERYCACHE_LOG_TRACE(component, ...) \
    ::querycache::util::Logger::instance().trace(component, __VA_ARGS__)
#define QUERYCACHE_LOG_DEBUG(component, ...) \
    ::querycache::util::Logger::instance().debug(component, __VA_ARGS__)
#define QUERYCACHE_LOG_INFO(component, ...) \
    ::querycache::util::Logger::instance().info(component, __VA_ARGS__)
#define QUERYCACHE_LOG_WARN(component, ...) \
    ::querycache::util::Logger::instance().warn(component, __VA_ARGS__)
#define QUERYCACHE_LOG_ERROR(component, ...) \
    ::querycache::util::Logger::instance().error(component, __VA_ARGS__)
#define QUERYCACHE_LOG_CRITICAL(component, ...) \
    ::querycache::util::Logger::instance().critical(component, __VA_ARGS__)

// Component constants
namespace log_component {
    constexpr std::string_view Cache = "cache";
    constexpr std::string_view Config = "config";
    constexpr std::string_view Remote = "remote";
    constexpr std::string_view Admin = "admin";
    constexpr std::string_view Diagnostics = "diagnostics";
    constexpr std::string_view Cli = "cli";
}

} // namespace querycache::util

#endif // QUERYCACHE_UTIL_LOGGER_HPP
