/**
 * QueryCache - Prefix-invalidating query cache
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace querycache::util {

// Static members
std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

void Logger::init(const LogConfig& config) {
    bool created = false;
    std::call_once(init_flag_, [&config, &created]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(config);
        created = true;
    });
    // Logging may have started on defaults before the configuration was read
    if (!created) {
        instance_->configure(config);
    }
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        LogConfig config;
        config.level = LogLevel::Info;
        config.enable_console = true;
        config.enable_colors = true;
        instance_->configure(config);
    });
    return *instance_;
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.enable_colors) {
            console_sink->set_color_mode(spdlog::color_mode::never);
        }
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    // File sink with rotation
    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("querycache", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog_level(config.level));
    logger_->flush_on(spdlog::level::warn);

    current_level_.store(config.level, std::memory_order_relaxed);

    // lru_store logs through bare spdlog:: calls
    spdlog::drop("querycache");
    spdlog::register_logger(logger_);
    spdlog::set_default_logger(logger_);
}

std::optional<LogLevel> Logger::parse_level(std::string_view name) {
    struct Alias {
        std::string_view name;
        LogLevel level;
    };
    static constexpr Alias kAliases[] = {
        {"trace", LogLevel::Trace},    {"debug", LogLevel::Debug},   {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},      {"warning", LogLevel::Warn},  {"error", LogLevel::Error},
        {"err", LogLevel::Error},      {"critical", LogLevel::Critical}, {"crit", LogLevel::Critical},
        {"off", LogLevel::Off},
    };

    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& alias : kAliases) {
        if (alias.name == lower) {
            return alias.level;
        }
    }
    return std::nullopt;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace querycache::util
