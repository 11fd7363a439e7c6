/**
 * QueryCache - Prefix-invalidating query cache
 * Diagnostics Publisher Implementation
 */

#include "diagnostics/diagnostics_publisher.hpp"

#include "cache/cache_key.hpp"
#include "util/logger.hpp"

namespace querycache::diagnostics {

namespace {

boost::beast::string_view to_beast(std::string_view value) {
    return boost::beast::string_view(value.data(), value.size());
}

} // namespace

std::string display_key(const config::CachingSettings& settings, std::string_view logical_key) {
    if (cache::is_blank(logical_key)) {
        return std::string(logical_key);
    }
    if (settings.diagnostics.key_display_mode == config::KeyDisplayMode::Hash) {
        return cache::hash_key(logical_key);
    }
    return std::string(logical_key);
}

// ============================================================================
// HttpDiagnosticsPublisher Implementation
// ============================================================================

HttpDiagnosticsPublisher::HttpDiagnosticsPublisher(const config::SettingsProvider& settings,
                                                   boost::beast::http::fields& headers)
    : settings_(settings)
    , headers_(headers) {
}

void HttpDiagnosticsPublisher::report_hit(std::string_view logical_key,
                                          std::optional<std::chrono::milliseconds> remaining) {
    write_status("HIT", logical_key, remaining);
}

void HttpDiagnosticsPublisher::report_miss(std::string_view logical_key,
                                           std::optional<std::chrono::milliseconds> ttl) {
    write_status("MISS", logical_key, ttl);
}

void HttpDiagnosticsPublisher::write_status(std::string_view status, std::string_view logical_key,
                                            std::optional<std::chrono::milliseconds> duration) {
    auto settings = settings_.snapshot();
    if (!settings.diagnostics.emit_cache_status_header) {
        return;
    }

    std::string_view header_name = settings.diagnostics.header_name;
    if (cache::is_blank(header_name)) {
        header_name = config::kDefaultStatusHeaderName;
    }

    headers_.set(to_beast(header_name), to_beast(status));

    auto shown = display_key(settings, logical_key);
    if (!cache::is_blank(shown)) {
        headers_.set(to_beast(kCacheKeyHeader), shown);
    }

    if (duration && duration->count() > 0) {
        headers_.set(to_beast(kCacheDurationHeader), std::to_string(duration->count()));
    }
}

// ============================================================================
// LoggingDiagnosticsPublisher Implementation
// ============================================================================

LoggingDiagnosticsPublisher::LoggingDiagnosticsPublisher(const config::SettingsProvider& settings)
    : settings_(settings) {
}

void LoggingDiagnosticsPublisher::report_hit(std::string_view logical_key,
                                             std::optional<std::chrono::milliseconds> remaining) {
    QUERYCACHE_LOG_DEBUG(util::log_component::Diagnostics, "HIT key={} remaining_ms={}",
                         display_key(settings_.snapshot(), logical_key),
                         remaining ? remaining->count() : 0);
}

void LoggingDiagnosticsPublisher::report_miss(std::string_view logical_key,
                                              std::optional<std::chrono::milliseconds> ttl) {
    QUERYCACHE_LOG_DEBUG(util::log_component::Diagnostics, "MISS key={} ttl_ms={}",
                         display_key(settings_.snapshot(), logical_key),
                         ttl ? ttl->count() : 0);
}

} // namespace querycache::diagnostics
