/**
 * QueryCache - Prefix-invalidating query cache
 * Diagnostics Publisher - Reports cache hits and misses to the caller's surface
 *
 * Keys are shown raw or hashed depending on diagnostics.key_display_mode,
 * so filter values a user typed never leak into headers or logs when
 * hashing is on.
 */

#ifndef QUERYCACHE_DIAGNOSTICS_DIAGNOSTICS_PUBLISHER_HPP
#define QUERYCACHE_DIAGNOSTICS_DIAGNOSTICS_PUBLISHER_HPP

#include "config/config.hpp"

#include <boost/beast/http/fields.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace querycache::diagnostics {

inline constexpr std::string_view kCacheKeyHeader = "X-Cache-Key";
inline constexpr std::string_view kCacheDurationHeader = "X-Cache-Duration-Ms";

/**
 * The key as diagnostics should show it (raw logical key or its hash)
 */
std::string display_key(const config::CachingSettings& settings, std::string_view logical_key);

class DiagnosticsPublisher {
public:
    virtual ~DiagnosticsPublisher() = default;

    /**
     * @param remaining Time the entry stays cached, if known
     */
    virtual void report_hit(std::string_view logical_key, std::optional<std::chrono::milliseconds> remaining) = 0;

    /**
     * @param ttl Lifetime given to the freshly written entry, if any
     */
    virtual void report_miss(std::string_view logical_key, std::optional<std::chrono::milliseconds> ttl) = 0;
};

/**
 * Writes status headers into a response header set
 *
 * <header_name>: HIT|MISS, X-Cache-Key and X-Cache-Duration-Ms (only when
 * positive). Does nothing unless diagnostics.emit_cache_status_header is set.
 */
class HttpDiagnosticsPublisher : public DiagnosticsPublisher {
public:
    HttpDiagnosticsPublisher(const config::SettingsProvider& settings, boost::beast::http::fields& headers);

    void report_hit(std::string_view logical_key, std::optional<std::chrono::milliseconds> remaining) override;
    void report_miss(std::string_view logical_key, std::optional<std::chrono::milliseconds> ttl) override;

private:
    void write_status(std::string_view status, std::string_view logical_key,
                      std::optional<std::chrono::milliseconds> duration);

    const config::SettingsProvider& settings_;
    boost::beast::http::fields& headers_;
};

/**
 * Logs hits and misses at debug level
 */
class LoggingDiagnosticsPublisher : public DiagnosticsPublisher {
public:
    explicit LoggingDiagnosticsPublisher(const config::SettingsProvider& settings);

    void report_hit(std::string_view logical_key, std::optional<std::chrono::milliseconds> remaining) override;
    void report_miss(std::string_view logical_key, std::optional<std::chrono::milliseconds> ttl) override;

private:
    const config::SettingsProvider& settings_;
};

} // namespace querycache::diagnostics

#endif // QUERYCACHE_DIAGNOSTICS_DIAGNOSTICS_PUBLISHER_HPP
