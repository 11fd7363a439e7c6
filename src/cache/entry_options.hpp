/**
 * QueryCache - Prefix-invalidating query cache
 * Entry Options - TTL resolution for cache writes
 */

#ifndef QUERYCACHE_CACHE_ENTRY_OPTIONS_HPP
#define QUERYCACHE_CACHE_ENTRY_OPTIONS_HPP

#include "config/config.hpp"

#include <chrono>
#include <optional>
#include <string_view>

namespace querycache::cache {

/**
 * Expiry for a single cache write
 *
 * An absolute_ttl of zero (or less) means "do not write".
 */
struct CacheEntryOptions {
    std::chrono::seconds absolute_ttl{0};
    std::optional<std::chrono::seconds> sliding_ttl;

    bool should_write() const { return absolute_ttl > std::chrono::seconds::zero(); }

    bool operator==(const CacheEntryOptions&) const = default;
};

/**
 * Fallback TTL used whenever a configured duration is not positive
 */
inline constexpr int kFallbackTtlSeconds = 60;

/**
 * Default entry TTL in seconds: default_cache_duration_seconds, or 60 if not positive
 */
int default_ttl_seconds(const config::CachingSettings& settings);

/**
 * Compute entry options for a write made on behalf of an endpoint
 *
 * Disabled caching yields a zero TTL. Endpoint lookup is case-insensitive,
 * falls back to the "" entry, then to the default TTL.
 */
CacheEntryOptions resolve_entry_options(const config::CachingSettings& settings, std::string_view endpoint);

/**
 * TTL for prefix index, catalog and hash index entries
 *
 * max(entry TTL, index_key_ttl_seconds), each side defaulted when not positive.
 */
std::chrono::seconds resolve_index_ttl(const config::CachingSettings& settings, const CacheEntryOptions& entry);

/**
 * Resolver bound to a settings provider (one snapshot per call)
 */
class EntryOptionsResolver {
public:
    explicit EntryOptionsResolver(const config::SettingsProvider& settings);

    CacheEntryOptions resolve(std::string_view endpoint) const;

private:
    const config::SettingsProvider& settings_;
};

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_ENTRY_OPTIONS_HPP
