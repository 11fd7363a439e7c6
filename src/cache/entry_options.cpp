/**
 * QueryCache - Prefix-invalidating query cache
 * Entry Options Implementation
 */

#include "cache/entry_options.hpp"

#include "cache/cache_key.hpp"

#include <algorithm>
#include <string>

namespace querycache::cache {

int default_ttl_seconds(const config::CachingSettings& settings) {
    return settings.default_cache_duration_seconds > 0
        ? settings.default_cache_duration_seconds
        : kFallbackTtlSeconds;
}

CacheEntryOptions resolve_entry_options(const config::CachingSettings& settings, std::string_view endpoint) {
    if (!settings.is_active()) {
        return CacheEntryOptions{};
    }

    std::string_view lookup = is_blank(endpoint) ? std::string_view{} : endpoint;

    const config::EndpointCacheSettings* endpoint_settings = nullptr;
    if (auto it = settings.per_endpoint.find(lookup); it != settings.per_endpoint.end()) {
        endpoint_settings = &it->second;
    } else if (auto fallback = settings.per_endpoint.find(std::string_view{}); fallback != settings.per_endpoint.end()) {
        endpoint_settings = &fallback->second;
    }

    int absolute = default_ttl_seconds(settings);
    if (endpoint_settings && endpoint_settings->absolute_ttl_seconds && *endpoint_settings->absolute_ttl_seconds > 0) {
        absolute = *endpoint_settings->absolute_ttl_seconds;
    }

    CacheEntryOptions options;
    options.absolute_ttl = std::chrono::seconds(absolute);
    if (endpoint_settings && endpoint_settings->sliding_ttl_seconds && *endpoint_settings->sliding_ttl_seconds > 0) {
        options.sliding_ttl = std::chrono::seconds(*endpoint_settings->sliding_ttl_seconds);
    }
    return options;
}

std::chrono::seconds resolve_index_ttl(const config::CachingSettings& settings, const CacheEntryOptions& entry) {
    auto entry_seconds = entry.absolute_ttl.count();
    if (entry_seconds <= 0) {
        entry_seconds = default_ttl_seconds(settings);
    }

    auto index_seconds = static_cast<std::chrono::seconds::rep>(
        settings.provider_settings.distributed.index_key_ttl_seconds);
    if (index_seconds <= 0) {
        index_seconds = default_ttl_seconds(settings);
    }

    return std::chrono::seconds(std::max(entry_seconds, index_seconds));
}

EntryOptionsResolver::EntryOptionsResolver(const config::SettingsProvider& settings)
    : settings_(settings) {
}

CacheEntryOptions EntryOptionsResolver::resolve(std::string_view endpoint) const {
    return resolve_entry_options(settings_.snapshot(), endpoint);
}

} // namespace querycache::cache
