/**
 * QueryCache - Prefix-invalidating query cache
 * Cache Factory - Wires the configured backend once at startup
 */

#ifndef QUERYCACHE_CACHE_CACHE_FACTORY_HPP
#define QUERYCACHE_CACHE_CACHE_FACTORY_HPP

#include "cache/cache_store.hpp"
#include "cache/invalidation_service.hpp"
#include "cache/key_index.hpp"
#include "cache/lru_store.hpp"
#include "cache/payload_codec.hpp"
#include "config/config.hpp"
#include "remote/remote_store.hpp"

#include <memory>

namespace querycache::cache {

struct CacheServicesOptions {
    std::shared_ptr<const PayloadCodec> codec;           // Defaults to the configured payload_format
    std::shared_ptr<remote::RemoteStore> remote_store;   // Used instead of connecting to Redis
    std::shared_ptr<LruStore> lru_store;                 // Used instead of a new store sized from settings
};

/**
 * Everything a host needs to cache and invalidate
 */
struct CacheServices {
    std::shared_ptr<CacheStore> store;
    std::shared_ptr<KeyIndex> key_index;
    std::shared_ptr<InvalidationService> invalidation;
};

/**
 * Build the backend named by settings.provider (case-insensitive)
 *
 * The settings provider must outlive the returned services.
 *
 * @throws std::runtime_error for an unknown provider or payload format, or a
 *         Distributed provider with neither a connection string nor an injected store
 */
CacheServices make_cache_services(const config::SettingsProvider& settings, CacheServicesOptions options = {});

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_CACHE_FACTORY_HPP
