/**
 * QueryCache - Prefix-invalidating query cache
 * Cache Factory Implementation
 */

#include "cache/cache_factory.hpp"

#include "cache/distributed_cache_store.hpp"
#include "cache/memory_cache_store.hpp"
#include "remote/redis_client.hpp"
#include "util/logger.hpp"

#include <stdexcept>

namespace querycache::cache {

CacheServices make_cache_services(const config::SettingsProvider& settings, CacheServicesOptions options) {
    auto snapshot = settings.snapshot();

    if (!options.codec) {
        auto format = parse_payload_format(snapshot.payload_format);
        if (!format) {
            throw std::runtime_error("Unknown payload format: " + snapshot.payload_format);
        }
        options.codec = make_codec(*format);
    }

    CacheServices services;

    if (config::iequals(snapshot.provider, config::providers::Memory)) {
        auto lru = options.lru_store
            ? std::move(options.lru_store)
            : std::make_shared<LruStore>(LruStoreConfig::from_settings(snapshot.provider_settings.memory));

        services.store = std::make_shared<MemoryCacheStore>(settings, lru, options.codec);
        services.key_index = std::make_shared<MemoryKeyIndex>(settings, lru);
    } else if (config::iequals(snapshot.provider, config::providers::Distributed)) {
        auto remote = std::move(options.remote_store);
        if (!remote) {
            const auto& connection = snapshot.provider_settings.distributed.connection_string;
            if (!connection || is_blank(*connection)) {
                throw std::runtime_error(
                    "Distributed cache provider requires provider_settings.distributed.connection_string");
            }
            remote = std::make_shared<remote::RedisClient>(remote::RedisOptions::parse(*connection));
        }

        services.store = std::make_shared<DistributedCacheStore>(settings, remote, options.codec);
        services.key_index = std::make_shared<DistributedKeyIndex>(settings, remote);
    } else {
        throw std::runtime_error("Unknown cache provider: " + snapshot.provider);
    }

    services.store->attach_key_index(services.key_index);
    services.invalidation = std::make_shared<InvalidationService>(services.store, services.key_index);

    QUERYCACHE_LOG_INFO(util::log_component::Cache, "Cache services ready: provider={}, codec={}, enabled={}",
                        services.store->backend_name(), options.codec->name(), snapshot.is_active());
    return services;
}

} // namespace querycache::cache
