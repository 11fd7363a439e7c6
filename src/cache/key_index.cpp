/**
 * QueryCache - Prefix-invalidating query cache
 * Key Index Implementation
 */

#include "cache/key_index.hpp"

#include "cache/cache_key.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

namespace querycache::cache {

// ============================================================================
// MemoryKeyIndex Implementation
// ============================================================================

MemoryKeyIndex::MemoryKeyIndex(const config::SettingsProvider& settings, std::shared_ptr<LruStore> store)
    : settings_(settings)
    , store_(std::move(store)) {
}

void MemoryKeyIndex::track(std::string_view logical_key, const CacheEntryOptions& opts, const CallContext& ctx) {
    if (is_blank(logical_key)) {
        return;
    }

    auto hashed = hash_key(logical_key);
    auto settings = settings_.snapshot();
    auto ttl = resolve_index_ttl(settings, opts);

    ctx.checkpoint();
    store_->put(build_hash_key(settings, hashed), std::string(logical_key), ttl);
}

std::optional<std::string> MemoryKeyIndex::try_resolve(std::string_view hashed_key, const CallContext& ctx) {
    if (is_blank(hashed_key)) {
        return std::nullopt;
    }

    auto settings = settings_.snapshot();
    ctx.checkpoint();
    auto entry = store_->get(build_hash_key(settings, hashed_key));
    if (!entry) {
        return std::nullopt;
    }
    return std::move(entry->payload);
}

void MemoryKeyIndex::remove(std::string_view hashed_key, const CallContext& ctx) {
    if (is_blank(hashed_key)) {
        return;
    }

    auto settings = settings_.snapshot();
    ctx.checkpoint();
    store_->remove(build_hash_key(settings, hashed_key));
}

// ============================================================================
// DistributedKeyIndex Implementation
// ============================================================================

DistributedKeyIndex::DistributedKeyIndex(const config::SettingsProvider& settings,
                                         std::shared_ptr<remote::RemoteStore> store)
    : settings_(settings)
    , store_(std::move(store)) {
}

void DistributedKeyIndex::track(std::string_view logical_key, const CacheEntryOptions& opts, const CallContext& ctx) {
    if (is_blank(logical_key)) {
        return;
    }

    auto hashed = hash_key(logical_key);
    auto settings = settings_.snapshot();
    auto ttl = resolve_index_ttl(settings, opts);

    ctx.checkpoint();
    try {
        store_->set(build_hash_key(settings, hashed), logical_key, ttl);
    } catch (const remote::StoreUnavailableError& e) {
        util::Metrics::instance().store_failure();
        QUERYCACHE_LOG_WARN(util::log_component::Cache, "Hash index write skipped: {}", e.what());
    }
}

std::optional<std::string> DistributedKeyIndex::try_resolve(std::string_view hashed_key, const CallContext& ctx) {
    if (is_blank(hashed_key)) {
        return std::nullopt;
    }

    auto settings = settings_.snapshot();
    ctx.checkpoint();
    try {
        return store_->get(build_hash_key(settings, hashed_key));
    } catch (const remote::StoreUnavailableError& e) {
        util::Metrics::instance().store_failure();
        QUERYCACHE_LOG_WARN(util::log_component::Cache, "Hash index lookup failed: {}", e.what());
        return std::nullopt;
    }
}

void DistributedKeyIndex::remove(std::string_view hashed_key, const CallContext& ctx) {
    if (is_blank(hashed_key)) {
        return;
    }

    auto settings = settings_.snapshot();
    ctx.checkpoint();
    try {
        store_->remove(build_hash_key(settings, hashed_key));
    } catch (const remote::StoreUnavailableError& e) {
        util::Metrics::instance().store_failure();
        QUERYCACHE_LOG_WARN(util::log_component::Cache, "Hash index removal failed: {}", e.what());
    }
}

} // namespace querycache::cache
