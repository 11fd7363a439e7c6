/**
 * QueryCache - Prefix-invalidating query cache
 * Invalidation Service Implementation
 */

#include "cache/invalidation_service.hpp"

#include "util/logger.hpp"

namespace querycache::cache {

InvalidationService::InvalidationService(std::shared_ptr<CacheStore> store, std::shared_ptr<KeyIndex> key_index)
    : store_(std::move(store))
    , key_index_(std::move(key_index)) {
    if (!key_index_ && store_) {
        key_index_ = store_->key_index();
    }
}

void InvalidationService::invalidate_key(std::string_view key_or_hash, const CallContext& ctx) {
    auto settings = store_->settings_provider().snapshot();

    if (key_index_ && settings.diagnostics.key_display_mode == config::KeyDisplayMode::Hash) {
        if (auto logical_key = key_index_->try_resolve(key_or_hash, ctx)) {
            QUERYCACHE_LOG_INFO(util::log_component::Cache, "Invalidating hashed key {}", key_or_hash);
            store_->remove(*logical_key, ctx);
            key_index_->remove(key_or_hash, ctx);
            return;
        }
    }

    QUERYCACHE_LOG_INFO(util::log_component::Cache, "Invalidating key {}", key_or_hash);
    store_->remove(key_or_hash, ctx);
}

void InvalidationService::invalidate_prefix(std::string_view prefix, const CallContext& ctx) {
    QUERYCACHE_LOG_INFO(util::log_component::Cache, "Invalidating prefix {}", prefix);
    store_->remove_by_prefix(prefix, ctx);
}

void InvalidationService::invalidate_all(const CallContext& ctx) {
    QUERYCACHE_LOG_INFO(util::log_component::Cache, "Invalidating all cached entries");
    store_->remove_by_prefix("", ctx);
}

} // namespace querycache::cache
