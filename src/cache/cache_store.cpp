/**
 * QueryCache - Prefix-invalidating query cache
 * Cache Store Implementation
 */

#include "cache/cache_store.hpp"

#include "cache/cache_key.hpp"
#include "cache/key_index.hpp"
#include "util/logger.hpp"

namespace querycache::cache {

bool is_cache_enabled(const config::CachingSettings& settings, const CallContext& ctx) {
    return settings.is_active() && !ctx.bypass.should_bypass();
}

CacheStore::CacheStore(const config::SettingsProvider& settings, std::shared_ptr<const PayloadCodec> codec)
    : settings_(settings)
    , codec_(codec ? std::move(codec) : make_codec(PayloadFormat::Json)) {
}

void CacheStore::attach_key_index(std::shared_ptr<KeyIndex> index) {
    key_index_ = std::move(index);
}

void CacheStore::report_decode_failure(std::string_view key, std::string_view what) const {
    util::Metrics::instance().decode_failure();
    QUERYCACHE_LOG_DEBUG(util::log_component::Cache, "Undecodable cache entry treated as miss: key={}, error={}",
                         key, what);
}

void CacheStore::report_encode_failure(std::string_view key, std::string_view what) const {
    util::Metrics::instance().encode_failure();
    QUERYCACHE_LOG_WARN(util::log_component::Cache, "Unencodable value not cached: key={}, error={}", key, what);
}

std::optional<CacheStore::DocumentHit> CacheStore::lookup_document(std::string_view key, const CallContext& ctx) {
    auto settings = settings_.snapshot();
    if (!is_cache_enabled(settings, ctx)) {
        return std::nullopt;
    }

    ctx.checkpoint();
    auto physical_key = build_cache_key(settings, key);
    auto hit = read_document(settings, physical_key, ctx);

    if (hit) {
        util::Metrics::instance().cache_hit();
        QUERYCACHE_LOG_DEBUG(util::log_component::Cache, "Cache hit: key={}", physical_key);
    } else {
        util::Metrics::instance().cache_miss();
        QUERYCACHE_LOG_DEBUG(util::log_component::Cache, "Cache miss: key={}", physical_key);
    }
    return hit;
}

void CacheStore::store_document(std::string_view key, const nlohmann::json& document,
                                const CacheEntryOptions& opts, const CallContext& ctx) {
    auto settings = settings_.snapshot();
    if (!is_cache_enabled(settings, ctx) || !opts.should_write()) {
        return;
    }

    ctx.checkpoint();
    auto physical_key = build_cache_key(settings, key);
    if (!write_document(settings, key, physical_key, document, opts, ctx)) {
        return;
    }

    util::Metrics::instance().cache_write();
    QUERYCACHE_LOG_DEBUG(util::log_component::Cache, "Cache write: key={}, ttl={}s{}",
                         physical_key, opts.absolute_ttl.count(),
                         opts.sliding_ttl ? ", sliding=" + std::to_string(opts.sliding_ttl->count()) + "s" : "");

    if (key_index_ && settings.diagnostics.key_display_mode == config::KeyDisplayMode::Hash) {
        ctx.checkpoint();
        key_index_->track(key, opts, ctx);
    }
}

} // namespace querycache::cache
