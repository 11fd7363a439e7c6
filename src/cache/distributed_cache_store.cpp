/**
 * QueryCache - Prefix-invalidating query cache
 * Distributed Cache Store Implementation
 */

#include "cache/distributed_cache_store.hpp"

#include "cache/cache_key.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <algorithm>
#include <cstdint>

namespace querycache::cache {

namespace {

constexpr const char* kValueField = "v";
constexpr const char* kExpiresField = "exp";
constexpr const char* kSlidingField = "sld";

std::int64_t unix_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

DistributedCacheStore::DistributedCacheStore(const config::SettingsProvider& settings,
                                             std::shared_ptr<remote::RemoteStore> store,
                                             std::shared_ptr<const PayloadCodec> codec)
    : CacheStore(settings, std::move(codec))
    , store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("DistributedCacheStore requires a remote store");
    }
}

void DistributedCacheStore::report_store_failure(std::string_view operation,
                                                 const remote::StoreUnavailableError& error) const {
    util::Metrics::instance().store_failure();
    QUERYCACHE_LOG_WARN(util::log_component::Cache, "Remote cache {} degraded: {}", operation, error.what());
}

std::optional<CacheStore::DocumentHit> DistributedCacheStore::read_document(const config::CachingSettings& /*settings*/,
                                                                            std::string_view physical_key,
                                                                            const CallContext& ctx) {
    std::optional<std::string> payload;
    try {
        payload = store_->get(physical_key);
    } catch (const remote::StoreUnavailableError& e) {
        report_store_failure("read", e);
        return std::nullopt;
    }
    if (!payload) {
        return std::nullopt;
    }

    nlohmann::json envelope;
    try {
        envelope = codec().decode(*payload);
    } catch (const nlohmann::json::exception& e) {
        report_decode_failure(physical_key, e.what());
        return std::nullopt;
    }

    if (!envelope.is_object() || !envelope.contains(kValueField) ||
        !envelope.contains(kExpiresField) || !envelope.at(kExpiresField).is_number_integer()) {
        report_decode_failure(physical_key, "missing envelope fields");
        return std::nullopt;
    }

    auto remaining = std::chrono::milliseconds(envelope.at(kExpiresField).get<std::int64_t>() - unix_now_ms());
    if (remaining <= std::chrono::milliseconds::zero()) {
        return std::nullopt;
    }

    if (envelope.contains(kSlidingField) && envelope.at(kSlidingField).is_number_integer()) {
        auto sliding = std::chrono::seconds(envelope.at(kSlidingField).get<std::int64_t>());
        if (sliding > std::chrono::seconds::zero()) {
            remaining = std::min<std::chrono::milliseconds>(sliding, remaining);
            ctx.checkpoint();
            try {
                store_->expire(physical_key, remaining);
            } catch (const remote::StoreUnavailableError& e) {
                report_store_failure("sliding refresh", e);
            }
        }
    }

    return DocumentHit{std::move(envelope.at(kValueField)), remaining};
}

bool DistributedCacheStore::write_document(const config::CachingSettings& settings,
                                           std::string_view logical_key,
                                           const std::string& physical_key,
                                           const nlohmann::json& document,
                                           const CacheEntryOptions& opts,
                                           const CallContext& ctx) {
    std::chrono::milliseconds ttl = opts.absolute_ttl;
    nlohmann::json envelope = {
        {kValueField, document},
        {kExpiresField, unix_now_ms() + ttl.count()}
    };
    if (opts.sliding_ttl) {
        envelope[kSlidingField] = opts.sliding_ttl->count();
        ttl = std::min<std::chrono::milliseconds>(ttl, *opts.sliding_ttl);
    }

    std::string payload;
    try {
        payload = codec().encode(envelope);
    } catch (const nlohmann::json::type_error& e) {
        report_encode_failure(physical_key, e.what());
        return false;
    }

    try {
        store_->set(physical_key, payload, ttl);
    } catch (const remote::StoreUnavailableError& e) {
        report_store_failure("write", e);
        return false;
    }

    auto prefix = extract_prefix(logical_key);
    if (is_blank(prefix)) {
        return true;
    }

    auto prefix_key = build_prefix_key(settings, prefix);
    auto index_ttl = resolve_index_ttl(settings, opts);
    try {
        ctx.checkpoint();
        add_to_list(build_index_key(prefix_key), physical_key, index_ttl);
        ctx.checkpoint();
        add_to_list(build_catalog_key(settings), prefix_key, index_ttl);
    } catch (const remote::StoreUnavailableError& e) {
        report_store_failure("index update", e);
    } catch (const nlohmann::json::type_error& e) {
        // An entry the prefix index cannot list would escape invalidation
        report_encode_failure(physical_key, e.what());
        try {
            store_->remove(physical_key);
        } catch (const remote::StoreUnavailableError& unavailable) {
            report_store_failure("remove", unavailable);
        }
        return false;
    }
    return true;
}

std::vector<std::string> DistributedCacheStore::read_list(const std::string& list_key) {
    auto payload = store_->get(list_key);
    if (!payload) {
        return {};
    }

    try {
        auto document = codec().decode(*payload);
        return document.get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& e) {
        report_decode_failure(list_key, e.what());
        return {};
    }
}

void DistributedCacheStore::add_to_list(const std::string& list_key, const std::string& member,
                                        std::chrono::milliseconds ttl) {
    auto members = read_list(list_key);
    auto remaining = store_->ttl(list_key);

    if (std::find(members.begin(), members.end(), member) != members.end()) {
        // Already listed; only make sure the list outlives the new entry
        if (!remaining || *remaining < ttl) {
            store_->expire(list_key, ttl);
        }
        return;
    }

    members.push_back(member);
    if (remaining && *remaining > ttl) {
        ttl = *remaining;
    }
    store_->set(list_key, codec().encode(nlohmann::json(members)), ttl);
}

bool DistributedCacheStore::remove_from_list(const config::CachingSettings& settings, const std::string& list_key,
                                             const std::string& member) {
    auto members = read_list(list_key);
    auto it = std::find(members.begin(), members.end(), member);
    if (it == members.end()) {
        return false;
    }

    members.erase(std::remove(it, members.end(), member), members.end());
    if (members.empty()) {
        store_->remove(list_key);
        return true;
    }

    std::chrono::milliseconds ttl = resolve_index_ttl(settings, CacheEntryOptions{});
    if (auto remaining = store_->ttl(list_key); remaining && *remaining > ttl) {
        ttl = *remaining;
    }
    store_->set(list_key, codec().encode(nlohmann::json(members)), ttl);
    return false;
}

std::vector<std::string> DistributedCacheStore::tracked_keys(std::string_view prefix) {
    auto settings = settings_provider().snapshot();
    try {
        return read_list(build_index_key(build_prefix_key(settings, prefix)));
    } catch (const remote::StoreUnavailableError& e) {
        report_store_failure("index read", e);
        return {};
    }
}

std::vector<std::string> DistributedCacheStore::catalog() {
    auto settings = settings_provider().snapshot();
    try {
        return read_list(build_catalog_key(settings));
    } catch (const remote::StoreUnavailableError& e) {
        report_store_failure("catalog read", e);
        return {};
    }
}

void DistributedCacheStore::remove(std::string_view key, const CallContext& ctx) {
    auto settings = settings_provider().snapshot();
    auto physical_key = build_cache_key(settings, key);

    try {
        ctx.checkpoint();
        if (store_->remove(physical_key)) {
            util::Metrics::instance().cache_removal();
        }

        auto prefix = extract_prefix(key);
        if (is_blank(prefix)) {
            return;
        }

        auto prefix_key = build_prefix_key(settings, prefix);
        ctx.checkpoint();
        if (remove_from_list(settings, build_index_key(prefix_key), physical_key)) {
            ctx.checkpoint();
            remove_from_list(settings, build_catalog_key(settings), prefix_key);
        }
        QUERYCACHE_LOG_DEBUG(util::log_component::Cache, "Removed cache key {}", physical_key);
    } catch (const remote::StoreUnavailableError& e) {
        report_store_failure("remove", e);
    }
}

void DistributedCacheStore::remove_by_prefix(std::string_view prefix, const CallContext& ctx) {
    util::Metrics::instance().prefix_sweep();
    auto settings = settings_provider().snapshot();

    try {
        if (is_blank(prefix)) {
            auto catalog_key = build_catalog_key(settings);
            ctx.checkpoint();
            auto prefixes = read_list(catalog_key);
            for (const auto& prefix_key : prefixes) {
                remove_prefix_key(settings, prefix_key, ctx);
            }
            ctx.checkpoint();
            store_->remove(catalog_key);

            QUERYCACHE_LOG_INFO(util::log_component::Cache, "Invalidated {} cached prefixes", prefixes.size());
            return;
        }

        remove_prefix_key(settings, build_prefix_key(settings, prefix), ctx);
    } catch (const remote::StoreUnavailableError& e) {
        report_store_failure("prefix invalidation", e);
    }
}

void DistributedCacheStore::remove_prefix_key(const config::CachingSettings& settings, const std::string& prefix_key,
                                              const CallContext& ctx) {
    auto index_key = build_index_key(prefix_key);
    ctx.checkpoint();
    auto members = read_list(index_key);

    std::size_t removed = 0;
    for (const auto& key : members) {
        ctx.checkpoint();
        if (store_->remove(key)) {
            util::Metrics::instance().cache_removal();
            ++removed;
        }
    }

    ctx.checkpoint();
    store_->remove(index_key);
    ctx.checkpoint();
    remove_from_list(settings, build_catalog_key(settings), prefix_key);

    QUERYCACHE_LOG_DEBUG(util::log_component::Cache, "Invalidated prefix {}: {} entries removed",
                         prefix_key, removed);
}

} // namespace querycache::cache
