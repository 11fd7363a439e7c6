/**
 * QueryCache - Prefix-invalidating query cache
 * Memory Cache Store Implementation
 */

#include "cache/memory_cache_store.hpp"

#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <algorithm>
#include <iterator>

namespace querycache::cache {

MemoryCacheStore::MemoryCacheStore(const config::SettingsProvider& settings,
                                   std::shared_ptr<LruStore> store,
                                   std::shared_ptr<const PayloadCodec> codec)
    : CacheStore(settings, std::move(codec))
    , store_(store ? std::move(store) : std::make_shared<LruStore>()) {
}

std::optional<CacheStore::DocumentHit> MemoryCacheStore::read_document(const config::CachingSettings& /*settings*/,
                                                                       std::string_view physical_key,
                                                                       const CallContext& /*ctx*/) {
    auto entry = store_->get(physical_key);
    if (!entry) {
        return std::nullopt;
    }

    try {
        return DocumentHit{codec().decode(entry->payload), entry->remaining};
    } catch (const nlohmann::json::exception& e) {
        report_decode_failure(physical_key, e.what());
        return std::nullopt;
    }
}

bool MemoryCacheStore::write_document(const config::CachingSettings& settings,
                                      std::string_view logical_key,
                                      const std::string& physical_key,
                                      const nlohmann::json& document,
                                      const CacheEntryOptions& opts,
                                      const CallContext& ctx) {
    std::string payload;
    try {
        payload = codec().encode(document);
    } catch (const nlohmann::json::type_error& e) {
        report_encode_failure(physical_key, e.what());
        return false;
    }

    std::optional<std::chrono::milliseconds> sliding;
    if (opts.sliding_ttl) {
        sliding = *opts.sliding_ttl;
    }
    store_->put(physical_key, std::move(payload), opts.absolute_ttl, sliding);

    auto now = store_->now();
    reclaim_expired(now);

    auto prefix = extract_prefix(logical_key);
    if (is_blank(prefix)) {
        return true;
    }

    ctx.checkpoint();
    auto prefix_key = build_prefix_key(settings, prefix);
    auto deadline = now + resolve_index_ttl(settings, opts);

    std::lock_guard<std::mutex> lock(index_mutex_);
    track_key(prefix_key, physical_key, deadline);
    return true;
}

void MemoryCacheStore::reclaim_expired(TimePoint now) {
    std::size_t pruned = 0;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        if (now < next_reclaim_) {
            return;
        }
        next_reclaim_ = now + kReclaimInterval;

        for (auto it = prefix_index_.begin(); it != prefix_index_.end();) {
            auto& members = it->second;
            for (auto member = members.begin(); member != members.end();) {
                if (member->second <= now) {
                    key_to_prefix_.erase(member->first);
                    member = members.erase(member);
                    ++pruned;
                } else {
                    ++member;
                }
            }
            it = members.empty() ? prefix_index_.erase(it) : std::next(it);
        }
    }

    auto purged = store_->purge_expired();
    if (purged > 0 || pruned > 0) {
        QUERYCACHE_LOG_DEBUG(util::log_component::Cache, "Reclaimed {} expired entries, {} index members",
                             purged, pruned);
    }
}

void MemoryCacheStore::track_key(const std::string& prefix_key, const std::string& physical_key, TimePoint deadline) {
    auto& members = prefix_index_[prefix_key];
    auto [member, inserted] = members.try_emplace(physical_key, deadline);
    if (!inserted) {
        member->second = std::max(member->second, deadline);
    }
    key_to_prefix_[physical_key] = prefix_key;
}

bool MemoryCacheStore::prune_index(const std::string& prefix_key, TimePoint now) const {
    auto it = prefix_index_.find(prefix_key);
    if (it == prefix_index_.end()) {
        return false;
    }

    auto& members = it->second;
    for (auto member = members.begin(); member != members.end();) {
        if (member->second <= now) {
            key_to_prefix_.erase(member->first);
            member = members.erase(member);
        } else {
            ++member;
        }
    }

    if (members.empty()) {
        prefix_index_.erase(it);
        return false;
    }
    return true;
}

std::vector<std::string> MemoryCacheStore::tracked_keys(std::string_view prefix) const {
    auto prefix_key = build_prefix_key(settings_provider().snapshot(), prefix);

    std::lock_guard<std::mutex> lock(index_mutex_);
    std::vector<std::string> keys;
    if (!prune_index(prefix_key, store_->now())) {
        return keys;
    }

    const auto& members = prefix_index_.at(prefix_key);
    keys.reserve(members.size());
    for (const auto& [key, deadline] : members) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::vector<std::string> MemoryCacheStore::catalog() const {
    std::lock_guard<std::mutex> lock(index_mutex_);

    std::vector<std::string> prefixes;
    prefixes.reserve(prefix_index_.size());
    for (const auto& [prefix_key, members] : prefix_index_) {
        prefixes.push_back(prefix_key);
    }

    auto now = store_->now();
    prefixes.erase(std::remove_if(prefixes.begin(), prefixes.end(),
                                  [&](const std::string& prefix_key) { return !prune_index(prefix_key, now); }),
                   prefixes.end());
    std::sort(prefixes.begin(), prefixes.end());
    return prefixes;
}

void MemoryCacheStore::remove(std::string_view key, const CallContext& ctx) {
    auto settings = settings_provider().snapshot();
    auto physical_key = build_cache_key(settings, key);

    ctx.checkpoint();
    if (store_->remove(physical_key)) {
        util::Metrics::instance().cache_removal();
    }

    ctx.checkpoint();
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = key_to_prefix_.find(physical_key);
    if (it == key_to_prefix_.end()) {
        return;
    }

    if (auto index = prefix_index_.find(it->second); index != prefix_index_.end()) {
        index->second.erase(physical_key);
        if (index->second.empty()) {
            prefix_index_.erase(index);
        }
    }
    key_to_prefix_.erase(it);

    QUERYCACHE_LOG_DEBUG(util::log_component::Cache, "Removed cache key {}", physical_key);
}

void MemoryCacheStore::remove_by_prefix(std::string_view prefix, const CallContext& ctx) {
    util::Metrics::instance().prefix_sweep();

    if (is_blank(prefix)) {
        std::vector<std::string> prefixes;
        {
            std::lock_guard<std::mutex> lock(index_mutex_);
            prefixes.reserve(prefix_index_.size());
            for (const auto& [prefix_key, members] : prefix_index_) {
                prefixes.push_back(prefix_key);
            }
        }

        for (const auto& prefix_key : prefixes) {
            remove_prefix_key(prefix_key, ctx);
        }

        QUERYCACHE_LOG_INFO(util::log_component::Cache, "Invalidated {} cached prefixes", prefixes.size());
        return;
    }

    auto prefix_key = build_prefix_key(settings_provider().snapshot(), prefix);
    remove_prefix_key(prefix_key, ctx);
}

void MemoryCacheStore::remove_prefix_key(const std::string& prefix_key, const CallContext& ctx) {
    std::vector<std::string> members;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = prefix_index_.find(prefix_key);
        if (it == prefix_index_.end()) {
            return;
        }
        members.reserve(it->second.size());
        for (const auto& [key, deadline] : it->second) {
            members.push_back(key);
        }
    }

    std::size_t removed = 0;
    for (const auto& key : members) {
        ctx.checkpoint();
        if (store_->remove(key)) {
            util::Metrics::instance().cache_removal();
            ++removed;
        }
    }

    ctx.checkpoint();
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = prefix_index_.find(prefix_key);
        if (it != prefix_index_.end()) {
            for (const auto& key : members) {
                it->second.erase(key);
                if (auto owner = key_to_prefix_.find(key); owner != key_to_prefix_.end() && owner->second == prefix_key) {
                    key_to_prefix_.erase(owner);
                }
            }
            // Keys first indexed while the sweep ran stay
            if (it->second.empty()) {
                prefix_index_.erase(it);
            }
        }
    }

    QUERYCACHE_LOG_DEBUG(util::log_component::Cache, "Invalidated prefix {}: {} entries removed",
                         prefix_key, removed);
}

} // namespace querycache::cache
