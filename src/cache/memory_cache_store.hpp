/**
 * QueryCache - Prefix-invalidating query cache
 * Memory Cache Store - In-process backend over the LRU store
 *
 * Entries live in the LruStore. The prefix index is an in-process map from
 * prefix physical key to the physical keys written under it; each member
 * carries an index deadline and is pruned once it passes. Writes sweep
 * expired entries and index members at most once per kReclaimInterval.
 * The catalog is the set of prefixes whose index is non-empty.
 */

#ifndef QUERYCACHE_CACHE_MEMORY_CACHE_STORE_HPP
#define QUERYCACHE_CACHE_MEMORY_CACHE_STORE_HPP

#include "cache/cache_key.hpp"
#include "cache/cache_store.hpp"
#include "cache/lru_store.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace querycache::cache {

class MemoryCacheStore : public CacheStore {
public:
    static constexpr std::chrono::seconds kReclaimInterval{30};

    MemoryCacheStore(const config::SettingsProvider& settings,
                     std::shared_ptr<LruStore> store,
                     std::shared_ptr<const PayloadCodec> codec = nullptr);

    void remove(std::string_view key, const CallContext& ctx = {}) override;
    void remove_by_prefix(std::string_view prefix, const CallContext& ctx = {}) override;

    std::string_view backend_name() const override { return config::providers::Memory; }

    /**
     * Physical keys currently indexed under a logical prefix
     */
    std::vector<std::string> tracked_keys(std::string_view prefix) const;

    /**
     * Prefix physical keys with a non-empty index
     */
    std::vector<std::string> catalog() const;

    const std::shared_ptr<LruStore>& lru_store() const { return store_; }

protected:
    std::optional<DocumentHit> read_document(const config::CachingSettings& settings,
                                             std::string_view physical_key,
                                             const CallContext& ctx) override;

    bool write_document(const config::CachingSettings& settings,
                        std::string_view logical_key,
                        const std::string& physical_key,
                        const nlohmann::json& document,
                        const CacheEntryOptions& opts,
                        const CallContext& ctx) override;

private:
    using TimePoint = LruStoreConfig::Clock::time_point;
    using Members = std::unordered_map<std::string, TimePoint, PhysicalKeyHash, std::equal_to<>>;

    /**
     * Must be called with index_mutex_ held
     */
    void track_key(const std::string& prefix_key, const std::string& physical_key, TimePoint deadline);

    /**
     * Drop members whose index deadline passed; erases the index if it empties.
     * Must be called with index_mutex_ held.
     *
     * @return true if the index still exists
     */
    bool prune_index(const std::string& prefix_key, TimePoint now) const;

    /**
     * Drop expired entries and index members if kReclaimInterval has passed
     * since the last sweep
     */
    void reclaim_expired(TimePoint now);

    /**
     * Delete every entry indexed under prefix_key, then the index itself
     */
    void remove_prefix_key(const std::string& prefix_key, const CallContext& ctx);

    std::shared_ptr<LruStore> store_;

    mutable std::mutex index_mutex_;
    mutable std::unordered_map<std::string, Members, PhysicalKeyHash, std::equal_to<>> prefix_index_;
    mutable std::unordered_map<std::string, std::string, PhysicalKeyHash, std::equal_to<>> key_to_prefix_;
    TimePoint next_reclaim_{};
};

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_MEMORY_CACHE_STORE_HPP
