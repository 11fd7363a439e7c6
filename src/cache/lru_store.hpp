/**
 * QueryCache - Prefix-invalidating query cache
 * Thread-Safe LRU Store - In-process byte store behind the memory backend
 *
 * Features:
 * - Thread-safe with std::shared_mutex
 * - Size-bounded LRU eviction (key + payload bytes)
 * - Per-entry absolute deadline with optional sliding expiry
 * - Statistics for monitoring
 */

#ifndef QUERYCACHE_CACHE_LRU_STORE_HPP
#define QUERYCACHE_CACHE_LRU_STORE_HPP

#include "cache/cache_key.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace querycache::cache {

/**
 * Payload returned by a successful lookup
 */
struct StoredEntry {
    std::string payload;
    std::chrono::milliseconds remaining{0};   // Time until the entry expires as of this read
};

/**
 * Store statistics for monitoring
 */
struct LruStoreStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
    std::uint64_t expired{0};

    std::size_t entries{0};
    std::size_t size_bytes{0};
    std::size_t max_size_bytes{0};   // 0 = unbounded

    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

/**
 * LRU store configuration
 */
struct LruStoreConfig {
    using Clock = std::chrono::steady_clock;

    std::size_t max_size_bytes{0};                       // 0 = unbounded
    std::function<Clock::time_point()> now{&Clock::now};  // Replaceable for tests

    /**
     * Build from the memory provider settings (size_limit_mb)
     */
    static LruStoreConfig from_settings(const config::MemoryProviderSettings& settings);
};

/**
 * Thread-safe LRU byte store
 *
 * Reads take the exclusive lock: a hit moves the entry to the front and
 * may extend its sliding deadline.
 *
 * Implementation:
 * - Hash map (XXH64 over the physical key) for O(1) lookup
 * - Doubly-linked list for LRU ordering
 * - Size-based eviction when max_size_bytes is exceeded
 * - Expiration checked on access and by purge_expired()
 */
class LruStore {
public:
    explicit LruStore(LruStoreConfig config = {});
    ~LruStore() = default;

    // Non-copyable, non-movable
    LruStore(const LruStore&) = delete;
    LruStore& operator=(const LruStore&) = delete;
    LruStore(LruStore&&) = delete;
    LruStore& operator=(LruStore&&) = delete;

    /**
     * Get a payload by physical key
     *
     * @return Entry if present and not expired, nullopt otherwise
     */
    std::optional<StoredEntry> get(std::string_view key);

    /**
     * Store a payload, replacing any previous entry under the key
     *
     * @param absolute_ttl Lifetime from now; a non-positive value removes the key instead
     * @param sliding_ttl  If set, the entry also expires after this long without a read
     */
    void put(std::string key, std::string payload,
             std::chrono::milliseconds absolute_ttl,
             std::optional<std::chrono::milliseconds> sliding_ttl = std::nullopt);

    /**
     * @return true if an entry was removed
     */
    bool remove(std::string_view key);

    /**
     * True if a live entry exists; does not count as a read
     */
    bool contains(std::string_view key) const;

    void clear();

    /**
     * Drop every expired entry
     *
     * @return Number of entries removed
     */
    std::size_t purge_expired();

    LruStoreStats get_stats() const;

    /**
     * Current time on the store's clock
     */
    LruStoreConfig::Clock::time_point now() const { return config_.now(); }

private:
    using TimePoint = LruStoreConfig::Clock::time_point;

    struct Node {
        std::string key;
        std::string payload;
        std::size_t size_bytes{0};
        TimePoint absolute_deadline;
        std::optional<std::chrono::milliseconds> sliding;
        TimePoint sliding_deadline;
    };

    using LruList = std::list<Node>;
    using StoreMap = std::unordered_map<std::string_view, LruList::iterator, PhysicalKeyHash, std::equal_to<>>;

    /**
     * Move node to front of LRU list
     * Must be called with exclusive lock held
     */
    void touch_node(LruList::iterator it);

    /**
     * Must be called with exclusive lock held
     */
    void erase_node(LruList::iterator it);

    /**
     * Evict entries until the store is within max_size_bytes
     * Must be called with exclusive lock held
     */
    void evict_if_needed();

    static bool is_expired(const Node& node, TimePoint now);

    mutable std::shared_mutex mutex_;
    LruStoreConfig config_;

    LruList lru_list_;   // Front = most recently used, back = least recently used
    StoreMap store_map_; // Keys view into the owning list node

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> expired_{0};
    std::size_t current_size_bytes_{0};
};

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_LRU_STORE_HPP
