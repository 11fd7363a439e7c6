/**
 * QueryCache - Prefix-invalidating query cache
 * LRU Store Implementation
 */

#include "cache/lru_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace querycache::cache {

LruStoreConfig LruStoreConfig::from_settings(const config::MemoryProviderSettings& settings) {
    LruStoreConfig result;
    if (settings.size_limit_mb && *settings.size_limit_mb > 0) {
        result.max_size_bytes = static_cast<std::size_t>(*settings.size_limit_mb) * 1024 * 1024;
    }
    return result;
}

LruStore::LruStore(LruStoreConfig config)
    : config_(std::move(config)) {
    if (!config_.now) {
        config_.now = &LruStoreConfig::Clock::now;
    }
    spdlog::debug("LRU store initialized: max_size={}MB",
                  config_.max_size_bytes / (1024 * 1024));
}

std::optional<StoredEntry> LruStore::get(std::string_view key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = store_map_.find(key);
    if (it == store_map_.end()) {
        ++misses_;
        return std::nullopt;
    }

    auto now = config_.now();
    auto node_it = it->second;
    if (is_expired(*node_it, now)) {
        erase_node(node_it);
        ++expired_;
        ++misses_;
        return std::nullopt;
    }

    if (node_it->sliding) {
        node_it->sliding_deadline = now + *node_it->sliding;
    }
    touch_node(node_it);
    ++hits_;

    auto deadline = node_it->absolute_deadline;
    if (node_it->sliding) {
        deadline = std::min(deadline, node_it->sliding_deadline);
    }

    StoredEntry result;
    result.payload = node_it->payload;
    result.remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    return result;
}

void LruStore::put(std::string key, std::string payload,
                   std::chrono::milliseconds absolute_ttl,
                   std::optional<std::chrono::milliseconds> sliding_ttl) {
    if (absolute_ttl <= std::chrono::milliseconds::zero()) {
        remove(key);
        return;
    }
    if (sliding_ttl && *sliding_ttl <= std::chrono::milliseconds::zero()) {
        sliding_ttl.reset();
    }

    std::size_t entry_size = key.size() + payload.size();

    std::unique_lock<std::shared_mutex> lock(mutex_);

    // Entries larger than the whole store are not kept; drop any older value too
    if (config_.max_size_bytes > 0 && entry_size > config_.max_size_bytes) {
        spdlog::debug("LRU store entry too large: {} bytes > {} max",
                      entry_size, config_.max_size_bytes);
        if (auto it = store_map_.find(std::string_view(key)); it != store_map_.end()) {
            erase_node(it->second);
        }
        return;
    }

    auto now = config_.now();

    auto it = store_map_.find(std::string_view(key));
    if (it != store_map_.end()) {
        auto node_it = it->second;
        current_size_bytes_ = current_size_bytes_ - node_it->size_bytes + entry_size;
        node_it->payload = std::move(payload);
        node_it->size_bytes = entry_size;
        node_it->absolute_deadline = now + absolute_ttl;
        node_it->sliding = sliding_ttl;
        node_it->sliding_deadline = sliding_ttl ? now + *sliding_ttl : node_it->absolute_deadline;
        touch_node(node_it);

        spdlog::debug("LRU store entry updated: key={}, size={}", node_it->key, entry_size);
    } else {
        Node node;
        node.key = std::move(key);
        node.payload = std::move(payload);
        node.size_bytes = entry_size;
        node.absolute_deadline = now + absolute_ttl;
        node.sliding = sliding_ttl;
        node.sliding_deadline = sliding_ttl ? now + *sliding_ttl : node.absolute_deadline;

        lru_list_.push_front(std::move(node));
        store_map_.emplace(std::string_view(lru_list_.front().key), lru_list_.begin());
        current_size_bytes_ += entry_size;

        spdlog::debug("LRU store entry added: key={}, size={}, total_size={}",
                      lru_list_.front().key, entry_size, current_size_bytes_);
    }

    evict_if_needed();
}

bool LruStore::remove(std::string_view key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = store_map_.find(key);
    if (it == store_map_.end()) {
        return false;
    }

    spdlog::debug("LRU store entry removed: key={}", key);
    erase_node(it->second);
    return true;
}

bool LruStore::contains(std::string_view key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = store_map_.find(key);
    return it != store_map_.end() && !is_expired(*it->second, config_.now());
}

void LruStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::size_t count = store_map_.size();
    store_map_.clear();
    lru_list_.clear();
    current_size_bytes_ = 0;

    spdlog::info("LRU store cleared: {} entries removed", count);
}

std::size_t LruStore::purge_expired() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto now = config_.now();
    std::size_t removed = 0;
    for (auto it = lru_list_.begin(); it != lru_list_.end();) {
        auto next = std::next(it);
        if (is_expired(*it, now)) {
            erase_node(it);
            ++removed;
        }
        it = next;
    }
    expired_ += removed;
    return removed;
}

LruStoreStats LruStore::get_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    LruStoreStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.evictions = evictions_.load();
    stats.expired = expired_.load();
    stats.entries = store_map_.size();
    stats.size_bytes = current_size_bytes_;
    stats.max_size_bytes = config_.max_size_bytes;

    return stats;
}

void LruStore::touch_node(LruList::iterator it) {
    if (it != lru_list_.begin()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, it);
    }
}

void LruStore::erase_node(LruList::iterator it) {
    current_size_bytes_ -= it->size_bytes;
    store_map_.erase(std::string_view(it->key));
    lru_list_.erase(it);
}

void LruStore::evict_if_needed() {
    if (config_.max_size_bytes == 0) {
        return;
    }

    // Evict from back (least recently used) until under size limit
    while (current_size_bytes_ > config_.max_size_bytes && !lru_list_.empty()) {
        auto last = std::prev(lru_list_.end());

        spdlog::debug("Evicting LRU store entry: key={}, size={}", last->key, last->size_bytes);

        erase_node(last);
        ++evictions_;
    }
}

bool LruStore::is_expired(const Node& node, TimePoint now) {
    if (now >= node.absolute_deadline) {
        return true;
    }
    return node.sliding.has_value() && now >= node.sliding_deadline;
}

} // namespace querycache::cache
