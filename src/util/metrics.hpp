/**
 * QueryCache - Prefix-invalidating query cache
 * Metrics - Thread-safe cache statistics for monitoring
 *
 * Provides:
 * - Hit/miss counters and hit rate
 * - Write, removal and prefix sweep counters
 * - Degradation counters (store failures, undecodable payloads)
 * - Thread-safe collection using atomics
 */

#ifndef QUERYCACHE_UTIL_METRICS_HPP
#define QUERYCACHE_UTIL_METRICS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace querycache::util {

/**
 * Global metrics snapshot
 */
struct MetricsSnapshot {
    std::uint64_t cache_hits{0};
    std::uint64_t cache_misses{0};
    double cache_hit_rate{0.0};

    std::uint64_t writes{0};
    std::uint64_t removals{0};
    std::uint64_t prefix_sweeps{0};

    std::uint64_t store_failures{0};
    std::uint64_t decode_failures{0};
    std::uint64_t encode_failures{0};

    std::uint64_t uptime_seconds{0};

    /**
     * Serialize to JSON string
     */
    std::string to_json() const;
};

/**
 * Metrics collector - centralized statistics tracking
 *
 * Lock-free counters, singleton for access from every backend.
 */
class Metrics {
public:
    static Metrics& instance();

    void cache_hit();
    void cache_miss();
    void cache_write();
    void cache_removal();
    void prefix_sweep();
    void store_failure();
    void decode_failure();
    void encode_failure();

    MetricsSnapshot snapshot() const;

    std::uint64_t uptime_seconds() const;

private:
    Metrics();
    ~Metrics() = default;

    // Non-copyable
    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> cache_misses_{0};
    std::atomic<std::uint64_t> writes_{0};
    std::atomic<std::uint64_t> removals_{0};
    std::atomic<std::uint64_t> prefix_sweeps_{0};
    std::atomic<std::uint64_t> store_failures_{0};
    std::atomic<std::uint64_t> decode_failures_{0};
    std::atomic<std::uint64_t> encode_failures_{0};

    std::chrono::steady_clock::time_point start_time_;
};

} // namespace querycache::util

#endif // QUERYCACHE_UTIL_METRICS_HPP
