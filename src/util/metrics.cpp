/**
 * QueryCache - Prefix-invalidating query cache
 * Metrics Implementation
 */

#include "util/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace querycache::util {

Metrics::Metrics()
    : start_time_(std::chrono::steady_clock::now())
{
}

Metrics& Metrics::instance() {
    static Metrics instance;
    return instance;
}

void Metrics::cache_hit() {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_miss() {
    cache_misses_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_write() {
    writes_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_removal() {
    removals_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::prefix_sweep() {
    prefix_sweeps_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::store_failure() {
    store_failures_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::decode_failure() {
    decode_failures_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::encode_failure() {
    encode_failures_.fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t Metrics::uptime_seconds() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();
}

MetricsSnapshot Metrics::snapshot() const {
    MetricsSnapshot snap;

    snap.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    snap.cache_misses = cache_misses_.load(std::memory_order_relaxed);
    auto cache_total = snap.cache_hits + snap.cache_misses;
    snap.cache_hit_rate = cache_total > 0
        ? static_cast<double>(snap.cache_hits) / cache_total
        : 0.0;

    snap.writes = writes_.load(std::memory_order_relaxed);
    snap.removals = removals_.load(std::memory_order_relaxed);
    snap.prefix_sweeps = prefix_sweeps_.load(std::memory_order_relaxed);

    snap.store_failures = store_failures_.load(std::memory_order_relaxed);
    snap.decode_failures = decode_failures_.load(std::memory_order_relaxed);
    snap.encode_failures = encode_failures_.load(std::memory_order_relaxed);

    snap.uptime_seconds = uptime_seconds();

    return snap;
}

std::string MetricsSnapshot::to_json() const {
    std::ostringstream json;
    json << std::fixed << std::setprecision(4);

    json << "{\n";

    json << "  \"cache\": {\n";
    json << "    \"hits\": " << cache_hits << ",\n";
    json << "    \"misses\": " << cache_misses << ",\n";
    json << "    \"hit_rate\": " << cache_hit_rate << ",\n";
    json << "    \"writes\": " << writes << ",\n";
    json << "    \"removals\": " << removals << ",\n";
    json << "    \"prefix_sweeps\": " << prefix_sweeps << "\n";
    json << "  },\n";

    json << "  \"degraded\": {\n";
    json << "    \"store_failures\": " << store_failures << ",\n";
    json << "    \"decode_failures\": " << decode_failures << ",\n";
    json << "    \"encode_failures\": " << encode_failures << "\n";
    json << "  },\n";

    json << "  \"system\": {\n";
    json << "    \"uptime_seconds\": " << uptime_seconds << "\n";
    json << "  }\n";

    json << "}";

    return json.str();
}

} // namespace querycache::util
