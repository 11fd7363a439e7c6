/**
 * QueryCache - Prefix-invalidating query cache
 * Cached Query - Get-or-compute wrapper for read handlers
 *
 * Looks the key up; on a hit reports HIT and returns the cached value. On a
 * miss runs compute, reports MISS, resolves the endpoint's entry options and
 * writes the result. A compute returning an empty std::optional signals an
 * unsuccessful result: it is returned as-is and never cached.
 *
 *     auto page = cache::get_or_compute(store, "Employees:GetAll",
 *                                       "Employees:GetAll:page=1:size=10",
 *                                       [&] { return repository.page(1, 10); },
 *                                       &publisher, ctx);
 */

#ifndef QUERYCACHE_CACHE_CACHED_QUERY_HPP
#define QUERYCACHE_CACHE_CACHED_QUERY_HPP

#include "cache/cache_store.hpp"
#include "cache/entry_options.hpp"
#include "diagnostics/diagnostics_publisher.hpp"

#include <chrono>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace querycache::cache {

namespace detail {

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template<typename T>
struct cached_type { using type = T; };

template<typename T>
struct cached_type<std::optional<T>> { using type = T; };

template<typename T>
const auto& computed_value(const T& value) {
    if constexpr (is_optional<T>::value) {
        return *value;
    } else {
        return value;
    }
}

} // namespace detail

/**
 * @param endpoint  Name used to pick per-endpoint TTLs
 * @param publisher Optional; receives HIT/MISS reports
 * @return Cached or freshly computed value (same type compute returns)
 * @throws OperationCancelled, or whatever compute throws
 */
template<typename Compute>
std::decay_t<std::invoke_result_t<Compute&>> get_or_compute(CacheStore& store,
                                                            std::string_view endpoint,
                                                            std::string_view key,
                                                            Compute&& compute,
                                                            diagnostics::DiagnosticsPublisher* publisher = nullptr,
                                                            const CallContext& ctx = {}) {
    using Result = std::decay_t<std::invoke_result_t<Compute&>>;
    using Value = typename detail::cached_type<Result>::type;

    if (auto hit = store.lookup<Value>(key, ctx)) {
        if (publisher) {
            publisher->report_hit(key, hit->remaining);
        }
        return Result(std::move(hit->value));
    }

    Result result = compute();
    if constexpr (detail::is_optional<Result>::value) {
        if (!result) {
            return result;
        }
    }

    auto opts = resolve_entry_options(store.settings_provider().snapshot(), endpoint);
    if (publisher) {
        std::optional<std::chrono::milliseconds> ttl;
        if (opts.should_write()) {
            ttl = opts.absolute_ttl;
        }
        publisher->report_miss(key, ttl);
    }

    store.set(key, detail::computed_value(result), opts, ctx);
    return result;
}

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_CACHED_QUERY_HPP
