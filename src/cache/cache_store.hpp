/**
 * QueryCache - Prefix-invalidating query cache
 * Cache Store - Get/Set/Remove/RemoveByPrefix over a physical substrate
 *
 * Values travel as nlohmann::json (to_json/from_json ADL hooks) and are laid
 * out in bytes by the injected PayloadCodec. Every write registers its
 * physical key under the key's prefix so a whole family of filtered queries
 * can be dropped at once.
 *
 * Settings are snapshotted once per operation. Reads and writes act as
 * disabled when caching is off or the call carries a bypass; removals
 * always run.
 */

#ifndef QUERYCACHE_CACHE_CACHE_STORE_HPP
#define QUERYCACHE_CACHE_CACHE_STORE_HPP

#include "cache/call_context.hpp"
#include "cache/entry_options.hpp"
#include "cache/payload_codec.hpp"
#include "config/config.hpp"
#include "util/metrics.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace querycache::cache {

class KeyIndex;

/**
 * A hit together with how long it stays cached
 */
template<typename T>
struct CachedValue {
    T value;
    std::optional<std::chrono::milliseconds> remaining;
};

/**
 * Reads and writes are skipped when caching is inactive or the call bypasses
 */
bool is_cache_enabled(const config::CachingSettings& settings, const CallContext& ctx);

class CacheStore {
public:
    CacheStore(const config::SettingsProvider& settings, std::shared_ptr<const PayloadCodec> codec);
    virtual ~CacheStore() = default;

    // Non-copyable
    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    /**
     * @return Cached value, or nullopt on miss (including undecodable payloads)
     * @throws OperationCancelled
     */
    template<typename T>
    std::optional<T> get(std::string_view key, const CallContext& ctx = {}) {
        auto hit = lookup<T>(key, ctx);
        if (!hit) {
            return std::nullopt;
        }
        return std::move(hit->value);
    }

    /**
     * Like get, also reporting the remaining lifetime
     */
    template<typename T>
    std::optional<CachedValue<T>> lookup(std::string_view key, const CallContext& ctx = {}) {
        auto document = lookup_document(key, ctx);
        if (!document) {
            return std::nullopt;
        }
        try {
            return CachedValue<T>{document->document.template get<T>(), document->remaining};
        } catch (const nlohmann::json::exception& e) {
            report_decode_failure(key, e.what());
            return std::nullopt;
        }
    }

    /**
     * Write value under key; a no-op when disabled or opts.absolute_ttl <= 0
     * @throws OperationCancelled
     */
    template<typename T>
    void set(std::string_view key, const T& value, const CacheEntryOptions& opts, const CallContext& ctx = {}) {
        store_document(key, nlohmann::json(value), opts, ctx);
    }

    /**
     * Delete one entry and drop it from its prefix's index
     * @throws OperationCancelled
     */
    virtual void remove(std::string_view key, const CallContext& ctx = {}) = 0;

    /**
     * Delete every entry tracked under prefix; a blank prefix clears everything tracked
     * @throws OperationCancelled
     */
    virtual void remove_by_prefix(std::string_view prefix, const CallContext& ctx = {}) = 0;

    /**
     * Hash index fed by set() when key_display_mode is Hash
     */
    void attach_key_index(std::shared_ptr<KeyIndex> index);
    std::shared_ptr<KeyIndex> key_index() const { return key_index_; }

    const config::SettingsProvider& settings_provider() const { return settings_; }
    const PayloadCodec& codec() const { return *codec_; }

    virtual std::string_view backend_name() const = 0;

protected:
    struct DocumentHit {
        nlohmann::json document;
        std::optional<std::chrono::milliseconds> remaining;
    };

    /**
     * Fetch and decode one physical entry; nullopt on miss or decode failure
     */
    virtual std::optional<DocumentHit> read_document(const config::CachingSettings& settings,
                                                     std::string_view physical_key,
                                                     const CallContext& ctx) = 0;

    /**
     * Store one entry and register it under its prefix
     *
     * @return false if the substrate could not be written
     */
    virtual bool write_document(const config::CachingSettings& settings,
                                std::string_view logical_key,
                                const std::string& physical_key,
                                const nlohmann::json& document,
                                const CacheEntryOptions& opts,
                                const CallContext& ctx) = 0;

    void report_decode_failure(std::string_view key, std::string_view what) const;

    /**
     * Log and count a value the codec refused; the write is skipped
     */
    void report_encode_failure(std::string_view key, std::string_view what) const;

private:
    std::optional<DocumentHit> lookup_document(std::string_view key, const CallContext& ctx);
    void store_document(std::string_view key, const nlohmann::json& document,
                        const CacheEntryOptions& opts, const CallContext& ctx);

    const config::SettingsProvider& settings_;
    std::shared_ptr<const PayloadCodec> codec_;
    std::shared_ptr<KeyIndex> key_index_;
};

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_CACHE_STORE_HPP
