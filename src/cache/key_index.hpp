/**
 * QueryCache - Prefix-invalidating query cache
 * Key Index - Resolves a hashed logical key back to the key itself
 *
 * When diagnostics show hashed keys, operators only ever see the hash; the
 * index lets an invalidation request name an entry by that hash.
 */

#ifndef QUERYCACHE_CACHE_KEY_INDEX_HPP
#define QUERYCACHE_CACHE_KEY_INDEX_HPP

#include "cache/call_context.hpp"
#include "cache/entry_options.hpp"
#include "cache/lru_store.hpp"
#include "config/config.hpp"
#include "remote/remote_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace querycache::cache {

class KeyIndex {
public:
    virtual ~KeyIndex() = default;

    /**
     * Remember hash(logical_key) -> logical_key for resolve_index_ttl(opts)
     */
    virtual void track(std::string_view logical_key, const CacheEntryOptions& opts, const CallContext& ctx = {}) = 0;

    /**
     * @return The logical key, or nullopt for blank or unknown hashes
     */
    virtual std::optional<std::string> try_resolve(std::string_view hashed_key, const CallContext& ctx = {}) = 0;

    virtual void remove(std::string_view hashed_key, const CallContext& ctx = {}) = 0;
};

/**
 * Mappings kept in the same LRU store as the entries
 */
class MemoryKeyIndex : public KeyIndex {
public:
    MemoryKeyIndex(const config::SettingsProvider& settings, std::shared_ptr<LruStore> store);

    void track(std::string_view logical_key, const CacheEntryOptions& opts, const CallContext& ctx = {}) override;
    std::optional<std::string> try_resolve(std::string_view hashed_key, const CallContext& ctx = {}) override;
    void remove(std::string_view hashed_key, const CallContext& ctx = {}) override;

private:
    const config::SettingsProvider& settings_;
    std::shared_ptr<LruStore> store_;
};

/**
 * Mappings kept in the remote store; transport failures degrade to no-op / unresolved
 */
class DistributedKeyIndex : public KeyIndex {
public:
    DistributedKeyIndex(const config::SettingsProvider& settings, std::shared_ptr<remote::RemoteStore> store);

    void track(std::string_view logical_key, const CacheEntryOptions& opts, const CallContext& ctx = {}) override;
    std::optional<std::string> try_resolve(std::string_view hashed_key, const CallContext& ctx = {}) override;
    void remove(std::string_view hashed_key, const CallContext& ctx = {}) override;

private:
    const config::SettingsProvider& settings_;
    std::shared_ptr<remote::RemoteStore> store_;
};

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_KEY_INDEX_HPP
