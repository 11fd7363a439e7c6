/**
 * QueryCache - Prefix-invalidating query cache
 * Invalidation Service - The one entry point for dropping cached data
 *
 * Every operation is idempotent: invalidating something that is not cached
 * succeeds and changes nothing.
 */

#ifndef QUERYCACHE_CACHE_INVALIDATION_SERVICE_HPP
#define QUERYCACHE_CACHE_INVALIDATION_SERVICE_HPP

#include "cache/cache_store.hpp"
#include "cache/key_index.hpp"

#include <memory>
#include <string_view>

namespace querycache::cache {

class InvalidationService {
public:
    InvalidationService(std::shared_ptr<CacheStore> store, std::shared_ptr<KeyIndex> key_index = nullptr);

    /**
     * Drop one entry, named by its logical key or (in Hash display mode) by its hash
     */
    void invalidate_key(std::string_view key_or_hash, const CallContext& ctx = {});

    /**
     * Drop every entry tracked under a logical prefix
     */
    void invalidate_prefix(std::string_view prefix, const CallContext& ctx = {});

    /**
     * Drop every tracked entry in the namespace
     */
    void invalidate_all(const CallContext& ctx = {});

private:
    std::shared_ptr<CacheStore> store_;
    std::shared_ptr<KeyIndex> key_index_;
};

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_INVALIDATION_SERVICE_HPP
