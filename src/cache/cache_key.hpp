/**
 * QueryCache - Prefix-invalidating query cache
 * Cache Key - Physical key formatting, prefix extraction and key hashing
 *
 * Logical keys are colon-delimited; filter segments carry an '='
 * (e.g. "Employees:page=1:size=10:last=smith"). Everything sent to a
 * backing store is namespaced with the configured key prefix.
 */

#ifndef QUERYCACHE_CACHE_CACHE_KEY_HPP
#define QUERYCACHE_CACHE_CACHE_KEY_HPP

#include "config/config.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace querycache::cache {

/**
 * key_prefix + ":" + logical_key
 */
std::string build_cache_key(const config::CachingSettings& settings, std::string_view logical_key);

/**
 * key_prefix + ":" + prefix
 */
std::string build_prefix_key(const config::CachingSettings& settings, std::string_view prefix);

/**
 * Key of the prefix index holding the physical keys tracked under prefix_key
 */
std::string build_index_key(std::string_view prefix_key);

/**
 * Key of the namespace-wide catalog of prefixes with a non-empty index
 */
std::string build_catalog_key(const config::CachingSettings& settings);

/**
 * Key of the hash index entry for a hashed logical key
 */
std::string build_hash_key(const config::CachingSettings& settings, std::string_view hashed_key);

/**
 * Derive the aggregate prefix of a logical key
 *
 * Walks the colons left to right; the first colon whose following segment
 * contains '=' ends the prefix. Keys without such a segment are their own
 * prefix. Blank keys yield an empty prefix.
 */
std::string extract_prefix(std::string_view logical_key);

/**
 * One-way, deterministic hash of a logical key (SHA-256, lowercase hex)
 *
 * Used wherever a key would otherwise expose user-supplied filter values.
 */
std::string hash_key(std::string_view logical_key);

/**
 * True for empty or whitespace-only strings
 */
bool is_blank(std::string_view value);

/**
 * XXH64 hash functor for physical-key maps
 */
struct PhysicalKeyHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view key) const noexcept;
};

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_CACHE_KEY_HPP
