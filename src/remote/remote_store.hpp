/**
 * QueryCache - Prefix-invalidating query cache
 * Remote Store - Key/value substrate behind the distributed backend
 *
 * The substrate offers single-key get/set/delete with per-key TTL and
 * nothing else; prefix invalidation is built on top by the cache layer.
 */

#ifndef QUERYCACHE_REMOTE_REMOTE_STORE_HPP
#define QUERYCACHE_REMOTE_REMOTE_STORE_HPP

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace querycache::remote {

/**
 * Transport-level failure (connection refused, timeout, protocol error)
 */
class StoreUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    /**
     * @return Value if the key exists, nullopt otherwise
     * @throws StoreUnavailableError
     */
    virtual std::optional<std::string> get(std::string_view key) = 0;

    /**
     * Write a value that expires after ttl
     * @throws StoreUnavailableError
     */
    virtual void set(std::string_view key, std::string_view value, std::chrono::milliseconds ttl) = 0;

    /**
     * @return true if the key existed
     * @throws StoreUnavailableError
     */
    virtual bool remove(std::string_view key) = 0;

    /**
     * Reset the expiry of an existing key
     *
     * @return false if the key does not exist
     * @throws StoreUnavailableError
     */
    virtual bool expire(std::string_view key, std::chrono::milliseconds ttl) = 0;

    /**
     * Remaining lifetime of a key; nullopt if the key is missing or has no expiry
     * @throws StoreUnavailableError
     */
    virtual std::optional<std::chrono::milliseconds> ttl(std::string_view key) = 0;

    /**
     * @return true if the store answered
     */
    virtual bool ping() = 0;
};

} // namespace querycache::remote

#endif // QUERYCACHE_REMOTE_REMOTE_STORE_HPP
