/**
 * QueryCache - Prefix-invalidating query cache
 * Distributed Cache Store - Backend over a shared remote key/value store
 *
 * Entries, prefix indexes and the prefix catalog all live in the remote
 * store. Indexes and the catalog are codec-encoded string lists updated by
 * read-modify-write, so concurrent writers may briefly lose or duplicate a
 * reference; a stale value is never served because entries expire on their
 * own TTL.
 *
 * Entries are wrapped in an envelope {"v": value, "exp": unix ms, "sld": s}
 * so sliding expiry can be emulated with PEXPIRE on read.
 *
 * Transport failures are logged, counted and swallowed: reads miss and
 * writes or removals become no-ops.
 */

#ifndef QUERYCACHE_CACHE_DISTRIBUTED_CACHE_STORE_HPP
#define QUERYCACHE_CACHE_DISTRIBUTED_CACHE_STORE_HPP

#include "cache/cache_store.hpp"
#include "remote/remote_store.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace querycache::cache {

class DistributedCacheStore : public CacheStore {
public:
    DistributedCacheStore(const config::SettingsProvider& settings,
                          std::shared_ptr<remote::RemoteStore> store,
                          std::shared_ptr<const PayloadCodec> codec = nullptr);

    void remove(std::string_view key, const CallContext& ctx = {}) override;
    void remove_by_prefix(std::string_view prefix, const CallContext& ctx = {}) override;

    std::string_view backend_name() const override { return config::providers::Distributed; }

    /**
     * Physical keys listed in the index of a logical prefix
     */
    std::vector<std::string> tracked_keys(std::string_view prefix);

    /**
     * Prefix physical keys listed in the catalog
     */
    std::vector<std::string> catalog();

    const std::shared_ptr<remote::RemoteStore>& remote_store() const { return store_; }

protected:
    std::optional<DocumentHit> read_document(const config::CachingSettings& settings,
                                             std::string_view physical_key,
                                             const CallContext& ctx) override;

    bool write_document(const config::CachingSettings& settings,
                        std::string_view logical_key,
                        const std::string& physical_key,
                        const nlohmann::json& document,
                        const CacheEntryOptions& opts,
                        const CallContext& ctx) override;

private:
    /**
     * Add member to the list stored at list_key, keeping the list alive for at least ttl
     * @throws remote::StoreUnavailableError
     */
    void add_to_list(const std::string& list_key, const std::string& member, std::chrono::milliseconds ttl);

    /**
     * Remove member from the list at list_key; deletes the list once empty
     *
     * @return true if the list was deleted
     * @throws remote::StoreUnavailableError
     */
    bool remove_from_list(const config::CachingSettings& settings, const std::string& list_key,
                          const std::string& member);

    /**
     * @throws remote::StoreUnavailableError
     */
    std::vector<std::string> read_list(const std::string& list_key);

    /**
     * @throws remote::StoreUnavailableError
     */
    void remove_prefix_key(const config::CachingSettings& settings, const std::string& prefix_key,
                           const CallContext& ctx);

    void report_store_failure(std::string_view operation, const remote::StoreUnavailableError& error) const;

    std::shared_ptr<remote::RemoteStore> store_;
};

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_DISTRIBUTED_CACHE_STORE_HPP
