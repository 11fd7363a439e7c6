/**
 * QueryCache - Prefix-invalidating query cache
 * Redis Client - RemoteStore over a synchronous hiredis connection
 *
 * A single connection is reused for every command and serialized by a
 * mutex. A transport error drops the connection; the next command
 * reconnects (AUTH and SELECT are replayed).
 */

#ifndef QUERYCACHE_REMOTE_REDIS_CLIENT_HPP
#define QUERYCACHE_REMOTE_REDIS_CLIENT_HPP

#include "remote/remote_store.hpp"

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

struct redisContext;
struct redisReply;

namespace querycache::remote {

/**
 * Parsed connection string
 *
 * Format: host[:port][,password=...][,defaultDatabase=N][,connectTimeout=ms][,syncTimeout=ms]
 */
struct RedisOptions {
    std::string host{"localhost"};
    std::uint16_t port{6379};
    std::optional<std::string> password;
    int database{0};
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds command_timeout{5000};

    /**
     * @throws std::runtime_error on malformed input
     */
    static RedisOptions parse(std::string_view connection_string);

    /**
     * host:port for logging; never includes the password
     */
    std::string endpoint() const;
};

class RedisClient : public RemoteStore {
public:
    explicit RedisClient(RedisOptions options);
    ~RedisClient() override;

    // Non-copyable
    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    std::optional<std::string> get(std::string_view key) override;
    void set(std::string_view key, std::string_view value, std::chrono::milliseconds ttl) override;
    bool remove(std::string_view key) override;
    bool expire(std::string_view key, std::chrono::milliseconds ttl) override;
    std::optional<std::chrono::milliseconds> ttl(std::string_view key) override;
    bool ping() override;

    const RedisOptions& options() const { return options_; }

private:
    struct ContextDeleter {
        void operator()(redisContext* context) const;
    };
    struct ReplyDeleter {
        void operator()(redisReply* reply) const;
    };

    using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    /**
     * Connect if needed. Must be called with mutex_ held.
     * @throws StoreUnavailableError
     */
    void ensure_connected();

    /**
     * Send one command given as binary-safe arguments. Must be called with mutex_ held.
     * @throws StoreUnavailableError on transport failure or an error reply
     */
    ReplyPtr command(std::initializer_list<std::string_view> args);

    RedisOptions options_;
    std::mutex mutex_;
    ContextPtr context_;
};

} // namespace querycache::remote

#endif // QUERYCACHE_REMOTE_REDIS_CLIENT_HPP
