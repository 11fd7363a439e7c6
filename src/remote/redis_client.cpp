/**
 * QueryCache - Prefix-invalidating query cache
 * Redis Client - Implementation
 */

#include "remote/redis_client.hpp"

#include "config/config.hpp"
#include "util/logger.hpp"

#include <hiredis/hiredis.h>

#include <sys/time.h>

#include <algorithm>
#include <charconv>
#include <vector>

namespace querycache::remote {

namespace {

std::string_view trim(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.remove_suffix(1);
    return value;
}

template<typename T>
T parse_number(std::string_view name, std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::runtime_error("Invalid Redis connection string: bad " + std::string(name) +
                                 " '" + std::string(text) + "'");
    }
    return value;
}

timeval to_timeval(std::chrono::milliseconds duration) {
    timeval tv{};
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(duration.count() / 1000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>((duration.count() % 1000) * 1000);
    return tv;
}

} // namespace

// ============================================================================
// RedisOptions Implementation
// ============================================================================

RedisOptions RedisOptions::parse(std::string_view connection_string) {
    RedisOptions options;
    bool have_endpoint = false;

    while (!connection_string.empty()) {
        auto comma = connection_string.find(',');
        auto segment = trim(connection_string.substr(0, comma));
        connection_string = comma == std::string_view::npos
            ? std::string_view{}
            : connection_string.substr(comma + 1);

        if (segment.empty()) {
            continue;
        }

        auto eq = segment.find('=');
        if (eq == std::string_view::npos) {
            if (have_endpoint) {
                QUERYCACHE_LOG_WARN(util::log_component::Remote,
                                    "Ignoring additional Redis endpoint '{}'", segment);
                continue;
            }
            auto colon = segment.rfind(':');
            if (colon == std::string_view::npos) {
                options.host = std::string(segment);
            } else {
                options.host = std::string(segment.substr(0, colon));
                options.port = parse_number<std::uint16_t>("port", segment.substr(colon + 1));
            }
            if (options.host.empty()) {
                throw std::runtime_error("Invalid Redis connection string: empty host");
            }
            have_endpoint = true;
            continue;
        }

        auto name = trim(segment.substr(0, eq));
        auto value = trim(segment.substr(eq + 1));

        if (config::iequals(name, "password")) {
            options.password = std::string(value);
        } else if (config::iequals(name, "defaultDatabase")) {
            options.database = parse_number<int>(name, value);
        } else if (config::iequals(name, "connectTimeout")) {
            options.connect_timeout = std::chrono::milliseconds(parse_number<long>(name, value));
        } else if (config::iequals(name, "syncTimeout")) {
            options.command_timeout = std::chrono::milliseconds(parse_number<long>(name, value));
        } else {
            QUERYCACHE_LOG_DEBUG(util::log_component::Remote,
                                 "Ignoring Redis connection option '{}'", name);
        }
    }

    if (!have_endpoint) {
        throw std::runtime_error("Invalid Redis connection string: no host given");
    }
    return options;
}

std::string RedisOptions::endpoint() const {
    return host + ":" + std::to_string(port);
}

// ============================================================================
// RedisClient Implementation
// ============================================================================

void RedisClient::ContextDeleter::operator()(redisContext* context) const {
    redisFree(context);
}

void RedisClient::ReplyDeleter::operator()(redisReply* reply) const {
    freeReplyObject(reply);
}

RedisClient::RedisClient(RedisOptions options)
    : options_(std::move(options)) {
    QUERYCACHE_LOG_INFO(util::log_component::Remote, "Redis client created for {} (db {})",
                        options_.endpoint(), options_.database);
}

RedisClient::~RedisClient() = default;

void RedisClient::ensure_connected() {
    if (context_) {
        return;
    }

    ContextPtr context(redisConnectWithTimeout(options_.host.c_str(), options_.port,
                                               to_timeval(options_.connect_timeout)));
    if (!context) {
        throw StoreUnavailableError("Redis connect to " + options_.endpoint() + " failed: out of memory");
    }
    if (context->err) {
        throw StoreUnavailableError("Redis connect to " + options_.endpoint() + " failed: " + context->errstr);
    }
    if (redisSetTimeout(context.get(), to_timeval(options_.command_timeout)) != REDIS_OK) {
        throw StoreUnavailableError("Redis connect to " + options_.endpoint() + " failed: cannot set timeout");
    }

    context_ = std::move(context);
    QUERYCACHE_LOG_DEBUG(util::log_component::Remote, "Connected to Redis at {}", options_.endpoint());

    try {
        if (options_.password) {
            command({"AUTH", *options_.password});
        }
        if (options_.database != 0) {
            auto db = std::to_string(options_.database);
            command({"SELECT", db});
        }
    } catch (const StoreUnavailableError&) {
        context_.reset();
        throw;
    }
}

RedisClient::ReplyPtr RedisClient::command(std::initializer_list<std::string_view> args) {
    ensure_connected();

    std::vector<const char*> argv;
    std::vector<std::size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (auto arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    ReplyPtr reply(static_cast<redisReply*>(
        redisCommandArgv(context_.get(), static_cast<int>(argv.size()), argv.data(), argvlen.data())));

    if (!reply) {
        std::string error = context_->errstr;
        context_.reset();
        throw StoreUnavailableError("Redis " + std::string(*args.begin()) + " failed: " + error);
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        throw StoreUnavailableError("Redis " + std::string(*args.begin()) + " error: " +
                                    std::string(reply->str, reply->len));
    }
    return reply;
}

std::optional<std::string> RedisClient::get(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto reply = command({"GET", key});
    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    return std::string(reply->str, reply->len);
}

void RedisClient::set(std::string_view key, std::string_view value, std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto px = std::to_string(std::max<long long>(ttl.count(), 1));
    command({"SET", key, value, "PX", px});
}

bool RedisClient::remove(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto reply = command({"DEL", key});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

bool RedisClient::expire(std::string_view key, std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto px = std::to_string(std::max<long long>(ttl.count(), 1));
    auto reply = command({"PEXPIRE", key, px});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer == 1;
}

std::optional<std::chrono::milliseconds> RedisClient::ttl(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);

    // -2 = missing, -1 = no expiry
    auto reply = command({"PTTL", key});
    if (reply->type != REDIS_REPLY_INTEGER || reply->integer < 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(reply->integer);
}

bool RedisClient::ping() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        auto reply = command({"PING"});
        return reply->type == REDIS_REPLY_STATUS;
    } catch (const StoreUnavailableError& e) {
        QUERYCACHE_LOG_WARN(util::log_component::Remote, "Redis ping failed: {}", e.what());
        return false;
    }
}

} // namespace querycache::remote
