/**
 * QueryCache - Prefix-invalidating query cache
 * Bypass Context - Per-request switch that makes every cache operation act disabled
 *
 * A bypass is a value carried in the CallContext of one request. It is never
 * stored globally or in thread-local state.
 */

#ifndef QUERYCACHE_CACHE_BYPASS_CONTEXT_HPP
#define QUERYCACHE_CACHE_BYPASS_CONTEXT_HPP

#include <boost/beast/http/fields.hpp>

#include <string>
#include <string_view>

namespace querycache::cache {

inline constexpr std::string_view kBypassHeaderName = "X-Cache-Bypass";

class BypassContext {
public:
    BypassContext() = default;

    bool should_bypass() const { return should_bypass_; }
    const std::string& reason() const { return reason_; }

    void enable(std::string reason);
    void reset();

private:
    bool should_bypass_{false};
    std::string reason_;
};

/**
 * Check if a Cache-Control value asks to skip the cache
 */
bool should_bypass_cache(std::string_view cache_control);

/**
 * Build the bypass context for an incoming request
 *
 * Only authorized callers may bypass. The debug signal is an
 * X-Cache-Bypass header of true/1/yes, or a Cache-Control header carrying
 * no-cache or no-store.
 */
BypassContext bypass_from_request(const boost::beast::http::fields& headers, bool authorized);

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_BYPASS_CONTEXT_HPP
