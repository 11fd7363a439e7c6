/**
 * QueryCache - Prefix-invalidating query cache
 * Invalidation Endpoint - Admin HTTP handler over the invalidation service
 *
 * Routes:
 *   POST /cache/invalidate   body {"key"?, "prefix"?, "invalidateAll"?}, optional ?invalidateAll=true
 *   GET  /cache/stats        metrics snapshot as JSON
 *
 * Authorization is the host's concern; the handler is transport-agnostic and
 * works on Boost.Beast message types.
 */

#ifndef QUERYCACHE_ADMIN_INVALIDATION_ENDPOINT_HPP
#define QUERYCACHE_ADMIN_INVALIDATION_ENDPOINT_HPP

#include "cache/call_context.hpp"
#include "cache/invalidation_service.hpp"

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace querycache::admin {

namespace http = boost::beast::http;

inline constexpr std::string_view kInvalidatePath = "/cache/invalidate";
inline constexpr std::string_view kStatsPath = "/cache/stats";
inline constexpr std::string_view kMissingTargetMessage = "Specify a key, prefix, or set invalidateAll=true.";

/**
 * Malformed admin request (bad JSON, wrong field types, bad query flag)
 */
class BadRequestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct InvalidationRequest {
    std::optional<std::string> key;
    std::optional<std::string> prefix;
    bool invalidate_all{false};
};

enum class InvalidationAction {
    All,
    Key,
    Prefix,
    None
};

/**
 * Parse the JSON body (field names matched case-insensitively) and the
 * invalidateAll query flag of the request target. An empty body is an empty request.
 *
 * @throws BadRequestError
 */
InvalidationRequest parse_invalidation_request(std::string_view body, std::string_view target);

/**
 * invalidate_all wins over key, key wins over prefix; blank values count as absent
 */
InvalidationAction select_action(const InvalidationRequest& request);

class InvalidationEndpoint {
public:
    explicit InvalidationEndpoint(std::shared_ptr<cache::InvalidationService> invalidation);

    /**
     * Handle one admin request; unknown routes get 404
     *
     * @throws cache::OperationCancelled if ctx requests a stop
     */
    http::response<http::string_body> handle(const http::request<http::string_body>& request,
                                             const cache::CallContext& ctx = {});

private:
    http::response<http::string_body> handle_invalidate(const http::request<http::string_body>& request,
                                                        const cache::CallContext& ctx);
    http::response<http::string_body> handle_stats(const http::request<http::string_body>& request);

    std::shared_ptr<cache::InvalidationService> invalidation_;
};

} // namespace querycache::admin

#endif // QUERYCACHE_ADMIN_INVALIDATION_ENDPOINT_HPP
