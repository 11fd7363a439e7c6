/**
 * QueryCache - Prefix-invalidating query cache
 * Call Context - Per-call bypass flag and cancellation
 */

#ifndef QUERYCACHE_CACHE_CALL_CONTEXT_HPP
#define QUERYCACHE_CACHE_CALL_CONTEXT_HPP

#include "cache/bypass_context.hpp"

#include <stdexcept>
#include <stop_token>

namespace querycache::cache {

/**
 * Raised when a caller requests a stop; steps already completed stay applied
 */
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("cache operation cancelled") {}
};

struct CallContext {
    BypassContext bypass;
    std::stop_token cancel;

    /**
     * @throws OperationCancelled if a stop was requested
     */
    void checkpoint() const {
        if (cancel.stop_requested()) {
            throw OperationCancelled();
        }
    }
};

} // namespace querycache::cache

#endif // QUERYCACHE_CACHE_CALL_CONTEXT_HPP
