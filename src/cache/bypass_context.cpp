/**
 * QueryCache - Prefix-invalidating query cache
 * Bypass Context Implementation
 */

#include "cache/bypass_context.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cctype>

namespace querycache::cache {

namespace {

std::string to_lower(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

} // namespace

void BypassContext::enable(std::string reason) {
    should_bypass_ = true;
    reason_ = std::move(reason);
}

void BypassContext::reset() {
    should_bypass_ = false;
    reason_.clear();
}

bool should_bypass_cache(std::string_view cache_control) {
    if (cache_control.empty()) {
        return false;
    }

    std::string lower = to_lower(cache_control);
    return lower.find("no-cache") != std::string::npos ||
           lower.find("no-store") != std::string::npos;
}

BypassContext bypass_from_request(const boost::beast::http::fields& headers, bool authorized) {
    BypassContext context;
    if (!authorized) {
        return context;
    }

    if (auto it = headers.find(boost::beast::string_view(kBypassHeaderName.data(), kBypassHeaderName.size()));
        it != headers.end()) {
        auto value = to_lower(std::string_view(it->value().data(), it->value().size()));
        if (value == "true" || value == "1" || value == "yes") {
            context.enable("X-Cache-Bypass header");
        }
    }

    if (!context.should_bypass()) {
        if (auto it = headers.find(boost::beast::http::field::cache_control); it != headers.end()) {
            if (should_bypass_cache(std::string_view(it->value().data(), it->value().size()))) {
                context.enable("Cache-Control header");
            }
        }
    }

    if (context.should_bypass()) {
        QUERYCACHE_LOG_DEBUG(util::log_component::Cache, "Cache bypass enabled: {}", context.reason());
    }
    return context;
}

} // namespace querycache::cache
