/**
 * QueryCache - Prefix-invalidating query cache
 * Invalidation Endpoint Implementation
 */

#include "admin/invalidation_endpoint.hpp"

#include "cache/cache_key.hpp"
#include "config/config.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <nlohmann/json.hpp>

namespace querycache::admin {

namespace {

std::string_view path_of(std::string_view target) {
    return target.substr(0, target.find('?'));
}

std::optional<std::string> query_param(std::string_view target, std::string_view name) {
    auto question = target.find('?');
    if (question == std::string_view::npos) {
        return std::nullopt;
    }

    auto query = target.substr(question + 1);
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        auto eq = pair.find('=');
        auto key = pair.substr(0, eq);
        if (config::iequals(key, name)) {
            return std::string(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
        }
    }
    return std::nullopt;
}

bool parse_flag(std::string_view name, std::string_view value) {
    if (config::iequals(value, "true") || value == "1") return true;
    if (config::iequals(value, "false") || value == "0") return false;
    throw BadRequestError("The value '" + std::string(value) + "' is not valid for " + std::string(name) + ".");
}

std::optional<std::string> read_string(const nlohmann::json& value, std::string_view name) {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (!value.is_string()) {
        throw BadRequestError("Field '" + std::string(name) + "' must be a string.");
    }
    return value.get<std::string>();
}

http::response<http::string_body> make_response(const http::request<http::string_body>& request,
                                                http::status status, std::string body = {}) {
    http::response<http::string_body> response{status, request.version()};
    response.set(http::field::server, "QueryCache");
    if (!body.empty()) {
        response.set(http::field::content_type, "application/json");
        response.body() = std::move(body);
    }
    response.keep_alive(request.keep_alive());
    response.prepare_payload();
    return response;
}

http::response<http::string_body> make_error(const http::request<http::string_body>& request,
                                             http::status status, std::string_view message) {
    nlohmann::json body = {{"error", std::string(message)}};
    return make_response(request, status, body.dump());
}

} // namespace

InvalidationRequest parse_invalidation_request(std::string_view body, std::string_view target) {
    InvalidationRequest request;

    if (!cache::is_blank(body)) {
        nlohmann::json document;
        try {
            document = nlohmann::json::parse(body.begin(), body.end());
        } catch (const nlohmann::json::parse_error& e) {
            throw BadRequestError(std::string("Malformed JSON body: ") + e.what());
        }

        if (!document.is_null()) {
            if (!document.is_object()) {
                throw BadRequestError("Request body must be a JSON object.");
            }
            for (const auto& [name, value] : document.items()) {
                if (config::iequals(name, "key")) {
                    request.key = read_string(value, "key");
                } else if (config::iequals(name, "prefix")) {
                    request.prefix = read_string(value, "prefix");
                } else if (config::iequals(name, "invalidateAll")) {
                    if (!value.is_boolean()) {
                        throw BadRequestError("Field 'invalidateAll' must be a boolean.");
                    }
                    request.invalidate_all = value.get<bool>();
                }
            }
        }
    }

    if (auto flag = query_param(target, "invalidateAll")) {
        request.invalidate_all = request.invalidate_all || parse_flag("invalidateAll", *flag);
    }
    return request;
}

InvalidationAction select_action(const InvalidationRequest& request) {
    if (request.invalidate_all) {
        return InvalidationAction::All;
    }
    if (request.key && !cache::is_blank(*request.key)) {
        return InvalidationAction::Key;
    }
    if (request.prefix && !cache::is_blank(*request.prefix)) {
        return InvalidationAction::Prefix;
    }
    return InvalidationAction::None;
}

InvalidationEndpoint::InvalidationEndpoint(std::shared_ptr<cache::InvalidationService> invalidation)
    : invalidation_(std::move(invalidation)) {
}

http::response<http::string_body> InvalidationEndpoint::handle(const http::request<http::string_body>& request,
                                                               const cache::CallContext& ctx) {
    std::string_view target(request.target().data(), request.target().size());
    auto path = path_of(target);

    QUERYCACHE_LOG_DEBUG(util::log_component::Admin, "Admin request: {} {}",
                         std::string(http::to_string(request.method())), target);

    if (path == kInvalidatePath && request.method() == http::verb::post) {
        return handle_invalidate(request, ctx);
    }
    if (path == kStatsPath && request.method() == http::verb::get) {
        return handle_stats(request);
    }
    return make_error(request, http::status::not_found, "Not found");
}

http::response<http::string_body> InvalidationEndpoint::handle_invalidate(const http::request<http::string_body>& request,
                                                                          const cache::CallContext& ctx) {
    InvalidationRequest parsed;
    try {
        parsed = parse_invalidation_request(request.body(),
                                            std::string_view(request.target().data(), request.target().size()));
    } catch (const BadRequestError& e) {
        QUERYCACHE_LOG_WARN(util::log_component::Admin, "Rejected invalidation request: {}", e.what());
        return make_error(request, http::status::bad_request, e.what());
    }

    switch (select_action(parsed)) {
        case InvalidationAction::All:
            invalidation_->invalidate_all(ctx);
            break;
        case InvalidationAction::Key:
            invalidation_->invalidate_key(*parsed.key, ctx);
            break;
        case InvalidationAction::Prefix:
            invalidation_->invalidate_prefix(*parsed.prefix, ctx);
            break;
        case InvalidationAction::None:
            return make_error(request, http::status::bad_request, kMissingTargetMessage);
    }

    return make_response(request, http::status::no_content);
}

http::response<http::string_body> InvalidationEndpoint::handle_stats(const http::request<http::string_body>& request) {
    return make_response(request, http::status::ok, util::Metrics::instance().snapshot().to_json());
}

} // namespace querycache::admin
