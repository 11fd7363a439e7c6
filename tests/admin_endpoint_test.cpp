#include <gtest/gtest.h>

#include "admin/invalidation_endpoint.hpp"
#include "cache/memory_cache_store.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

/**
 * Admin invalidation endpoint: request parsing, priority, routing
 */

using namespace querycache;
using namespace std::chrono_literals;
namespace http = boost::beast::http;

namespace {

config::CachingSettings enabled_settings() {
    config::CachingSettings settings;
    settings.enabled = true;
    return settings;
}

const cache::CacheEntryOptions kMinute{60s, std::nullopt};

http::request<http::string_body> make_request(http::verb method, std::string target, std::string body = {}) {
    http::request<http::string_body> request{method, target, 11};
    request.body() = std::move(body);
    request.prepare_payload();
    return request;
}

class AdminEndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<cache::MemoryCacheStore>(settings_, std::make_shared<cache::LruStore>());
        endpoint_ = std::make_unique<admin::InvalidationEndpoint>(std::make_shared<cache::InvalidationService>(store_));

        store_->set("Employees:page=1", 1, kMinute);
        store_->set("Employees:page=2", 2, kMinute);
        store_->set("Departments:page=1", 3, kMinute);
    }

    http::response<http::string_body> invalidate(std::string body, std::string target = "/cache/invalidate") {
        return endpoint_->handle(make_request(http::verb::post, std::move(target), std::move(body)));
    }

    bool cached(const std::string& key) { return store_->get<int>(key).has_value(); }

    config::StaticSettingsProvider settings_{enabled_settings()};
    std::shared_ptr<cache::MemoryCacheStore> store_;
    std::unique_ptr<admin::InvalidationEndpoint> endpoint_;
};

} // namespace

// ==================== Parsing ====================

TEST(InvalidationRequestTest, ParsesFieldsCaseInsensitively) {
    auto request = admin::parse_invalidation_request(R"({"Key": "a:b=1", "PREFIX": "a", "invalidateall": false})",
                                                     "/cache/invalidate");

    EXPECT_EQ(request.key, "a:b=1");
    EXPECT_EQ(request.prefix, "a");
    EXPECT_FALSE(request.invalidate_all);
}

TEST(InvalidationRequestTest, EmptyAndNullBodies) {
    EXPECT_EQ(admin::select_action(admin::parse_invalidation_request("", "/cache/invalidate")),
              admin::InvalidationAction::None);
    EXPECT_EQ(admin::select_action(admin::parse_invalidation_request("null", "/cache/invalidate")),
              admin::InvalidationAction::None);
}

TEST(InvalidationRequestTest, QueryFlag) {
    auto request = admin::parse_invalidation_request("", "/cache/invalidate?invalidateAll=TRUE");
    EXPECT_TRUE(request.invalidate_all);

    request = admin::parse_invalidation_request("", "/cache/invalidate?x=1&invalidateAll=0");
    EXPECT_FALSE(request.invalidate_all);
}

TEST(InvalidationRequestTest, RejectsMalformedInput) {
    EXPECT_THROW(admin::parse_invalidation_request("{oops", "/"), admin::BadRequestError);
    EXPECT_THROW(admin::parse_invalidation_request("[1, 2]", "/"), admin::BadRequestError);
    EXPECT_THROW(admin::parse_invalidation_request(R"({"key": 5})", "/"), admin::BadRequestError);
    EXPECT_THROW(admin::parse_invalidation_request(R"({"invalidateAll": "yes"})", "/"), admin::BadRequestError);
    EXPECT_THROW(admin::parse_invalidation_request("", "/?invalidateAll=maybe"), admin::BadRequestError);
}

TEST(InvalidationRequestTest, Priority) {
    admin::InvalidationRequest request;
    request.key = "k:a=1";
    request.prefix = "k";
    EXPECT_EQ(admin::select_action(request), admin::InvalidationAction::Key);

    request.invalidate_all = true;
    EXPECT_EQ(admin::select_action(request), admin::InvalidationAction::All);

    request.invalidate_all = false;
    request.key = "  ";
    EXPECT_EQ(admin::select_action(request), admin::InvalidationAction::Prefix);

    request.prefix.reset();
    EXPECT_EQ(admin::select_action(request), admin::InvalidationAction::None);
}

// ==================== Invalidate route ====================

TEST_F(AdminEndpointTest, InvalidateKey) {
    auto response = invalidate(R"({"key": "Employees:page=1"})");

    EXPECT_EQ(response.result(), http::status::no_content);
    EXPECT_FALSE(cached("Employees:page=1"));
    EXPECT_TRUE(cached("Employees:page=2"));
}

TEST_F(AdminEndpointTest, InvalidatePrefix) {
    auto response = invalidate(R"({"prefix": "Employees"})");

    EXPECT_EQ(response.result(), http::status::no_content);
    EXPECT_FALSE(cached("Employees:page=1"));
    EXPECT_FALSE(cached("Employees:page=2"));
    EXPECT_TRUE(cached("Departments:page=1"));
}

TEST_F(AdminEndpointTest, KeyWinsOverPrefix) {
    invalidate(R"({"key": "Employees:page=1", "prefix": "Departments"})");

    EXPECT_FALSE(cached("Employees:page=1"));
    EXPECT_TRUE(cached("Departments:page=1"));
}

TEST_F(AdminEndpointTest, InvalidateAllFromQuery) {
    auto response = invalidate(R"({"key": "Employees:page=1"})", "/cache/invalidate?invalidateAll=true");

    EXPECT_EQ(response.result(), http::status::no_content);
    EXPECT_FALSE(cached("Employees:page=2"));
    EXPECT_FALSE(cached("Departments:page=1"));
}

TEST_F(AdminEndpointTest, NoTargetIsBadRequest) {
    auto response = invalidate("{}");

    EXPECT_EQ(response.result(), http::status::bad_request);
    auto body = nlohmann::json::parse(response.body());
    EXPECT_EQ(body.at("error"), std::string(admin::kMissingTargetMessage));
    EXPECT_TRUE(cached("Employees:page=1"));
}

TEST_F(AdminEndpointTest, MalformedBodyIsBadRequest) {
    auto response = invalidate("{not json");

    EXPECT_EQ(response.result(), http::status::bad_request);
    EXPECT_EQ(response[http::field::content_type], "application/json");
}

TEST_F(AdminEndpointTest, RepeatedInvalidationSucceeds) {
    EXPECT_EQ(invalidate(R"({"prefix": "Employees"})").result(), http::status::no_content);
    EXPECT_EQ(invalidate(R"({"prefix": "Employees"})").result(), http::status::no_content);
}

// ==================== Other routes ====================

TEST_F(AdminEndpointTest, StatsReturnsMetrics) {
    auto response = endpoint_->handle(make_request(http::verb::get, "/cache/stats"));

    EXPECT_EQ(response.result(), http::status::ok);
    auto body = nlohmann::json::parse(response.body());
    EXPECT_TRUE(body.is_object());
}

TEST_F(AdminEndpointTest, UnknownRouteIsNotFound) {
    EXPECT_EQ(endpoint_->handle(make_request(http::verb::get, "/cache/invalidate")).result(),
              http::status::not_found);
    EXPECT_EQ(endpoint_->handle(make_request(http::verb::post, "/elsewhere", "{}")).result(),
              http::status::not_found);
}
