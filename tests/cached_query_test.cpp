#include <gtest/gtest.h>

#include "cache/cached_query.hpp"
#include "cache/memory_cache_store.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Get-or-compute wrapper
 */

using namespace querycache;
using namespace std::chrono_literals;

namespace {

struct Report {
    std::string kind;
    std::optional<std::chrono::milliseconds> duration;
};

class RecordingPublisher : public diagnostics::DiagnosticsPublisher {
public:
    void report_hit(std::string_view, std::optional<std::chrono::milliseconds> remaining) override {
        reports.push_back({"HIT", remaining});
    }
    void report_miss(std::string_view, std::optional<std::chrono::milliseconds> ttl) override {
        reports.push_back({"MISS", ttl});
    }

    std::vector<Report> reports;
};

config::CachingSettings enabled_settings() {
    config::CachingSettings settings;
    settings.enabled = true;
    settings.default_cache_duration_seconds = 60;
    settings.per_endpoint["Employees:GetAll"] = {120, std::nullopt};
    return settings;
}

class CachedQueryTest : public ::testing::Test {
protected:
    config::StaticSettingsProvider settings_{enabled_settings()};
    cache::MemoryCacheStore store_{settings_, std::make_shared<cache::LruStore>()};
    RecordingPublisher publisher_;
};

} // namespace

// ==================== Hit and miss ====================

TEST_F(CachedQueryTest, ComputesOnceThenHits) {
    int calls = 0;
    auto compute = [&]() { ++calls; return std::vector<std::string>{"smith", "jones"}; };

    auto first = cache::get_or_compute(store_, "Employees:GetAll", "Employees:GetAll:page=1", compute, &publisher_);
    auto second = cache::get_or_compute(store_, "Employees:GetAll", "Employees:GetAll:page=1", compute, &publisher_);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(first, second);
    ASSERT_EQ(publisher_.reports.size(), 2u);
    EXPECT_EQ(publisher_.reports[0].kind, "MISS");
    EXPECT_EQ(publisher_.reports[0].duration, std::chrono::milliseconds(120s));
    EXPECT_EQ(publisher_.reports[1].kind, "HIT");
    ASSERT_TRUE(publisher_.reports[1].duration.has_value());
    EXPECT_LE(*publisher_.reports[1].duration, 120s);
}

TEST_F(CachedQueryTest, WorksWithoutPublisher) {
    auto value = cache::get_or_compute(store_, "", "Departments:page=1", [] { return 5; });

    EXPECT_EQ(value, 5);
    EXPECT_EQ(store_.get<int>("Departments:page=1"), 5);
}

// ==================== Unsuccessful results ====================

TEST_F(CachedQueryTest, EmptyOptionalIsNotCached) {
    int calls = 0;
    auto compute = [&]() -> std::optional<int> { ++calls; return std::nullopt; };

    EXPECT_FALSE(cache::get_or_compute(store_, "", "Employees:id=9", compute, &publisher_).has_value());
    EXPECT_FALSE(cache::get_or_compute(store_, "", "Employees:id=9", compute, &publisher_).has_value());

    EXPECT_EQ(calls, 2);
    EXPECT_TRUE(publisher_.reports.empty());
}

TEST_F(CachedQueryTest, FilledOptionalIsCached) {
    auto compute = []() -> std::optional<int> { return 7; };

    EXPECT_EQ(cache::get_or_compute(store_, "", "Employees:id=7", compute), 7);
    EXPECT_EQ(store_.get<int>("Employees:id=7"), 7);

    auto again = cache::get_or_compute(store_, "", "Employees:id=7",
                                       []() -> std::optional<int> { return std::nullopt; });
    EXPECT_EQ(again, 7);
}

TEST_F(CachedQueryTest, ComputeFailurePropagatesAndCachesNothing) {
    auto failing = []() -> int { throw std::runtime_error("database down"); };

    EXPECT_THROW(cache::get_or_compute(store_, "", "Employees:page=1", failing, &publisher_), std::runtime_error);
    EXPECT_FALSE(store_.get<int>("Employees:page=1").has_value());
    EXPECT_TRUE(publisher_.reports.empty());
}

// ==================== Disabled ====================

TEST_F(CachedQueryTest, DisabledAlwaysComputes) {
    auto disabled = enabled_settings();
    disabled.enabled = false;
    settings_.update(disabled);

    int calls = 0;
    auto compute = [&]() { return ++calls; };
    cache::get_or_compute(store_, "", "Employees:page=1", compute, &publisher_);
    cache::get_or_compute(store_, "", "Employees:page=1", compute, &publisher_);

    EXPECT_EQ(calls, 2);
    ASSERT_EQ(publisher_.reports.size(), 2u);
    EXPECT_EQ(publisher_.reports[0].kind, "MISS");
    EXPECT_FALSE(publisher_.reports[0].duration.has_value());
}

TEST_F(CachedQueryTest, BypassAlwaysComputes) {
    cache::CallContext ctx;
    ctx.bypass.enable("debug");

    int calls = 0;
    auto compute = [&]() { return ++calls; };
    cache::get_or_compute(store_, "", "Employees:page=1", compute, nullptr, ctx);
    cache::get_or_compute(store_, "", "Employees:page=1", compute, nullptr, ctx);

    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(store_.get<int>("Employees:page=1").has_value());
}
