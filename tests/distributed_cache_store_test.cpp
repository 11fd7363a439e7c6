#include <gtest/gtest.h>

#include "cache/distributed_cache_store.hpp"
#include "fake_remote_store.hpp"
#include "util/metrics.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <thread>
#include <vector>

/**
 * Remote backend: envelope, prefix index and catalog lists, degradation
 */

using namespace querycache;
using namespace std::chrono_literals;

namespace {

config::CachingSettings enabled_settings() {
    config::CachingSettings settings;
    settings.enabled = true;
    settings.provider = config::providers::Distributed;
    settings.key_prefix = "app";
    settings.provider_settings.distributed.index_key_ttl_seconds = 600;
    return settings;
}

const cache::CacheEntryOptions kMinute{60s, std::nullopt};

class DistributedCacheStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        remote_ = std::make_shared<fakes::FakeRemoteStore>();
        store_ = std::make_unique<cache::DistributedCacheStore>(settings_, remote_);
    }

    config::StaticSettingsProvider settings_{enabled_settings()};
    std::shared_ptr<fakes::FakeRemoteStore> remote_;
    std::unique_ptr<cache::DistributedCacheStore> store_;
};

} // namespace

// ==================== Construction ====================

TEST(DistributedCacheStoreConstructionTest, RequiresRemoteStore) {
    config::StaticSettingsProvider settings(enabled_settings());

    EXPECT_THROW(cache::DistributedCacheStore(settings, nullptr), std::invalid_argument);
}

// ==================== Round trip ====================

TEST_F(DistributedCacheStoreTest, SetThenGet) {
    store_->set("Employees:page=1:size=10:last=smith", std::vector<int>{1, 2, 3}, kMinute);

    auto cached = store_->get<std::vector<int>>("Employees:page=1:size=10:last=smith");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(*cached, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(remote_->contains("app:Employees:page=1:size=10:last=smith"));
}

TEST_F(DistributedCacheStoreTest, RemainingLifetimeIsReported) {
    store_->set("Employees:page=1", 1, kMinute);

    auto hit = store_->lookup<int>("Employees:page=1");
    ASSERT_TRUE(hit.has_value());
    ASSERT_TRUE(hit->remaining.has_value());
    EXPECT_GT(*hit->remaining, 55s);
    EXPECT_LE(*hit->remaining, 60s);
}

TEST_F(DistributedCacheStoreTest, EntryTtlIsAbsoluteTtl) {
    store_->set("Employees:page=1", 1, kMinute);

    EXPECT_EQ(remote_->last_set_ttl("app:Employees:page=1"), std::chrono::milliseconds(60s));
}

TEST_F(DistributedCacheStoreTest, SlidingEntryRefreshedOnRead) {
    store_->set("Employees:page=1", 1, cache::CacheEntryOptions{60s, 10s});
    EXPECT_EQ(remote_->last_set_ttl("app:Employees:page=1"), std::chrono::milliseconds(10s));

    auto hit = store_->lookup<int>("Employees:page=1");
    ASSERT_TRUE(hit.has_value());
    EXPECT_LE(*hit->remaining, 10s);

    auto calls = remote_->expire_calls();
    auto refresh = std::find_if(calls.begin(), calls.end(),
                                [](const auto& call) { return call.first == "app:Employees:page=1"; });
    ASSERT_NE(refresh, calls.end());
    EXPECT_EQ(refresh->second, *hit->remaining);
}

TEST_F(DistributedCacheStoreTest, BinaryCodec) {
    cache::DistributedCacheStore cbor_store(settings_, remote_, cache::make_codec(cache::PayloadFormat::Cbor));
    cbor_store.set("Employees:page=1", std::string("smith"), kMinute);

    auto cached = cbor_store.get<std::string>("Employees:page=1");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(*cached, "smith");

    // The JSON-configured store cannot read CBOR bytes and treats them as a miss
    EXPECT_FALSE(store_->get<std::string>("Employees:page=1").has_value());
}

// ==================== Malformed payloads ====================

TEST_F(DistributedCacheStoreTest, GarbagePayloadIsMiss) {
    auto before = util::Metrics::instance().snapshot();
    remote_->put_raw("app:Employees:page=1", "\x01garbage", 60s);

    EXPECT_FALSE(store_->get<int>("Employees:page=1").has_value());
    EXPECT_EQ(util::Metrics::instance().snapshot().decode_failures - before.decode_failures, 1u);
}

TEST_F(DistributedCacheStoreTest, InvalidUtf8ValueIsNotCached) {
    auto before = util::Metrics::instance().snapshot();

    store_->set("Employees:last=x", std::string("smith\xff\xfe"), kMinute);

    EXPECT_EQ(util::Metrics::instance().snapshot().encode_failures - before.encode_failures, 1u);
    EXPECT_EQ(remote_->size(), 0u);
    EXPECT_FALSE(store_->get<std::string>("Employees:last=x").has_value());
}

TEST_F(DistributedCacheStoreTest, UnlistableKeyIsNotLeftBehind) {
    auto before = util::Metrics::instance().snapshot();

    store_->set("Employees:last=\xff", 1, kMinute);

    EXPECT_EQ(util::Metrics::instance().snapshot().encode_failures - before.encode_failures, 1u);
    EXPECT_EQ(remote_->size(), 0u);
}

TEST_F(DistributedCacheStoreTest, PayloadWithoutEnvelopeIsMiss) {
    remote_->put_raw("app:Employees:page=1", R"({"x": 1})", 60s);

    EXPECT_FALSE(store_->get<int>("Employees:page=1").has_value());
}

TEST_F(DistributedCacheStoreTest, EnvelopePastExpiryIsMiss) {
    remote_->put_raw("app:Employees:page=1", R"({"v": 1, "exp": 1000})", 60s);

    EXPECT_FALSE(store_->get<int>("Employees:page=1").has_value());
}

// ==================== Prefix index and catalog ====================

TEST_F(DistributedCacheStoreTest, WritesMaintainIndexAndCatalog) {
    store_->set("Employees:page=1", 1, kMinute);
    store_->set("Employees:page=2", 2, kMinute);
    store_->set("Departments:page=1", 3, kMinute);

    EXPECT_EQ(store_->tracked_keys("Employees"),
              (std::vector<std::string>{"app:Employees:page=1", "app:Employees:page=2"}));
    EXPECT_EQ(store_->catalog(), (std::vector<std::string>{"app:Employees", "app:Departments"}));
}

TEST_F(DistributedCacheStoreTest, RewriteDoesNotDuplicateIndexMember) {
    store_->set("Employees:page=1", 1, kMinute);
    store_->set("Employees:page=1", 2, kMinute);

    EXPECT_EQ(store_->tracked_keys("Employees"), std::vector<std::string>{"app:Employees:page=1"});
    EXPECT_EQ(store_->catalog(), std::vector<std::string>{"app:Employees"});
}

TEST_F(DistributedCacheStoreTest, IndexTtlIsAtLeastIndexSetting) {
    store_->set("Employees:page=1", 1, kMinute);

    EXPECT_EQ(remote_->last_set_ttl("app:Employees:__index"), std::chrono::milliseconds(600s));
    EXPECT_EQ(remote_->last_set_ttl("app:__prefix_catalog"), std::chrono::milliseconds(600s));
}

TEST_F(DistributedCacheStoreTest, IndexTtlStretchesToLongEntries) {
    store_->set("Employees:page=1", 1, cache::CacheEntryOptions{900s, std::nullopt});

    EXPECT_EQ(remote_->last_set_ttl("app:Employees:__index"), std::chrono::milliseconds(900s));
}

TEST_F(DistributedCacheStoreTest, ExistingIndexExtendedForLongerEntry) {
    store_->set("Employees:page=1", 1, kMinute);
    store_->set("Employees:page=1", 1, cache::CacheEntryOptions{900s, std::nullopt});

    auto calls = remote_->expire_calls();
    auto extended = std::find_if(calls.begin(), calls.end(), [](const auto& call) {
        return call.first == "app:Employees:__index" && call.second == std::chrono::milliseconds(900s);
    });
    EXPECT_NE(extended, calls.end());
    auto remaining = remote_->ttl("app:Employees:__index");
    ASSERT_TRUE(remaining.has_value());
    EXPECT_GT(*remaining, 800s);
}

TEST_F(DistributedCacheStoreTest, UnreadableIndexCountsAsEmpty) {
    remote_->put_raw("app:Employees:__index", "not a list", 60s);

    EXPECT_TRUE(store_->tracked_keys("Employees").empty());
    EXPECT_NO_THROW(store_->remove_by_prefix("Employees"));
}

// ==================== Removal ====================

TEST_F(DistributedCacheStoreTest, RemoveLastKeyDropsIndexAndCatalog) {
    store_->set("Employees:page=1", 1, kMinute);
    store_->remove("Employees:page=1");

    EXPECT_FALSE(store_->get<int>("Employees:page=1").has_value());
    EXPECT_FALSE(remote_->contains("app:Employees:__index"));
    EXPECT_FALSE(remote_->contains("app:__prefix_catalog"));
}

TEST_F(DistributedCacheStoreTest, RemoveKeepsSiblingsListed) {
    store_->set("Employees:page=1", 1, kMinute);
    store_->set("Employees:page=2", 2, kMinute);
    store_->remove("Employees:page=1");

    EXPECT_EQ(store_->tracked_keys("Employees"), std::vector<std::string>{"app:Employees:page=2"});
    EXPECT_EQ(store_->catalog(), std::vector<std::string>{"app:Employees"});
}

TEST_F(DistributedCacheStoreTest, RemoveByPrefixDropsFamily) {
    store_->set("Employees:page=1", 1, kMinute);
    store_->set("Employees:page=2", 2, kMinute);
    store_->set("Departments:page=1", 3, kMinute);

    store_->remove_by_prefix("Employees");

    EXPECT_FALSE(store_->get<int>("Employees:page=1").has_value());
    EXPECT_FALSE(store_->get<int>("Employees:page=2").has_value());
    EXPECT_TRUE(store_->get<int>("Departments:page=1").has_value());
    EXPECT_FALSE(remote_->contains("app:Employees:__index"));
    EXPECT_EQ(store_->catalog(), std::vector<std::string>{"app:Departments"});

    EXPECT_NO_THROW(store_->remove_by_prefix("Employees"));
}

TEST_F(DistributedCacheStoreTest, EmptyPrefixClearsNamespace) {
    store_->set("Employees:page=1", 1, kMinute);
    store_->set("Departments:page=1", 2, kMinute);

    store_->remove_by_prefix("");

    EXPECT_EQ(remote_->size(), 0u);
    EXPECT_TRUE(store_->catalog().empty());
}

TEST_F(DistributedCacheStoreTest, OtherNamespaceUntouched) {
    auto other_settings = enabled_settings();
    other_settings.key_prefix = "other";
    config::StaticSettingsProvider other_provider(other_settings);
    cache::DistributedCacheStore other(other_provider, remote_);

    other.set("Employees:page=1", 9, kMinute);
    store_->set("Employees:page=1", 1, kMinute);
    store_->remove_by_prefix("");

    EXPECT_TRUE(other.get<int>("Employees:page=1").has_value());
}

// ==================== Degradation ====================

TEST_F(DistributedCacheStoreTest, UnavailableStoreDegrades) {
    store_->set("Employees:page=1", 1, kMinute);
    auto before = util::Metrics::instance().snapshot();
    remote_->set_available(false);

    EXPECT_FALSE(store_->get<int>("Employees:page=1").has_value());
    store_->set("Employees:page=2", 2, kMinute);
    store_->remove("Employees:page=1");
    store_->remove_by_prefix("Employees");
    store_->remove_by_prefix("");
    EXPECT_TRUE(store_->catalog().empty());

    auto after = util::Metrics::instance().snapshot();
    EXPECT_GE(after.store_failures - before.store_failures, 5u);
    EXPECT_EQ(after.writes, before.writes);

    remote_->set_available(true);
    EXPECT_TRUE(store_->get<int>("Employees:page=1").has_value());
}

TEST_F(DistributedCacheStoreTest, DisabledCachingSkipsRemote) {
    auto disabled = enabled_settings();
    disabled.enabled = false;
    settings_.update(disabled);

    store_->set("Employees:page=1", 1, kMinute);
    EXPECT_EQ(remote_->size(), 0u);
}

// ==================== Concurrency ====================

TEST_F(DistributedCacheStoreTest, ConcurrentSetsLastWriterWins) {
    std::thread a([&]() {
        for (int i = 0; i < 100; ++i) store_->set("Employees:page=1", std::string("alpha"), kMinute);
    });
    std::thread b([&]() {
        for (int i = 0; i < 100; ++i) store_->set("Employees:page=1", std::string("bravo"), kMinute);
    });
    a.join();
    b.join();

    auto cached = store_->get<std::string>("Employees:page=1");
    ASSERT_TRUE(cached.has_value());
    EXPECT_TRUE(*cached == "alpha" || *cached == "bravo");
}
