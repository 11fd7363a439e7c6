#include <gtest/gtest.h>

#include "config/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

/**
 * Configuration: JSON schema, validation, precedence, reload
 */

using namespace querycache;

namespace {

class ArgList {
public:
    ArgList(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& content) {
        path_ = std::filesystem::temp_directory_path() /
                ("querycache_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
        write(content);
    }

    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void write(const std::string& content) {
        std::ofstream out(path_, std::ios::trunc);
        out << content;
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

// ==================== Defaults and validation ====================

TEST(ConfigTest, DefaultsAreValid) {
    config::Config config;

    EXPECT_NO_THROW(config.validate());
    EXPECT_FALSE(config.caching.enabled);
    EXPECT_FALSE(config.caching.is_active());
    EXPECT_EQ(config.caching.default_cache_duration_seconds, 60);
    EXPECT_EQ(config.caching.key_prefix, "app");
    EXPECT_EQ(config.caching.provider_settings.distributed.index_key_ttl_seconds, 600);
    EXPECT_EQ(config.caching.diagnostics.header_name, "X-Cache-Status");
    EXPECT_EQ(config.caching.diagnostics.key_display_mode, config::KeyDisplayMode::Raw);
}

TEST(ConfigTest, KillSwitchOverridesEnabled) {
    config::CachingSettings settings;
    settings.enabled = true;
    EXPECT_TRUE(settings.is_active());

    settings.disable_cache = true;
    EXPECT_FALSE(settings.is_active());
}

TEST(ConfigTest, RejectsInvalidValues) {
    config::Config config;
    config.caching.provider = "Disk";
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = {};
    config.caching.provider = "distributed";
    EXPECT_THROW(config.validate(), std::runtime_error);
    config.caching.provider_settings.distributed.connection_string = "localhost:6379";
    EXPECT_NO_THROW(config.validate());

    config = {};
    config.caching.key_prefix.clear();
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = {};
    config.caching.payload_format = "xml";
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = {};
    config.caching.provider_settings.memory.size_limit_mb = -1;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = {};
    config.logging.level = "loud";
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(ConfigTest, ShortIndexTtlOnlyWarns) {
    config::Config config;
    config.caching.default_cache_duration_seconds = 900;
    config.caching.provider_settings.distributed.index_key_ttl_seconds = 60;

    EXPECT_NO_THROW(config.validate());
}

// ==================== JSON ====================

TEST(ConfigTest, ParsesJsonDocument) {
    auto j = nlohmann::json::parse(R"({
        "caching": {
            "enabled": true,
            "provider": "Distributed",
            "key_prefix": "hr",
            "provider_settings": {
                "memory": {"size_limit_mb": 64},
                "distributed": {"connection_string": "redis:6380", "index_key_ttl_seconds": 900}
            },
            "per_endpoint": {
                "Employees:GetAll": {"absolute_ttl_seconds": 120, "sliding_ttl_seconds": 30}
            },
            "diagnostics": {"emit_cache_status_header": true, "key_display_mode": "hash"}
        },
        "logging": {"level": "debug"}
    })");

    auto config = j.get<config::Config>();

    EXPECT_TRUE(config.caching.enabled);
    EXPECT_EQ(config.caching.provider, "Distributed");
    EXPECT_EQ(config.caching.key_prefix, "hr");
    EXPECT_EQ(config.caching.provider_settings.memory.size_limit_mb, 64);
    EXPECT_EQ(config.caching.provider_settings.distributed.connection_string, "redis:6380");
    EXPECT_EQ(config.caching.provider_settings.distributed.index_key_ttl_seconds, 900);
    EXPECT_EQ(config.caching.diagnostics.key_display_mode, config::KeyDisplayMode::Hash);
    EXPECT_EQ(config.logging.level, "debug");
    // Untouched fields keep their defaults
    EXPECT_EQ(config.caching.default_cache_duration_seconds, 60);
    EXPECT_EQ(config.caching.payload_format, "json");

    auto endpoint = config.caching.per_endpoint.find("employees:getall");
    ASSERT_TRUE(endpoint != config.caching.per_endpoint.end());
    EXPECT_EQ(endpoint->second.absolute_ttl_seconds, 120);
    EXPECT_EQ(endpoint->second.sliding_ttl_seconds, 30);
}

TEST(ConfigTest, JsonRoundTripPreservesSettings) {
    config::Config config;
    config.caching.enabled = true;
    config.caching.per_endpoint["Reports"] = {300, std::nullopt};
    config.caching.diagnostics.key_display_mode = config::KeyDisplayMode::Hash;

    nlohmann::json j = config;
    EXPECT_EQ(j.get<config::Config>(), config);
}

TEST(ConfigTest, UnknownDisplayModeRejected) {
    auto j = nlohmann::json::parse(R"({"caching": {"diagnostics": {"key_display_mode": "Masked"}}})");

    EXPECT_THROW(j.get<config::Config>(), std::runtime_error);
}

// ==================== ConfigManager ====================

TEST(ConfigManagerTest, LoadsFileAndCollectsCommands) {
    TempConfigFile file(R"({"caching": {"enabled": true, "key_prefix": "file"}})");
    ArgList args{"querycache-ctl", "--config", file.path(), "invalidate-prefix", "Employees"};

    config::ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    EXPECT_TRUE(manager.snapshot().enabled);
    EXPECT_EQ(manager.snapshot().key_prefix, "file");
    EXPECT_EQ(manager.positional_args(), (std::vector<std::string>{"invalidate-prefix", "Employees"}));
}

TEST(ConfigManagerTest, PrecedenceCliOverEnvOverFile) {
    TempConfigFile file(R"({"caching": {"key_prefix": "file", "default_cache_duration_seconds": 10}})");
    ScopedEnv prefix("QUERYCACHE_KEY_PREFIX", "env");
    ScopedEnv ttl("QUERYCACHE_CACHE_TTL", "30");
    ArgList args{"querycache-ctl", "--config=" + file.path(), "--key-prefix", "cli"};

    config::ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    auto settings = manager.snapshot();
    EXPECT_EQ(settings.key_prefix, "cli");
    EXPECT_EQ(settings.default_cache_duration_seconds, 30);
}

TEST(ConfigManagerTest, BadEnvironmentNumberFails) {
    ScopedEnv ttl("QUERYCACHE_CACHE_TTL", "soon");
    ArgList args{"querycache-ctl"};

    config::ConfigManager manager;
    EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
}

TEST(ConfigManagerTest, UnknownOptionFails) {
    ArgList args{"querycache-ctl", "--verbose"};

    config::ConfigManager manager;
    EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
}

TEST(ConfigManagerTest, HelpStopsLoading) {
    ArgList args{"querycache-ctl", "--help"};

    config::ConfigManager manager;
    EXPECT_FALSE(manager.load(args.argc(), args.argv()));
}

TEST(ConfigManagerTest, ReloadNotifiesAndKeepsCliOverrides) {
    TempConfigFile file(R"({"caching": {"enabled": false}})");
    ArgList args{"querycache-ctl", "-c", file.path(), "--key-prefix", "cli"};

    config::ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    int notified = 0;
    manager.on_reload([&](const config::Config& updated) {
        ++notified;
        EXPECT_TRUE(updated.caching.enabled);
    });

    file.write(R"({"caching": {"enabled": true, "key_prefix": "file"}})");
    manager.reload();

    EXPECT_EQ(notified, 1);
    EXPECT_TRUE(manager.snapshot().enabled);
    EXPECT_EQ(manager.snapshot().key_prefix, "cli");
}

TEST(ConfigManagerTest, FailedReloadKeepsPreviousConfig) {
    TempConfigFile file(R"({"caching": {"enabled": true}})");
    ArgList args{"querycache-ctl", "-c", file.path()};

    config::ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    file.write(R"({"caching": {"provider": "Disk"}})");
    manager.reload();
    EXPECT_TRUE(manager.snapshot().enabled);
    EXPECT_EQ(manager.snapshot().provider, "Memory");

    file.write("{ not json");
    manager.reload();
    EXPECT_TRUE(manager.snapshot().enabled);
}

TEST(ConfigManagerTest, MissingFileFails) {
    ArgList args{"querycache-ctl", "--config", "/nonexistent/querycache.json"};

    config::ConfigManager manager;
    EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
}

// ==================== Static provider ====================

TEST(ConfigTest, StaticProviderSnapshotsAreCopies) {
    config::StaticSettingsProvider provider;
    auto snapshot = provider.snapshot();

    auto updated = snapshot;
    updated.enabled = true;
    provider.update(updated);

    EXPECT_FALSE(snapshot.enabled);
    EXPECT_TRUE(provider.snapshot().enabled);
}
