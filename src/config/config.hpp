/**
 * QueryCache - Prefix-invalidating query cache
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (QUERYCACHE_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 *
 * Cache operations never hold on to a Config: they ask a SettingsProvider
 * for a fresh CachingSettings snapshot per call, so a reload can never be
 * observed half-applied.
 */

#ifndef QUERYCACHE_CONFIG_CONFIG_HPP
#define QUERYCACHE_CONFIG_CONFIG_HPP

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace querycache::config {

/**
 * Backend names accepted by CachingSettings::provider
 */
namespace providers {
    constexpr std::string_view Memory = "Memory";
    constexpr std::string_view Distributed = "Distributed";
}

inline constexpr std::string_view kDefaultStatusHeaderName = "X-Cache-Status";

/**
 * How cache keys are exposed to diagnostics output
 */
enum class KeyDisplayMode {
    Raw,
    Hash
};

std::string_view to_string(KeyDisplayMode mode);
std::optional<KeyDisplayMode> parse_key_display_mode(std::string_view value);

/**
 * Case-insensitive ordering used for endpoint names
 */
struct CaseInsensitiveLess {
    using is_transparent = void;
    bool operator()(std::string_view lhs, std::string_view rhs) const;
};

bool iequals(std::string_view lhs, std::string_view rhs);

/**
 * Per-endpoint TTL override
 */
struct EndpointCacheSettings {
    std::optional<int> absolute_ttl_seconds;
    std::optional<int> sliding_ttl_seconds;

    bool operator==(const EndpointCacheSettings&) const = default;
};

struct MemoryProviderSettings {
    std::optional<int> size_limit_mb;

    bool operator==(const MemoryProviderSettings&) const = default;
};

struct DistributedProviderSettings {
    std::optional<std::string> connection_string;
    int index_key_ttl_seconds{600};

    bool operator==(const DistributedProviderSettings&) const = default;
};

struct ProviderSettings {
    MemoryProviderSettings memory;
    DistributedProviderSettings distributed;

    bool operator==(const ProviderSettings&) const = default;
};

struct DiagnosticsSettings {
    bool emit_cache_status_header{false};
    std::string header_name{kDefaultStatusHeaderName};
    KeyDisplayMode key_display_mode{KeyDisplayMode::Raw};

    bool operator==(const DiagnosticsSettings&) const = default;
};

using EndpointMap = std::map<std::string, EndpointCacheSettings, CaseInsensitiveLess>;

/**
 * Caching configuration snapshot
 */
struct CachingSettings {
    bool enabled{false};
    bool disable_cache{false};               // Hard kill switch, overrides enabled
    int default_cache_duration_seconds{60};
    std::string provider{providers::Memory};
    std::string key_prefix{"app"};
    std::string payload_format{"json"};     // json, cbor or msgpack
    ProviderSettings provider_settings;
    EndpointMap per_endpoint;                // "" is the default entry
    DiagnosticsSettings diagnostics;

    /**
     * True when reads and writes should reach the store at all
     */
    bool is_active() const { return enabled && !disable_cache; }

    bool operator==(const CachingSettings&) const = default;
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};

    util::LogConfig to_log_config() const;

    bool operator==(const LogSettings&) const = default;
};

/**
 * Complete application configuration
 */
struct Config {
    CachingSettings caching;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     */
    void validate() const;

    bool operator==(const Config&) const = default;
};

/**
 * Source of caching settings snapshots
 */
class SettingsProvider {
public:
    virtual ~SettingsProvider() = default;

    /**
     * Current settings, copied so the caller owns an immutable view
     */
    virtual CachingSettings snapshot() const = 0;
};

/**
 * Settings provider holding a value set in code (embedding, tests)
 */
class StaticSettingsProvider : public SettingsProvider {
public:
    explicit StaticSettingsProvider(CachingSettings settings = {});

    CachingSettings snapshot() const override;

    /**
     * Replace the settings; later snapshots observe the new value
     */
    void update(CachingSettings settings);

private:
    mutable std::mutex mutex_;
    CachingSettings settings_;
};

/**
 * Configuration reload callback type
 */
using ConfigReloadCallback = std::function<void(const Config&)>;

/**
 * Configuration manager - handles loading, parsing, and hot-reload
 */
class ConfigManager : public SettingsProvider {
public:
    ConfigManager();
    ~ConfigManager() override;

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws std::runtime_error on configuration errors
     */
    bool load(int argc, char* argv[]);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    CachingSettings snapshot() const override;

    /**
     * Reload configuration from file.
     * Keeps the previous configuration if the new one fails to parse or validate.
     */
    void reload();

    /**
     * Register callback for configuration reload events
     */
    void on_reload(ConfigReloadCallback callback);

    std::filesystem::path get_config_path() const;

    /**
     * Arguments that are not options (commands and their operands)
     */
    std::vector<std::string> positional_args() const;

    static void print_help(const char* program_name);

private:
    void load_from_file(const std::filesystem::path& path);
    void apply_environment_overrides();
    void apply_cli_overrides(int argc, char* argv[]);
    void reapply_cli_overrides();

    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
    std::vector<ConfigReloadCallback> reload_callbacks_;
    std::vector<std::string> positional_;

    // CLI overrides (stored to preserve precedence on reload)
    std::optional<std::string> cli_provider_;
    std::optional<std::string> cli_key_prefix_;
    std::optional<std::string> cli_redis_;
    std::optional<std::string> cli_log_level_;
};

// JSON serialization support
void to_json(nlohmann::json& j, const EndpointCacheSettings& e);
void from_json(const nlohmann::json& j, EndpointCacheSettings& e);
void to_json(nlohmann::json& j, const ProviderSettings& p);
void from_json(const nlohmann::json& j, ProviderSettings& p);
void to_json(nlohmann::json& j, const DiagnosticsSettings& d);
void from_json(const nlohmann::json& j, DiagnosticsSettings& d);
void to_json(nlohmann::json& j, const CachingSettings& c);
void from_json(const nlohmann::json& j, CachingSettings& c);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace querycache::config

#endif // QUERYCACHE_CONFIG_CONFIG_HPP
