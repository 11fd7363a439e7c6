/**
 * QueryCache - Prefix-invalidating query cache
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace querycache::config {

namespace {

template<typename T>
void read_optional(const nlohmann::json& j, const char* name, std::optional<T>& out) {
    if (!j.contains(name)) return;
    const auto& value = j.at(name);
    if (value.is_null()) {
        out.reset();
    } else {
        out = value.get<T>();
    }
}

template<typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

bool parse_bool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower == "true" || lower == "1" || lower == "yes";
}

int parse_int(const std::string& name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + name + " value: " + value);
    }
}

} // namespace

std::string_view to_string(KeyDisplayMode mode) {
    switch (mode) {
        case KeyDisplayMode::Raw:  return "Raw";
        case KeyDisplayMode::Hash: return "Hash";
    }
    return "Raw";
}

std::optional<KeyDisplayMode> parse_key_display_mode(std::string_view value) {
    if (iequals(value, "Raw")) return KeyDisplayMode::Raw;
    if (iequals(value, "Hash")) return KeyDisplayMode::Hash;
    return std::nullopt;
}

bool CaseInsensitiveLess::operator()(std::string_view lhs, std::string_view rhs) const {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
}

bool iequals(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                      [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
}

// JSON serialization implementations
void to_json(nlohmann::json& j, const EndpointCacheSettings& e) {
    j = nlohmann::json{
        {"absolute_ttl_seconds", optional_to_json(e.absolute_ttl_seconds)},
        {"sliding_ttl_seconds", optional_to_json(e.sliding_ttl_seconds)}
    };
}

void from_json(const nlohmann::json& j, EndpointCacheSettings& e) {
    read_optional(j, "absolute_ttl_seconds", e.absolute_ttl_seconds);
    read_optional(j, "sliding_ttl_seconds", e.sliding_ttl_seconds);
}

void to_json(nlohmann::json& j, const ProviderSettings& p) {
    j = nlohmann::json{
        {"memory", {
            {"size_limit_mb", optional_to_json(p.memory.size_limit_mb)}
        }},
        {"distributed", {
            {"connection_string", optional_to_json(p.distributed.connection_string)},
            {"index_key_ttl_seconds", p.distributed.index_key_ttl_seconds}
        }}
    };
}

void from_json(const nlohmann::json& j, ProviderSettings& p) {
    if (j.contains("memory")) {
        read_optional(j.at("memory"), "size_limit_mb", p.memory.size_limit_mb);
    }
    if (j.contains("distributed")) {
        const auto& d = j.at("distributed");
        read_optional(d, "connection_string", p.distributed.connection_string);
        if (d.contains("index_key_ttl_seconds")) d.at("index_key_ttl_seconds").get_to(p.distributed.index_key_ttl_seconds);
    }
}

void to_json(nlohmann::json& j, const DiagnosticsSettings& d) {
    j = nlohmann::json{
        {"emit_cache_status_header", d.emit_cache_status_header},
        {"header_name", d.header_name},
        {"key_display_mode", std::string(to_string(d.key_display_mode))}
    };
}

void from_json(const nlohmann::json& j, DiagnosticsSettings& d) {
    if (j.contains("emit_cache_status_header")) j.at("emit_cache_status_header").get_to(d.emit_cache_status_header);
    if (j.contains("header_name")) j.at("header_name").get_to(d.header_name);
    if (j.contains("key_display_mode")) {
        auto text = j.at("key_display_mode").get<std::string>();
        auto mode = parse_key_display_mode(text);
        if (!mode) {
            throw std::runtime_error("Configuration error: unknown diagnostics.key_display_mode '" + text + "'");
        }
        d.key_display_mode = *mode;
    }
}

void to_json(nlohmann::json& j, const CachingSettings& c) {
    nlohmann::json endpoints = nlohmann::json::object();
    for (const auto& [name, endpoint] : c.per_endpoint) {
        endpoints[name] = endpoint;
    }

    j = nlohmann::json{
        {"enabled", c.enabled},
        {"disable_cache", c.disable_cache},
        {"default_cache_duration_seconds", c.default_cache_duration_seconds},
        {"provider", c.provider},
        {"key_prefix", c.key_prefix},
        {"payload_format", c.payload_format},
        {"provider_settings", c.provider_settings},
        {"per_endpoint", endpoints},
        {"diagnostics", c.diagnostics}
    };
}

void from_json(const nlohmann::json& j, CachingSettings& c) {
    if (j.contains("enabled")) j.at("enabled").get_to(c.enabled);
    if (j.contains("disable_cache")) j.at("disable_cache").get_to(c.disable_cache);
    if (j.contains("default_cache_duration_seconds")) j.at("default_cache_duration_seconds").get_to(c.default_cache_duration_seconds);
    if (j.contains("provider")) j.at("provider").get_to(c.provider);
    if (j.contains("key_prefix")) j.at("key_prefix").get_to(c.key_prefix);
    if (j.contains("payload_format")) j.at("payload_format").get_to(c.payload_format);
    if (j.contains("provider_settings")) j.at("provider_settings").get_to(c.provider_settings);
    if (j.contains("per_endpoint")) {
        c.per_endpoint.clear();
        for (const auto& [name, value] : j.at("per_endpoint").items()) {
            c.per_endpoint[name] = value.get<EndpointCacheSettings>();
        }
    }
    if (j.contains("diagnostics")) j.at("diagnostics").get_to(c.diagnostics);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"caching", c.caching},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("caching")) j.at("caching").get_to(c.caching);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

util::LogConfig LogSettings::to_log_config() const {
    util::LogConfig log_config;
    log_config.level = util::Logger::parse_level(level).value_or(util::LogLevel::Info);
    log_config.file_path = file;
    log_config.max_file_size_mb = max_file_size_mb;
    log_config.max_files = max_files;
    log_config.enable_console = enable_console;
    log_config.enable_colors = enable_colors;
    return log_config;
}

// Config validation
void Config::validate() const {
    const bool memory = iequals(caching.provider, providers::Memory);
    const bool distributed = iequals(caching.provider, providers::Distributed);
    if (!memory && !distributed) {
        throw std::runtime_error("Configuration error: caching.provider must be 'Memory' or 'Distributed', got '" +
                                 caching.provider + "'");
    }

    if (caching.key_prefix.empty()) {
        throw std::runtime_error("Configuration error: caching.key_prefix cannot be empty");
    }

    if (!iequals(caching.payload_format, "json") && !iequals(caching.payload_format, "cbor") &&
        !iequals(caching.payload_format, "msgpack")) {
        throw std::runtime_error("Configuration error: caching.payload_format must be json, cbor or msgpack, got '" +
                                 caching.payload_format + "'");
    }

    if (distributed) {
        const auto& connection = caching.provider_settings.distributed.connection_string;
        if (!connection || connection->empty()) {
            throw std::runtime_error(
                "Configuration error: caching.provider_settings.distributed.connection_string is required "
                "for the Distributed provider");
        }
    }

    if (auto limit = caching.provider_settings.memory.size_limit_mb; limit && *limit < 0) {
        throw std::runtime_error("Configuration error: caching.provider_settings.memory.size_limit_mb cannot be negative");
    }

    if (!util::Logger::parse_level(logging.level)) {
        throw std::runtime_error("Configuration error: unknown logging.level '" + logging.level + "'");
    }

    // An index that expires before the entries it tracks orphans them from
    // prefix invalidation. Writes stretch the index TTL to cover each entry,
    // but flag configurations that rely on it.
    const int index_ttl = caching.provider_settings.distributed.index_key_ttl_seconds;
    if (index_ttl > 0) {
        if (caching.default_cache_duration_seconds > index_ttl) {
            QUERYCACHE_LOG_WARN(util::log_component::Config,
                "index_key_ttl_seconds={} is shorter than default_cache_duration_seconds={}",
                index_ttl, caching.default_cache_duration_seconds);
        }
        for (const auto& [name, endpoint] : caching.per_endpoint) {
            if (endpoint.absolute_ttl_seconds && *endpoint.absolute_ttl_seconds > index_ttl) {
                QUERYCACHE_LOG_WARN(util::log_component::Config,
                    "index_key_ttl_seconds={} is shorter than per_endpoint['{}'].absolute_ttl_seconds={}",
                    index_ttl, name, *endpoint.absolute_ttl_seconds);
            }
        }
    }

    QUERYCACHE_LOG_DEBUG(util::log_component::Config, "Configuration validated successfully");
}

// StaticSettingsProvider implementation
StaticSettingsProvider::StaticSettingsProvider(CachingSettings settings)
    : settings_(std::move(settings)) {
}

CachingSettings StaticSettingsProvider::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

void StaticSettingsProvider::update(CachingSettings settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(settings);
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

bool ConfigManager::load(int argc, char* argv[]) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    // Start with defaults
    config_ = Config{};
    positional_.clear();

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path_ = argv[++i];
        } else if (arg.starts_with("--config=")) {
            config_path_ = arg.substr(9);
        }
    }

    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    apply_environment_overrides();

    // Highest precedence
    apply_cli_overrides(argc, argv);

    config_.validate();

    QUERYCACHE_LOG_INFO(util::log_component::Config, "Configuration loaded successfully");
    return true;
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

CachingSettings ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_.caching;
}

void ConfigManager::reload() {
    std::vector<ConfigReloadCallback> callbacks;
    Config updated;

    {
        std::lock_guard<std::mutex> lock(config_mutex_);

        if (config_path_.empty()) {
            QUERYCACHE_LOG_WARN(util::log_component::Config, "No configuration file specified, reload skipped");
            return;
        }

        QUERYCACHE_LOG_INFO(util::log_component::Config, "Reloading configuration from {}", config_path_.string());

        Config previous = config_;
        try {
            config_ = Config{};
            load_from_file(config_path_);
            apply_environment_overrides();
            reapply_cli_overrides();
            config_.validate();
        } catch (const std::exception& e) {
            QUERYCACHE_LOG_ERROR(util::log_component::Config, "Configuration reload failed: {}", e.what());
            // Keep existing configuration on error
            config_ = std::move(previous);
            return;
        }

        if (!iequals(config_.caching.provider, previous.caching.provider)) {
            QUERYCACHE_LOG_WARN(util::log_component::Config,
                "caching.provider changed from {} to {}; the backend is chosen at startup and requires a restart",
                previous.caching.provider, config_.caching.provider);
        }

        if (config_ == previous) {
            QUERYCACHE_LOG_INFO(util::log_component::Config, "Configuration reloaded, no changes");
            return;
        }

        callbacks = reload_callbacks_;
        updated = config_;
    }

    QUERYCACHE_LOG_INFO(util::log_component::Config, "Configuration changed, notifying {} listeners", callbacks.size());
    for (const auto& callback : callbacks) {
        try {
            callback(updated);
        } catch (const std::exception& e) {
            QUERYCACHE_LOG_ERROR(util::log_component::Config, "Reload callback error: {}", e.what());
        }
    }
}

void ConfigManager::on_reload(ConfigReloadCallback callback) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    reload_callbacks_.push_back(std::move(callback));
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

std::vector<std::string> ConfigManager::positional_args() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return positional_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "QueryCache - prefix-invalidating query cache control tool\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS] COMMAND [ARG]\n"
              << "\n"
              << "Commands:\n"
              << "  invalidate-key KEY      Remove one entry (KEY may be a key hash in Hash mode)\n"
              << "  invalidate-prefix P     Remove every entry tracked under prefix P\n"
              << "  invalidate-all          Remove every tracked entry\n"
              << "  probe KEY               Print the cached value for KEY, or 'miss'\n"
              << "  hash KEY                Print the diagnostics hash of KEY\n"
              << "  extract-prefix KEY      Print the aggregate prefix of KEY\n"
              << "  stats                   Print cache metrics as JSON\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Path to JSON configuration file\n"
              << "  --provider NAME         Memory or Distributed\n"
              << "  --key-prefix PREFIX     Namespace for physical keys\n"
              << "  --redis CONNECTION      Redis connection string (host:port,password=...)\n"
              << "  --log-level LEVEL       trace/debug/info/warn/error/critical/off\n"
              << "\n"
              << "Environment Variables:\n"
              << "  QUERYCACHE_CONFIG             Path to configuration file\n"
              << "  QUERYCACHE_CACHE_ENABLED      Enable/disable caching (true/false)\n"
              << "  QUERYCACHE_DISABLE_CACHE      Hard kill switch (true/false)\n"
              << "  QUERYCACHE_PROVIDER           Memory or Distributed\n"
              << "  QUERYCACHE_KEY_PREFIX         Namespace for physical keys\n"
              << "  QUERYCACHE_CACHE_TTL          Default entry TTL in seconds\n"
              << "  QUERYCACHE_REDIS              Redis connection string\n"
              << "  QUERYCACHE_INDEX_TTL          Prefix/hash index TTL in seconds\n"
              << "  QUERYCACHE_KEY_DISPLAY_MODE   Raw or Hash\n"
              << "  QUERYCACHE_LOG_LEVEL          Log level\n"
              << "  QUERYCACHE_LOG_FILE           Log file path (stdout if not set)\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"caching\": {\n"
              << "      \"enabled\": true,\n"
              << "      \"disable_cache\": false,\n"
              << "      \"default_cache_duration_seconds\": 60,\n"
              << "      \"provider\": \"Distributed\",\n"
              << "      \"key_prefix\": \"app\",\n"
              << "      \"payload_format\": \"json\",\n"
              << "      \"provider_settings\": {\n"
              << "        \"memory\": {\"size_limit_mb\": 64},\n"
              << "        \"distributed\": {\"connection_string\": \"localhost:6379\", \"index_key_ttl_seconds\": 600}\n"
              << "      },\n"
              << "      \"per_endpoint\": {\n"
              << "        \"Employees:GetAll\": {\"absolute_ttl_seconds\": 120, \"sliding_ttl_seconds\": 30}\n"
              << "      },\n"
              << "      \"diagnostics\": {\n"
              << "        \"emit_cache_status_header\": true,\n"
              << "        \"header_name\": \"X-Cache-Status\",\n"
              << "        \"key_display_mode\": \"Hash\"\n"
              << "      }\n"
              << "    },\n"
              << "    \"logging\": {\"level\": \"info\", \"file\": \"\"}\n"
              << "  }\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        QUERYCACHE_LOG_DEBUG(util::log_component::Config, "Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    if (config_path_.empty()) {
        if (auto env = get_env("QUERYCACHE_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    auto& caching = config_.caching;

    if (auto env = get_env("QUERYCACHE_CACHE_ENABLED")) {
        caching.enabled = parse_bool(*env);
        QUERYCACHE_LOG_DEBUG(util::log_component::Config, "Applied QUERYCACHE_CACHE_ENABLED={}", caching.enabled);
    }

    if (auto env = get_env("QUERYCACHE_DISABLE_CACHE")) {
        caching.disable_cache = parse_bool(*env);
        QUERYCACHE_LOG_DEBUG(util::log_component::Config, "Applied QUERYCACHE_DISABLE_CACHE={}", caching.disable_cache);
    }

    if (auto env = get_env("QUERYCACHE_PROVIDER")) {
        caching.provider = *env;
        QUERYCACHE_LOG_DEBUG(util::log_component::Config, "Applied QUERYCACHE_PROVIDER={}", caching.provider);
    }

    if (auto env = get_env("QUERYCACHE_KEY_PREFIX")) {
        caching.key_prefix = *env;
        QUERYCACHE_LOG_DEBUG(util::log_component::Config, "Applied QUERYCACHE_KEY_PREFIX={}", caching.key_prefix);
    }

    if (auto env = get_env("QUERYCACHE_CACHE_TTL")) {
        caching.default_cache_duration_seconds = parse_int("QUERYCACHE_CACHE_TTL", *env);
        QUERYCACHE_LOG_DEBUG(util::log_component::Config, "Applied QUERYCACHE_CACHE_TTL={}",
                             caching.default_cache_duration_seconds);
    }

    if (auto env = get_env("QUERYCACHE_REDIS")) {
        caching.provider_settings.distributed.connection_string = *env;
        QUERYCACHE_LOG_DEBUG(util::log_component::Config, "Applied QUERYCACHE_REDIS");
    }

    if (auto env = get_env("QUERYCACHE_INDEX_TTL")) {
        caching.provider_settings.distributed.index_key_ttl_seconds = parse_int("QUERYCACHE_INDEX_TTL", *env);
        QUERYCACHE_LOG_DEBUG(util::log_component::Config, "Applied QUERYCACHE_INDEX_TTL={}",
                             caching.provider_settings.distributed.index_key_ttl_seconds);
    }

    if (auto env = get_env("QUERYCACHE_KEY_DISPLAY_MODE")) {
        auto mode = parse_key_display_mode(*env);
        if (!mode) {
            throw std::runtime_error("Invalid QUERYCACHE_KEY_DISPLAY_MODE value: " + *env);
        }
        caching.diagnostics.key_display_mode = *mode;
        QUERYCACHE_LOG_DEBUG(util::log_component::Config, "Applied QUERYCACHE_KEY_DISPLAY_MODE={}", *env);
    }

    if (auto env = get_env("QUERYCACHE_LOG_LEVEL")) {
        config_.logging.level = *env;
        QUERYCACHE_LOG_DEBUG(util::log_component::Config, "Applied QUERYCACHE_LOG_LEVEL={}", config_.logging.level);
    }

    if (auto env = get_env("QUERYCACHE_LOG_FILE")) {
        config_.logging.file = *env;
        QUERYCACHE_LOG_DEBUG(util::log_component::Config, "Applied QUERYCACHE_LOG_FILE={}", config_.logging.file);
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    auto take_value = [&](int& i, const std::string& arg, std::string_view flag,
                          std::optional<std::string>& target) -> bool {
        std::string prefixed = std::string(flag) + "=";
        if (arg == flag && i + 1 < argc) {
            target = argv[++i];
            return true;
        }
        if (arg.starts_with(prefixed)) {
            target = arg.substr(prefixed.size());
            return true;
        }
        return false;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        // Skip already processed args
        if (arg == "--help" || arg == "-h") continue;
        if (arg == "--config" || arg == "-c") { ++i; continue; }
        if (arg.starts_with("--config=")) continue;

        if (take_value(i, arg, "--provider", cli_provider_)) continue;
        if (take_value(i, arg, "--key-prefix", cli_key_prefix_)) continue;
        if (take_value(i, arg, "--redis", cli_redis_)) continue;
        if (take_value(i, arg, "--log-level", cli_log_level_)) continue;

        if (arg.starts_with("-")) {
            throw std::runtime_error("Unknown option: " + arg);
        }

        positional_.push_back(arg);
    }

    reapply_cli_overrides();
}

void ConfigManager::reapply_cli_overrides() {
    if (cli_provider_) config_.caching.provider = *cli_provider_;
    if (cli_key_prefix_) config_.caching.key_prefix = *cli_key_prefix_;
    if (cli_redis_) config_.caching.provider_settings.distributed.connection_string = *cli_redis_;
    if (cli_log_level_) config_.logging.level = *cli_log_level_;
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace querycache::config
