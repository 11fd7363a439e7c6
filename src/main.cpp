/**
 * QueryCache - Prefix-invalidating query cache
 *
 * querycache-ctl: operator tool that loads the cache configuration, builds
 * the configured backend and runs one invalidation or inspection command.
 */

#include "config/config.hpp"
#include "cache/cache_factory.hpp"
#include "cache/cache_key.hpp"
#include "diagnostics/diagnostics_publisher.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <iostream>
#include <stop_token>
#include <string>
#include <vector>

namespace {

std::stop_source g_stop_source;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_source.request_stop();
    }
}

int usage_error(const char* program, const std::string& message) {
    std::cerr << "Error: " << message << "\n"
              << "Run '" << program << " --help' for usage.\n";
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    namespace qc = querycache;
    using qc::util::log_component::Cli;

    try {
        qc::config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return 0;
        }

        auto config = config_manager.get_config();
        qc::util::Logger::init(config.logging.to_log_config());

        auto args = config_manager.positional_args();
        if (args.empty()) {
            return usage_error(argv[0], "no command given");
        }

        const auto& command = args[0];
        auto require_arg = [&](const char* what) -> const std::string& {
            if (args.size() < 2) {
                throw std::invalid_argument(command + " requires " + what);
            }
            return args[1];
        };

        // Commands that need no backend
        if (command == "hash") {
            std::cout << qc::cache::hash_key(require_arg("a KEY")) << "\n";
            return 0;
        }
        if (command == "extract-prefix") {
            std::cout << qc::cache::extract_prefix(require_arg("a KEY")) << "\n";
            return 0;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        auto services = qc::cache::make_cache_services(config_manager);
        qc::cache::CallContext ctx;
        ctx.cancel = g_stop_source.get_token();

        if (command == "invalidate-key") {
            services.invalidation->invalidate_key(require_arg("a KEY"), ctx);
        } else if (command == "invalidate-prefix") {
            services.invalidation->invalidate_prefix(require_arg("a PREFIX"), ctx);
        } else if (command == "invalidate-all") {
            services.invalidation->invalidate_all(ctx);
        } else if (command == "probe") {
            const auto& key = require_arg("a KEY");
            if (!config.caching.is_active()) {
                QUERYCACHE_LOG_WARN(Cli, "Caching is disabled by configuration; every probe misses");
            }

            qc::diagnostics::LoggingDiagnosticsPublisher publisher(config_manager);
            auto hit = services.store->lookup<nlohmann::json>(key, ctx);
            if (!hit) {
                std::cout << "miss\n";
                return 1;
            }
            publisher.report_hit(key, hit->remaining);
            std::cout << hit->value.dump(2) << "\n";
            if (hit->remaining) {
                std::cout << "remaining_ms: " << hit->remaining->count() << "\n";
            }
            return 0;
        } else if (command == "stats") {
            std::cout << qc::util::Metrics::instance().snapshot().to_json() << "\n";
            return 0;
        } else {
            return usage_error(argv[0], "unknown command '" + command + "'");
        }

        QUERYCACHE_LOG_INFO(Cli, "{} completed", command);
        qc::util::Logger::instance().flush();
        return 0;

    } catch (const qc::cache::OperationCancelled& e) {
        std::cerr << "Interrupted: " << e.what() << "\n";
        return 130;
    } catch (const std::invalid_argument& e) {
        return usage_error(argv[0], e.what());
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
