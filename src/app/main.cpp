/**
 * @file main.cpp
 * @brief hvac_exporter daemon entry point.
 *
 * Wires the modules into the polling pipeline:
 *   Config → Logger → HostTable → StateCache → RefreshScheduler
 *          → DiscoveryEngine → MetricServer
 */

#include "cache/state_cache.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "network/discovery_engine.hpp"
#include "network/host_table.hpp"
#include "protocol/query_client.hpp"
#include "scheduler/refresh_scheduler.hpp"
#include "telemetry/exporter_stats.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metric_server.hpp"
#include "telemetry/prometheus_renderer.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace hvac_exporter;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_level;
};

void print_usage() {
    std::cout << "Usage: hvac_exporter [OPTIONS] [CONFIG]\n"
              << "  CONFIG, --config <path>\n"
              << "                        Configuration file (default: config/default.toml)\n"
              << "  --log-level <level>   debug, info, warn or error (overrides config)\n"
              << "  --help, -h            Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    bool config_given = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool positional = !arg.empty() && arg[0] != '-';
        if (((arg == "--config" && i + 1 < argc) || positional) && config_given) {
            std::cerr << "Configuration file given twice\n";
            print_usage();
            std::exit(2);
        }

        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
            config_given = true;
        } else if (positional) {
            args.config_path = arg;
            config_given = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

/**
 * @brief Resolve "host[:port]" strings from the config; bad entries are fatal.
 */
Result<std::vector<Endpoint>> parse_endpoints(const std::vector<std::string>& texts,
                                              uint16_t default_port) {
    std::vector<Endpoint> endpoints;
    for (const auto& text : texts) {
        auto endpoint = parse_endpoint(text, default_port);
        if (!endpoint) return endpoint.error();
        endpoints.push_back(std::move(*endpoint));
    }
    return endpoints;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << level.error().message << std::endl;
        return 1;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        auto file_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "hvac_exporter",
                                                        config.telemetry.max_file_size_mb,
                                                        config.telemetry.rotate_count);
        if (file_sink->is_open()) {
            log_sink = std::move(file_sink);
        } else {
            std::cerr << "Cannot write logs to " << config.telemetry.log_dir.string()
                      << ", logging to stdout." << std::endl;
        }
    }
    if (!log_sink) {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), *level);
    logger.info("hvac_exporter starting");

    // ── Parse addresses ──────────────────────
    auto static_hosts = parse_endpoints(config.hosts, UNIT_PORT);
    auto targets = parse_endpoints(config.discovery.targets, config.discovery.port);
    auto discovery_bind = parse_endpoint(config.discovery.bind_address, 0);
    auto exporter_bind = parse_endpoint(config.exporter.bind_address, 9150);
    if (!static_hosts || !targets || !discovery_bind || !exporter_bind) {
        const auto& failure = !static_hosts ? static_hosts.error()
                            : !targets ? targets.error()
                            : !discovery_bind ? discovery_bind.error()
                            : exporter_bind.error();
        logger.error("Invalid configuration: " + failure.message);
        return 1;
    }

    // ── Host Table and Cache ─────────────────
    HostTable hosts;
    for (size_t i = 0; i < static_hosts->size(); ++i) {
        if (!hosts.add_static(config.hosts[i], (*static_hosts)[i])) {
            logger.warn("Duplicate static host ignored: " + config.hosts[i]);
        }
    }

    const Duration refresh_interval{config.refresh.interval_ms};
    StateCache cache(hosts, refresh_interval);
    ExporterStats stats;

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Refresh Scheduler ────────────────────
    RefreshScheduler scheduler(
        RefreshSettings{.interval = refresh_interval,
                        .timeout = Duration{config.refresh.timeout_ms}},
        hosts, cache, udp_query_client_factory(config.refresh.groups, &stats), logger, stats);
    scheduler.start();
    logger.info("Refreshing " + std::to_string(hosts.size()) + " static host(s) every "
                + std::to_string(config.refresh.interval_ms) + "ms (timeout "
                + std::to_string(config.refresh.timeout_ms) + "ms)");

    // ── Discovery ────────────────────────────
    DiscoveryEngine discovery(
        DiscoverySettings{.bind_address = *discovery_bind,
                          .major_interval = Duration{config.discovery.major_interval_ms},
                          .minor_interval = Duration{config.discovery.minor_interval_ms},
                          .unit_port = config.discovery.port,
                          .targets = *targets},
        hosts, logger, stats);
    discovery.on_host_added([&scheduler](const HostRecord& host) {
        scheduler.add_host(host.key);
    });

    if (config.discovery.enabled) {
        auto started = discovery.start();
        if (!started) {
            logger.error("Discovery disabled: " + started.error().message);
        }
    } else {
        logger.info("Discovery disabled by configuration");
    }

    // ── Metrics Endpoint ─────────────────────
    MetricServer metric_server(*exporter_bind, [&]() {
        auto now = std::chrono::system_clock::now();
        return render_prometheus(hosts.snapshot(), cache.snapshot_all(now), stats, now);
    }, logger);

    auto listening = metric_server.start();
    if (!listening) {
        logger.error("Could not start metrics endpoint: " + listening.error().message);
        discovery.stop();
        scheduler.stop();
        return 1;
    }

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    metric_server.stop();
    discovery.stop();
    scheduler.stop();

    logger.info("hvac_exporter stopped.");
    logger.flush();
    return 0;
}
