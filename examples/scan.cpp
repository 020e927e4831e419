/**
 * arbscan - cross-venue arbitrage scanner
 *
 *   arbscan [config.toml] [--once] [--json]
 *
 * Without a config file three simulated exchanges are scanned. With --once a
 * single cycle runs and the program exits; otherwise cycles repeat every
 * scanner.interval_ms until Ctrl+C.
 */

#include <arbscan/config.hpp>
#include <arbscan/connectors/factory.hpp>
#include <arbscan/logging.hpp>
#include <arbscan/orchestrator.hpp>
#include <arbscan/report.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <set>
#include <thread>

using namespace arbscan;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

struct Options {
    std::string config_path;
    bool once = false;
    bool as_json = false;
};

void print_usage() {
    std::cerr << "usage: arbscan [config.toml] [--once] [--json]" << std::endl;
}

std::optional<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--once") {
            opts.once = true;
        } else if (arg == "--json") {
            opts.as_json = true;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "unknown option: " << arg << std::endl;
            return std::nullopt;
        } else if (opts.config_path.empty()) {
            opts.config_path = arg;
        } else {
            std::cerr << "unexpected argument: " << arg << std::endl;
            return std::nullopt;
        }
    }
    return opts;
}

}  // namespace

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 2;
    }

    Config config;
    try {
        config = opts->config_path.empty() ? Config::demo() : Config::from_file(opts->config_path);
    } catch (const ConfigError& e) {
        std::cerr << "config error: " << e.what() << std::endl;
        return 1;
    }

    init_logging(config.general.log_level);
    if (opts->config_path.empty()) {
        spdlog::info("No config file given, scanning simulated venues");
    }

    if (config.scanner.symbols.empty()) {
        spdlog::error("No symbols configured");
        return 1;
    }

    auto settings = ScanSettings::from_config(config);
    auto connectors = connect_all(make_connectors(config), settings.timeout);
    if (connectors.size() < 2) {
        spdlog::error("Need at least two connected venues, have {}", connectors.size());
        return 1;
    }

    std::shared_ptr<TickStore> store;
    if (config.scanner.save_ticks) {
        store = make_memory_store(std::chrono::milliseconds(config.scanner.tick_retention_ms));
    }

    ScanOrchestrator orchestrator(settings, make_fee_model(config), connectors, store);

    std::set<std::string> assets;
    for (const auto& symbol : settings.symbols) {
        assets.insert(base_asset(symbol));
    }
    orchestrator.refresh_transfer_fees(std::vector<std::string>(assets.begin(), assets.end()));

    auto emit = [&opts](const ScanResult& result) {
        if (opts->as_json) print_json(std::cout, result);
        else print_table(std::cout, result);
    };

    if (opts->once) {
        emit(orchestrator.run_once());
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    orchestrator.on_result(emit);
    orchestrator.start();
    spdlog::info("Scanning {} symbols on {} venues every {}ms, Ctrl+C to stop",
                 settings.symbols.size(), connectors.size(), settings.interval.count());

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    orchestrator.stop();
    spdlog::info("Stopped");
    return 0;
}
