// arbscan - Configuration
// Builder pattern for fluent configuration, TOML loading

#pragma once

#include <arbscan/types.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbscan {

// Configuration error
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// General settings
struct GeneralConfig {
    std::string log_level = "info";
    int timeout_ms = 5000;  // deadline for one aggregation cycle
};

// Scanner settings
struct ScannerConfig {
    Decimal threshold_pct{20000000};  // 0.2 %
    std::vector<std::string> symbols;
    int interval_ms = 10000;
    bool save_ticks = false;
    int tick_retention_ms = 86400000;  // saved ticks older than this are pruned
};

// Fee tables: default schedule plus per-venue overrides
struct FeeConfig {
    FeeSchedule default_schedule;
    std::unordered_map<std::string, FeeSchedule> venues;
};

// CCXT exchange config (centralized venues through a CCXT REST service)
class CcxtConfig {
public:
    std::string exchange_id;
    std::string service_url = "http://localhost:3000";
    std::optional<std::string> api_key;
    std::optional<std::string> api_secret;
    std::optional<std::string> password;
    bool sandbox = false;
    std::optional<int> timeout_ms;  // per request; general.timeout_ms when unset

    CcxtConfig() = default;

    static CcxtConfig create(std::string_view exchange) {
        CcxtConfig cfg;
        cfg.exchange_id = std::string(exchange);
        return cfg;
    }

    CcxtConfig& with_credentials(std::string_view key, std::string_view secret) {
        api_key = std::string(key);
        api_secret = std::string(secret);
        return *this;
    }

    CcxtConfig& with_service_url(std::string_view url) {
        service_url = std::string(url);
        return *this;
    }

    CcxtConfig& enable_sandbox() {
        sandbox = true;
        return *this;
    }

    CcxtConfig& with_timeout(int ms) {
        timeout_ms = ms;
        return *this;
    }
};

// Hummingbot Gateway config (DEX pools and bridges)
class GatewayConfig {
public:
    std::string host = "localhost";
    int port = 15888;
    bool https = false;
    std::string connector;
    std::string chain = "ethereum";
    std::string network = "mainnet";
    VenueKind kind = VenueKind::Dex;
    std::optional<int> timeout_ms;

    GatewayConfig() = default;

    static GatewayConfig create(std::string_view conn) {
        GatewayConfig cfg;
        cfg.connector = std::string(conn);
        return cfg;
    }

    GatewayConfig& with_endpoint(std::string_view h, int p) {
        host = std::string(h);
        port = p;
        return *this;
    }

    GatewayConfig& on_chain(std::string_view c, std::string_view n) {
        chain = std::string(c);
        network = std::string(n);
        return *this;
    }

    GatewayConfig& as_bridge() {
        kind = VenueKind::Bridge;
        return *this;
    }

    GatewayConfig& with_timeout(int ms) {
        timeout_ms = ms;
        return *this;
    }

    [[nodiscard]] std::string base_url() const {
        return (https ? "https://" : "http://") + host + ":" + std::to_string(port);
    }
};

// Simulated venue config (demo mode)
class SimulatedConfig {
public:
    VenueKind kind = VenueKind::Cex;
    Decimal seed_price = Decimal::from_int(50000);
    Decimal half_spread{20000};  // 0.0002 relative
    Decimal max_step{100000};    // 0.001 relative random walk step
    int min_latency_ms = 100;
    int max_latency_ms = 500;
    std::optional<uint64_t> seed;
    // asset -> network -> fixed withdrawal fee
    std::unordered_map<std::string, std::unordered_map<std::string, Decimal>> withdraw_fees;

    SimulatedConfig() = default;

    static SimulatedConfig around(Decimal price) {
        SimulatedConfig cfg;
        cfg.seed_price = price;
        return cfg;
    }

    SimulatedConfig& with_seed(uint64_t s) {
        seed = s;
        return *this;
    }

    SimulatedConfig& with_latency(int min_ms, int max_ms) {
        min_latency_ms = min_ms;
        max_latency_ms = max_ms;
        return *this;
    }

    SimulatedConfig& with_withdraw_fee(std::string_view asset, std::string_view network, Decimal fee) {
        withdraw_fees[std::string(asset)][std::string(network)] = fee;
        return *this;
    }
};

// Main configuration
class Config {
public:
    GeneralConfig general;
    ScannerConfig scanner;
    FeeConfig fees;
    std::unordered_map<std::string, CcxtConfig> ccxt;
    std::unordered_map<std::string, GatewayConfig> gateway;
    std::unordered_map<std::string, SimulatedConfig> simulated;

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Three simulated exchanges scanning BTC/USDT and ETH/USDT
    static Config demo();

    // Builder methods
    Config& with_ccxt(std::string_view name, CcxtConfig cfg) {
        ccxt[std::string(name)] = std::move(cfg);
        return *this;
    }

    Config& with_gateway(std::string_view name, GatewayConfig cfg) {
        gateway[std::string(name)] = std::move(cfg);
        return *this;
    }

    Config& with_simulated(std::string_view name, SimulatedConfig cfg) {
        simulated[std::string(name)] = std::move(cfg);
        return *this;
    }

    Config& with_symbols(std::vector<std::string> symbols) {
        scanner.symbols = std::move(symbols);
        return *this;
    }

    Config& set_threshold(Decimal pct) {
        scanner.threshold_pct = pct;
        return *this;
    }

    Config& set_timeout(int ms) {
        general.timeout_ms = ms;
        return *this;
    }

    Config& set_default_fees(FeeSchedule schedule) {
        fees.default_schedule = std::move(schedule);
        return *this;
    }

    Config& set_venue_fees(std::string_view venue, FeeSchedule schedule) {
        schedule.venue = std::string(venue);
        fees.venues[to_lower(venue)] = std::move(schedule);
        return *this;
    }

    // Number of configured venues across all connector types
    [[nodiscard]] size_t venue_count() const noexcept {
        return ccxt.size() + gateway.size() + simulated.size();
    }
};

}  // namespace arbscan
