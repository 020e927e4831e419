// arbscan - Configuration Implementation

#include <arbscan/config.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace arbscan {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing "# comment" that is not inside a quoted string
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

// "$NAME" reads the environment variable NAME
std::string expand_env(const std::string& value) {
    if (value.size() > 1 && value[0] == '$') {
        const char* env = std::getenv(value.c_str() + 1);
        return env ? std::string(env) : std::string();
    }
    return value;
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::string body = raw;
    if (!body.empty() && body.front() == '[') {
        if (body.back() != ']') {
            throw ConfigError("Unterminated list: " + raw);
        }
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> items;
    std::istringstream stream{body};
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = unquote(trim(item));
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

Decimal parse_decimal(const std::string& key, const std::string& value) {
    try {
        return Decimal::from_string(value);
    } catch (const std::invalid_argument&) {
        throw ConfigError("Invalid number for '" + key + "': " + value);
    }
}

int parse_int(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid integer for '" + key + "': " + value);
    }
}

Decimal parse_fee(const std::string& key, const std::string& value) {
    Decimal fee = parse_decimal(key, value);
    if (fee.is_negative()) {
        throw ConfigError("Negative fee for '" + key + "': " + value);
    }
    return fee;
}

uint64_t parse_seed(const std::string& key, const std::string& value) {
    // stoull accepts a leading minus and wraps it
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("Invalid unsigned integer for '" + key + "': " + value);
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw ConfigError("Invalid unsigned integer for '" + key + "': " + value);
    }
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    throw ConfigError("Invalid boolean for '" + key + "': " + value);
}

VenueKind parse_kind(const std::string& key, const std::string& value) {
    auto kind = venue_kind_from_string(value);
    if (!kind) {
        throw ConfigError("Unknown venue kind for '" + key + "': " + value);
    }
    return *kind;
}

void apply_fee_key(FeeSchedule& schedule, const std::string& key, const std::string& value) {
    if (key == "taker") {
        schedule.taker_rate = parse_fee(key, value);
    } else if (key.rfind("withdraw.", 0) == 0) {
        schedule.withdrawal_fees[key.substr(9)] = parse_fee(key, value);
    } else {
        spdlog::warn("Unknown fee key '{}' for {}", key, schedule.venue);
    }
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;
    std::string current_subsection;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        // Skip empty lines and comments
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Malformed section header: " + line);
            }
            std::string section = line.substr(1, end - 1);

            // Check for subsection [section.name]
            auto dot = section.find('.');
            if (dot != std::string::npos) {
                current_section = section.substr(0, dot);
                current_subsection = section.substr(dot + 1);
            } else {
                current_section = section;
                current_subsection.clear();
            }
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Expected key = value: " + line);
        }

        std::string key = unquote(trim(line.substr(0, eq)));
        std::string raw = trim(line.substr(eq + 1));
        std::string value = unquote(raw);

        // Parse based on section
        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
            else if (key == "timeout_ms") config.general.timeout_ms = parse_int(key, value);
            else spdlog::warn("Unknown key general.{}", key);
        }
        else if (current_section == "scanner") {
            if (key == "threshold_pct") config.scanner.threshold_pct = parse_decimal(key, value);
            else if (key == "symbols") config.scanner.symbols = parse_list(raw);
            else if (key == "interval_ms") config.scanner.interval_ms = parse_int(key, value);
            else if (key == "save_ticks") config.scanner.save_ticks = parse_bool(key, value);
            else if (key == "tick_retention_ms") config.scanner.tick_retention_ms = parse_int(key, value);
            else spdlog::warn("Unknown key scanner.{}", key);
        }
        else if (current_section == "fees" && !current_subsection.empty()) {
            if (to_lower(current_subsection) == "default") {
                config.fees.default_schedule.venue = "default";
                apply_fee_key(config.fees.default_schedule, key, value);
            } else {
                auto& schedule = config.fees.venues[to_lower(current_subsection)];
                // A venue entry replaces the default entirely; unset keys keep
                // the built-in values, not the [fees.default] ones
                if (schedule.venue.empty()) schedule.venue = current_subsection;
                apply_fee_key(schedule, key, value);
            }
        }
        else if (current_section == "ccxt" && !current_subsection.empty()) {
            auto& ccxt_cfg = config.ccxt[current_subsection];
            if (ccxt_cfg.exchange_id.empty()) ccxt_cfg.exchange_id = current_subsection;
            if (key == "exchange_id") ccxt_cfg.exchange_id = value;
            else if (key == "service_url") ccxt_cfg.service_url = value;
            else if (key == "api_key") ccxt_cfg.api_key = expand_env(value);
            else if (key == "api_secret") ccxt_cfg.api_secret = expand_env(value);
            else if (key == "password") ccxt_cfg.password = expand_env(value);
            else if (key == "sandbox") ccxt_cfg.sandbox = parse_bool(key, value);
            else if (key == "timeout_ms") ccxt_cfg.timeout_ms = parse_int(key, value);
            else spdlog::warn("Unknown key ccxt.{}.{}", current_subsection, key);
        }
        else if (current_section == "gateway" && !current_subsection.empty()) {
            auto& gw_cfg = config.gateway[current_subsection];
            if (key == "host") gw_cfg.host = value;
            else if (key == "port") gw_cfg.port = parse_int(key, value);
            else if (key == "https") gw_cfg.https = parse_bool(key, value);
            else if (key == "connector") gw_cfg.connector = value;
            else if (key == "chain") gw_cfg.chain = value;
            else if (key == "network") gw_cfg.network = value;
            else if (key == "kind") gw_cfg.kind = parse_kind(key, value);
            else if (key == "timeout_ms") gw_cfg.timeout_ms = parse_int(key, value);
            else spdlog::warn("Unknown key gateway.{}.{}", current_subsection, key);
        }
        else if (current_section == "simulated" && !current_subsection.empty()) {
            auto& sim_cfg = config.simulated[current_subsection];
            if (key == "kind") sim_cfg.kind = parse_kind(key, value);
            else if (key == "seed_price") sim_cfg.seed_price = parse_decimal(key, value);
            else if (key == "half_spread") sim_cfg.half_spread = parse_decimal(key, value);
            else if (key == "max_step") sim_cfg.max_step = parse_decimal(key, value);
            else if (key == "min_latency_ms") sim_cfg.min_latency_ms = parse_int(key, value);
            else if (key == "max_latency_ms") sim_cfg.max_latency_ms = parse_int(key, value);
            else if (key == "seed") sim_cfg.seed = parse_seed(key, value);
            else if (key.rfind("withdraw.", 0) == 0) {
                // withdraw.<ASSET>.<NETWORK> = fee
                auto rest = key.substr(9);
                auto dot = rest.find('.');
                if (dot == std::string::npos) {
                    throw ConfigError("Expected withdraw.<asset>.<network>: " + key);
                }
                sim_cfg.withdraw_fees[rest.substr(0, dot)][rest.substr(dot + 1)] =
                    parse_fee(key, value);
            }
            else spdlog::warn("Unknown key simulated.{}.{}", current_subsection, key);
        }
        else {
            spdlog::warn("Ignoring key '{}' in section [{}]", key, current_section);
        }
    }

    if (config.general.timeout_ms <= 0) {
        throw ConfigError("general.timeout_ms must be positive");
    }
    if (config.scanner.interval_ms < 0) {
        throw ConfigError("scanner.interval_ms must not be negative");
    }
    if (config.scanner.tick_retention_ms <= 0) {
        throw ConfigError("scanner.tick_retention_ms must be positive");
    }
    for (const auto& [name, ccxt_cfg] : config.ccxt) {
        if (ccxt_cfg.timeout_ms && *ccxt_cfg.timeout_ms <= 0) {
            throw ConfigError("ccxt." + name + ".timeout_ms must be positive");
        }
    }
    for (const auto& [name, gw_cfg] : config.gateway) {
        if (gw_cfg.timeout_ms && *gw_cfg.timeout_ms <= 0) {
            throw ConfigError("gateway." + name + ".timeout_ms must be positive");
        }
    }

    return config;
}

Config Config::demo() {
    Config config;
    config.with_symbols({"BTC/USDT", "ETH/USDT"});

    const char* names[] = {"binance", "okx", "bybit"};
    for (const char* name : names) {
        config.with_simulated(name, SimulatedConfig::around(Decimal::from_int(50000))
            .with_withdraw_fee("BTC", "BTC", Decimal::from_string("0.0005"))
            .with_withdraw_fee("ETH", "ERC20", Decimal::from_string("0.005")));
    }

    FeeSchedule binance;
    binance.taker_rate = Decimal::from_string("0.001");
    config.set_venue_fees("binance", binance);

    FeeSchedule okx;
    okx.taker_rate = Decimal::from_string("0.0008");
    config.set_venue_fees("okx", okx);

    config.set_threshold(Decimal::zero());
    return config;
}

}  // namespace arbscan
