// arbscan - CCXT Connector Implementation

#include <arbscan/connectors/ccxt.hpp>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

namespace arbscan {

using json = nlohmann::json;

namespace {

std::optional<Decimal> number_field(const json& data, const char* key) {
    if (!data.contains(key) || data[key].is_null()) return std::nullopt;
    const auto& v = data[key];
    if (v.is_string()) return Decimal::from_string(v.get<std::string>());
    return Decimal::from_double(v.get<double>());
}

std::map<std::string, NetworkFee> parse_networks(const json& networks) {
    std::map<std::string, NetworkFee> out;
    if (!networks.is_object()) return out;

    for (const auto& [network, entry] : networks.items()) {
        auto fee = number_field(entry, "fee");
        if (!fee) continue;  // venue does not publish a fee for this network
        out[network] = NetworkFee{*fee, entry.value("percentage", false)};
    }
    return out;
}

}  // namespace

CcxtConnector::CcxtConnector(std::string_view name, const CcxtConfig& config)
    : name_(name), config_(config) {}

CcxtConnector::~CcxtConnector() = default;

std::chrono::milliseconds CcxtConnector::request_timeout() const noexcept {
    return config_.timeout_ms ? std::chrono::milliseconds(*config_.timeout_ms)
                              : DEFAULT_REQUEST_TIMEOUT;
}

void CcxtConnector::update_latency(int64_t start_ns) {
    int64_t elapsed = now_ns() - start_ns;
    latency_.store(static_cast<int>(elapsed / 1000000), std::memory_order_release);
}

std::future<void> CcxtConnector::connect() {
    return std::async(std::launch::async, [this]() {
        auto start = now_ns();

        json body = {
            {"exchange", config_.exchange_id},
            {"apiKey", config_.api_key.value_or("")},
            {"secret", config_.api_secret.value_or("")},
            {"sandbox", config_.sandbox}
        };

        if (config_.password) {
            body["password"] = *config_.password;
        }

        auto response = cpr::Post(
            cpr::Url{config_.service_url + "/connect"},
            cpr::Header{{"Content-Type", "application/json"}},
            cpr::Body{body.dump()},
            cpr::Timeout{request_timeout()});

        if (response.status_code != 200) {
            throw ConnectorError("CCXT connect failed for " + name_ + ": " + response.text);
        }

        update_latency(start);
    });
}

std::future<Quote> CcxtConnector::fetch_ticker(const std::string& symbol) {
    return std::async(std::launch::async, [this, symbol]() {
        auto start = now_ns();

        auto response = cpr::Get(
            cpr::Url{config_.service_url + "/ticker/" + config_.exchange_id},
            cpr::Parameters{{"symbol", symbol}},
            cpr::Timeout{request_timeout()});

        update_latency(start);

        if (response.status_code != 200) {
            throw ConnectorError("Failed to get ticker " + symbol + " from " + name_ +
                                 ": " + response.text);
        }

        try {
            return parse_ticker(json::parse(response.text), name_, symbol);
        } catch (const std::exception& e) {
            throw ConnectorError("Bad ticker payload from " + name_ + ": " + e.what());
        }
    });
}

std::future<TransferFees> CcxtConnector::fetch_transfer_fees(const std::string& asset) {
    return std::async(std::launch::async, [this, asset]() {
        auto start = now_ns();

        auto response = cpr::Get(
            cpr::Url{config_.service_url + "/fees/" + config_.exchange_id},
            cpr::Parameters{{"code", asset}},
            cpr::Timeout{request_timeout()});

        update_latency(start);

        if (response.status_code != 200) {
            throw ConnectorError("Failed to get transfer fees for " + asset + " from " +
                                 name_ + ": " + response.text);
        }

        try {
            return parse_transfer_fees(json::parse(response.text), name_, asset);
        } catch (const ConnectorError&) {
            throw;
        } catch (const std::exception& e) {
            throw ConnectorError("Bad fee payload from " + name_ + ": " + e.what());
        }
    });
}

Quote CcxtConnector::parse_ticker(const json& data, std::string_view venue,
                                  const std::string& symbol) {
    Quote quote;
    quote.venue = std::string(venue);
    quote.symbol = data.value("symbol", symbol);
    quote.bid = number_field(data, "bid");
    quote.ask = number_field(data, "ask");
    quote.last = number_field(data, "last");
    quote.volume = number_field(data, "baseVolume");

    if (data.contains("timestamp") && data["timestamp"].is_number()) {
        quote.timestamp = data["timestamp"].get<int64_t>();
    } else {
        quote.timestamp = now_ms();
    }
    return quote;
}

TransferFees CcxtConnector::parse_transfer_fees(const json& data, std::string_view venue,
                                                const std::string& asset) {
    if (!data.contains(asset) || !data[asset].contains("networks")) {
        throw ConnectorError("No fee info found for " + asset + " on " + std::string(venue));
    }

    const auto& networks = data[asset]["networks"];

    TransferFees fees;
    fees.venue = std::string(venue);
    fees.asset = asset;
    fees.withdraw = parse_networks(networks.value("withdraw", json::object()));
    fees.deposit = parse_networks(networks.value("deposit", json::object()));
    return fees;
}

}  // namespace arbscan
