// arbscan - Hummingbot Gateway Connector Implementation

#include <arbscan/connectors/gateway.hpp>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

namespace arbscan {

using json = nlohmann::json;

GatewayConnector::GatewayConnector(std::string_view name, const GatewayConfig& config)
    : name_(name), config_(config) {}

GatewayConnector::~GatewayConnector() = default;

std::chrono::milliseconds GatewayConnector::request_timeout() const noexcept {
    return config_.timeout_ms ? std::chrono::milliseconds(*config_.timeout_ms)
                              : DEFAULT_REQUEST_TIMEOUT;
}

void GatewayConnector::update_latency(int64_t start_ns) {
    int64_t elapsed = now_ns() - start_ns;
    latency_.store(static_cast<int>(elapsed / 1000000), std::memory_order_release);
}

json GatewayConnector::build_request_body() const {
    return json{
        {"chain", config_.chain},
        {"network", config_.network},
        {"connector", config_.connector}
    };
}

std::future<void> GatewayConnector::connect() {
    return std::async(std::launch::async, [this]() {
        auto start = now_ns();

        auto response = cpr::Get(cpr::Url{config_.base_url()},
                                 cpr::Timeout{request_timeout()});

        if (response.status_code != 200) {
            throw ConnectorError("Gateway not ready for " + name_ + ": " + response.text);
        }

        auto data = json::parse(response.text, nullptr, false);
        if (data.is_discarded() || data.value("status", "") != "ok") {
            throw ConnectorError("Gateway not ready for " + name_);
        }

        update_latency(start);
    });
}

Decimal GatewayConnector::fetch_price(const std::string& base, const std::string& quote,
                                      const char* side) {
    json body = build_request_body();
    body["base"] = base;
    body["quote"] = quote;
    body["amount"] = "1";
    body["side"] = side;

    auto response = cpr::Post(
        cpr::Url{config_.base_url() + "/amm/price"},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{body.dump()},
        cpr::Timeout{request_timeout()});

    if (response.status_code != 200) {
        throw ConnectorError("Failed to get " + std::string(side) + " price for " +
                             base + "/" + quote + " from " + name_ + ": " + response.text);
    }

    auto data = json::parse(response.text, nullptr, false);
    if (data.is_discarded() || !data.contains("price") || !data["price"].is_string()) {
        throw ConnectorError("Bad price payload from " + name_);
    }

    try {
        return Decimal::from_string(data["price"].get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConnectorError("Bad price from " + name_ + ": " + e.what());
    }
}

std::future<Quote> GatewayConnector::fetch_ticker(const std::string& symbol) {
    return std::async(std::launch::async, [this, symbol]() {
        auto slash = symbol.find('/');
        if (slash == std::string::npos) {
            throw ConnectorError("Invalid symbol: " + symbol);
        }

        std::string base = symbol.substr(0, slash);
        std::string quote = symbol.substr(slash + 1);

        auto start = now_ns();
        Decimal ask = fetch_price(base, quote, "BUY");
        Decimal bid = fetch_price(base, quote, "SELL");
        update_latency(start);

        Quote q;
        q.venue = name_;
        q.symbol = symbol;
        q.bid = bid;
        q.ask = ask;
        q.last = (bid + ask) / Decimal::from_int(2);
        q.timestamp = now_ms();
        return q;
    });
}

}  // namespace arbscan
