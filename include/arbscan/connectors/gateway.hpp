// arbscan - Hummingbot Gateway Connector
// DEX pools and bridges quoted through the Gateway REST API

#pragma once

#include <arbscan/config.hpp>
#include <arbscan/connector.hpp>
#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <chrono>

namespace arbscan {

// Prices a one-unit swap in both directions: the BUY price is the ask and
// the SELL price is the bid.
class GatewayConnector : public VenueConnector {
public:
    GatewayConnector(std::string_view name, const GatewayConfig& config);
    ~GatewayConnector() override;

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] VenueKind kind() const override { return config_.kind; }
    [[nodiscard]] std::optional<int> latency_ms() const override {
        int lat = latency_.load();
        return lat > 0 ? std::optional<int>(lat) : std::nullopt;
    }

    [[nodiscard]] std::chrono::milliseconds request_timeout() const noexcept;

    std::future<void> connect() override;
    std::future<Quote> fetch_ticker(const std::string& symbol) override;

private:
    nlohmann::json build_request_body() const;
    Decimal fetch_price(const std::string& base, const std::string& quote, const char* side);
    void update_latency(int64_t start_ns);

    std::string name_;
    GatewayConfig config_;
    std::atomic<int> latency_{0};
};

}  // namespace arbscan
