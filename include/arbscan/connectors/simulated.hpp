// arbscan - Simulated Connector
// Random-walk quotes with network latency, for demo mode and local runs

#pragma once

#include <arbscan/config.hpp>
#include <arbscan/connector.hpp>
#include <mutex>
#include <random>
#include <unordered_map>

namespace arbscan {

class SimulatedConnector : public VenueConnector {
public:
    SimulatedConnector(std::string_view name, const SimulatedConfig& config);

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] VenueKind kind() const override { return config_.kind; }

    std::future<Quote> fetch_ticker(const std::string& symbol) override;
    std::future<TransferFees> fetch_transfer_fees(const std::string& asset) override;

    // Next quote for a symbol without the simulated latency
    Quote next_quote(const std::string& symbol);

private:
    int draw_latency_ms();

    std::string name_;
    SimulatedConfig config_;
    std::mutex mutex_;
    std::mt19937_64 rng_;
    std::unordered_map<std::string, Decimal> last_prices_;
};

}  // namespace arbscan
