// arbscan - CCXT Connector
// REST proxy to a CCXT service for centralized exchanges

#pragma once

#include <arbscan/config.hpp>
#include <arbscan/connector.hpp>
#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <chrono>

namespace arbscan {

// CCXT Connector - connects to a CCXT REST service
class CcxtConnector : public VenueConnector {
public:
    CcxtConnector(std::string_view name, const CcxtConfig& config);
    ~CcxtConnector() override;

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] VenueKind kind() const override { return VenueKind::Cex; }
    [[nodiscard]] std::optional<int> latency_ms() const override {
        int lat = latency_.load();
        return lat > 0 ? std::optional<int>(lat) : std::nullopt;
    }

    // Upper bound on every HTTP request; a hung service cannot pin a fetch thread
    [[nodiscard]] std::chrono::milliseconds request_timeout() const noexcept;

    std::future<void> connect() override;
    std::future<Quote> fetch_ticker(const std::string& symbol) override;
    std::future<TransferFees> fetch_transfer_fees(const std::string& asset) override;

    // Parse a CCXT ticker payload
    static Quote parse_ticker(const nlohmann::json& data, std::string_view venue,
                              const std::string& symbol);

    // Parse a CCXT fetchDepositWithdrawFees payload for one asset
    static TransferFees parse_transfer_fees(const nlohmann::json& data, std::string_view venue,
                                            const std::string& asset);

private:
    void update_latency(int64_t start_ns);

    std::string name_;
    CcxtConfig config_;
    std::atomic<int> latency_{0};
};

}  // namespace arbscan
