// arbscan - Simulated Connector Implementation

#include <arbscan/connectors/simulated.hpp>
#include <algorithm>
#include <chrono>
#include <thread>

namespace arbscan {

SimulatedConnector::SimulatedConnector(std::string_view name, const SimulatedConfig& config)
    : name_(name),
      config_(config),
      rng_(config.seed ? *config.seed : std::random_device{}()) {
    // Stablecoin withdrawal table every simulated venue publishes
    auto& usdt = config_.withdraw_fees["USDT"];
    usdt.emplace("TRX", Decimal::from_int(1));
    usdt.emplace("ERC20", Decimal::from_int(25));
    usdt.emplace("SOL", Decimal::from_string("0.5"));
}

int SimulatedConnector::draw_latency_ms() {
    std::lock_guard<std::mutex> lock(mutex_);
    int lo = std::max(0, config_.min_latency_ms);
    int hi = std::max(lo, config_.max_latency_ms);
    return std::uniform_int_distribution<int>(lo, hi)(rng_);
}

Quote SimulatedConnector::next_quote(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = last_prices_.try_emplace(symbol, config_.seed_price).first;
    double step = config_.max_step.to_double();
    double factor = std::uniform_real_distribution<double>(1.0 - step, 1.0 + step)(rng_);
    it->second = it->second * Decimal::from_double(factor);

    const Decimal price = it->second;
    const Decimal half = price * config_.half_spread;

    Quote q;
    q.venue = name_;
    q.symbol = symbol;
    q.bid = price - half;
    q.ask = price + half;
    q.last = price;
    q.volume = Decimal::from_double(std::uniform_real_distribution<double>(1000.0, 5000.0)(rng_));
    q.timestamp = now_ms();
    return q;
}

std::future<Quote> SimulatedConnector::fetch_ticker(const std::string& symbol) {
    int latency = draw_latency_ms();
    return std::async(std::launch::async, [this, symbol, latency]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(latency));
        return next_quote(symbol);
    });
}

std::future<TransferFees> SimulatedConnector::fetch_transfer_fees(const std::string& asset) {
    return std::async(std::launch::async, [this, asset]() {
        auto it = config_.withdraw_fees.find(asset);
        if (it == config_.withdraw_fees.end()) {
            throw ConnectorError("No fee info found for " + asset + " on " + name_);
        }

        TransferFees fees;
        fees.venue = name_;
        fees.asset = asset;
        for (const auto& [network, fee] : it->second) {
            fees.withdraw[network] = NetworkFee{fee, false};
            fees.deposit[network] = NetworkFee{Decimal::zero(), false};
        }
        return fees;
    });
}

}  // namespace arbscan
