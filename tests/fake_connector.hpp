// arbscan - Scripted connector for tests

#pragma once

#include <arbscan/connector.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>

namespace arbscan::testing {

// Answers from a per-symbol script: a fixed quote, an error, and an optional delay
class FakeConnector : public VenueConnector {
public:
    explicit FakeConnector(std::string name, VenueKind kind = VenueKind::Cex)
        : name_(std::move(name)), kind_(kind) {}

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] VenueKind kind() const override { return kind_; }

    FakeConnector& quote(const std::string& symbol, const char* bid, const char* ask) {
        std::lock_guard<std::mutex> lock(mutex_);
        Quote q;
        q.venue = name_;
        q.symbol = symbol;
        q.bid = Decimal::from_string(bid);
        q.ask = Decimal::from_string(ask);
        q.timestamp = now_ms();
        quotes_[symbol] = q;
        return *this;
    }

    FakeConnector& fail(const std::string& symbol, std::string error) {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_[symbol] = std::move(error);
        return *this;
    }

    FakeConnector& delay(std::chrono::milliseconds d) {
        delay_ = d;
        return *this;
    }

    FakeConnector& withdraw_fee(const std::string& asset, const std::string& network, const char* fee) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& fees = transfer_fees_[asset];
        fees.venue = name_;
        fees.asset = asset;
        fees.withdraw[network] = NetworkFee{Decimal::from_string(fee), false};
        return *this;
    }

    std::future<Quote> fetch_ticker(const std::string& symbol) override {
        ++calls_;
        return std::async(std::launch::async, [this, symbol]() {
            std::this_thread::sleep_for(delay_);
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto err = errors_.find(symbol); err != errors_.end()) {
                throw ConnectorError(err->second);
            }
            auto it = quotes_.find(symbol);
            if (it == quotes_.end()) {
                throw ConnectorError("no market " + symbol + " on " + name_);
            }
            return it->second;
        });
    }

    std::future<TransferFees> fetch_transfer_fees(const std::string& asset) override {
        return std::async(std::launch::async, [this, asset]() {
            std::this_thread::sleep_for(delay_);
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = transfer_fees_.find(asset);
            if (it == transfer_fees_.end()) {
                throw ConnectorError("no fee info for " + asset);
            }
            return it->second;
        });
    }

    [[nodiscard]] int calls() const { return calls_.load(); }

private:
    std::string name_;
    VenueKind kind_;
    std::chrono::milliseconds delay_{0};
    std::mutex mutex_;
    std::map<std::string, Quote> quotes_;
    std::map<std::string, std::string> errors_;
    std::map<std::string, TransferFees> transfer_fees_;
    std::atomic<int> calls_{0};
};

}  // namespace arbscan::testing
