// arbscan - Scan Orchestrator
// Drives scan cycles: collect quotes, persist them, scan, rank

#pragma once

#include <arbscan/aggregator.hpp>
#include <arbscan/config.hpp>
#include <arbscan/fee_model.hpp>
#include <arbscan/scanner.hpp>
#include <arbscan/tick_store.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace arbscan {

/// What to scan and how often
struct ScanSettings {
    std::vector<std::string> symbols;
    Decimal threshold_pct{20000000};  // 0.2 %
    std::chrono::milliseconds timeout{5000};
    std::chrono::milliseconds interval{10000};

    static ScanSettings from_config(const Config& config);
};

/// Outcome of one cycle, plain data for the caller to render or store
struct ScanResult {
    uint64_t cycle = 0;
    int64_t started_at = 0;
    int64_t finished_at = 0;
    std::vector<Opportunity> opportunities;  // ranked, best first
    std::vector<FetchFailure> failures;
    std::vector<Quote> quotes;
};

/// FeeModel built from the [fees] tables of a Config
FeeModel make_fee_model(const Config& config);

class ScanOrchestrator {
public:
    using ResultCallback = std::function<void(const ScanResult&)>;

    /// Throws std::invalid_argument on a null connector.
    /// `store` is optional; when set every snapshot is saved to it.
    ScanOrchestrator(ScanSettings settings,
                     FeeModel fees,
                     std::vector<ConnectorPtr> connectors,
                     std::shared_ptr<TickStore> store = nullptr);
    ~ScanOrchestrator();

    // Non-copyable
    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    /// One synchronous cycle. `stop` abandons outstanding fetches early.
    ScanResult run_once(std::stop_token stop = {});

    /// Pull withdrawal fees for `assets` from every venue and merge them into
    /// the fee model. Takes effect from the next cycle.
    TransferFeeBatch refresh_transfer_fees(const std::vector<std::string>& assets,
                                           std::stop_token stop = {});

    /// Subscribe to results of the background loop
    void on_result(ResultCallback callback);

    /// Run cycles on a background thread, `interval` apart
    void start();

    /// Stop the background loop and wait for it
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Copy of the current fee model
    [[nodiscard]] FeeModel fee_model() const;

    [[nodiscard]] const ScanSettings& settings() const noexcept { return settings_; }
    [[nodiscard]] const std::vector<ConnectorPtr>& connectors() const noexcept { return connectors_; }

private:
    void scan_loop(std::stop_token stop);

    ScanSettings settings_;
    std::vector<ConnectorPtr> connectors_;
    std::shared_ptr<TickStore> store_;
    QuoteAggregator aggregator_;
    ArbitrageScanner scanner_;

    FeeModel fees_;
    mutable std::shared_mutex fees_mutex_;

    std::vector<ResultCallback> callbacks_;
    std::mutex callbacks_mutex_;

    std::atomic<uint64_t> cycles_{0};
    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::jthread scan_thread_;
};

}  // namespace arbscan
