// arbscan - Scan Orchestrator Implementation

#include <arbscan/orchestrator.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace arbscan {

ScanSettings ScanSettings::from_config(const Config& config) {
    ScanSettings settings;
    settings.symbols = config.scanner.symbols;
    settings.threshold_pct = config.scanner.threshold_pct;
    settings.timeout = std::chrono::milliseconds(config.general.timeout_ms);
    settings.interval = std::chrono::milliseconds(config.scanner.interval_ms);
    return settings;
}

FeeModel make_fee_model(const Config& config) {
    FeeModel model(config.fees.default_schedule);
    for (const auto& [venue, schedule] : config.fees.venues) {
        FeeSchedule s = schedule;
        if (s.venue.empty()) s.venue = venue;
        model.set_schedule(std::move(s));
    }
    return model;
}

ScanOrchestrator::ScanOrchestrator(ScanSettings settings,
                                   FeeModel fees,
                                   std::vector<ConnectorPtr> connectors,
                                   std::shared_ptr<TickStore> store)
    : settings_(std::move(settings)),
      connectors_(std::move(connectors)),
      store_(std::move(store)),
      fees_(std::move(fees)) {
    for (const auto& c : connectors_) {
        if (!c) throw std::invalid_argument("ScanOrchestrator: null connector");
    }
}

ScanOrchestrator::~ScanOrchestrator() {
    stop();
}

FeeModel ScanOrchestrator::fee_model() const {
    std::shared_lock<std::shared_mutex> lock(fees_mutex_);
    return fees_;
}

ScanResult ScanOrchestrator::run_once(std::stop_token stop) {
    ScanResult result;
    result.cycle = ++cycles_;
    result.started_at = now_ms();

    Snapshot snapshot = aggregator_.collect(connectors_, settings_.symbols,
                                            settings_.timeout, std::move(stop));

    if (store_) {
        try {
            store_->save_ticks(snapshot.quotes);
        } catch (const std::exception& e) {
            spdlog::error("Cycle {}: saving {} ticks failed: {}",
                          result.cycle, snapshot.quotes.size(), e.what());
        }
    }

    // Fees stay fixed for the whole scan even if a refresh lands meanwhile
    const FeeModel fees = fee_model();
    result.opportunities = scanner_.scan(snapshot.quotes, fees, settings_.threshold_pct);
    ArbitrageScanner::rank(result.opportunities);

    result.quotes = std::move(snapshot.quotes);
    result.failures = std::move(snapshot.failures);
    result.finished_at = now_ms();

    spdlog::info("Cycle {}: {} quotes, {} failures, {} opportunities in {}ms",
                 result.cycle, result.quotes.size(), result.failures.size(),
                 result.opportunities.size(), result.finished_at - result.started_at);
    return result;
}

TransferFeeBatch ScanOrchestrator::refresh_transfer_fees(const std::vector<std::string>& assets,
                                                         std::stop_token stop) {
    TransferFeeBatch batch = aggregator_.collect_transfer_fees(connectors_, assets,
                                                               settings_.timeout, std::move(stop));

    size_t applied = 0;
    {
        std::unique_lock<std::shared_mutex> lock(fees_mutex_);
        for (const auto& fees : batch.fees) {
            if (fees_.apply_transfer_fees(fees)) {
                ++applied;
            } else {
                spdlog::debug("No usable withdrawal fee for {} on {}", fees.asset, fees.venue);
            }
        }
    }

    spdlog::info("Refreshed {} withdrawal fees ({} venue/asset lookups failed)",
                 applied, batch.failures.size());
    return batch;
}

void ScanOrchestrator::on_result(ResultCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

void ScanOrchestrator::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    scan_thread_ = std::jthread([this](std::stop_token stop) { scan_loop(stop); });
}

void ScanOrchestrator::stop() {
    running_.store(false);

    if (scan_thread_.joinable()) {
        scan_thread_.request_stop();
        scan_thread_.join();
    }
}

void ScanOrchestrator::scan_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto result = run_once(stop);
        if (stop.stop_requested()) {
            break;  // partial cycle cut short by stop()
        }

        // Callbacks run unlocked so they may register further callbacks
        std::vector<ResultCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callbacks = callbacks_;
        }
        for (const auto& callback : callbacks) {
            try {
                callback(result);
            } catch (const std::exception& e) {
                spdlog::error("Result callback failed: {}", e.what());
            }
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, stop, settings_.interval, [] { return false; });
    }
}

}  // namespace arbscan
