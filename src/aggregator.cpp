// arbscan - Quote Aggregator Implementation

#include <arbscan/aggregator.hpp>
#include <spdlog/spdlog.h>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace arbscan {

namespace {

using Clock = std::chrono::steady_clock;

template <typename T>
struct Slot {
    std::optional<T> value;
    std::string error;
};

// Join point shared by the fetch tasks of one call. Each task writes only its
// own slot; results arriving after the caller stopped waiting are dropped.
template <typename T>
class FanIn {
public:
    explicit FanIn(size_t n) : slots_(n), pending_(n) {}

    void complete(size_t i, T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        slots_[i].value = std::move(value);
        finish_locked();
    }

    void fail(size_t i, std::string error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        slots_[i].error = std::move(error);
        finish_locked();
    }

    std::vector<Slot<T>> wait(Clock::time_point deadline, std::stop_token stop) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, stop, deadline, [this] { return pending_ == 0; });
        closed_ = true;
        return slots_;
    }

private:
    void finish_locked() {
        if (--pending_ == 0) cv_.notify_all();
    }

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::vector<Slot<T>> slots_;
    size_t pending_;
    bool closed_ = false;
};

// Run every task on its own thread and wait for all of them, the deadline,
// or a stop request, whichever comes first.
template <typename T>
std::vector<Slot<T>> fan_out(std::vector<std::function<T()>> tasks,
                             std::chrono::milliseconds timeout,
                             std::stop_token stop) {
    const auto deadline = Clock::now() + timeout;
    auto state = std::make_shared<FanIn<T>>(tasks.size());

    for (size_t i = 0; i < tasks.size(); ++i) {
        try {
            std::thread([state, i, task = std::move(tasks[i])]() {
                try {
                    state->complete(i, task());
                } catch (const std::exception& e) {
                    state->fail(i, e.what());
                } catch (...) {
                    state->fail(i, "unknown error");
                }
            }).detach();
        } catch (const std::system_error& e) {
            state->fail(i, std::string("could not start fetch: ") + e.what());
        }
    }

    auto slots = state->wait(deadline, stop);

    const char* reason = stop.stop_requested() ? "cancelled" : "deadline exceeded";
    for (auto& slot : slots) {
        if (!slot.value && slot.error.empty()) slot.error = reason;
    }
    return slots;
}

void require_connectors(const std::vector<ConnectorPtr>& connectors) {
    for (const auto& c : connectors) {
        if (!c) throw std::invalid_argument("QuoteAggregator: null connector");
    }
}

}  // namespace

Snapshot QuoteAggregator::collect(const std::vector<ConnectorPtr>& connectors,
                                  const std::vector<std::string>& symbols,
                                  std::chrono::milliseconds timeout,
                                  std::stop_token stop) const {
    require_connectors(connectors);

    struct Request {
        std::string venue;
        std::string symbol;
    };

    std::vector<Request> requests;
    std::vector<std::function<Quote()>> tasks;
    requests.reserve(connectors.size() * symbols.size());
    tasks.reserve(connectors.size() * symbols.size());

    for (const auto& connector : connectors) {
        for (const auto& symbol : symbols) {
            requests.push_back({std::string(connector->name()), symbol});
            tasks.push_back([connector, symbol]() {
                Quote q = connector->fetch_ticker(symbol).get();
                if (q.venue.empty()) q.venue = std::string(connector->name());
                if (q.symbol.empty()) q.symbol = symbol;
                return q;
            });
        }
    }

    auto start = Clock::now();
    auto slots = fan_out(std::move(tasks), timeout, std::move(stop));

    Snapshot snapshot;
    snapshot.quotes.reserve(slots.size());
    for (size_t i = 0; i < slots.size(); ++i) {
        if (slots[i].value) {
            snapshot.quotes.push_back(std::move(*slots[i].value));
        } else {
            spdlog::warn("Skipping {} {}: {}", requests[i].venue, requests[i].symbol, slots[i].error);
            snapshot.failures.push_back({requests[i].venue, requests[i].symbol, slots[i].error});
        }
    }

    spdlog::debug("Collected {} quotes, {} failures in {}ms",
                  snapshot.quotes.size(), snapshot.failures.size(),
                  std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
    return snapshot;
}

TransferFeeBatch QuoteAggregator::collect_transfer_fees(
    const std::vector<ConnectorPtr>& connectors,
    const std::vector<std::string>& assets,
    std::chrono::milliseconds timeout,
    std::stop_token stop) const {
    require_connectors(connectors);

    std::vector<FetchFailure> requests;
    std::vector<std::function<TransferFees()>> tasks;

    for (const auto& connector : connectors) {
        for (const auto& asset : assets) {
            requests.push_back({std::string(connector->name()), asset, {}});
            tasks.push_back([connector, asset]() {
                TransferFees fees = connector->fetch_transfer_fees(asset).get();
                if (fees.venue.empty()) fees.venue = std::string(connector->name());
                if (fees.asset.empty()) fees.asset = asset;
                return fees;
            });
        }
    }

    auto slots = fan_out(std::move(tasks), timeout, std::move(stop));

    TransferFeeBatch batch;
    for (size_t i = 0; i < slots.size(); ++i) {
        if (slots[i].value) {
            batch.fees.push_back(std::move(*slots[i].value));
        } else {
            spdlog::warn("No transfer fees for {} on {}: {}",
                         requests[i].symbol, requests[i].venue, slots[i].error);
            requests[i].error = slots[i].error;
            batch.failures.push_back(std::move(requests[i]));
        }
    }
    return batch;
}

}  // namespace arbscan
