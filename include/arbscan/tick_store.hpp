// arbscan - Tick Store
// Persistence port for quote history and 1-minute OHLCV aggregation

#pragma once

#include <arbscan/types.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace arbscan {

// One OHLCV bucket for a venue and symbol
struct OhlcvBar {
    std::string venue;
    std::string symbol;
    int64_t bucket_start = 0;  // ms, aligned to the bucket width
    Decimal open;
    Decimal high;
    Decimal low;
    Decimal close;
    Decimal volume;
    size_t ticks = 0;
};

class TickStore {
public:
    static constexpr int64_t BUCKET_MS = 60000;

    virtual ~TickStore() = default;

    // Append a batch of quotes; quotes without a price are skipped
    virtual void save_ticks(const std::vector<Quote>& quotes) = 0;

    // Quotes for a symbol with start_ms <= timestamp <= end_ms, oldest first
    virtual std::vector<Quote> query_range(const std::string& symbol,
                                           int64_t start_ms, int64_t end_ms) const = 0;

    // 1-minute bars whose bucket start lies in [start_ms, end_ms], oldest first
    virtual std::vector<OhlcvBar> query_ohlcv(const std::string& symbol,
                                              int64_t start_ms, int64_t end_ms) const = 0;
};

// Thread-safe in-process store. Ticks older than the retention window,
// measured back from the newest saved timestamp, are pruned on save.
class MemoryTickStore final : public TickStore {
public:
    static constexpr std::chrono::milliseconds DEFAULT_RETENTION{86400000};

    explicit MemoryTickStore(std::chrono::milliseconds retention = DEFAULT_RETENTION);

    void save_ticks(const std::vector<Quote>& quotes) override;
    std::vector<Quote> query_range(const std::string& symbol,
                                   int64_t start_ms, int64_t end_ms) const override;
    std::vector<OhlcvBar> query_ohlcv(const std::string& symbol,
                                      int64_t start_ms, int64_t end_ms) const override;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::chrono::milliseconds retention() const noexcept { return retention_; }

private:
    std::chrono::milliseconds retention_;
    mutable std::mutex mutex_;
    std::vector<Quote> ticks_;
    int64_t newest_ = INT64_MIN;
};

std::unique_ptr<TickStore> make_memory_store(
    std::chrono::milliseconds retention = MemoryTickStore::DEFAULT_RETENTION);

}  // namespace arbscan
