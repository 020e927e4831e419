// arbscan - Tick Store Implementation

#include <arbscan/tick_store.hpp>
#include <algorithm>
#include <map>
#include <stdexcept>
#include <tuple>

namespace arbscan {

namespace {

// Trade price if the venue reported one, else the mid
std::optional<Decimal> tick_price(const Quote& q) {
    return q.last ? q.last : q.mid_price();
}

int64_t bucket_of(int64_t ts) {
    int64_t b = ts - (ts % TickStore::BUCKET_MS);
    return ts < 0 && ts % TickStore::BUCKET_MS != 0 ? b - TickStore::BUCKET_MS : b;
}

}  // namespace

MemoryTickStore::MemoryTickStore(std::chrono::milliseconds retention)
    : retention_(retention) {
    if (retention_.count() <= 0) {
        throw std::invalid_argument("Tick retention must be positive");
    }
}

void MemoryTickStore::save_ticks(const std::vector<Quote>& quotes) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& q : quotes) {
        if (!tick_price(q)) continue;
        ticks_.push_back(q);
        newest_ = std::max(newest_, q.timestamp);
    }

    if (ticks_.empty()) return;
    const int64_t cutoff = newest_ - retention_.count();
    std::erase_if(ticks_, [cutoff](const Quote& q) { return q.timestamp < cutoff; });
}

std::vector<Quote> MemoryTickStore::query_range(const std::string& symbol,
                                                int64_t start_ms, int64_t end_ms) const {
    std::vector<Quote> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& q : ticks_) {
            if (q.symbol == symbol && q.timestamp >= start_ms && q.timestamp <= end_ms) {
                out.push_back(q);
            }
        }
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const Quote& a, const Quote& b) { return a.timestamp < b.timestamp; });
    return out;
}

std::vector<OhlcvBar> MemoryTickStore::query_ohlcv(const std::string& symbol,
                                                   int64_t start_ms, int64_t end_ms) const {
    // Bars are built from the ticks of every bucket that overlaps the range
    auto ticks = query_range(symbol, bucket_of(start_ms), bucket_of(end_ms) + BUCKET_MS - 1);

    std::map<std::tuple<int64_t, std::string>, OhlcvBar> bars;
    for (const auto& q : ticks) {
        const int64_t bucket = bucket_of(q.timestamp);
        if (bucket < start_ms || bucket > end_ms) continue;

        const Decimal price = *tick_price(q);
        auto [it, inserted] = bars.try_emplace(std::make_tuple(bucket, q.venue));
        OhlcvBar& bar = it->second;
        if (inserted) {
            bar.venue = q.venue;
            bar.symbol = symbol;
            bar.bucket_start = bucket;
            bar.open = bar.high = bar.low = price;
        }

        bar.high = std::max(bar.high, price);
        bar.low = std::min(bar.low, price);
        bar.close = price;
        if (q.volume) bar.volume += *q.volume;
        ++bar.ticks;
    }

    std::vector<OhlcvBar> out;
    out.reserve(bars.size());
    for (auto& [key, bar] : bars) {
        out.push_back(std::move(bar));
    }
    return out;
}

size_t MemoryTickStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ticks_.size();
}

std::unique_ptr<TickStore> make_memory_store(std::chrono::milliseconds retention) {
    return std::make_unique<MemoryTickStore>(retention);
}

}  // namespace arbscan
