// arbscan - Arbitrage Scanner
// Fee-adjusted cross-venue opportunity detection over one quote snapshot

#pragma once

#include <arbscan/fee_model.hpp>
#include <arbscan/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arbscan {

/// Directional venue pair: buy at `buy->ask`, sell at `sell->bid`
struct QuotePair {
    const Quote* buy = nullptr;
    const Quote* sell = nullptr;
};

/// Pure function of its inputs: no I/O, no shared state, never fails on
/// market data. Bad quotes are filtered, unprofitable pairs discarded.
class ArbitrageScanner {
public:
    /// Every ordered venue pair of every symbol, net of taker and withdrawal
    /// fees, whose profit percentage is strictly above `threshold_pct`.
    /// Results are grouped by symbol; order within a symbol is unspecified.
    [[nodiscard]] std::vector<Opportunity> scan(const std::vector<Quote>& quotes,
                                                const FeeModel& fees,
                                                Decimal threshold_pct) const;

    /// Bid and ask present and positive, bid <= ask
    [[nodiscard]] static bool is_valid(const Quote& q) noexcept;

    /// Valid quotes by symbol, at most one per venue (the most recent)
    [[nodiscard]] static std::map<std::string, std::vector<Quote>> group_valid(
        const std::vector<Quote>& quotes);

    /// All V*(V-1) ordered pairs of distinct venues; pointers refer into `group`
    [[nodiscard]] static std::vector<QuotePair> enumerate_pairs(const std::vector<Quote>& group);

    /// Full-precision economics of one directional pair, no threshold applied.
    /// nullopt when either quote is invalid or there is no raw spread
    /// (buy ask >= sell bid).
    [[nodiscard]] static std::optional<VenuePairResult> evaluate(const Quote& buy,
                                                                 const Quote& sell,
                                                                 const FeeModel& fees);

    /// Highest profit percentage first, for display
    static void rank(std::vector<Opportunity>& opportunities);
};

}  // namespace arbscan
