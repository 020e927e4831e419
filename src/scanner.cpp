// arbscan - Arbitrage Scanner Implementation

#include <arbscan/scanner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace arbscan {

namespace {

// Pair economics are exact on an 18-digit grid; 8-digit rounding is for output
using X18 = __int128;

constexpr X18 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr X18 LIFT = X18_ONE / Decimal::SCALE;  // 8 -> 18 digits
constexpr X18 PRODUCT_LIFT = X18_ONE / (static_cast<X18>(Decimal::SCALE) * Decimal::SCALE);
constexpr int DISPLAY_PLACES = 4;

X18 lift(Decimal d) {
    return static_cast<X18>(d.scaled_value()) * LIFT;
}

// Product of two 8-digit decimals, no digits lost
X18 mul(Decimal a, Decimal b) {
    return static_cast<X18>(a.scaled_value()) * b.scaled_value() * PRODUCT_LIFT;
}

// Round half away from zero
X18 div_round(X18 num, X18 den) {
    const bool negative = (num < 0) != (den < 0);
    X18 n = num < 0 ? -num : num;
    X18 d = den < 0 ? -den : den;
    X18 q = n / d;
    if ((n % d) * 2 >= d) ++q;
    return negative ? -q : q;
}

Decimal narrow(X18 v) {
    return Decimal(static_cast<int64_t>(div_round(v, LIFT)));
}

struct Evaluation {
    VenuePairResult result;
    X18 total_cost = 0;
    X18 net_profit = 0;
};

std::optional<Evaluation> evaluate_exact(const Quote& buy, const Quote& sell, const FeeModel& fees) {
    if (!ArbitrageScanner::is_valid(buy) || !ArbitrageScanner::is_valid(sell)) {
        return std::nullopt;
    }

    const Decimal buy_price = *buy.ask;
    const Decimal sell_price = *sell.bid;
    if (buy_price >= sell_price) {
        return std::nullopt;
    }

    const FeeSchedule buy_fees = fees.resolve(buy.venue);
    const FeeSchedule sell_fees = fees.resolve(sell.venue);

    const X18 buy_fee = mul(buy_price, buy_fees.taker_rate);
    const X18 total_cost = lift(buy_price) + buy_fee;
    if (total_cost <= 0) {
        return std::nullopt;
    }

    const X18 sell_fee = mul(sell_price, sell_fees.taker_rate);
    const X18 net_revenue = lift(sell_price) - sell_fee;

    // The asset leaves the buy venue, so its withdrawal fee applies, valued
    // at the buy price
    const Decimal withdrawal_in_asset = FeeModel::withdrawal_fee(buy_fees, base_asset(buy.symbol));
    const X18 withdrawal_fee = mul(withdrawal_in_asset, buy_price);

    const X18 net_profit = net_revenue - total_cost - withdrawal_fee;

    Evaluation e;
    e.total_cost = total_cost;
    e.net_profit = net_profit;

    VenuePairResult& r = e.result;
    r.symbol = buy.symbol;
    r.buy_venue = buy.venue;
    r.sell_venue = sell.venue;
    r.buy_price = buy_price;
    r.sell_price = sell_price;
    r.buy_fee = narrow(buy_fee);
    r.sell_fee = narrow(sell_fee);
    r.withdrawal_fee = narrow(withdrawal_fee);
    r.total_cost = narrow(total_cost);
    r.net_revenue = narrow(net_revenue);
    r.gross_profit = sell_price - buy_price;
    r.total_fees = narrow(buy_fee + sell_fee + withdrawal_fee);
    r.net_profit = narrow(net_profit);
    r.profit_percentage = Decimal(static_cast<int64_t>(
        div_round(net_profit * 100 * Decimal::SCALE, total_cost)));
    return e;
}

// net_profit / total_cost * 100 > threshold, compared without rounding
bool above_threshold(const Evaluation& e, Decimal threshold_pct) {
    return e.net_profit * 100 * Decimal::SCALE >
           static_cast<X18>(threshold_pct.scaled_value()) * e.total_cost;
}

}  // namespace

bool ArbitrageScanner::is_valid(const Quote& q) noexcept {
    return q.bid && q.ask &&
           q.bid->is_positive() && q.ask->is_positive() &&
           *q.bid <= *q.ask;
}

std::map<std::string, std::vector<Quote>> ArbitrageScanner::group_valid(
    const std::vector<Quote>& quotes) {
    std::map<std::string, std::vector<Quote>> groups;

    for (const auto& q : quotes) {
        if (!is_valid(q)) {
            continue;
        }

        auto& group = groups[q.symbol];
        auto venue = to_lower(q.venue);
        auto same = std::find_if(group.begin(), group.end(),
                                 [&venue](const Quote& g) { return to_lower(g.venue) == venue; });

        if (same == group.end()) {
            group.push_back(q);
        } else if (q.timestamp >= same->timestamp) {
            *same = q;
        }
    }

    return groups;
}

std::vector<QuotePair> ArbitrageScanner::enumerate_pairs(const std::vector<Quote>& group) {
    std::vector<QuotePair> pairs;
    if (group.size() < 2) {
        return pairs;
    }

    pairs.reserve(group.size() * (group.size() - 1));
    for (size_t i = 0; i < group.size(); ++i) {
        for (size_t j = 0; j < group.size(); ++j) {
            if (i == j) continue;
            pairs.push_back({&group[i], &group[j]});
        }
    }
    return pairs;
}

std::optional<VenuePairResult> ArbitrageScanner::evaluate(const Quote& buy,
                                                          const Quote& sell,
                                                          const FeeModel& fees) {
    auto e = evaluate_exact(buy, sell, fees);
    if (!e) {
        return std::nullopt;
    }
    return std::move(e->result);
}

std::vector<Opportunity> ArbitrageScanner::scan(const std::vector<Quote>& quotes,
                                                const FeeModel& fees,
                                                Decimal threshold_pct) const {
    std::vector<Opportunity> opportunities;

    for (const auto& [symbol, group] : group_valid(quotes)) {
        if (group.size() < 2) {
            continue;
        }

        for (const auto& pair : enumerate_pairs(group)) {
            auto e = evaluate_exact(*pair.buy, *pair.sell, fees);
            if (!e) {
                continue;
            }

            const VenuePairResult& result = e->result;
            if (e->net_profit <= 0) {
                spdlog::trace("{} {}->{}: net {} after fees", symbol, result.buy_venue,
                              result.sell_venue, result.net_profit.to_string());
                continue;
            }

            if (!above_threshold(*e, threshold_pct)) {
                spdlog::trace("{} {}->{}: {}% not above {}%", symbol, result.buy_venue,
                              result.sell_venue, result.profit_percentage.to_string(),
                              threshold_pct.to_string());
                continue;
            }

            opportunities.push_back(Opportunity::from_result(result, DISPLAY_PLACES));
        }
    }

    return opportunities;
}

void ArbitrageScanner::rank(std::vector<Opportunity>& opportunities) {
    std::stable_sort(opportunities.begin(), opportunities.end(),
                     [](const Opportunity& a, const Opportunity& b) {
                         if (a.profit_percentage != b.profit_percentage) {
                             return a.profit_percentage > b.profit_percentage;
                         }
                         return a.net_profit > b.net_profit;
                     });
}

}  // namespace arbscan
