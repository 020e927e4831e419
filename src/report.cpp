// arbscan - Scan Report Implementation

#include <arbscan/report.hpp>
#include <nlohmann/json.hpp>
#include <iomanip>
#include <string>

namespace arbscan {

using json = nlohmann::json;

namespace {

constexpr int WIDTH = 110;
constexpr int PLACES = 4;

void print_opportunities(std::ostream& out, const std::vector<Opportunity>& opportunities) {
    out << std::left
        << std::setw(12) << "Symbol"
        << std::setw(12) << "Buy"
        << std::setw(12) << "Sell"
        << std::setw(14) << "Buy Price"
        << std::setw(14) << "Sell Price"
        << std::setw(12) << "Fees"
        << std::setw(14) << "Net Profit"
        << std::setw(10) << "Profit %" << '\n';
    out << std::string(WIDTH, '-') << '\n';

    for (const auto& opp : opportunities) {
        out << std::left
            << std::setw(12) << opp.symbol
            << std::setw(12) << opp.buy_venue
            << std::setw(12) << opp.sell_venue
            << std::setw(14) << opp.buy_price.to_string(PLACES)
            << std::setw(14) << opp.sell_price.to_string(PLACES)
            << std::setw(12) << opp.total_fees.to_string(PLACES)
            << std::setw(14) << opp.net_profit.to_string(PLACES)
            << std::setw(10) << opp.profit_percentage.to_string(PLACES) << '\n';
    }
}

void print_failures(std::ostream& out, const std::vector<FetchFailure>& failures) {
    out << std::string(WIDTH, '-') << '\n';
    for (const auto& f : failures) {
        out << "Failed: " << std::left
            << std::setw(12) << f.venue
            << std::setw(12) << f.symbol
            << f.error << '\n';
    }
}

}  // namespace

json to_json(const Opportunity& opp) {
    return {
        {"symbol", opp.symbol},
        {"buy_venue", opp.buy_venue},
        {"sell_venue", opp.sell_venue},
        {"buy_price", opp.buy_price.to_string(PLACES)},
        {"sell_price", opp.sell_price.to_string(PLACES)},
        {"buy_fee", opp.buy_fee.to_string(PLACES)},
        {"sell_fee", opp.sell_fee.to_string(PLACES)},
        {"withdrawal_fee", opp.withdrawal_fee.to_string(PLACES)},
        {"gross_profit", opp.gross_profit.to_string(PLACES)},
        {"total_fees", opp.total_fees.to_string(PLACES)},
        {"net_profit", opp.net_profit.to_string(PLACES)},
        {"profit_percentage", opp.profit_percentage.to_string(PLACES)}
    };
}

json to_json(const FetchFailure& failure) {
    return {{"venue", failure.venue}, {"symbol", failure.symbol}, {"error", failure.error}};
}

json to_json(const ScanResult& result) {
    json out = {
        {"cycle", result.cycle},
        {"started_at", result.started_at},
        {"finished_at", result.finished_at},
        {"quotes", result.quotes.size()},
        {"opportunities", json::array()},
        {"failures", json::array()}
    };
    for (const auto& opp : result.opportunities) {
        out["opportunities"].push_back(to_json(opp));
    }
    for (const auto& f : result.failures) {
        out["failures"].push_back(to_json(f));
    }
    return out;
}

void print_json(std::ostream& out, const ScanResult& result) {
    out << to_json(result).dump() << std::endl;
}

void print_table(std::ostream& out, const ScanResult& result) {
    out << '\n';
    out << std::string(WIDTH, '=') << '\n';
    out << "Cycle " << result.cycle << ": " << result.quotes.size() << " quotes, "
        << result.failures.size() << " failures, "
        << result.opportunities.size() << " opportunities" << '\n';
    out << std::string(WIDTH, '=') << '\n';

    if (result.opportunities.empty()) {
        out << "No opportunities above threshold" << '\n';
    } else {
        print_opportunities(out, result.opportunities);
    }

    if (!result.failures.empty()) {
        print_failures(out, result.failures);
    }
    out << std::flush;
}

}  // namespace arbscan
