// arbscan - Arbitrage Scanner Tests

#include <catch2/catch_test_macros.hpp>
#include <arbscan/scanner.hpp>
#include <algorithm>
#include <set>
#include <utility>

using namespace arbscan;

namespace {

Decimal dec(const char* s) {
    return Decimal::from_string(s);
}

Quote make_quote(const char* venue, const char* symbol, const char* bid, const char* ask,
                 int64_t ts = 1000) {
    Quote q;
    q.venue = venue;
    q.symbol = symbol;
    q.bid = dec(bid);
    q.ask = dec(ask);
    q.timestamp = ts;
    return q;
}

FeeSchedule taker(const char* venue, const char* rate) {
    FeeSchedule s;
    s.venue = venue;
    s.taker_rate = dec(rate);
    return s;
}

FeeModel zero_fees() {
    return FeeModel(taker("default", "0"));
}

}  // namespace

TEST_CASE("Fee-adjusted pair economics", "[scanner]") {
    FeeModel fees(taker("default", "0.002"));
    fees.set_schedule(taker("A", "0.001"));
    fees.set_schedule(taker("B", "0.002"));

    auto a = make_quote("A", "X/USDT", "99", "100");
    auto b = make_quote("B", "X/USDT", "102", "103");

    SECTION("Exact intermediate values") {
        auto r = ArbitrageScanner::evaluate(a, b, fees);
        REQUIRE(r.has_value());
        REQUIRE(r->buy_fee == dec("0.1"));
        REQUIRE(r->total_cost == dec("100.1"));
        REQUIRE(r->sell_fee == dec("0.204"));
        REQUIRE(r->net_revenue == dec("101.796"));
        REQUIRE(r->withdrawal_fee.is_zero());
        REQUIRE(r->gross_profit == dec("2"));
        REQUIRE(r->total_fees == dec("0.304"));
        REQUIRE(r->net_profit == dec("1.696"));
        REQUIRE(r->profit_percentage == dec("1.69430569"));
    }

    SECTION("Scan emits one rounded opportunity") {
        ArbitrageScanner scanner;
        auto opps = scanner.scan({a, b}, fees, Decimal::zero());
        REQUIRE(opps.size() == 1);

        const auto& opp = opps[0];
        REQUIRE(opp.symbol == "X/USDT");
        REQUIRE(opp.buy_venue == "A");
        REQUIRE(opp.sell_venue == "B");
        REQUIRE(opp.buy_price == dec("100"));
        REQUIRE(opp.sell_price == dec("102"));
        REQUIRE(opp.net_profit == dec("1.696"));
        REQUIRE(opp.profit_percentage == dec("1.6943"));
        REQUIRE(opp.profit_percentage.to_string(4) == "1.6943");
    }

    SECTION("Reverse direction has no raw spread") {
        REQUIRE_FALSE(ArbitrageScanner::evaluate(b, a, fees).has_value());
    }
}

TEST_CASE("Withdrawal fee is valued at the buy price", "[scanner]") {
    FeeSchedule a_fees = taker("A", "0");
    a_fees.withdrawal_fees["BTC"] = dec("0.0005");

    FeeModel fees = zero_fees();
    fees.set_schedule(a_fees);

    auto a = make_quote("A", "BTC/USDT", "49990", "50000");
    auto b = make_quote("B", "BTC/USDT", "51000", "51010");

    auto r = ArbitrageScanner::evaluate(a, b, fees);
    REQUIRE(r.has_value());
    REQUIRE(r->withdrawal_fee == dec("25"));
    REQUIRE(r->net_profit == dec("975"));
    REQUIRE(r->total_fees == dec("25"));
    REQUIRE(r->profit_percentage == dec("1.95"));

    SECTION("Only the buy venue's withdrawal fee applies") {
        auto reverse_fees = zero_fees();
        FeeSchedule b_fees = taker("B", "0");
        b_fees.withdrawal_fees["BTC"] = dec("0.0005");
        reverse_fees.set_schedule(b_fees);

        auto r2 = ArbitrageScanner::evaluate(a, b, reverse_fees);
        REQUIRE(r2.has_value());
        REQUIRE(r2->withdrawal_fee.is_zero());
    }
}

TEST_CASE("Fees can erase a raw spread", "[scanner]") {
    FeeModel fees(taker("default", "0.01"));
    auto a = make_quote("A", "X/USDT", "99", "100");
    auto b = make_quote("B", "X/USDT", "100.5", "101");

    ArbitrageScanner scanner;
    REQUIRE(scanner.scan({a, b}, fees, Decimal::zero()).empty());

    auto r = ArbitrageScanner::evaluate(a, b, fees);
    REQUIRE(r.has_value());
    REQUIRE(r->net_profit.is_negative());
}

TEST_CASE("Sub-unit fees are not truncated away", "[scanner]") {
    // Fees of about 1.9e-8 per side sit below the 8-digit grid
    FeeModel fees(taker("default", "0.0019"));
    auto a = make_quote("A", "PEPE/USDT", "0.00001000", "0.00001001");
    auto b = make_quote("B", "PEPE/USDT", "0.00001004", "0.00001005");

    ArbitrageScanner scanner;
    REQUIRE(scanner.scan({a, b}, fees, Decimal::zero()).empty());

    // exact net is -0.000000008095
    auto r = ArbitrageScanner::evaluate(a, b, fees);
    REQUIRE(r.has_value());
    REQUIRE(r->net_profit == dec("-0.00000001"));
    REQUIRE(r->buy_fee == dec("0.00000002"));
    REQUIRE(r->sell_fee == dec("0.00000002"));
}

TEST_CASE("Evaluate rejects invalid quotes", "[scanner]") {
    auto fees = zero_fees();
    auto good = make_quote("B", "X/USDT", "102", "103");

    SECTION("Zero ask") {
        auto zero_ask = make_quote("A", "X/USDT", "0", "0");
        REQUIRE_FALSE(ArbitrageScanner::evaluate(zero_ask, good, fees).has_value());
    }

    SECTION("Missing bid on the sell side") {
        auto a = make_quote("A", "X/USDT", "99", "100");
        auto no_bid = good;
        no_bid.bid.reset();
        REQUIRE_FALSE(ArbitrageScanner::evaluate(a, no_bid, fees).has_value());
    }

    SECTION("Crossed book") {
        auto crossed = make_quote("A", "X/USDT", "101", "100");
        REQUIRE_FALSE(ArbitrageScanner::evaluate(crossed, good, fees).has_value());
    }
}

TEST_CASE("Threshold is exclusive", "[scanner]") {
    ArbitrageScanner scanner;
    auto fees = zero_fees();
    std::vector<Quote> quotes = {
        make_quote("A", "X/USDT", "99", "100"),
        make_quote("B", "X/USDT", "101", "102"),
    };

    // buy 100, sell 101, no fees: exactly 1 %
    REQUIRE(scanner.scan(quotes, fees, dec("1")).empty());

    auto below = scanner.scan(quotes, fees, dec("1") - Decimal::epsilon());
    REQUIRE(below.size() == 1);
    REQUIRE(below[0].profit_percentage == dec("1"));
}

TEST_CASE("Net profit decreases as taker rates rise", "[scanner]") {
    auto a = make_quote("A", "X/USDT", "99", "100");
    auto b = make_quote("B", "X/USDT", "110", "111");

    const char* rates[] = {"0", "0.0005", "0.001", "0.002", "0.005", "0.01"};

    SECTION("Buy venue rate") {
        std::optional<Decimal> previous;
        for (const char* rate : rates) {
            FeeModel fees = zero_fees();
            fees.set_schedule(taker("A", rate));
            auto r = ArbitrageScanner::evaluate(a, b, fees);
            REQUIRE(r.has_value());
            if (previous) {
                REQUIRE(r->net_profit < *previous);
            }
            previous = r->net_profit;
        }
    }

    SECTION("Sell venue rate") {
        std::optional<Decimal> previous;
        for (const char* rate : rates) {
            FeeModel fees = zero_fees();
            fees.set_schedule(taker("B", rate));
            auto r = ArbitrageScanner::evaluate(a, b, fees);
            REQUIRE(r.has_value());
            if (previous) {
                REQUIRE(r->net_profit < *previous);
            }
            previous = r->net_profit;
        }
    }
}

TEST_CASE("Quote validity filter", "[scanner]") {
    SECTION("Rules") {
        REQUIRE(ArbitrageScanner::is_valid(make_quote("A", "X/USDT", "99", "100")));
        REQUIRE(ArbitrageScanner::is_valid(make_quote("A", "X/USDT", "100", "100")));
        REQUIRE_FALSE(ArbitrageScanner::is_valid(make_quote("A", "X/USDT", "101", "100")));
        REQUIRE_FALSE(ArbitrageScanner::is_valid(make_quote("A", "X/USDT", "0", "100")));
        REQUIRE_FALSE(ArbitrageScanner::is_valid(make_quote("A", "X/USDT", "-1", "100")));

        Quote missing = make_quote("A", "X/USDT", "99", "100");
        missing.ask.reset();
        REQUIRE_FALSE(ArbitrageScanner::is_valid(missing));
    }

    SECTION("Crossed quotes never reach a pair") {
        // C has a crossed book with an attractive bid
        std::vector<Quote> quotes = {
            make_quote("A", "X/USDT", "99", "100"),
            make_quote("B", "X/USDT", "99.5", "100.5"),
            make_quote("C", "X/USDT", "150", "101"),
        };

        auto groups = ArbitrageScanner::group_valid(quotes);
        REQUIRE(groups["X/USDT"].size() == 2);

        ArbitrageScanner scanner;
        auto opps = scanner.scan(quotes, zero_fees(), Decimal::zero());
        for (const auto& opp : opps) {
            REQUIRE(opp.buy_venue != "C");
            REQUIRE(opp.sell_venue != "C");
        }
    }

    SECTION("Symbols with one valid quote are skipped") {
        ArbitrageScanner scanner;
        std::vector<Quote> quotes = {
            make_quote("A", "X/USDT", "99", "100"),
            make_quote("B", "X/USDT", "120", "110"),
        };
        REQUIRE(scanner.scan(quotes, zero_fees(), Decimal::zero()).empty());
        REQUIRE(scanner.scan({}, zero_fees(), Decimal::zero()).empty());
    }
}

TEST_CASE("Same-venue quotes keep the most recent", "[scanner]") {
    std::vector<Quote> quotes = {
        make_quote("A", "X/USDT", "99", "100", 1000),
        make_quote("a", "X/USDT", "89", "90", 2000),
        make_quote("A", "X/USDT", "79", "80", 1500),
    };

    auto groups = ArbitrageScanner::group_valid(quotes);
    REQUIRE(groups["X/USDT"].size() == 1);
    REQUIRE(groups["X/USDT"][0].ask == dec("90"));
}

TEST_CASE("Directional pair enumeration", "[scanner]") {
    std::vector<Quote> group = {
        make_quote("A", "X/USDT", "99", "100"),
        make_quote("B", "X/USDT", "99", "100"),
        make_quote("C", "X/USDT", "99", "100"),
    };

    auto pairs = ArbitrageScanner::enumerate_pairs(group);
    REQUIRE(pairs.size() == 6);

    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& p : pairs) {
        REQUIRE(p.buy->venue != p.sell->venue);
        seen.emplace(p.buy->venue, p.sell->venue);
    }
    REQUIRE(seen.size() == 6);
    REQUIRE(seen.count({"A", "B"}) == 1);
    REQUIRE(seen.count({"B", "A"}) == 1);
    REQUIRE(seen.count({"C", "A"}) == 1);

    REQUIRE(ArbitrageScanner::enumerate_pairs({group[0]}).empty());
}

TEST_CASE("Both directions can be profitable", "[scanner]") {
    // With valid books only one direction per symbol has a raw spread
    std::vector<Quote> quotes = {
        make_quote("A", "X/USDT", "99", "100"),
        make_quote("B", "X/USDT", "105", "106"),
        make_quote("A", "Y/USDT", "205", "206"),
        make_quote("B", "Y/USDT", "199", "200"),
    };

    ArbitrageScanner scanner;
    auto opps = scanner.scan(quotes, zero_fees(), Decimal::zero());
    REQUIRE(opps.size() == 2);

    std::set<std::string> directions;
    for (const auto& opp : opps) {
        directions.insert(opp.symbol + ":" + opp.buy_venue + ">" + opp.sell_venue);
    }
    REQUIRE(directions.count("X/USDT:A>B") == 1);
    REQUIRE(directions.count("Y/USDT:B>A") == 1);
}

TEST_CASE("Scan is idempotent", "[scanner]") {
    FeeModel fees(taker("default", "0.001"));
    std::vector<Quote> quotes = {
        make_quote("A", "X/USDT", "99", "100"),
        make_quote("B", "X/USDT", "102", "103"),
        make_quote("C", "X/USDT", "101", "101.5"),
        make_quote("A", "Y/USDT", "10", "10.1"),
        make_quote("B", "Y/USDT", "10.5", "10.6"),
    };

    ArbitrageScanner scanner;
    auto key = [](const Opportunity& o) {
        return o.symbol + o.buy_venue + o.sell_venue + o.net_profit.to_string();
    };

    auto first = scanner.scan(quotes, fees, Decimal::zero());
    auto second = scanner.scan(quotes, fees, Decimal::zero());
    REQUIRE(first.size() == second.size());
    REQUIRE_FALSE(first.empty());

    std::multiset<std::string> a, b;
    for (const auto& o : first) a.insert(key(o));
    for (const auto& o : second) b.insert(key(o));
    REQUIRE(a == b);
}

TEST_CASE("Ranking by profit percentage", "[scanner]") {
    std::vector<Opportunity> opps(3);
    opps[0].profit_percentage = dec("0.5");
    opps[0].net_profit = dec("5");
    opps[1].profit_percentage = dec("1.5");
    opps[1].net_profit = dec("1");
    opps[2].profit_percentage = dec("0.5");
    opps[2].net_profit = dec("9");

    ArbitrageScanner::rank(opps);
    REQUIRE(opps[0].profit_percentage == dec("1.5"));
    REQUIRE(opps[1].net_profit == dec("9"));
    REQUIRE(opps[2].net_profit == dec("5"));
}
