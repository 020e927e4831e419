// arbscan - Types Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <arbscan/types.hpp>
#include <cstdint>
#include <stdexcept>

using namespace arbscan;
using Catch::Approx;

TEST_CASE("Decimal arithmetic", "[types]") {
    SECTION("Basic operations") {
        Decimal a = Decimal::from_double(100.5);
        Decimal b = Decimal::from_double(50.25);

        REQUIRE((a + b).to_double() == Approx(150.75));
        REQUIRE((a - b).to_double() == Approx(50.25));
        REQUIRE((a * Decimal::from_double(2.0)).to_double() == Approx(201.0));
        REQUIRE((a / Decimal::from_double(2.0)).to_double() == Approx(50.25));
    }

    SECTION("Exact fee products") {
        auto price = Decimal::from_int(100);
        auto rate = Decimal::from_string("0.001");
        REQUIRE(price * rate == Decimal::from_string("0.1"));
        REQUIRE(Decimal::from_int(102) * Decimal::from_string("0.002") == Decimal::from_string("0.204"));
    }

    SECTION("Large products do not overflow") {
        auto price = Decimal::from_int(50000);
        REQUIRE(price * price == Decimal::from_int(2500000000LL));
        REQUIRE((price * price) / price == price);
    }

    SECTION("Comparison") {
        Decimal a = Decimal::from_double(10.0);
        Decimal b = Decimal::from_double(20.0);

        REQUIRE(a < b);
        REQUIRE(b > a);
        REQUIRE(a <= a);
        REQUIRE(a == a);
        REQUIRE(a != b);
    }

    SECTION("Zero, one and epsilon") {
        REQUIRE(Decimal::zero().is_zero());
        REQUIRE(Decimal::one().to_double() == Approx(1.0));
        REQUIRE(Decimal::epsilon().scaled_value() == 1);
        REQUIRE((-Decimal::one()).is_negative());
    }
}

TEST_CASE("Decimal parsing", "[types]") {
    SECTION("Valid input") {
        REQUIRE(Decimal::from_string("123.456").to_double() == Approx(123.456));
        REQUIRE(Decimal::from_string("-99.99").is_negative());
        REQUIRE(Decimal::from_string("+5") == Decimal::from_int(5));
        REQUIRE(Decimal::from_string(".5") == Decimal::from_string("0.5"));
        REQUIRE(Decimal::from_string("7.") == Decimal::from_int(7));
    }

    SECTION("Digits beyond eight places are truncated") {
        REQUIRE(Decimal::from_string("0.123456789").scaled_value() == 12345678);
    }

    SECTION("Invalid input throws") {
        REQUIRE_THROWS_AS(Decimal::from_string(""), std::invalid_argument);
        REQUIRE_THROWS_AS(Decimal::from_string("-"), std::invalid_argument);
        REQUIRE_THROWS_AS(Decimal::from_string("."), std::invalid_argument);
        REQUIRE_THROWS_AS(Decimal::from_string("abc"), std::invalid_argument);
        REQUIRE_THROWS_AS(Decimal::from_string("1.2.3"), std::invalid_argument);
        REQUIRE_THROWS_AS(Decimal::from_string("1e5"), std::invalid_argument);
        REQUIRE_THROWS_AS(Decimal::from_string("99999999999999"), std::invalid_argument);
    }

    SECTION("Range limit includes the fraction") {
        REQUIRE(Decimal::from_string("92233720368.54775807").scaled_value() == INT64_MAX);
        REQUIRE(Decimal::from_string("-92233720368.54775807").scaled_value() == -INT64_MAX);
        REQUIRE_THROWS_AS(Decimal::from_string("92233720368.54775808"), std::invalid_argument);
        REQUIRE_THROWS_AS(Decimal::from_string("92233720368.99999999"), std::invalid_argument);
        REQUIRE_THROWS_AS(Decimal::from_string("-92233720368.99999999"), std::invalid_argument);
    }
}

TEST_CASE("Decimal rounding and formatting", "[types]") {
    SECTION("Round half away from zero") {
        REQUIRE(Decimal::from_string("1.69430569").round(4) == Decimal::from_string("1.6943"));
        REQUIRE(Decimal::from_string("0.00005").round(4) == Decimal::from_string("0.0001"));
        REQUIRE(Decimal::from_string("-0.00005").round(4) == Decimal::from_string("-0.0001"));
        REQUIRE(Decimal::from_string("2.49999999").round(0) == Decimal::from_int(2));
    }

    SECTION("Fixed places") {
        REQUIRE(Decimal::from_string("1.69430569").to_string(4) == "1.6943");
        REQUIRE(Decimal::from_int(100).to_string(4) == "100.0000");
        REQUIRE(Decimal::from_string("-0.5").to_string(2) == "-0.50");
        REQUIRE(Decimal::from_string("3.7").to_string(0) == "4");
    }

    SECTION("Shortest form") {
        REQUIRE(Decimal::from_string("101.796").to_string() == "101.796");
        REQUIRE(Decimal::from_int(25).to_string() == "25");
    }
}

TEST_CASE("Symbol and venue helpers", "[types]") {
    REQUIRE(base_asset("BTC/USDT") == "BTC");
    REQUIRE(base_asset("ETH") == "ETH");
    REQUIRE(to_lower("Binance") == "binance");

    REQUIRE(venue_kind_from_string("DEX") == VenueKind::Dex);
    REQUIRE(venue_kind_from_string("bridge") == VenueKind::Bridge);
    REQUIRE_FALSE(venue_kind_from_string("otc").has_value());
    REQUIRE(std::string(to_string(VenueKind::Cex)) == "cex");
}

TEST_CASE("Quote derived prices", "[types]") {
    Quote q;
    q.bid = Decimal::from_int(99);
    q.ask = Decimal::from_int(101);

    REQUIRE(q.mid_price() == Decimal::from_int(100));
    REQUIRE(q.spread() == Decimal::from_int(2));

    q.ask.reset();
    q.last = Decimal::from_int(98);
    REQUIRE(q.mid_price() == Decimal::from_int(98));
    REQUIRE_FALSE(q.spread().has_value());
}

TEST_CASE("Cheapest withdrawal network", "[types]") {
    TransferFees fees;
    fees.venue = "binance";
    fees.asset = "USDT";

    SECTION("No networks") {
        REQUIRE_FALSE(fees.cheapest_withdrawal().has_value());
    }

    SECTION("Fixed fees") {
        fees.withdraw["TRX"] = NetworkFee{Decimal::from_int(1), false};
        fees.withdraw["ERC20"] = NetworkFee{Decimal::from_int(25), false};
        REQUIRE(fees.cheapest_withdrawal() == Decimal::from_int(1));
    }

    SECTION("Percentage fee scales with amount") {
        fees.withdraw["TRX"] = NetworkFee{Decimal::from_int(1), false};
        fees.withdraw["INTERNAL"] = NetworkFee{Decimal::from_string("0.001"), true};
        REQUIRE(fees.cheapest_withdrawal(Decimal::from_int(100)) == Decimal::from_string("0.1"));
        REQUIRE(fees.cheapest_withdrawal(Decimal::from_int(5000)) == Decimal::from_int(1));
    }

    SECTION("Negative fees are ignored") {
        fees.withdraw["BAD"] = NetworkFee{Decimal::from_int(-1), false};
        fees.withdraw["SOL"] = NetworkFee{Decimal::from_string("0.5"), false};
        REQUIRE(fees.cheapest_withdrawal() == Decimal::from_string("0.5"));
    }
}
