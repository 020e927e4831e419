// arbscan - Core Types
// Fixed-point decimal and the market data records shared by every component

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arbscan {

// Fixed-point decimal for exact financial arithmetic
// Stores value as integer * 10^(-precision)
class Decimal {
public:
    static constexpr int PRECISION = 8;
    static constexpr int64_t SCALE = 100000000LL;

    constexpr Decimal() noexcept : value_(0) {}
    constexpr explicit Decimal(int64_t scaled) noexcept : value_(scaled) {}

    static Decimal from_double(double d) noexcept;

    // Throws std::invalid_argument on anything that is not a plain decimal number
    static Decimal from_string(std::string_view s);

    static constexpr Decimal from_int(int64_t v) noexcept { return Decimal(v * SCALE); }

    [[nodiscard]] double to_double() const noexcept {
        return static_cast<double>(value_) / SCALE;
    }

    [[nodiscard]] std::string to_string() const;

    // Fixed number of fractional digits, e.g. to_string(4) -> "1.6943"
    [[nodiscard]] std::string to_string(int places) const;

    [[nodiscard]] int64_t scaled_value() const noexcept { return value_; }

    // Round half away from zero to `places` fractional digits
    [[nodiscard]] Decimal round(int places) const noexcept;

    constexpr Decimal operator+(Decimal rhs) const noexcept {
        return Decimal(value_ + rhs.value_);
    }
    constexpr Decimal operator-(Decimal rhs) const noexcept {
        return Decimal(value_ - rhs.value_);
    }
    constexpr Decimal operator-() const noexcept { return Decimal(-value_); }

    // 128-bit intermediates: price * price and cost-sized divisions overflow int64
    constexpr Decimal operator*(Decimal rhs) const noexcept {
        return Decimal(static_cast<int64_t>(
            (static_cast<__int128>(value_) * rhs.value_) / SCALE));
    }
    constexpr Decimal operator/(Decimal rhs) const noexcept {
        return Decimal(static_cast<int64_t>(
            (static_cast<__int128>(value_) * SCALE) / rhs.value_));
    }

    Decimal& operator+=(Decimal rhs) noexcept { value_ += rhs.value_; return *this; }
    Decimal& operator-=(Decimal rhs) noexcept { value_ -= rhs.value_; return *this; }

    constexpr bool operator==(Decimal rhs) const noexcept { return value_ == rhs.value_; }
    constexpr bool operator!=(Decimal rhs) const noexcept { return value_ != rhs.value_; }
    constexpr bool operator<(Decimal rhs) const noexcept { return value_ < rhs.value_; }
    constexpr bool operator<=(Decimal rhs) const noexcept { return value_ <= rhs.value_; }
    constexpr bool operator>(Decimal rhs) const noexcept { return value_ > rhs.value_; }
    constexpr bool operator>=(Decimal rhs) const noexcept { return value_ >= rhs.value_; }

    constexpr Decimal abs() const noexcept { return Decimal(value_ < 0 ? -value_ : value_); }
    constexpr bool is_zero() const noexcept { return value_ == 0; }
    constexpr bool is_positive() const noexcept { return value_ > 0; }
    constexpr bool is_negative() const noexcept { return value_ < 0; }

    static constexpr Decimal zero() noexcept { return Decimal(0); }
    static constexpr Decimal one() noexcept { return Decimal(SCALE); }
    // Smallest representable step (1e-8)
    static constexpr Decimal epsilon() noexcept { return Decimal(1); }

private:
    int64_t value_;
};

// Kind of venue behind a connector, fixed at construction
enum class VenueKind : uint8_t {
    Cex = 0,
    Dex = 1,
    Bridge = 2
};

inline constexpr const char* to_string(VenueKind k) noexcept {
    switch (k) {
        case VenueKind::Cex: return "cex";
        case VenueKind::Dex: return "dex";
        case VenueKind::Bridge: return "bridge";
    }
    return "unknown";
}

std::optional<VenueKind> venue_kind_from_string(std::string_view s);

// Base asset of a "BASE/QUOTE" symbol; the whole symbol when there is no '/'
std::string base_asset(std::string_view symbol);

// Lower-cased copy, used to normalize venue ids
std::string to_lower(std::string_view s);

// Top-of-book quote from one venue for one symbol
struct Quote {
    std::string venue;
    std::string symbol;
    std::optional<Decimal> bid;
    std::optional<Decimal> ask;
    std::optional<Decimal> last;
    std::optional<Decimal> volume;
    int64_t timestamp = 0;  // Unix timestamp in milliseconds

    [[nodiscard]] std::optional<Decimal> mid_price() const noexcept {
        if (bid && ask) {
            return (*bid + *ask) / Decimal::from_int(2);
        }
        return last;
    }

    [[nodiscard]] std::optional<Decimal> spread() const noexcept {
        if (bid && ask) {
            return *ask - *bid;
        }
        return std::nullopt;
    }
};

// Trading and withdrawal fees for one venue
struct FeeSchedule {
    std::string venue;
    Decimal taker_rate{200000};  // 0.002
    // asset -> fixed amount in units of that asset
    std::map<std::string, Decimal> withdrawal_fees;
};

// Fee for moving an asset over one network
struct NetworkFee {
    Decimal fee;
    bool percentage = false;
};

// Deposit/withdrawal fee table for one asset as reported by a venue
struct TransferFees {
    std::string venue;
    std::string asset;
    std::map<std::string, NetworkFee> withdraw;
    std::map<std::string, NetworkFee> deposit;

    // Cheapest withdrawal cost in asset units for moving `amount` of the asset
    [[nodiscard]] std::optional<Decimal> cheapest_withdrawal(Decimal amount = Decimal::one()) const;
};

// Economics of buying on one venue and selling on another, full precision
struct VenuePairResult {
    std::string symbol;
    std::string buy_venue;
    std::string sell_venue;
    Decimal buy_price;
    Decimal sell_price;
    Decimal buy_fee;
    Decimal sell_fee;
    Decimal withdrawal_fee;  // quote currency
    Decimal total_cost;
    Decimal net_revenue;
    Decimal gross_profit;
    Decimal total_fees;
    Decimal net_profit;
    Decimal profit_percentage;
};

// A pair result that cleared the profit threshold, rounded for display
struct Opportunity {
    std::string symbol;
    std::string buy_venue;
    std::string sell_venue;
    Decimal buy_price;
    Decimal sell_price;
    Decimal buy_fee;
    Decimal sell_fee;
    Decimal withdrawal_fee;
    Decimal gross_profit;
    Decimal total_fees;
    Decimal net_profit;
    Decimal profit_percentage;

    static Opportunity from_result(const VenuePairResult& r, int places = 4);
};

// A fetch that did not produce a quote
struct FetchFailure {
    std::string venue;
    std::string symbol;
    std::string error;
};

// Best-effort collection result of one aggregation cycle
struct Snapshot {
    std::vector<Quote> quotes;
    std::vector<FetchFailure> failures;
};

// Timestamp utilities
inline int64_t now_ms() noexcept {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

inline int64_t now_ns() noexcept {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace arbscan
