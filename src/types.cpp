// arbscan - Types Implementation

#include <arbscan/types.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace arbscan {

namespace {

constexpr int64_t pow10(int n) noexcept {
    int64_t r = 1;
    while (n-- > 0) r *= 10;
    return r;
}

bool all_digits(std::string_view s) {
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace

// Decimal implementation
Decimal Decimal::from_double(double d) noexcept {
    return Decimal(static_cast<int64_t>(std::llround(d * SCALE)));
}

Decimal Decimal::from_string(std::string_view s) {
    const std::string input{s};
    auto fail = [&input]() -> Decimal {
        throw std::invalid_argument("Invalid decimal: '" + input + "'");
    };

    bool negative = false;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        negative = (s[0] == '-');
        s.remove_prefix(1);
    }
    if (s.empty()) return fail();

    std::string_view int_part = s;
    std::string_view frac_part;
    auto dot = s.find('.');
    if (dot != std::string_view::npos) {
        int_part = s.substr(0, dot);
        frac_part = s.substr(dot + 1);
    }

    if (int_part.empty() && frac_part.empty()) return fail();
    if (!all_digits(int_part) || !all_digits(frac_part)) return fail();

    int64_t int_val = 0;
    if (!int_part.empty()) {
        auto [ptr, ec] = std::from_chars(int_part.data(), int_part.data() + int_part.size(), int_val);
        if (ec != std::errc{} || int_val > INT64_MAX / SCALE) return fail();
    }

    int64_t frac_val = 0;
    if (!frac_part.empty()) {
        // Pad or truncate to PRECISION digits
        std::string frac_str(frac_part);
        if (frac_str.size() < PRECISION) {
            frac_str.append(PRECISION - frac_str.size(), '0');
        } else if (frac_str.size() > PRECISION) {
            frac_str = frac_str.substr(0, PRECISION);
        }
        std::from_chars(frac_str.data(), frac_str.data() + frac_str.size(), frac_val);
    }

    if (int_val == INT64_MAX / SCALE && frac_val > INT64_MAX % SCALE) return fail();

    int64_t result = int_val * SCALE + frac_val;
    return Decimal(negative ? -result : result);
}

std::string Decimal::to_string() const {
    int64_t abs_val = value_ < 0 ? -value_ : value_;
    int64_t int_part = abs_val / SCALE;
    int64_t frac_part = abs_val % SCALE;

    std::ostringstream oss;
    if (value_ < 0) oss << '-';
    oss << int_part << '.';

    // Format fractional part with leading zeros
    std::string frac_str = std::to_string(frac_part);
    oss << std::string(PRECISION - frac_str.size(), '0') << frac_str;

    std::string result = oss.str();

    // Trim trailing zeros after decimal point
    size_t last_non_zero = result.find_last_not_of('0');
    if (last_non_zero != std::string::npos && result[last_non_zero] == '.') {
        last_non_zero--;
    }
    result = result.substr(0, last_non_zero + 1);

    return result;
}

std::string Decimal::to_string(int places) const {
    places = std::clamp(places, 0, PRECISION);
    int64_t rounded = round(places).value_;
    int64_t abs_val = rounded < 0 ? -rounded : rounded;

    std::ostringstream oss;
    if (rounded < 0) oss << '-';
    oss << abs_val / SCALE;
    if (places > 0) {
        std::string frac_str = std::to_string((abs_val % SCALE) / pow10(PRECISION - places));
        oss << '.' << std::string(places - frac_str.size(), '0') << frac_str;
    }
    return oss.str();
}

Decimal Decimal::round(int places) const noexcept {
    if (places >= PRECISION) return *this;
    if (places < 0) places = 0;

    const int64_t step = pow10(PRECISION - places);
    const int64_t half = step / 2;
    int64_t abs_val = value_ < 0 ? -value_ : value_;
    int64_t rem = abs_val % step;
    abs_val -= rem;
    if (rem >= half) abs_val += step;
    return Decimal(value_ < 0 ? -abs_val : abs_val);
}

// TransferFees implementation
std::optional<Decimal> TransferFees::cheapest_withdrawal(Decimal amount) const {
    std::optional<Decimal> best;
    for (const auto& [network, nf] : withdraw) {
        Decimal cost = nf.percentage ? nf.fee * amount : nf.fee;
        if (cost.is_negative()) continue;
        if (!best || cost < *best) best = cost;
    }
    return best;
}

// Opportunity implementation
Opportunity Opportunity::from_result(const VenuePairResult& r, int places) {
    Opportunity opp;
    opp.symbol = r.symbol;
    opp.buy_venue = r.buy_venue;
    opp.sell_venue = r.sell_venue;
    opp.buy_price = r.buy_price.round(places);
    opp.sell_price = r.sell_price.round(places);
    opp.buy_fee = r.buy_fee.round(places);
    opp.sell_fee = r.sell_fee.round(places);
    opp.withdrawal_fee = r.withdrawal_fee.round(places);
    opp.gross_profit = r.gross_profit.round(places);
    opp.total_fees = r.total_fees.round(places);
    opp.net_profit = r.net_profit.round(places);
    opp.profit_percentage = r.profit_percentage.round(places);
    return opp;
}

// Free helpers
std::optional<VenueKind> venue_kind_from_string(std::string_view s) {
    auto lower = to_lower(s);
    if (lower == "cex") return VenueKind::Cex;
    if (lower == "dex") return VenueKind::Dex;
    if (lower == "bridge") return VenueKind::Bridge;
    return std::nullopt;
}

std::string base_asset(std::string_view symbol) {
    auto slash = symbol.find('/');
    return std::string(symbol.substr(0, slash));
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace arbscan
