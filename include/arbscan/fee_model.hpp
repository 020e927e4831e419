// arbscan - Fee Model
// Per-venue taker and withdrawal fee lookup with a default fallback

#pragma once

#include <arbscan/types.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace arbscan {

class FeeModel {
public:
    FeeModel() = default;
    /// Throws std::invalid_argument on a negative taker rate or withdrawal fee
    explicit FeeModel(FeeSchedule default_schedule);

    /// Schedule for a venue, or the default schedule when it has no entry.
    /// Venue ids are matched case-insensitively.
    [[nodiscard]] FeeSchedule resolve(std::string_view venue) const;

    /// Fixed withdrawal fee for an asset in units of that asset, 0 if unspecified
    [[nodiscard]] static Decimal withdrawal_fee(const FeeSchedule& schedule,
                                                std::string_view asset);

    /// Install or replace a venue-specific schedule. Validated like the default.
    void set_schedule(FeeSchedule schedule);

    /// Merge withdrawal fees reported by a venue into its schedule.
    /// A venue without an explicit entry gets a copy of the default first.
    /// Returns false when the report carries no usable withdrawal fee.
    bool apply_transfer_fees(const TransferFees& fees);

    [[nodiscard]] const FeeSchedule& default_schedule() const noexcept { return default_; }
    [[nodiscard]] bool has_schedule(std::string_view venue) const;
    [[nodiscard]] std::vector<std::string> venues() const;

private:
    FeeSchedule default_;
    std::unordered_map<std::string, FeeSchedule> schedules_;
};

}  // namespace arbscan
