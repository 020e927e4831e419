// arbscan - Fee Model Implementation

#include <arbscan/fee_model.hpp>
#include <algorithm>
#include <stdexcept>

namespace arbscan {

namespace {

void validate(const FeeSchedule& schedule) {
    if (schedule.taker_rate.is_negative()) {
        throw std::invalid_argument("Negative taker rate for venue '" + schedule.venue +
                                    "': " + schedule.taker_rate.to_string());
    }
    for (const auto& [asset, fee] : schedule.withdrawal_fees) {
        if (fee.is_negative()) {
            throw std::invalid_argument("Negative " + asset + " withdrawal fee for venue '" +
                                        schedule.venue + "': " + fee.to_string());
        }
    }
}

}  // namespace

FeeModel::FeeModel(FeeSchedule default_schedule)
    : default_(std::move(default_schedule)) {
    validate(default_);
    default_.venue = "default";
}

FeeSchedule FeeModel::resolve(std::string_view venue) const {
    auto it = schedules_.find(to_lower(venue));
    if (it != schedules_.end()) {
        return it->second;
    }

    FeeSchedule fallback = default_;
    fallback.venue = std::string(venue);
    return fallback;
}

Decimal FeeModel::withdrawal_fee(const FeeSchedule& schedule, std::string_view asset) {
    auto it = schedule.withdrawal_fees.find(std::string(asset));
    return it != schedule.withdrawal_fees.end() ? it->second : Decimal::zero();
}

void FeeModel::set_schedule(FeeSchedule schedule) {
    validate(schedule);
    auto key = to_lower(schedule.venue);
    schedules_[key] = std::move(schedule);
}

bool FeeModel::apply_transfer_fees(const TransferFees& fees) {
    auto cheapest = fees.cheapest_withdrawal();
    if (!cheapest || fees.asset.empty()) {
        return false;
    }

    auto key = to_lower(fees.venue);
    auto it = schedules_.find(key);
    if (it == schedules_.end()) {
        FeeSchedule schedule = default_;
        schedule.venue = fees.venue;
        it = schedules_.emplace(key, std::move(schedule)).first;
    }

    it->second.withdrawal_fees[fees.asset] = *cheapest;
    return true;
}

bool FeeModel::has_schedule(std::string_view venue) const {
    return schedules_.count(to_lower(venue)) > 0;
}

std::vector<std::string> FeeModel::venues() const {
    std::vector<std::string> out;
    out.reserve(schedules_.size());
    for (const auto& [key, schedule] : schedules_) {
        out.push_back(key);
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace arbscan
