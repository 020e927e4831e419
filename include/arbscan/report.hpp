// arbscan - Scan Report
// Table and JSON rendering of scan cycles

#pragma once

#include <arbscan/orchestrator.hpp>
#include <nlohmann/json_fwd.hpp>
#include <ostream>

namespace arbscan {

nlohmann::json to_json(const Opportunity& opp);
nlohmann::json to_json(const FetchFailure& failure);

// Cycle summary with every opportunity and fetch failure
nlohmann::json to_json(const ScanResult& result);

// One JSON object per line
void print_json(std::ostream& out, const ScanResult& result);

// Fixed-width table. Failures are listed after the opportunities.
void print_table(std::ostream& out, const ScanResult& result);

}  // namespace arbscan
