// arbscan - Quote Aggregator
// Concurrent best-effort snapshot of quotes across venues

#pragma once

#include <arbscan/connector.hpp>
#include <chrono>
#include <stop_token>
#include <string>
#include <vector>

namespace arbscan {

/// Withdrawal fee tables collected from several venues
struct TransferFeeBatch {
    std::vector<TransferFees> fees;
    std::vector<FetchFailure> failures;  // `symbol` holds the asset
};

/// Fans out one fetch per (venue, symbol) and joins them into a Snapshot.
///
/// A failing fetch becomes a FetchFailure and never aborts the batch. Fetches
/// still running when the timeout expires or `stop` is requested are
/// abandoned: they finish in the background and their results are dropped.
/// Holds no state between calls.
class QuoteAggregator {
public:
    /// Throws std::invalid_argument if `connectors` contains a null pointer
    [[nodiscard]] Snapshot collect(const std::vector<ConnectorPtr>& connectors,
                                   const std::vector<std::string>& symbols,
                                   std::chrono::milliseconds timeout,
                                   std::stop_token stop = {}) const;

    /// Same fan-out for fetch_transfer_fees, one fetch per (venue, asset)
    [[nodiscard]] TransferFeeBatch collect_transfer_fees(
        const std::vector<ConnectorPtr>& connectors,
        const std::vector<std::string>& assets,
        std::chrono::milliseconds timeout,
        std::stop_token stop = {}) const;
};

}  // namespace arbscan
