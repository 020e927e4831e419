// arbscan - Venue Connector Interface
// Abstract interface for all quote sources (CEX, DEX, bridge)

#pragma once

#include <arbscan/types.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace arbscan {

// Connector error
class ConnectorError : public std::runtime_error {
public:
    explicit ConnectorError(const std::string& msg) : std::runtime_error(msg) {}
};

// HTTP request timeout for connectors configured without one
inline constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{5000};

// Base connector interface
//
// Implementations must tolerate concurrent fetch_ticker calls for distinct
// symbols. Failures are reported by throwing ConnectorError from the
// returned future's get().
class VenueConnector {
public:
    virtual ~VenueConnector() = default;

    // Properties
    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual VenueKind kind() const = 0;
    [[nodiscard]] virtual std::optional<int> latency_ms() const { return std::nullopt; }

    // Connection; connectors without a session are ready immediately
    virtual std::future<void> connect() {
        std::promise<void> ready;
        ready.set_value();
        return ready.get_future();
    }

    // Market data
    virtual std::future<Quote> fetch_ticker(const std::string& symbol) = 0;

    // Deposit/withdrawal fees for one asset
    virtual std::future<TransferFees> fetch_transfer_fees(const std::string& asset) {
        std::string venue(name());
        return std::async(std::launch::deferred, [venue, asset]() -> TransferFees {
            throw ConnectorError("Transfer fees not supported by " + venue + " for " + asset);
        });
    }
};

using ConnectorPtr = std::shared_ptr<VenueConnector>;

}  // namespace arbscan
