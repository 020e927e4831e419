// arbscan - Connector Factory Implementation

#include <arbscan/connectors/factory.hpp>
#include <arbscan/connectors/ccxt.hpp>
#include <arbscan/connectors/gateway.hpp>
#include <arbscan/connectors/simulated.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>
#include <thread>

namespace arbscan {

std::vector<ConnectorPtr> make_connectors(const Config& config) {
    std::vector<ConnectorPtr> connectors;
    connectors.reserve(config.venue_count());

    // HTTP venues without their own timeout inherit the cycle deadline
    for (const auto& [name, cfg] : config.ccxt) {
        CcxtConfig venue = cfg;
        if (!venue.timeout_ms) venue.timeout_ms = config.general.timeout_ms;
        connectors.push_back(std::make_shared<CcxtConnector>(name, venue));
    }

    for (const auto& [name, cfg] : config.gateway) {
        GatewayConfig venue = cfg;
        if (!venue.timeout_ms) venue.timeout_ms = config.general.timeout_ms;
        connectors.push_back(std::make_shared<GatewayConnector>(name, venue));
    }

    for (const auto& [name, cfg] : config.simulated) {
        connectors.push_back(std::make_shared<SimulatedConnector>(name, cfg));
    }

    std::sort(connectors.begin(), connectors.end(),
              [](const ConnectorPtr& a, const ConnectorPtr& b) { return a->name() < b->name(); });

    return connectors;
}

std::vector<ConnectorPtr> connect_all(const std::vector<ConnectorPtr>& connectors,
                                      std::chrono::milliseconds timeout) {
    std::vector<std::future<void>> pending;
    pending.reserve(connectors.size());
    for (const auto& c : connectors) {
        pending.push_back(c->connect());
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<ConnectorPtr> ready;

    for (size_t i = 0; i < connectors.size(); ++i) {
        const auto& c = connectors[i];
        if (pending[i].wait_until(deadline) == std::future_status::timeout) {
            spdlog::warn("Venue {} did not connect within {}ms, disabled",
                         c->name(), timeout.count());
            // An async future blocks in its destructor; let it finish off-thread
            std::thread([c, f = std::move(pending[i])]() { f.wait(); }).detach();
            continue;
        }
        try {
            pending[i].get();
            spdlog::info("Venue {} ({}) connected", c->name(), to_string(c->kind()));
            ready.push_back(c);
        } catch (const std::exception& e) {
            spdlog::warn("Venue {} failed to connect, disabled: {}", c->name(), e.what());
        }
    }

    return ready;
}

}  // namespace arbscan
