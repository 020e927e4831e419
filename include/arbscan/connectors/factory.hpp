// arbscan - Connector Factory
// Builds the connector set described by a Config

#pragma once

#include <arbscan/config.hpp>
#include <arbscan/connector.hpp>
#include <chrono>
#include <vector>

namespace arbscan {

/// One connector per configured venue, sorted by name
std::vector<ConnectorPtr> make_connectors(const Config& config);

/// Connect every connector concurrently and return the ones that came up.
/// Connectors that fail or miss the timeout are logged and left out.
std::vector<ConnectorPtr> connect_all(const std::vector<ConnectorPtr>& connectors,
                                      std::chrono::milliseconds timeout);

}  // namespace arbscan
