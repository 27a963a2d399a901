#pragma once

#include "common/config.h"
#include "harness/test_client.h"
#include "harness/test_node.h"
#include <vector>

namespace vaultsim {
namespace harness {

using namespace vaultsim::common;

/**
 * Round driver
 *
 * A round polls every node once, then every client once, then advances the
 * network clock by `round_duration_ms`. Each function runs rounds until one
 * makes no progress and returns the number of productive rounds.
 * @throws ContractViolation if the simulation is still busy after
 * `max_rounds` rounds
 */
namespace poll {

size_t nodes(std::vector<TestNode> &nodes, const HarnessConfig &config);

size_t nodes_and_client(std::vector<TestNode> &nodes, TestClient &client);

size_t nodes_and_clients(std::vector<TestNode> &nodes,
                         std::vector<TestClient> &clients,
                         const HarnessConfig &config);

} // namespace poll
} // namespace harness
} // namespace vaultsim
