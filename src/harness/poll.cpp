#include "harness/poll.h"
#include "common/logging.h"
#include "harness/contract_violation.h"

namespace vaultsim {
namespace harness {
namespace poll {

namespace {

size_t run_rounds(std::vector<TestNode> &nodes,
                  const std::vector<TestClient *> &clients,
                  const HarnessConfig &config) {
  mock_network::Network *network = nullptr;
  if (!nodes.empty()) {
    network = &nodes.front().network();
  } else if (!clients.empty()) {
    network = &clients.front()->network();
  }

  size_t productive = 0;
  while (true) {
    if (productive >= config.max_rounds) {
      contract_violation(
          "Simulation did not quiesce",
          {{"max_rounds", std::to_string(config.max_rounds)},
           {"pending_packets",
            std::to_string(network ? network->pending_packets() : 0)}});
    }

    bool progress = false;
    for (auto &node : nodes) {
      progress = node.poll() || progress;
    }
    for (auto *client : clients) {
      progress = client->poll_once() || progress;
    }

    if (network) {
      network->advance_clock(config.round_duration_ms);
    }

    if (!progress) {
      break;
    }
    ++productive;
  }

  LOG_TRACE("harness", "Quiescent after ", productive, " rounds");
  return productive;
}

} // namespace

size_t nodes(std::vector<TestNode> &nodes, const HarnessConfig &config) {
  return run_rounds(nodes, {}, config);
}

size_t nodes_and_client(std::vector<TestNode> &nodes, TestClient &client) {
  return run_rounds(nodes, {&client}, client.config());
}

size_t nodes_and_clients(std::vector<TestNode> &nodes,
                         std::vector<TestClient> &clients,
                         const HarnessConfig &config) {
  std::vector<TestClient *> pointers;
  for (auto &client : clients) {
    pointers.push_back(&client);
  }
  return run_rounds(nodes, pointers, config);
}

} // namespace poll
} // namespace harness
} // namespace vaultsim
