#include "mock_network/network.h"
#include "common/logging.h"

namespace vaultsim {
namespace mock_network {

Network::Network(size_t min_section_size, uint64_t seed)
    : min_section_size_(min_section_size), rng_(seed), next_endpoint_(1),
      now_ms_(0), packets_sent_(0), packets_dropped_(0) {
  common::Logger::instance().set_sim_time(0);
  LOG_DEBUG("network", "Mock network created (min_section_size=",
            min_section_size, ", seed=", seed, ")");
}

void Network::advance_clock(uint64_t ms) {
  now_ms_ += ms;
  common::Logger::instance().set_sim_time(now_ms_);
}

SeededRng Network::new_rng() { return rng_.fork(); }

std::unique_ptr<ServiceHandle> Network::new_service_handle() {
  Endpoint endpoint = next_endpoint_++;
  queues_[endpoint];
  LOG_TRACE("network", "Endpoint ", endpoint, " attached");
  // The constructor is private to Network, out of std::make_unique's reach
  return std::unique_ptr<ServiceHandle>(new ServiceHandle(*this, endpoint));
}

void Network::register_node(Endpoint endpoint, const XorName &name) {
  nodes_[name] = endpoint;
  LOG_DEBUG("network", "Node ", short_name(name), " registered at endpoint ",
            endpoint);
}

std::optional<XorName> Network::closest_node(const XorName &target) const {
  std::optional<XorName> best;
  for (const auto &node : nodes_) {
    if (!best || closer_to(target, node.first, *best)) {
      best = node.first;
    }
  }
  return best;
}

std::optional<Endpoint> Network::endpoint_of(const XorName &name) const {
  auto it = nodes_.find(name);
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Endpoint> Network::default_bootstrap_contact() const {
  std::optional<Endpoint> lowest;
  for (const auto &node : nodes_) {
    if (!lowest || node.second < *lowest) {
      lowest = node.second;
    }
  }
  return lowest;
}

bool Network::is_connected(Endpoint endpoint) const {
  return queues_.count(endpoint) > 0;
}

size_t Network::pending_packets() const {
  size_t total = 0;
  for (const auto &queue : queues_) {
    total += queue.second.size();
  }
  return total;
}

bool Network::send(Endpoint from, Endpoint to, routing::Packet packet) {
  auto it = queues_.find(to);
  if (it == queues_.end()) {
    ++packets_dropped_;
    LOG_DEBUG("network", "Dropping packet from ", from, " to detached endpoint ",
              to);
    return false;
  }

  it->second.push_back(Envelope{from, to, std::move(packet)});
  ++packets_sent_;
  return true;
}

std::optional<Envelope> Network::receive(Endpoint endpoint) {
  auto it = queues_.find(endpoint);
  if (it == queues_.end() || it->second.empty()) {
    return std::nullopt;
  }

  Envelope envelope = std::move(it->second.front());
  it->second.pop_front();
  return envelope;
}

void Network::unregister(Endpoint endpoint) {
  auto it = queues_.find(endpoint);
  if (it != queues_.end()) {
    packets_dropped_ += it->second.size();
    queues_.erase(it);
  }

  for (auto node = nodes_.begin(); node != nodes_.end();) {
    if (node->second == endpoint) {
      node = nodes_.erase(node);
    } else {
      ++node;
    }
  }
  LOG_TRACE("network", "Endpoint ", endpoint, " detached");
}

ServiceHandle::~ServiceHandle() { network_.unregister(endpoint_); }

bool ServiceHandle::send(Endpoint to, routing::Packet packet) {
  return network_.send(endpoint_, to, std::move(packet));
}

std::optional<Envelope> ServiceHandle::receive() {
  return network_.receive(endpoint_);
}

} // namespace mock_network
} // namespace vaultsim
