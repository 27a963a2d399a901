#pragma once

#include "common/rng.h"
#include "common/types.h"
#include "routing/messages.h"
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace vaultsim {
namespace mock_network {

using namespace vaultsim::common;

/// Address of a participant on the mock network
using Endpoint = uint32_t;

/**
 * Envelope - A packet in flight between two endpoints
 */
struct Envelope {
  Endpoint from;
  Endpoint to;
  routing::Packet packet;
};

/**
 * BootstrapConfig - Endpoints a client may bootstrap off, in order
 */
struct BootstrapConfig {
  std::vector<Endpoint> contacts;
};

class ServiceHandle;

/**
 * In-memory network connecting vault nodes and clients
 *
 * Each endpoint owns a FIFO queue. Nothing moves on its own: participants
 * pull from their queue when polled, and virtual time advances only when the
 * poll driver calls advance_clock(). The network must outlive every
 * ServiceHandle it hands out.
 */
class Network {
public:
  Network(size_t min_section_size, uint64_t seed);

  Network(const Network &) = delete;
  Network &operator=(const Network &) = delete;

  size_t min_section_size() const { return min_section_size_; }

  /// Independent random stream forked from the network seed
  SeededRng new_rng();

  /// Attach a new participant; the endpoint lives as long as the handle
  std::unique_ptr<ServiceHandle> new_service_handle();

  // Node registry
  void register_node(Endpoint endpoint, const XorName &name);
  std::optional<XorName> closest_node(const XorName &target) const;
  std::optional<Endpoint> endpoint_of(const XorName &name) const;

  /// Lowest-numbered live node endpoint, used when a client has no contacts
  std::optional<Endpoint> default_bootstrap_contact() const;

  bool is_connected(Endpoint endpoint) const;
  size_t node_count() const { return nodes_.size(); }

  // Virtual clock
  uint64_t now_ms() const { return now_ms_; }
  void advance_clock(uint64_t ms);

  // Statistics
  uint64_t packets_sent() const { return packets_sent_; }
  uint64_t packets_dropped() const { return packets_dropped_; }
  size_t pending_packets() const;

private:
  friend class ServiceHandle;

  bool send(Endpoint from, Endpoint to, routing::Packet packet);
  std::optional<Envelope> receive(Endpoint endpoint);
  void unregister(Endpoint endpoint);

  size_t min_section_size_;
  SeededRng rng_;
  Endpoint next_endpoint_;
  uint64_t now_ms_;

  std::map<Endpoint, std::deque<Envelope>> queues_;
  std::map<XorName, Endpoint> nodes_;

  uint64_t packets_sent_;
  uint64_t packets_dropped_;
};

/**
 * ServiceHandle - A participant's attachment to the network
 *
 * Destroying the handle detaches the endpoint; packets still queued for it
 * are discarded and later sends to it fail.
 */
class ServiceHandle {
public:
  ~ServiceHandle();

  ServiceHandle(const ServiceHandle &) = delete;
  ServiceHandle &operator=(const ServiceHandle &) = delete;

  Endpoint endpoint() const { return endpoint_; }
  Network &network() { return network_; }
  const Network &network() const { return network_; }

  /// Queue a packet for `to`; false when `to` is not attached
  bool send(Endpoint to, routing::Packet packet);

  /// Next packet queued for this endpoint, if any
  std::optional<Envelope> receive();

private:
  friend class Network;
  ServiceHandle(Network &network, Endpoint endpoint)
      : network_(network), endpoint_(endpoint) {}

  Network &network_;
  Endpoint endpoint_;
};

} // namespace mock_network
} // namespace vaultsim
