#pragma once

#include "mock_network/network.h"
#include "routing/messages.h"
#include "vault/client_manager.h"
#include "vault/data_manager.h"
#include "vault/invitation_registry.h"
#include <cstdint>
#include <map>
#include <memory>

namespace vaultsim {
namespace vault {

using namespace vaultsim::common;

/**
 * VaultConfig - Behaviour shared by all vaults of a network
 */
struct VaultConfig {
  uint64_t account_mutations = 1000;            ///< Mutations granted per account
  std::shared_ptr<InvitationRegistry> invitations; ///< null: no invitations needed
};

/**
 * Vault - A storage node on the mock network
 *
 * Plays three roles. As a proxy it accepts client bootstraps and relays
 * their requests and responses. As a client manager and a data manager it
 * handles the routing messages addressed to names it is the closest node
 * to. Every routing hop, including one to itself, is a network packet.
 */
class Vault {
public:
  Vault(mock_network::Network &network, const XorName &name,
        VaultConfig config);

  Vault(const Vault &) = delete;
  Vault &operator=(const Vault &) = delete;

  /// Handle one queued packet; false when the queue was empty
  bool poll();

  const XorName &name() const { return name_; }
  mock_network::Endpoint endpoint() const { return handle_->endpoint(); }

  size_t client_count() const { return clients_.size(); }

  const ClientManager &client_manager() const { return client_manager_; }
  const DataManager &data_manager() const { return data_manager_; }

private:
  void handle_bootstrap(mock_network::Endpoint from,
                        const routing::packet::BootstrapRequest &request);
  void handle_client_request(mock_network::Endpoint from,
                             routing::packet::ClientRequest request);
  void handle_routing_message(routing::RoutingMessage message);
  void deliver_to_client(const routing::RoutingMessage &message);

  void send_packet(mock_network::Endpoint to, routing::Packet packet);

  /// Send each message to the node responsible for its destination
  void route(std::vector<routing::RoutingMessage> messages);
  void route(routing::RoutingMessage message);

  mock_network::Network &network_;
  std::unique_ptr<mock_network::ServiceHandle> handle_;
  XorName name_;

  ClientManager client_manager_;
  DataManager data_manager_;

  /// Clients bootstrapped off this node, by endpoint and by name
  std::map<mock_network::Endpoint, crypto::PublicKeys> clients_;
  std::map<XorName, mock_network::Endpoint> client_endpoints_;
};

} // namespace vault
} // namespace vaultsim
