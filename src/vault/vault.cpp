#include "vault/vault.h"
#include "common/logging.h"
#include "routing/serializer.h"

namespace vaultsim {
namespace vault {

using namespace vaultsim::routing;

Vault::Vault(mock_network::Network &network, const XorName &name,
             VaultConfig config)
    : network_(network), handle_(network.new_service_handle()), name_(name),
      client_manager_(config.account_mutations, std::move(config.invitations)) {
  network_.register_node(handle_->endpoint(), name_);
}

bool Vault::poll() {
  auto envelope = handle_->receive();
  if (!envelope) {
    return false;
  }

  auto &incoming = envelope->packet;
  if (auto *bootstrap = std::get_if<packet::BootstrapRequest>(&incoming)) {
    handle_bootstrap(envelope->from, *bootstrap);
  } else if (auto *request = std::get_if<packet::ClientRequest>(&incoming)) {
    handle_client_request(envelope->from, std::move(*request));
  } else if (auto *message = std::get_if<packet::NodeMessage>(&incoming)) {
    handle_routing_message(std::move(message->message));
  } else {
    LOG_WARN("vault", "Node ", short_name(name_),
             " ignoring unexpected packet from endpoint ", envelope->from);
  }
  return true;
}

void Vault::handle_bootstrap(mock_network::Endpoint from,
                             const packet::BootstrapRequest &request) {
  const auto &keys = request.client_keys;
  if (!crypto::verify(keys.public_sign_key(), bootstrap_challenge(keys),
                      request.signature)) {
    LOG_WARN("vault", "Node ", short_name(name_),
             " rejecting bootstrap with bad signature from endpoint ", from);
    send_packet(from, packet::BootstrapResponse{false, name_});
    return;
  }

  if (network_.node_count() < network_.min_section_size()) {
    LOG_INFO("vault", "Node ", short_name(name_), " rejecting client ",
             short_name(keys.name()), ": ", network_.node_count(),
             " nodes, section needs ", network_.min_section_size());
    send_packet(from, packet::BootstrapResponse{false, name_});
    return;
  }

  clients_[from] = keys;
  client_endpoints_[keys.name()] = from;
  LOG_DEBUG("vault", "Node ", short_name(name_), " proxying client ",
            short_name(keys.name()));
  send_packet(from, packet::BootstrapResponse{true, name_});
}

void Vault::handle_client_request(mock_network::Endpoint from,
                                  packet::ClientRequest request) {
  auto client = clients_.find(from);
  if (client == clients_.end()) {
    LOG_WARN("vault", "Node ", short_name(name_),
             " disconnecting unknown endpoint ", from);
    send_packet(from, packet::Disconnect{"not bootstrapped"});
    return;
  }

  Authority src = Authority::client(client->second, name_);

  size_t size = Serializer::serialize(request.request).size();
  if (size > MAX_REQUEST_PAYLOAD_SIZE) {
    LOG_WARN("vault", "Node ", short_name(name_), " disconnecting client ",
             short_name(src.name), ": ", request.request.name(), " of ", size,
             " bytes exceeds payload limit");
    client_endpoints_.erase(src.name);
    clients_.erase(client);
    send_packet(from, packet::Disconnect{"request payload too large"});
    return;
  }

  if (request.dst.is_client()) {
    send_packet(from, packet::ClientResponse{
                          request.dst, src,
                          error_response(request.request,
                                         ClientError::Kind::InvalidOperation)});
    return;
  }

  route(RoutingMessage{src, request.dst, std::move(request.request)});
}

void Vault::handle_routing_message(RoutingMessage message) {
  const Authority &dst = message.dst;

  if (dst.is_client()) {
    if (dst.proxy_node_name == name_) {
      deliver_to_client(message);
    } else {
      route(std::move(message));
    }
    return;
  }

  auto closest = network_.closest_node(dst.name);
  if (!closest || *closest != name_) {
    LOG_TRACE("vault", "Node ", short_name(name_), " forwarding message for ",
              dst.to_string());
    route(std::move(message));
    return;
  }

  if (auto *request = std::get_if<Request>(&message.content)) {
    if (dst.kind == Authority::Kind::ClientManager) {
      route(client_manager_.handle_request(message.src, dst, *request));
    } else {
      route(data_manager_.handle_request(message.src, dst, *request));
    }
    return;
  }

  const auto &response = std::get<Response>(message.content);
  if (dst.kind == Authority::Kind::ClientManager) {
    route(client_manager_.handle_response(message.src, dst, response));
  } else {
    LOG_WARN("vault", "Node ", short_name(name_), " dropping ",
             describe(response), " addressed to ", dst.to_string());
  }
}

void Vault::deliver_to_client(const RoutingMessage &message) {
  auto endpoint = client_endpoints_.find(message.dst.name);
  if (endpoint == client_endpoints_.end()) {
    LOG_WARN("vault", "Node ", short_name(name_), " has no client ",
             short_name(message.dst.name), " to deliver to");
    return;
  }

  const auto *response = std::get_if<Response>(&message.content);
  if (!response) {
    LOG_WARN("vault", "Node ", short_name(name_),
             " refusing to deliver a request to client ",
             short_name(message.dst.name));
    return;
  }

  send_packet(endpoint->second,
              packet::ClientResponse{message.src, message.dst, *response});
}

void Vault::send_packet(mock_network::Endpoint to, Packet packet) {
  if (!handle_->send(to, std::move(packet))) {
    LOG_DEBUG("vault", "Node ", short_name(name_), " lost packet to endpoint ",
              to);
  }
}

void Vault::route(std::vector<RoutingMessage> messages) {
  for (auto &message : messages) {
    route(std::move(message));
  }
}

void Vault::route(RoutingMessage message) {
  const XorName &target = message.dst.is_client()
                              ? message.dst.proxy_node_name
                              : message.dst.name;

  auto closest = network_.closest_node(target);
  auto endpoint = closest ? network_.endpoint_of(*closest) : std::nullopt;
  if (!endpoint) {
    LOG_VAULT_ERROR("No node to route message to",
                    "ROUTE_NO_NODE",
                    {{"node", short_name(name_)},
                     {"dst", message.dst.to_string()}});
    return;
  }

  if (!handle_->send(*endpoint, packet::NodeMessage{std::move(message)})) {
    LOG_WARN("vault", "Node ", short_name(name_), " failed to reach endpoint ",
             *endpoint);
  }
}

} // namespace vault
} // namespace vaultsim
