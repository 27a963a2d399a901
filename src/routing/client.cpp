#include "routing/client.h"
#include "common/logging.h"

namespace vaultsim {
namespace routing {

RoutingClient::RoutingClient(
    mock_network::Network &network,
    std::optional<mock_network::BootstrapConfig> bootstrap_config,
    crypto::SecretKeys keys, std::chrono::seconds msg_expiry)
    : network_(network), handle_(network.new_service_handle()),
      bootstrap_config_(std::move(bootstrap_config)), keys_(std::move(keys)),
      msg_expiry_(std::chrono::duration_cast<std::chrono::milliseconds>(
          msg_expiry)),
      state_(State::Bootstrapping) {}

bool RoutingClient::poll() {
  switch (state_) {
  case State::Terminated:
    return false;
  case State::Bootstrapping:
    return bootstrap();
  default:
    break;
  }

  if (auto envelope = handle_->receive()) {
    handle_packet(std::move(*envelope));
    return true;
  }

  if (state_ == State::Connected && !outbound_.empty()) {
    packet::ClientRequest request = std::move(outbound_.front());
    outbound_.pop_front();

    LOG_TRACE("routing", "Client ", short_name(public_keys().name()),
              " transmitting ", request.request.name(), " ",
              request.request.msg_id.to_string());

    if (!handle_->send(*proxy_endpoint_, std::move(request))) {
      LOG_NETWORK_ERROR("Proxy endpoint detached", "PROXY_UNREACHABLE",
                        {{"client", short_name(public_keys().name())},
                         {"endpoint", std::to_string(*proxy_endpoint_)}});
      terminate("proxy unreachable");
    }
    return true;
  }

  return false;
}

std::optional<Event> RoutingClient::try_next_event() {
  if (events_.empty()) {
    return std::nullopt;
  }
  Event event = std::move(events_.front());
  events_.pop_front();
  return event;
}

bool RoutingClient::bootstrap() {
  std::optional<mock_network::Endpoint> contact;
  if (bootstrap_config_) {
    for (auto endpoint : bootstrap_config_->contacts) {
      if (network_.is_connected(endpoint)) {
        contact = endpoint;
        break;
      }
    }
  } else {
    contact = network_.default_bootstrap_contact();
  }

  if (!contact) {
    terminate("no bootstrap contact");
    return true;
  }

  packet::BootstrapRequest request{public_keys(),
                                   keys_.sign(bootstrap_challenge(public_keys()))};
  if (!handle_->send(*contact, std::move(request))) {
    terminate("bootstrap contact unreachable");
    return true;
  }

  LOG_DEBUG("routing", "Client ", short_name(public_keys().name()),
            " bootstrapping off endpoint ", *contact);
  proxy_endpoint_ = contact;
  state_ = State::AwaitingProxy;
  return true;
}

void RoutingClient::handle_packet(mock_network::Envelope envelope) {
  if (auto *response = std::get_if<packet::BootstrapResponse>(&envelope.packet)) {
    if (state_ != State::AwaitingProxy) {
      LOG_WARN("routing", "Ignoring unexpected bootstrap response");
      return;
    }
    if (!response->accepted) {
      terminate("bootstrap rejected");
      return;
    }
    proxy_name_ = response->proxy_name;
    state_ = State::Connected;
    events_.push_back(event::Connected{});
    LOG_DEBUG("routing", "Client ", short_name(public_keys().name()),
              " connected via proxy ", short_name(response->proxy_name));
    return;
  }

  if (auto *response = std::get_if<packet::ClientResponse>(&envelope.packet)) {
    handle_response(std::move(*response));
    return;
  }

  if (auto *disconnect = std::get_if<packet::Disconnect>(&envelope.packet)) {
    terminate("disconnected by proxy: " + disconnect->reason);
    return;
  }

  LOG_WARN("routing", "Client ignoring unexpected packet from endpoint ",
           envelope.from);
}

void RoutingClient::handle_response(packet::ClientResponse response) {
  MessageId msg_id = response_msg_id(response.response);

  auto it = pending_.find(msg_id);
  if (it == pending_.end()) {
    LOG_WARN("routing", "Dropping response for unknown message ",
             msg_id.to_string());
    return;
  }

  uint64_t deadline = it->second;
  pending_.erase(it);

  if (network_.now_ms() > deadline) {
    LOG_WARN("routing", "Dropping expired response ", describe(response.response));
    return;
  }

  events_.push_back(event::Response{std::move(response.response),
                                    std::move(response.src),
                                    std::move(response.dst)});
}

void RoutingClient::terminate(const std::string &reason) {
  LOG_INFO("routing", "Client ", short_name(public_keys().name()),
           " terminated: ", reason);
  state_ = State::Terminated;
  outbound_.clear();
  pending_.clear();
  events_.push_back(event::Terminated{});
}

Result<bool> RoutingClient::send_request(const Authority &dst, RequestBody body,
                                         const MessageId &msg_id) {
  if (state_ == State::Terminated) {
    return Result<bool>("Routing client terminated");
  }
  if (state_ != State::Connected) {
    return Result<bool>("Routing client not connected");
  }

  pending_[msg_id] = network_.now_ms() + msg_expiry_.count();
  outbound_.push_back(packet::ClientRequest{dst, Request{std::move(body), msg_id}});
  return Result<bool>(true);
}

Result<bool> RoutingClient::send_put_idata(const Authority &dst,
                                           const ImmutableData &data,
                                           const MessageId &msg_id) {
  return send_request(dst, request::PutIData{data}, msg_id);
}

Result<bool> RoutingClient::send_get_idata(const Authority &dst,
                                           const XorName &name,
                                           const MessageId &msg_id) {
  return send_request(dst, request::GetIData{name}, msg_id);
}

Result<bool> RoutingClient::send_put_mdata(const Authority &dst,
                                           const MutableData &data,
                                           const MessageId &msg_id,
                                           const PublicSignKey &requester) {
  return send_request(dst, request::PutMData{data, requester}, msg_id);
}

Result<bool> RoutingClient::send_get_mdata_version(const Authority &dst,
                                                   const XorName &name,
                                                   uint64_t tag,
                                                   const MessageId &msg_id) {
  return send_request(dst, request::GetMDataVersion{name, tag}, msg_id);
}

Result<bool> RoutingClient::send_get_mdata_shell(const Authority &dst,
                                                 const XorName &name,
                                                 uint64_t tag,
                                                 const MessageId &msg_id) {
  return send_request(dst, request::GetMDataShell{name, tag}, msg_id);
}

Result<bool> RoutingClient::send_list_mdata_entries(const Authority &dst,
                                                    const XorName &name,
                                                    uint64_t tag,
                                                    const MessageId &msg_id) {
  return send_request(dst, request::ListMDataEntries{name, tag}, msg_id);
}

Result<bool> RoutingClient::send_get_mdata_value(const Authority &dst,
                                                 const XorName &name,
                                                 uint64_t tag, const Bytes &key,
                                                 const MessageId &msg_id) {
  return send_request(dst, request::GetMDataValue{name, tag, key}, msg_id);
}

Result<bool> RoutingClient::send_mutate_mdata_entries(
    const Authority &dst, const XorName &name, uint64_t tag,
    const EntryActionMap &actions, const MessageId &msg_id,
    const PublicSignKey &requester) {
  return send_request(
      dst, request::MutateMDataEntries{name, tag, actions, requester}, msg_id);
}

Result<bool> RoutingClient::send_list_mdata_permissions(
    const Authority &dst, const XorName &name, uint64_t tag,
    const MessageId &msg_id) {
  return send_request(dst, request::ListMDataPermissions{name, tag}, msg_id);
}

Result<bool> RoutingClient::send_list_mdata_user_permissions(
    const Authority &dst, const XorName &name, uint64_t tag, const User &user,
    const MessageId &msg_id) {
  return send_request(dst, request::ListMDataUserPermissions{name, tag, user},
                      msg_id);
}

Result<bool> RoutingClient::send_set_mdata_user_permissions(
    const Authority &dst, const XorName &name, uint64_t tag, const User &user,
    const PermissionSet &permissions, uint64_t version,
    const MessageId &msg_id, const PublicSignKey &requester) {
  return send_request(dst,
                      request::SetMDataUserPermissions{
                          name, tag, user, permissions, version, requester},
                      msg_id);
}

Result<bool> RoutingClient::send_del_mdata_user_permissions(
    const Authority &dst, const XorName &name, uint64_t tag, const User &user,
    uint64_t version, const MessageId &msg_id, const PublicSignKey &requester) {
  return send_request(
      dst, request::DelMDataUserPermissions{name, tag, user, version, requester},
      msg_id);
}

Result<bool> RoutingClient::send_change_mdata_owner(const Authority &dst,
                                                    const XorName &name,
                                                    uint64_t tag,
                                                    const Owners &new_owners,
                                                    uint64_t version,
                                                    const MessageId &msg_id) {
  return send_request(
      dst, request::ChangeMDataOwner{name, tag, new_owners, version}, msg_id);
}

Result<bool> RoutingClient::send_get_account_info(const Authority &dst,
                                                  const MessageId &msg_id) {
  return send_request(dst, request::GetAccountInfo{}, msg_id);
}

Result<bool>
RoutingClient::send_list_auth_keys_and_version(const Authority &dst,
                                               const MessageId &msg_id) {
  return send_request(dst, request::ListAuthKeysAndVersion{}, msg_id);
}

Result<bool> RoutingClient::send_ins_auth_key(const Authority &dst,
                                              const PublicSignKey &key,
                                              uint64_t version,
                                              const MessageId &msg_id) {
  return send_request(dst, request::InsAuthKey{key, version}, msg_id);
}

Result<bool> RoutingClient::send_del_auth_key(const Authority &dst,
                                              const PublicSignKey &key,
                                              uint64_t version,
                                              const MessageId &msg_id) {
  return send_request(dst, request::DelAuthKey{key, version}, msg_id);
}

} // namespace routing
} // namespace vaultsim
