#pragma once

#include "common/types.h"
#include "crypto/keys.h"
#include "mock_network/network.h"
#include "routing/messages.h"
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <optional>

namespace vaultsim {
namespace routing {

using namespace vaultsim::common;

/**
 * RoutingClient - Asynchronous client participant on the mock network
 *
 * Requests are only queued by the send_* calls; nothing reaches the network
 * until poll() is called. Each poll performs at most one unit of work
 * (bootstrap, handle one inbound packet, or transmit one queued request) and
 * reports whether it did anything. Results surface as events through
 * try_next_event().
 */
class RoutingClient {
public:
  RoutingClient(mock_network::Network &network,
                std::optional<mock_network::BootstrapConfig> bootstrap_config,
                crypto::SecretKeys keys, std::chrono::seconds msg_expiry);

  RoutingClient(const RoutingClient &) = delete;
  RoutingClient &operator=(const RoutingClient &) = delete;

  /// Perform one unit of work; false when there was nothing to do
  bool poll();

  /// Next queued event, if any
  std::optional<Event> try_next_event();

  bool is_connected() const { return state_ == State::Connected; }
  bool is_terminated() const { return state_ == State::Terminated; }

  /// Name of the proxy node once connected
  std::optional<XorName> proxy_name() const { return proxy_name_; }

  mock_network::Endpoint endpoint() const { return handle_->endpoint(); }

  const crypto::PublicKeys &public_keys() const {
    return keys_.public_keys();
  }

  /// Requests tracked and not yet answered or expired
  size_t pending_requests() const { return pending_.size(); }

  // Immutable data
  Result<bool> send_put_idata(const Authority &dst, const ImmutableData &data,
                              const MessageId &msg_id);
  Result<bool> send_get_idata(const Authority &dst, const XorName &name,
                              const MessageId &msg_id);

  // Mutable data
  Result<bool> send_put_mdata(const Authority &dst, const MutableData &data,
                              const MessageId &msg_id,
                              const PublicSignKey &requester);
  Result<bool> send_get_mdata_version(const Authority &dst,
                                      const XorName &name, uint64_t tag,
                                      const MessageId &msg_id);
  Result<bool> send_get_mdata_shell(const Authority &dst, const XorName &name,
                                    uint64_t tag, const MessageId &msg_id);
  Result<bool> send_list_mdata_entries(const Authority &dst,
                                       const XorName &name, uint64_t tag,
                                       const MessageId &msg_id);
  Result<bool> send_get_mdata_value(const Authority &dst, const XorName &name,
                                    uint64_t tag, const Bytes &key,
                                    const MessageId &msg_id);
  Result<bool> send_mutate_mdata_entries(const Authority &dst,
                                         const XorName &name, uint64_t tag,
                                         const EntryActionMap &actions,
                                         const MessageId &msg_id,
                                         const PublicSignKey &requester);
  Result<bool> send_list_mdata_permissions(const Authority &dst,
                                           const XorName &name, uint64_t tag,
                                           const MessageId &msg_id);
  Result<bool> send_list_mdata_user_permissions(const Authority &dst,
                                                const XorName &name,
                                                uint64_t tag, const User &user,
                                                const MessageId &msg_id);
  Result<bool> send_set_mdata_user_permissions(
      const Authority &dst, const XorName &name, uint64_t tag,
      const User &user, const PermissionSet &permissions, uint64_t version,
      const MessageId &msg_id, const PublicSignKey &requester);
  Result<bool> send_del_mdata_user_permissions(const Authority &dst,
                                               const XorName &name,
                                               uint64_t tag, const User &user,
                                               uint64_t version,
                                               const MessageId &msg_id,
                                               const PublicSignKey &requester);
  Result<bool> send_change_mdata_owner(const Authority &dst,
                                       const XorName &name, uint64_t tag,
                                       const Owners &new_owners,
                                       uint64_t version,
                                       const MessageId &msg_id);

  // Account
  Result<bool> send_get_account_info(const Authority &dst,
                                     const MessageId &msg_id);
  Result<bool> send_list_auth_keys_and_version(const Authority &dst,
                                               const MessageId &msg_id);
  Result<bool> send_ins_auth_key(const Authority &dst,
                                 const PublicSignKey &key, uint64_t version,
                                 const MessageId &msg_id);
  Result<bool> send_del_auth_key(const Authority &dst,
                                 const PublicSignKey &key, uint64_t version,
                                 const MessageId &msg_id);

private:
  enum class State { Bootstrapping, AwaitingProxy, Connected, Terminated };

  Result<bool> send_request(const Authority &dst, RequestBody body,
                            const MessageId &msg_id);

  bool bootstrap();
  void handle_packet(mock_network::Envelope envelope);
  void handle_response(packet::ClientResponse response);
  void terminate(const std::string &reason);

  mock_network::Network &network_;
  std::unique_ptr<mock_network::ServiceHandle> handle_;
  std::optional<mock_network::BootstrapConfig> bootstrap_config_;
  crypto::SecretKeys keys_;
  std::chrono::milliseconds msg_expiry_;

  State state_;
  std::optional<mock_network::Endpoint> proxy_endpoint_;
  std::optional<XorName> proxy_name_;

  std::deque<packet::ClientRequest> outbound_;
  std::map<MessageId, uint64_t> pending_; ///< msg_id -> deadline (virtual ms)
  std::deque<Event> events_;
};

} // namespace routing
} // namespace vaultsim
