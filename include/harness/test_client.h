#pragma once

#include "common/config.h"
#include "common/rng.h"
#include "crypto/keys.h"
#include "harness/response.h"
#include "harness/test_node.h"
#include "mock_network/network.h"
#include "routing/client.h"
#include "routing/messages.h"
#include "vault/authority.h"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vaultsim {
namespace harness {

using namespace vaultsim::common;

using routing::Authority;
using routing::ClientResult;
using routing::MessageId;

/**
 * TestClient - Synchronous client for tests on the mock network
 *
 * Each `*_response` operation sends one request, runs the simulation until
 * it is quiescent and then expects the next event to be the matching
 * response; anything else is a ContractViolation. Read-style operations
 * first discard events left over from earlier requests. The plain variants
 * only queue the request and return its message id.
 *
 * Mutations and account queries go to the client manager set with
 * set_client_manager() (by default the client's own), reads go to the data
 * manager of the data's name.
 */
class TestClient {
public:
  /// New client with an identity drawn from the network's random stream
  TestClient(mock_network::Network &network, const HarnessConfig &config,
             std::optional<mock_network::BootstrapConfig> bootstrap_config =
                 std::nullopt);

  /// New client using `full_id`
  TestClient(mock_network::Network &network, const HarnessConfig &config,
             std::optional<mock_network::BootstrapConfig> bootstrap_config,
             crypto::SecretKeys full_id);

  TestClient(TestClient &&) = default;
  TestClient &operator=(TestClient &&) = delete;

  /// Destination of mutation requests; an app acts for its owner this way
  void set_client_manager(const XorName &name);
  const Authority &client_manager() const { return client_manager_; }

  /// Next event from routing, if any
  std::optional<routing::Event> try_recv();

  /// Poll the routing client until it is idle; returns units of work done
  size_t poll();
  bool poll_once();

  /// Run the simulation and require a Connected event
  void ensure_connected(std::vector<TestNode> &nodes);
  bool is_connected() const { return connected_; }

  // Accounts
  /// Stores an account packet without a Login entry; returns its name
  XorName create_account(std::vector<TestNode> &nodes);
  ClientResult<bool>
  create_account_with_invitation_response(const std::string &invitation_code,
                                          std::vector<TestNode> &nodes);
  MessageId create_account_with_invitation(const std::string &invitation_code);

  /// Name of the last account packet this client sent
  const std::optional<XorName> &account_packet_name() const {
    return account_packet_name_;
  }

  // Immutable data
  MessageId put_idata(const routing::ImmutableData &data);
  void put_idata_with_msg_id(const routing::ImmutableData &data,
                             const MessageId &msg_id);
  ClientResult<bool> put_idata_response(const routing::ImmutableData &data,
                                        std::vector<TestNode> &nodes);
  ClientResult<bool>
  put_idata_response_with_msg_id(const routing::ImmutableData &data,
                                 const MessageId &msg_id,
                                 std::vector<TestNode> &nodes);

  /// Oversized payloads get the client disconnected: InvalidOperation
  ClientResult<bool> put_large_sized_idata(const routing::ImmutableData &data,
                                           std::vector<TestNode> &nodes);

  /// A missing response is a NetworkOther("No Response") failure
  ClientResult<bool> put_idata_may_response(const routing::ImmutableData &data,
                                            std::vector<TestNode> &nodes);

  ClientResult<routing::ImmutableData>
  get_idata_response(const XorName &name, std::vector<TestNode> &nodes);
  ClientResult<std::pair<routing::ImmutableData, Authority>>
  get_idata_response_with_src(const XorName &name,
                              std::vector<TestNode> &nodes);

  // Mutable data
  MessageId put_mdata(const routing::MutableData &data);
  ClientResult<bool> put_mdata_response(const routing::MutableData &data,
                                        std::vector<TestNode> &nodes);

  ClientResult<uint64_t> get_mdata_version_response(const XorName &name,
                                                    uint64_t tag,
                                                    std::vector<TestNode> &nodes);
  ClientResult<routing::MutableData>
  get_mdata_shell_response(const XorName &name, uint64_t tag,
                           std::vector<TestNode> &nodes);
  ClientResult<routing::Entries>
  list_mdata_entries_response(const XorName &name, uint64_t tag,
                              std::vector<TestNode> &nodes);
  ClientResult<routing::Value>
  get_mdata_value_response(const XorName &name, uint64_t tag, const Bytes &key,
                           std::vector<TestNode> &nodes);

  MessageId mutate_mdata_entries(const XorName &name, uint64_t tag,
                                 const routing::EntryActionMap &actions);
  ClientResult<bool>
  mutate_mdata_entries_response(const XorName &name, uint64_t tag,
                                const routing::EntryActionMap &actions,
                                std::vector<TestNode> &nodes);

  ClientResult<routing::Permissions>
  list_mdata_permissions_response(const XorName &name, uint64_t tag,
                                  std::vector<TestNode> &nodes);
  ClientResult<routing::PermissionSet>
  list_mdata_user_permissions_response(const XorName &name, uint64_t tag,
                                       const routing::User &user,
                                       std::vector<TestNode> &nodes);
  ClientResult<bool> set_mdata_user_permissions_response(
      const XorName &name, uint64_t tag, const routing::User &user,
      const routing::PermissionSet &permissions, uint64_t version,
      std::vector<TestNode> &nodes);
  ClientResult<bool>
  del_mdata_user_permissions_response(const XorName &name, uint64_t tag,
                                      const routing::User &user,
                                      uint64_t version,
                                      std::vector<TestNode> &nodes);
  ClientResult<bool>
  change_mdata_owner_response(const XorName &name, uint64_t tag,
                              const routing::Owners &new_owners,
                              uint64_t version, std::vector<TestNode> &nodes);

  // Account queries and app keys
  ClientResult<routing::AccountInfo>
  get_account_info_response(std::vector<TestNode> &nodes);
  ClientResult<routing::response::AuthKeysAndVersion>
  list_auth_keys_and_version_response(std::vector<TestNode> &nodes);

  MessageId ins_auth_key(const crypto::PublicSignKey &key, uint64_t version);
  MessageId del_auth_key(const crypto::PublicSignKey &key, uint64_t version);
  ClientResult<bool> ins_auth_key_response(const crypto::PublicSignKey &key,
                                           uint64_t version,
                                           std::vector<TestNode> &nodes);
  ClientResult<bool> del_auth_key_response(const crypto::PublicSignKey &key,
                                           uint64_t version,
                                           std::vector<TestNode> &nodes);

  // Identity
  const crypto::SecretKeys &full_id() const { return full_id_; }
  const crypto::PublicSignKey &signing_public_key() const {
    return full_id_.public_keys().public_sign_key();
  }
  const XorName &name() const { return full_id_.public_keys().name(); }

  /// This client as seen by the network; requires a connection
  vault::ClientAuthority client_authority() const;

  mock_network::Network &network() { return *network_; }
  const HarnessConfig &config() const { return config_; }

private:
  void require_connected(const char *operation) const;
  void check_sent(const Result<bool> &sent, const char *operation) const;

  /// Discard every queued event
  void flush();

  /// Session packet owned by this client, with a Login entry when invited
  routing::MutableData
  compose_account_data(const std::optional<std::string> &invitation_code);

  mock_network::Network *network_;
  HarnessConfig config_;
  SeededRng rng_;
  crypto::SecretKeys full_id_;
  std::unique_ptr<routing::RoutingClient> routing_client_;
  Authority client_manager_;
  std::optional<XorName> account_packet_name_;
  bool connected_;
};

} // namespace harness
} // namespace vaultsim
