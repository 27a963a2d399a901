#include "harness/test_client.h"
#include "common/logging.h"
#include "harness/contract_violation.h"
#include "harness/poll.h"
#include "routing/serializer.h"

namespace vaultsim {
namespace harness {

using namespace vaultsim::routing;

TestClient::TestClient(
    mock_network::Network &network, const HarnessConfig &config,
    std::optional<mock_network::BootstrapConfig> bootstrap_config)
    : network_(&network), config_(config), rng_(network.new_rng()),
      full_id_(crypto::SecretKeys::generate(rng_)),
      routing_client_(std::make_unique<RoutingClient>(
          network, std::move(bootstrap_config), full_id_,
          config.client_msg_expiry)),
      client_manager_(Authority::client_manager(full_id_.public_keys().name())),
      connected_(false) {}

TestClient::TestClient(
    mock_network::Network &network, const HarnessConfig &config,
    std::optional<mock_network::BootstrapConfig> bootstrap_config,
    crypto::SecretKeys full_id)
    : network_(&network), config_(config), rng_(network.new_rng()),
      full_id_(std::move(full_id)),
      routing_client_(std::make_unique<RoutingClient>(
          network, std::move(bootstrap_config), full_id_,
          config.client_msg_expiry)),
      client_manager_(Authority::client_manager(full_id_.public_keys().name())),
      connected_(false) {}

void TestClient::set_client_manager(const XorName &name) {
  client_manager_ = Authority::client_manager(name);
}

std::optional<Event> TestClient::try_recv() {
  auto next = routing_client_->try_next_event();
  if (next && std::holds_alternative<event::Connected>(*next)) {
    connected_ = true;
  }
  return next;
}

size_t TestClient::poll() {
  size_t result = 0;
  while (routing_client_->poll()) {
    ++result;
  }
  return result;
}

bool TestClient::poll_once() { return routing_client_->poll(); }

void TestClient::ensure_connected(std::vector<TestNode> &nodes) {
  poll::nodes_and_client(nodes, *this);

  auto next = try_recv();
  if (!next || !std::holds_alternative<event::Connected>(*next)) {
    contract_violation("Expected Connected event",
                       {{"event", next ? describe(*next) : "none"}});
  }
}

vault::ClientAuthority TestClient::client_authority() const {
  auto proxy = routing_client_->proxy_name();
  if (!connected_ || !proxy) {
    contract_violation("Client authority requested before connecting",
                       {{"client", short_name(name())}});
  }
  return vault::ClientAuthority{full_id_.public_keys(), *proxy};
}

void TestClient::require_connected(const char *operation) const {
  if (!connected_) {
    contract_violation(std::string(operation) + " issued before connecting",
                       {{"client", short_name(name())}});
  }
}

void TestClient::check_sent(const Result<bool> &sent,
                            const char *operation) const {
  if (sent.is_err()) {
    contract_violation(std::string("Routing refused ") + operation,
                       {{"client", short_name(name())},
                        {"error", sent.error()}});
  }
}

void TestClient::flush() {
  while (auto stale = try_recv()) {
    LOG_TRACE("harness", "Discarding stale event ", describe(*stale));
  }
}

// Accounts

XorName TestClient::create_account(std::vector<TestNode> &nodes) {
  MutableData data = compose_account_data(std::nullopt);

  auto res = put_mdata_response(data, nodes);
  if (res.is_err()) {
    contract_violation("Account creation failed",
                       {{"client", short_name(name())},
                        {"error", res.error().to_string()}});
  }
  return data.name();
}

MutableData TestClient::compose_account_data(
    const std::optional<std::string> &invitation_code) {
  Entries entries;
  if (invitation_code) {
    entries[login_entry_key()] =
        Value{Serializer::serialize(AccountPacket::with_invitation(*invitation_code)),
              0};
  }

  auto data = MutableData::create(rng_.gen_name(), TYPE_TAG_SESSION_PACKET,
                                  Permissions(), std::move(entries),
                                  Owners{signing_public_key()});
  if (data.is_err()) {
    contract_violation("Could not build account packet",
                       {{"error", data.error().to_string()}});
  }
  account_packet_name_ = data.value().name();
  return data.value();
}

ClientResult<bool> TestClient::create_account_with_invitation_response(
    const std::string &invitation_code, std::vector<TestNode> &nodes) {
  return put_mdata_response(compose_account_data(invitation_code), nodes);
}

MessageId
TestClient::create_account_with_invitation(const std::string &invitation_code) {
  return put_mdata(compose_account_data(invitation_code));
}

// Immutable data

MessageId TestClient::put_idata(const ImmutableData &data) {
  MessageId msg_id = MessageId::random(rng_);
  put_idata_with_msg_id(data, msg_id);
  return msg_id;
}

void TestClient::put_idata_with_msg_id(const ImmutableData &data,
                                       const MessageId &msg_id) {
  require_connected("PutIData");
  check_sent(routing_client_->send_put_idata(client_manager_, data, msg_id),
             "PutIData");
}

ClientResult<bool> TestClient::put_idata_response(const ImmutableData &data,
                                                  std::vector<TestNode> &nodes) {
  return put_idata_response_with_msg_id(data, MessageId::random(rng_), nodes);
}

ClientResult<bool>
TestClient::put_idata_response_with_msg_id(const ImmutableData &data,
                                           const MessageId &msg_id,
                                           std::vector<TestNode> &nodes) {
  put_idata_with_msg_id(data, msg_id);
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::PutIData>(try_recv(), msg_id);
}

ClientResult<bool>
TestClient::put_large_sized_idata(const ImmutableData &data,
                                  std::vector<TestNode> &nodes) {
  MessageId msg_id = put_idata(data);
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::PutIData>(
      try_recv(), msg_id, TerminationPolicy::InvalidOperation);
}

ClientResult<bool>
TestClient::put_idata_may_response(const ImmutableData &data,
                                   std::vector<TestNode> &nodes) {
  MessageId msg_id = put_idata(data);
  poll::nodes_and_client(nodes, *this);

  auto next = try_recv();
  if (!next) {
    LOG_DEBUG("harness", "No response to PutIData ", msg_id.to_string());
    return ClientResult<bool>::failure(
        ClientError::network_other("No Response"));
  }
  return expect_response<response::PutIData>(next, msg_id);
}

ClientResult<ImmutableData>
TestClient::get_idata_response(const XorName &name,
                               std::vector<TestNode> &nodes) {
  auto res = get_idata_response_with_src(name, nodes);
  if (res.is_err()) {
    return ClientResult<ImmutableData>::failure(res.error());
  }
  return ClientResult<ImmutableData>(res.value().first);
}

ClientResult<std::pair<ImmutableData, Authority>>
TestClient::get_idata_response_with_src(const XorName &name,
                                        std::vector<TestNode> &nodes) {
  using WithSrc = std::pair<ImmutableData, Authority>;

  flush();
  require_connected("GetIData");

  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_get_idata(Authority::nae_manager(name), name,
                                             msg_id),
             "GetIData");
  poll::nodes_and_client(nodes, *this);

  auto correlated = correlate<response::GetIData>(try_recv(), msg_id);
  if (correlated.res.is_err()) {
    return ClientResult<WithSrc>::failure(correlated.res.error());
  }
  return ClientResult<WithSrc>(WithSrc(correlated.res.value(), correlated.src));
}

// Mutable data

MessageId TestClient::put_mdata(const MutableData &data) {
  require_connected("PutMData");
  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_put_mdata(client_manager_, data, msg_id,
                                             signing_public_key()),
             "PutMData");
  return msg_id;
}

ClientResult<bool> TestClient::put_mdata_response(const MutableData &data,
                                                  std::vector<TestNode> &nodes) {
  MessageId msg_id = put_mdata(data);
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::PutMData>(try_recv(), msg_id);
}

ClientResult<uint64_t>
TestClient::get_mdata_version_response(const XorName &name, uint64_t tag,
                                       std::vector<TestNode> &nodes) {
  flush();
  require_connected("GetMDataVersion");

  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_get_mdata_version(
                 Authority::nae_manager(name), name, tag, msg_id),
             "GetMDataVersion");
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::GetMDataVersion>(try_recv(), msg_id);
}

ClientResult<MutableData>
TestClient::get_mdata_shell_response(const XorName &name, uint64_t tag,
                                     std::vector<TestNode> &nodes) {
  flush();
  require_connected("GetMDataShell");

  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_get_mdata_shell(Authority::nae_manager(name),
                                                   name, tag, msg_id),
             "GetMDataShell");
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::GetMDataShell>(try_recv(), msg_id);
}

ClientResult<Entries>
TestClient::list_mdata_entries_response(const XorName &name, uint64_t tag,
                                        std::vector<TestNode> &nodes) {
  flush();
  require_connected("ListMDataEntries");

  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_list_mdata_entries(
                 Authority::nae_manager(name), name, tag, msg_id),
             "ListMDataEntries");
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::ListMDataEntries>(try_recv(), msg_id);
}

ClientResult<Value>
TestClient::get_mdata_value_response(const XorName &name, uint64_t tag,
                                     const Bytes &key,
                                     std::vector<TestNode> &nodes) {
  flush();
  require_connected("GetMDataValue");

  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_get_mdata_value(Authority::nae_manager(name),
                                                   name, tag, key, msg_id),
             "GetMDataValue");
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::GetMDataValue>(try_recv(), msg_id);
}

MessageId TestClient::mutate_mdata_entries(const XorName &name, uint64_t tag,
                                           const EntryActionMap &actions) {
  require_connected("MutateMDataEntries");
  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_mutate_mdata_entries(
                 client_manager_, name, tag, actions, msg_id,
                 signing_public_key()),
             "MutateMDataEntries");
  return msg_id;
}

ClientResult<bool>
TestClient::mutate_mdata_entries_response(const XorName &name, uint64_t tag,
                                          const EntryActionMap &actions,
                                          std::vector<TestNode> &nodes) {
  MessageId msg_id = mutate_mdata_entries(name, tag, actions);
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::MutateMDataEntries>(try_recv(), msg_id);
}

ClientResult<Permissions>
TestClient::list_mdata_permissions_response(const XorName &name, uint64_t tag,
                                            std::vector<TestNode> &nodes) {
  flush();
  require_connected("ListMDataPermissions");

  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_list_mdata_permissions(
                 Authority::nae_manager(name), name, tag, msg_id),
             "ListMDataPermissions");
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::ListMDataPermissions>(try_recv(), msg_id);
}

ClientResult<PermissionSet> TestClient::list_mdata_user_permissions_response(
    const XorName &name, uint64_t tag, const User &user,
    std::vector<TestNode> &nodes) {
  flush();
  require_connected("ListMDataUserPermissions");

  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_list_mdata_user_permissions(
                 Authority::nae_manager(name), name, tag, user, msg_id),
             "ListMDataUserPermissions");
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::ListMDataUserPermissions>(try_recv(),
                                                             msg_id);
}

ClientResult<bool> TestClient::set_mdata_user_permissions_response(
    const XorName &name, uint64_t tag, const User &user,
    const PermissionSet &permissions, uint64_t version,
    std::vector<TestNode> &nodes) {
  require_connected("SetMDataUserPermissions");

  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_set_mdata_user_permissions(
                 client_manager_, name, tag, user, permissions, version,
                 msg_id, signing_public_key()),
             "SetMDataUserPermissions");
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::SetMDataUserPermissions>(try_recv(),
                                                            msg_id);
}

ClientResult<bool> TestClient::del_mdata_user_permissions_response(
    const XorName &name, uint64_t tag, const User &user, uint64_t version,
    std::vector<TestNode> &nodes) {
  require_connected("DelMDataUserPermissions");

  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_del_mdata_user_permissions(
                 client_manager_, name, tag, user, version, msg_id,
                 signing_public_key()),
             "DelMDataUserPermissions");
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::DelMDataUserPermissions>(try_recv(),
                                                            msg_id);
}

ClientResult<bool> TestClient::change_mdata_owner_response(
    const XorName &name, uint64_t tag, const Owners &new_owners,
    uint64_t version, std::vector<TestNode> &nodes) {
  require_connected("ChangeMDataOwner");

  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_change_mdata_owner(
                 client_manager_, name, tag, new_owners, version, msg_id),
             "ChangeMDataOwner");
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::ChangeMDataOwner>(try_recv(), msg_id);
}

// Account queries and app keys

ClientResult<AccountInfo>
TestClient::get_account_info_response(std::vector<TestNode> &nodes) {
  flush();
  require_connected("GetAccountInfo");

  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_get_account_info(client_manager_, msg_id),
             "GetAccountInfo");
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::GetAccountInfo>(try_recv(), msg_id);
}

ClientResult<response::AuthKeysAndVersion>
TestClient::list_auth_keys_and_version_response(std::vector<TestNode> &nodes) {
  flush();
  require_connected("ListAuthKeysAndVersion");

  MessageId msg_id = MessageId::random(rng_);
  check_sent(routing_client_->send_list_auth_keys_and_version(client_manager_,
                                                              msg_id),
             "ListAuthKeysAndVersion");
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::ListAuthKeysAndVersion>(try_recv(), msg_id);
}

MessageId TestClient::ins_auth_key(const crypto::PublicSignKey &key,
                                   uint64_t version) {
  require_connected("InsAuthKey");
  MessageId msg_id = MessageId::random(rng_);
  check_sent(
      routing_client_->send_ins_auth_key(client_manager_, key, version, msg_id),
      "InsAuthKey");
  return msg_id;
}

MessageId TestClient::del_auth_key(const crypto::PublicSignKey &key,
                                   uint64_t version) {
  require_connected("DelAuthKey");
  MessageId msg_id = MessageId::random(rng_);
  check_sent(
      routing_client_->send_del_auth_key(client_manager_, key, version, msg_id),
      "DelAuthKey");
  return msg_id;
}

ClientResult<bool>
TestClient::ins_auth_key_response(const crypto::PublicSignKey &key,
                                  uint64_t version,
                                  std::vector<TestNode> &nodes) {
  MessageId msg_id = ins_auth_key(key, version);
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::InsAuthKey>(try_recv(), msg_id);
}

ClientResult<bool>
TestClient::del_auth_key_response(const crypto::PublicSignKey &key,
                                  uint64_t version,
                                  std::vector<TestNode> &nodes) {
  MessageId msg_id = del_auth_key(key, version);
  poll::nodes_and_client(nodes, *this);
  return expect_response<response::DelAuthKey>(try_recv(), msg_id);
}

} // namespace harness
} // namespace vaultsim
