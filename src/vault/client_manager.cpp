#include "vault/client_manager.h"
#include "common/logging.h"
#include "routing/serializer.h"
#include <type_traits>

namespace vaultsim {
namespace vault {

using namespace vaultsim::routing;

namespace {

/// Requester named inside a request payload, for the kinds that carry one
std::optional<PublicSignKey> requester_of(const RequestBody &body) {
  if (auto *req = std::get_if<request::PutMData>(&body)) {
    return req->requester;
  }
  if (auto *req = std::get_if<request::MutateMDataEntries>(&body)) {
    return req->requester;
  }
  if (auto *req = std::get_if<request::SetMDataUserPermissions>(&body)) {
    return req->requester;
  }
  if (auto *req = std::get_if<request::DelMDataUserPermissions>(&body)) {
    return req->requester;
  }
  return std::nullopt;
}

/// Name of the data a mutation targets
XorName data_name_of(const RequestBody &body) {
  return std::visit(
      [](const auto &req) -> XorName {
        using Req = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<Req, request::PutIData> ||
                      std::is_same_v<Req, request::PutMData>) {
          return req.data.name();
        } else if constexpr (std::is_same_v<Req, request::GetAccountInfo> ||
                             std::is_same_v<Req,
                                            request::ListAuthKeysAndVersion> ||
                             std::is_same_v<Req, request::InsAuthKey> ||
                             std::is_same_v<Req, request::DelAuthKey>) {
          return XorName{};
        } else {
          return req.name;
        }
      },
      body);
}

bool response_succeeded(const Response &response) {
  return std::visit([](const auto &resp) { return resp.res.is_ok(); },
                    response);
}

} // namespace

ClientManager::ClientManager(uint64_t account_mutations,
                             std::shared_ptr<InvitationRegistry> invitations)
    : account_mutations_(account_mutations),
      invitations_(std::move(invitations)) {}

std::optional<Account> ClientManager::account(const XorName &name) const {
  auto it = accounts_.find(name);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

RoutingMessage ClientManager::reply(const Authority &dst,
                                    const Authority &client,
                                    Response response) {
  return RoutingMessage{Authority::client_manager(dst.name), client,
                        std::move(response)};
}

ClientResult<bool> ClientManager::authorise(const Authority &src,
                                            const XorName &account_name,
                                            bool owner_only) const {
  auto it = accounts_.find(account_name);
  if (it == accounts_.end()) {
    return ClientResult<bool>::failure(ClientError::Kind::NoSuchAccount);
  }

  const auto &key = src.client_keys.public_sign_key();
  if (crypto::name_from_key(key) == account_name) {
    return ClientResult<bool>(true);
  }
  if (!owner_only && it->second.auth_keys.count(key) > 0) {
    return ClientResult<bool>(true);
  }
  return ClientResult<bool>::failure(ClientError::Kind::AccessDenied);
}

std::vector<RoutingMessage>
ClientManager::handle_request(const Authority &src, const Authority &dst,
                              const Request &request) {
  if (!src.is_client()) {
    LOG_WARN("client_manager", "Rejecting ", request.name(), " from ",
             src.to_string());
    return {reply(dst, src,
                  error_response(request, ClientError::Kind::InvalidOperation))};
  }

  if (auto *put = std::get_if<request::PutMData>(&request.body)) {
    if (put->data.tag() == TYPE_TAG_SESSION_PACKET) {
      return handle_account_creation(src, dst, request, put->data);
    }
  }

  if (request.is_mutation()) {
    bool owner_only =
        std::holds_alternative<request::ChangeMDataOwner>(request.body);
    auto authorised = authorise(src, dst.name, owner_only);
    if (authorised.is_err()) {
      return {reply(dst, src, error_response(request, authorised.error()))};
    }

    auto requester = requester_of(request.body);
    if (requester && *requester != src.client_keys.public_sign_key()) {
      return {reply(dst, src,
                    error_response(request, ClientError::Kind::AccessDenied))};
    }

    return forward_mutation(src, dst, request, data_name_of(request.body));
  }

  if (std::holds_alternative<request::GetAccountInfo>(request.body) ||
      std::holds_alternative<request::ListAuthKeysAndVersion>(request.body) ||
      std::holds_alternative<request::InsAuthKey>(request.body) ||
      std::holds_alternative<request::DelAuthKey>(request.body)) {
    return handle_account_request(src, dst, request);
  }

  // Reads are served by data managers only
  return {reply(dst, src,
                error_response(request, ClientError::Kind::InvalidOperation))};
}

std::vector<RoutingMessage> ClientManager::handle_account_creation(
    const Authority &src, const Authority &dst, const Request &request,
    const MutableData &data) {
  if (crypto::name_from_key(src.client_keys.public_sign_key()) != dst.name) {
    return {reply(dst, src,
                  error_response(request, ClientError::Kind::AccessDenied))};
  }
  if (accounts_.count(dst.name) > 0) {
    return {reply(dst, src,
                  error_response(request, ClientError::Kind::AccountExists))};
  }

  PendingOp op;
  op.client = src;
  op.account_name = dst.name;
  op.creates_account = true;

  if (invitations_) {
    auto login = data.get(login_entry_key());
    if (!login) {
      return {reply(dst, src,
                    error_response(request,
                                   ClientError::Kind::InvalidInvitation))};
    }

    auto packet = Serializer::deserialize_account_packet(login->content);
    if (packet.is_err() ||
        packet.value().kind != AccountPacket::Kind::WithInvitation) {
      return {reply(dst, src,
                    error_response(request,
                                   ClientError::Kind::InvalidInvitation))};
    }

    auto claimed = invitations_->claim(packet.value().invitation_string);
    if (claimed.is_err()) {
      return {reply(dst, src, error_response(request, claimed.error()))};
    }
    op.invitation = packet.value().invitation_string;
  }

  LOG_DEBUG("client_manager", "Creating account ", short_name(dst.name));
  pending_[request.msg_id] = op;
  return {RoutingMessage{Authority::client_manager(dst.name),
                         Authority::nae_manager(data.name()), request}};
}

std::vector<RoutingMessage>
ClientManager::forward_mutation(const Authority &src, const Authority &dst,
                                const Request &request,
                                const XorName &data_name) {
  Account &account = accounts_[dst.name];
  if (account.mutations_available == 0) {
    return {reply(dst, src,
                  error_response(request, ClientError::Kind::LowBalance))};
  }

  --account.mutations_available;
  ++account.mutations_done;

  PendingOp op;
  op.client = src;
  op.account_name = dst.name;
  op.charged = true;
  pending_[request.msg_id] = op;

  LOG_TRACE("client_manager", "Forwarding ", request.name(), " ",
            request.msg_id.to_string(), " to ", short_name(data_name));
  return {RoutingMessage{Authority::client_manager(dst.name),
                         Authority::nae_manager(data_name), request}};
}

std::vector<RoutingMessage>
ClientManager::handle_account_request(const Authority &src,
                                      const Authority &dst,
                                      const Request &request) {
  auto authorised = authorise(src, dst.name, true);
  if (authorised.is_err()) {
    return {reply(dst, src, error_response(request, authorised.error()))};
  }

  Account &account = accounts_[dst.name];

  if (std::holds_alternative<request::GetAccountInfo>(request.body)) {
    return {reply(dst, src,
                  response::GetAccountInfo{
                      ClientResult<AccountInfo>(account.info()),
                      request.msg_id})};
  }

  if (std::holds_alternative<request::ListAuthKeysAndVersion>(request.body)) {
    response::AuthKeysAndVersion keys{account.auth_keys,
                                      account.auth_keys_version};
    return {reply(dst, src,
                  response::ListAuthKeysAndVersion{
                      ClientResult<response::AuthKeysAndVersion>(keys),
                      request.msg_id})};
  }

  if (auto *ins = std::get_if<request::InsAuthKey>(&request.body)) {
    if (ins->version != account.auth_keys_version + 1) {
      return {reply(dst, src,
                    error_response(request, ClientError::invalid_successor(
                                                account.auth_keys_version)))};
    }
    account.auth_keys.insert(ins->key);
    account.auth_keys_version = ins->version;
    return {reply(dst, src,
                  response::InsAuthKey{ClientResult<bool>(true),
                                       request.msg_id})};
  }

  const auto &del = std::get<request::DelAuthKey>(request.body);
  if (del.version != account.auth_keys_version + 1) {
    return {reply(dst, src,
                  error_response(request, ClientError::invalid_successor(
                                              account.auth_keys_version)))};
  }
  if (account.auth_keys.erase(del.key) == 0) {
    return {reply(dst, src,
                  error_response(request, ClientError::Kind::NoSuchKey))};
  }
  account.auth_keys_version = del.version;
  return {reply(dst, src,
                response::DelAuthKey{ClientResult<bool>(true),
                                     request.msg_id})};
}

std::vector<RoutingMessage>
ClientManager::handle_response(const Authority &src, const Authority &dst,
                               const Response &response) {
  MessageId msg_id = response_msg_id(response);
  auto it = pending_.find(msg_id);
  if (it == pending_.end()) {
    LOG_WARN("client_manager", "No pending operation for ",
             describe(response), " from ", src.to_string());
    return {};
  }

  PendingOp op = it->second;
  pending_.erase(it);

  bool succeeded = response_succeeded(response);

  if (op.creates_account) {
    if (succeeded) {
      Account account;
      account.mutations_available = account_mutations_;
      accounts_[op.account_name] = account;
      LOG_DEBUG("client_manager", "Account ", short_name(op.account_name),
                " created");
    } else if (invitations_ && !op.invitation.empty()) {
      invitations_->release(op.invitation);
    }
  } else if (op.charged && !succeeded) {
    auto account = accounts_.find(op.account_name);
    if (account != accounts_.end()) {
      ++account->second.mutations_available;
      --account->second.mutations_done;
    }
  }

  return {reply(dst, op.client, response)};
}

} // namespace vault
} // namespace vaultsim
