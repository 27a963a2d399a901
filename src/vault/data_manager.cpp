#include "vault/data_manager.h"
#include "common/logging.h"

namespace vaultsim {
namespace vault {

using namespace vaultsim::routing;

namespace {

template <typename Resp, typename T>
Response ok(T value, const MessageId &msg_id) {
  using Res = decltype(Resp::res);
  return Resp{Res(std::move(value)), msg_id};
}

template <typename Resp>
Response outcome(ClientResult<bool> res, const MessageId &msg_id) {
  return Resp{std::move(res), msg_id};
}

} // namespace

std::optional<ImmutableData> DataManager::idata(const XorName &name) const {
  auto it = idata_.find(name);
  if (it == idata_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<MutableData> DataManager::mdata(const XorName &name,
                                              uint64_t tag) const {
  auto it = mdata_.find(MDataKey(name, tag));
  if (it == mdata_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ClientResult<MutableData *> DataManager::find_mdata(const XorName &name,
                                                    uint64_t tag) {
  auto it = mdata_.find(MDataKey(name, tag));
  if (it == mdata_.end()) {
    return ClientResult<MutableData *>::failure(ClientError::Kind::NoSuchData);
  }
  return ClientResult<MutableData *>(&it->second);
}

ClientResult<const MutableData *>
DataManager::find_mdata(const XorName &name, uint64_t tag) const {
  auto it = mdata_.find(MDataKey(name, tag));
  if (it == mdata_.end()) {
    return ClientResult<const MutableData *>::failure(
        ClientError::Kind::NoSuchData);
  }
  return ClientResult<const MutableData *>(&it->second);
}

std::vector<RoutingMessage>
DataManager::handle_request(const Authority &src, const Authority &dst,
                            const Request &request) {
  Response response = error_response(request, ClientError::Kind::InvalidOperation);

  if (request.is_mutation()) {
    if (src.kind == Authority::Kind::ClientManager) {
      response = handle_mutation(src, request);
    } else {
      LOG_WARN("data_manager", "Rejecting ", request.name(),
               " not forwarded by a client manager: ", src.to_string());
    }
  } else if (!std::holds_alternative<request::GetAccountInfo>(request.body) &&
             !std::holds_alternative<request::ListAuthKeysAndVersion>(
                 request.body) &&
             !std::holds_alternative<request::InsAuthKey>(request.body) &&
             !std::holds_alternative<request::DelAuthKey>(request.body)) {
    response = handle_read(request);
  }

  LOG_TRACE("data_manager", "Replying ", describe(response), " to ",
            src.to_string());
  return {RoutingMessage{Authority::nae_manager(dst.name), src,
                         std::move(response)}};
}

Response DataManager::handle_read(const Request &request) const {
  const MessageId &msg_id = request.msg_id;

  if (auto *req = std::get_if<request::GetIData>(&request.body)) {
    auto it = idata_.find(req->name);
    if (it == idata_.end()) {
      return error_response(request, ClientError::Kind::NoSuchData);
    }
    return ok<response::GetIData>(it->second, msg_id);
  }

  if (auto *req = std::get_if<request::GetMDataVersion>(&request.body)) {
    auto data = find_mdata(req->name, req->tag);
    if (data.is_err()) {
      return error_response(request, data.error());
    }
    return ok<response::GetMDataVersion>(data.value()->version(), msg_id);
  }

  if (auto *req = std::get_if<request::GetMDataShell>(&request.body)) {
    auto data = find_mdata(req->name, req->tag);
    if (data.is_err()) {
      return error_response(request, data.error());
    }
    return ok<response::GetMDataShell>(data.value()->shell(), msg_id);
  }

  if (auto *req = std::get_if<request::ListMDataEntries>(&request.body)) {
    auto data = find_mdata(req->name, req->tag);
    if (data.is_err()) {
      return error_response(request, data.error());
    }
    return ok<response::ListMDataEntries>(data.value()->entries(), msg_id);
  }

  if (auto *req = std::get_if<request::GetMDataValue>(&request.body)) {
    auto data = find_mdata(req->name, req->tag);
    if (data.is_err()) {
      return error_response(request, data.error());
    }
    auto value = data.value()->get(req->key);
    if (!value) {
      return error_response(request, ClientError::Kind::NoSuchEntry);
    }
    return ok<response::GetMDataValue>(*value, msg_id);
  }

  if (auto *req = std::get_if<request::ListMDataPermissions>(&request.body)) {
    auto data = find_mdata(req->name, req->tag);
    if (data.is_err()) {
      return error_response(request, data.error());
    }
    return ok<response::ListMDataPermissions>(data.value()->permissions(),
                                              msg_id);
  }

  if (auto *req =
          std::get_if<request::ListMDataUserPermissions>(&request.body)) {
    auto data = find_mdata(req->name, req->tag);
    if (data.is_err()) {
      return error_response(request, data.error());
    }
    return response::ListMDataUserPermissions{
        data.value()->user_permissions(req->user), msg_id};
  }

  return error_response(request, ClientError::Kind::InvalidOperation);
}

Response DataManager::handle_mutation(const Authority &src,
                                      const Request &request) {
  const MessageId &msg_id = request.msg_id;

  if (auto *req = std::get_if<request::PutIData>(&request.body)) {
    if (req->data.value().size() > MAX_IMMUTABLE_DATA_SIZE_IN_BYTES) {
      return error_response(request, ClientError::Kind::DataTooLarge);
    }
    // Storing the same content twice is not an error
    idata_.emplace(req->data.name(), req->data);
    return ok<response::PutIData>(true, msg_id);
  }

  if (auto *req = std::get_if<request::PutMData>(&request.body)) {
    const MutableData &data = req->data;
    if (mdata_.count(MDataKey(data.name(), data.tag())) > 0) {
      return error_response(request, ClientError::Kind::DataExists);
    }
    if (data.owners().size() != 1 ||
        crypto::name_from_key(*data.owners().begin()) != src.name) {
      return error_response(request, ClientError::Kind::InvalidOwners);
    }
    auto valid = data.validate();
    if (valid.is_err()) {
      return error_response(request, valid.error());
    }
    mdata_.emplace(MDataKey(data.name(), data.tag()), data);
    return ok<response::PutMData>(true, msg_id);
  }

  if (auto *req = std::get_if<request::MutateMDataEntries>(&request.body)) {
    auto data = find_mdata(req->name, req->tag);
    if (data.is_err()) {
      return error_response(request, data.error());
    }
    return outcome<response::MutateMDataEntries>(
        data.value()->mutate_entries(req->actions, req->requester), msg_id);
  }

  if (auto *req =
          std::get_if<request::SetMDataUserPermissions>(&request.body)) {
    auto data = find_mdata(req->name, req->tag);
    if (data.is_err()) {
      return error_response(request, data.error());
    }
    return outcome<response::SetMDataUserPermissions>(
        data.value()->set_user_permissions(req->user, req->permissions,
                                           req->version, req->requester),
        msg_id);
  }

  if (auto *req =
          std::get_if<request::DelMDataUserPermissions>(&request.body)) {
    auto data = find_mdata(req->name, req->tag);
    if (data.is_err()) {
      return error_response(request, data.error());
    }
    return outcome<response::DelMDataUserPermissions>(
        data.value()->del_user_permissions(req->user, req->version,
                                           req->requester),
        msg_id);
  }

  if (auto *req = std::get_if<request::ChangeMDataOwner>(&request.body)) {
    auto data = find_mdata(req->name, req->tag);
    if (data.is_err()) {
      return error_response(request, data.error());
    }
    if (req->new_owners.size() != 1) {
      return error_response(request, ClientError::Kind::InvalidOwners);
    }

    // Only the current owner's client manager may hand the record over
    bool from_owner = false;
    for (const auto &owner : data.value()->owners()) {
      if (crypto::name_from_key(owner) == src.name) {
        from_owner = true;
      }
    }
    if (!from_owner) {
      return error_response(request, ClientError::Kind::AccessDenied);
    }

    return outcome<response::ChangeMDataOwner>(
        data.value()->change_owner(*req->new_owners.begin(), req->version),
        msg_id);
  }

  return error_response(request, ClientError::Kind::InvalidOperation);
}

} // namespace vault
} // namespace vaultsim
