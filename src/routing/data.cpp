#include "routing/data.h"
#include "routing/serializer.h"
#include <cstring>

namespace vaultsim {
namespace routing {

Bytes login_entry_key() {
  return Bytes(ACC_LOGIN_ENTRY_KEY,
               ACC_LOGIN_ENTRY_KEY + std::strlen(ACC_LOGIN_ENTRY_KEY));
}

// ImmutableData

ImmutableData::ImmutableData() : ImmutableData(Bytes()) {}

ImmutableData::ImmutableData(Bytes value)
    : value_(std::move(value)), name_(crypto::sha256(value_)) {}

// PermissionSet

PermissionSet &PermissionSet::allow(Action action) {
  permissions_[action] = true;
  return *this;
}

PermissionSet &PermissionSet::deny(Action action) {
  permissions_[action] = false;
  return *this;
}

PermissionSet &PermissionSet::clear(Action action) {
  permissions_.erase(action);
  return *this;
}

std::optional<bool> PermissionSet::is_allowed(Action action) const {
  auto it = permissions_.find(action);
  if (it == permissions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// EntryActions

EntryActions &EntryActions::ins(Bytes key, Bytes content, uint64_t version) {
  actions_[std::move(key)] =
      EntryAction{EntryAction::Kind::Insert, std::move(content), version};
  return *this;
}

EntryActions &EntryActions::update(Bytes key, Bytes content,
                                   uint64_t version) {
  actions_[std::move(key)] =
      EntryAction{EntryAction::Kind::Update, std::move(content), version};
  return *this;
}

EntryActions &EntryActions::del(Bytes key, uint64_t version) {
  actions_[std::move(key)] =
      EntryAction{EntryAction::Kind::Delete, Bytes(), version};
  return *this;
}

// MutableData

MutableData::MutableData() : name_{}, tag_(0), version_(0) {}

ClientResult<MutableData> MutableData::create(const XorName &name,
                                              uint64_t tag,
                                              Permissions permissions,
                                              Entries entries, Owners owners) {
  if (owners.size() > 1) {
    return ClientResult<MutableData>::failure(ClientError::Kind::InvalidOwners);
  }

  MutableData data;
  data.name_ = name;
  data.tag_ = tag;
  data.entries_ = std::move(entries);
  data.permissions_ = std::move(permissions);
  data.owners_ = std::move(owners);

  auto valid = data.validate();
  if (valid.is_err()) {
    return ClientResult<MutableData>::failure(valid.error());
  }
  return ClientResult<MutableData>(std::move(data));
}

std::set<Bytes> MutableData::keys() const {
  std::set<Bytes> keys;
  for (const auto &entry : entries_) {
    keys.insert(entry.first);
  }
  return keys;
}

std::optional<Value> MutableData::get(const Bytes &key) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ClientResult<PermissionSet>
MutableData::user_permissions(const User &user) const {
  auto it = permissions_.find(user);
  if (it == permissions_.end()) {
    return ClientResult<PermissionSet>::failure(ClientError::Kind::NoSuchKey);
  }
  return ClientResult<PermissionSet>(it->second);
}

MutableData MutableData::shell() const {
  MutableData shell = *this;
  shell.entries_.clear();
  return shell;
}

bool MutableData::is_action_allowed(const PublicSignKey &requester,
                                    Action action) const {
  if (owners_.count(requester) > 0) {
    return true;
  }

  auto own = permissions_.find(User::for_key(requester));
  if (own != permissions_.end()) {
    auto allowed = own->second.is_allowed(action);
    if (allowed) {
      return *allowed;
    }
  }

  auto anyone = permissions_.find(User::anyone());
  if (anyone != permissions_.end()) {
    return anyone->second.is_allowed(action).value_or(false);
  }
  return false;
}

ClientResult<bool> MutableData::mutate_entries(const EntryActionMap &actions,
                                               const PublicSignKey &requester) {
  // Every action kind present in the batch must be permitted
  for (const auto &[key, action] : actions) {
    Action needed = Action::Insert;
    if (action.kind == EntryAction::Kind::Update) {
      needed = Action::Update;
    } else if (action.kind == EntryAction::Kind::Delete) {
      needed = Action::Delete;
    }
    if (!is_action_allowed(requester, needed)) {
      return ClientResult<bool>::failure(ClientError::Kind::AccessDenied);
    }
  }

  Entries updated = entries_;
  std::map<Bytes, EntryError> errors;

  for (const auto &[key, action] : actions) {
    auto it = updated.find(key);
    switch (action.kind) {
    case EntryAction::Kind::Insert:
      if (it != updated.end()) {
        errors[key] = EntryError{EntryError::Kind::EntryExists,
                                 it->second.entry_version};
      } else {
        updated[key] = Value{action.content, action.version};
      }
      break;
    case EntryAction::Kind::Update:
      if (it == updated.end()) {
        errors[key] = EntryError{EntryError::Kind::NoSuchEntry, 0};
      } else if (action.version != it->second.entry_version + 1) {
        errors[key] = EntryError{EntryError::Kind::InvalidSuccessor,
                                 it->second.entry_version};
      } else {
        it->second = Value{action.content, action.version};
      }
      break;
    case EntryAction::Kind::Delete:
      if (it == updated.end()) {
        errors[key] = EntryError{EntryError::Kind::NoSuchEntry, 0};
      } else if (action.version != it->second.entry_version + 1) {
        errors[key] = EntryError{EntryError::Kind::InvalidSuccessor,
                                 it->second.entry_version};
      } else {
        updated.erase(it);
      }
      break;
    }
  }

  if (!errors.empty()) {
    return ClientResult<bool>::failure(
        ClientError::invalid_entry_actions(std::move(errors)));
  }

  Entries previous = std::move(entries_);
  entries_ = std::move(updated);

  auto valid = validate();
  if (valid.is_err()) {
    entries_ = std::move(previous);
    return valid;
  }
  return ClientResult<bool>(true);
}

ClientResult<bool>
MutableData::set_user_permissions(const User &user,
                                  const PermissionSet &permissions,
                                  uint64_t version,
                                  const PublicSignKey &requester) {
  if (!is_action_allowed(requester, Action::ManagePermissions)) {
    return ClientResult<bool>::failure(ClientError::Kind::AccessDenied);
  }
  if (version != version_ + 1) {
    return ClientResult<bool>::failure(
        ClientError::invalid_successor(version_));
  }

  Permissions previous = permissions_;
  permissions_[user] = permissions;

  auto valid = validate();
  if (valid.is_err()) {
    permissions_ = std::move(previous);
    return valid;
  }

  version_ = version;
  return ClientResult<bool>(true);
}

ClientResult<bool>
MutableData::del_user_permissions(const User &user, uint64_t version,
                                  const PublicSignKey &requester) {
  if (!is_action_allowed(requester, Action::ManagePermissions)) {
    return ClientResult<bool>::failure(ClientError::Kind::AccessDenied);
  }
  if (version != version_ + 1) {
    return ClientResult<bool>::failure(
        ClientError::invalid_successor(version_));
  }
  if (permissions_.erase(user) == 0) {
    return ClientResult<bool>::failure(ClientError::Kind::NoSuchKey);
  }

  version_ = version;
  return ClientResult<bool>(true);
}

ClientResult<bool> MutableData::change_owner(const PublicSignKey &new_owner,
                                             uint64_t version) {
  if (version != version_ + 1) {
    return ClientResult<bool>::failure(
        ClientError::invalid_successor(version_));
  }

  owners_.clear();
  owners_.insert(new_owner);
  version_ = version;
  return ClientResult<bool>(true);
}

ClientResult<bool> MutableData::validate() const {
  if (entries_.size() > MAX_MUTABLE_DATA_ENTRIES) {
    return ClientResult<bool>::failure(ClientError::Kind::TooManyEntries);
  }
  if (Serializer::serialize(*this).size() > MAX_MUTABLE_DATA_SIZE_IN_BYTES) {
    return ClientResult<bool>::failure(ClientError::Kind::DataTooLarge);
  }
  return ClientResult<bool>(true);
}

bool MutableData::operator==(const MutableData &other) const {
  return name_ == other.name_ && tag_ == other.tag_ &&
         entries_ == other.entries_ && permissions_ == other.permissions_ &&
         version_ == other.version_ && owners_ == other.owners_;
}

} // namespace routing
} // namespace vaultsim
