#include "routing/serializer.h"
#include <stdexcept>

namespace vaultsim {
namespace routing {

// Write primitive types in little-endian format
void Serializer::write_u8(std::vector<uint8_t> &buf, uint8_t val) {
  buf.push_back(val);
}

void Serializer::write_u32(std::vector<uint8_t> &buf, uint32_t val) {
  buf.push_back(val & 0xFF);
  buf.push_back((val >> 8) & 0xFF);
  buf.push_back((val >> 16) & 0xFF);
  buf.push_back((val >> 24) & 0xFF);
}

void Serializer::write_u64(std::vector<uint8_t> &buf, uint64_t val) {
  for (int i = 0; i < 8; ++i) {
    buf.push_back((val >> (i * 8)) & 0xFF);
  }
}

void Serializer::write_bytes(std::vector<uint8_t> &buf,
                             const std::vector<uint8_t> &bytes) {
  write_u64(buf, bytes.size());
  buf.insert(buf.end(), bytes.begin(), bytes.end());
}

void Serializer::write_string(std::vector<uint8_t> &buf,
                              const std::string &str) {
  write_u64(buf, str.size());
  buf.insert(buf.end(), str.begin(), str.end());
}

void Serializer::write_name(std::vector<uint8_t> &buf, const XorName &name) {
  buf.insert(buf.end(), name.begin(), name.end());
}

void Serializer::write_user(std::vector<uint8_t> &buf, const User &user) {
  write_u8(buf, static_cast<uint8_t>(user.kind));
  if (user.kind == User::Kind::Key) {
    buf.insert(buf.end(), user.sign_key.begin(), user.sign_key.end());
  }
}

void Serializer::write_permission_set(std::vector<uint8_t> &buf,
                                      const PermissionSet &permissions) {
  const Action actions[] = {Action::Insert, Action::Update, Action::Delete,
                            Action::ManagePermissions};
  for (Action action : actions) {
    auto allowed = permissions.is_allowed(action);
    // 0 = unset, 1 = allowed, 2 = denied
    write_u8(buf, !allowed ? 0 : (*allowed ? 1 : 2));
  }
}

void Serializer::write_entry_actions(std::vector<uint8_t> &buf,
                                     const EntryActionMap &actions) {
  write_u64(buf, actions.size());
  for (const auto &[key, action] : actions) {
    write_bytes(buf, key);
    write_u8(buf, static_cast<uint8_t>(action.kind));
    write_bytes(buf, action.content);
    write_u64(buf, action.version);
  }
}

// Read primitive types
uint8_t Serializer::read_u8(const uint8_t *&ptr, const uint8_t *end) {
  if (ptr >= end)
    throw std::runtime_error("Buffer underflow");
  return *ptr++;
}

uint32_t Serializer::read_u32(const uint8_t *&ptr, const uint8_t *end) {
  if (end - ptr < 4)
    throw std::runtime_error("Buffer underflow");
  uint32_t val = ptr[0] | (ptr[1] << 8) | (ptr[2] << 16) |
                 (static_cast<uint32_t>(ptr[3]) << 24);
  ptr += 4;
  return val;
}

uint64_t Serializer::read_u64(const uint8_t *&ptr, const uint8_t *end) {
  if (end - ptr < 8)
    throw std::runtime_error("Buffer underflow");
  uint64_t val = 0;
  for (int i = 0; i < 8; ++i) {
    val |= ((uint64_t)ptr[i]) << (i * 8);
  }
  ptr += 8;
  return val;
}

std::vector<uint8_t> Serializer::read_bytes(const uint8_t *&ptr,
                                            const uint8_t *end, size_t len) {
  if (static_cast<size_t>(end - ptr) < len)
    throw std::runtime_error("Buffer underflow");
  std::vector<uint8_t> result(ptr, ptr + len);
  ptr += len;
  return result;
}

std::vector<uint8_t> Serializer::serialize(const ImmutableData &data) {
  std::vector<uint8_t> buf;
  write_bytes(buf, data.value());
  return buf;
}

std::vector<uint8_t> Serializer::serialize(const MutableData &data) {
  std::vector<uint8_t> buf;

  write_name(buf, data.name());
  write_u64(buf, data.tag());

  write_u64(buf, data.entries().size());
  for (const auto &[key, value] : data.entries()) {
    write_bytes(buf, key);
    write_bytes(buf, value.content);
    write_u64(buf, value.entry_version);
  }

  write_u64(buf, data.permissions().size());
  for (const auto &[user, permissions] : data.permissions()) {
    write_user(buf, user);
    write_permission_set(buf, permissions);
  }

  write_u64(buf, data.version());

  write_u64(buf, data.owners().size());
  for (const auto &owner : data.owners()) {
    buf.insert(buf.end(), owner.begin(), owner.end());
  }

  return buf;
}

std::vector<uint8_t> Serializer::serialize(const AccountPacket &packet) {
  std::vector<uint8_t> buf;

  // Write variant tag
  write_u32(buf, static_cast<uint32_t>(packet.kind));
  if (packet.kind == AccountPacket::Kind::WithInvitation) {
    write_string(buf, packet.invitation_string);
  }
  write_bytes(buf, packet.acc_pkt);

  return buf;
}

namespace {

/// Writes the fields of one request body
struct RequestBodyWriter {
  std::vector<uint8_t> &buf;

  void key(const PublicSignKey &key) {
    buf.insert(buf.end(), key.begin(), key.end());
  }

  void address(const XorName &name, uint64_t tag) {
    Serializer::write_name(buf, name);
    Serializer::write_u64(buf, tag);
  }

  void operator()(const request::PutIData &req) {
    auto data = Serializer::serialize(req.data);
    buf.insert(buf.end(), data.begin(), data.end());
  }
  void operator()(const request::GetIData &req) {
    Serializer::write_name(buf, req.name);
  }
  void operator()(const request::PutMData &req) {
    auto data = Serializer::serialize(req.data);
    buf.insert(buf.end(), data.begin(), data.end());
    key(req.requester);
  }
  void operator()(const request::GetMDataVersion &req) {
    address(req.name, req.tag);
  }
  void operator()(const request::GetMDataShell &req) {
    address(req.name, req.tag);
  }
  void operator()(const request::ListMDataEntries &req) {
    address(req.name, req.tag);
  }
  void operator()(const request::GetMDataValue &req) {
    address(req.name, req.tag);
    Serializer::write_bytes(buf, req.key);
  }
  void operator()(const request::MutateMDataEntries &req) {
    address(req.name, req.tag);
    Serializer::write_entry_actions(buf, req.actions);
    key(req.requester);
  }
  void operator()(const request::ListMDataPermissions &req) {
    address(req.name, req.tag);
  }
  void operator()(const request::ListMDataUserPermissions &req) {
    address(req.name, req.tag);
    Serializer::write_user(buf, req.user);
  }
  void operator()(const request::SetMDataUserPermissions &req) {
    address(req.name, req.tag);
    Serializer::write_user(buf, req.user);
    Serializer::write_permission_set(buf, req.permissions);
    Serializer::write_u64(buf, req.version);
    key(req.requester);
  }
  void operator()(const request::DelMDataUserPermissions &req) {
    address(req.name, req.tag);
    Serializer::write_user(buf, req.user);
    Serializer::write_u64(buf, req.version);
    key(req.requester);
  }
  void operator()(const request::ChangeMDataOwner &req) {
    address(req.name, req.tag);
    Serializer::write_u64(buf, req.new_owners.size());
    for (const auto &owner : req.new_owners) {
      key(owner);
    }
    Serializer::write_u64(buf, req.version);
  }
  void operator()(const request::GetAccountInfo &) {}
  void operator()(const request::ListAuthKeysAndVersion &) {}
  void operator()(const request::InsAuthKey &req) {
    key(req.key);
    Serializer::write_u64(buf, req.version);
  }
  void operator()(const request::DelAuthKey &req) {
    key(req.key);
    Serializer::write_u64(buf, req.version);
  }
};

} // namespace

std::vector<uint8_t> Serializer::serialize(const Request &request) {
  std::vector<uint8_t> buf;

  write_u32(buf, static_cast<uint32_t>(request.body.index()));
  write_name(buf, request.msg_id.id);
  std::visit(RequestBodyWriter{buf}, request.body);

  return buf;
}

Result<AccountPacket>
Serializer::deserialize_account_packet(const std::vector<uint8_t> &data) {
  try {
    const uint8_t *ptr = data.data();
    const uint8_t *end = data.data() + data.size();

    AccountPacket packet;
    uint32_t tag = read_u32(ptr, end);
    if (tag == static_cast<uint32_t>(AccountPacket::Kind::WithInvitation)) {
      packet.kind = AccountPacket::Kind::WithInvitation;
      uint64_t len = read_u64(ptr, end);
      auto invitation = read_bytes(ptr, end, len);
      packet.invitation_string.assign(invitation.begin(), invitation.end());
    } else if (tag == static_cast<uint32_t>(AccountPacket::Kind::AccPkt)) {
      packet.kind = AccountPacket::Kind::AccPkt;
    } else {
      return Result<AccountPacket>("Unknown account packet tag " +
                                   std::to_string(tag));
    }

    uint64_t len = read_u64(ptr, end);
    packet.acc_pkt = read_bytes(ptr, end, len);

    if (ptr != end) {
      return Result<AccountPacket>("Trailing bytes after account packet");
    }
    return Result<AccountPacket>(packet);
  } catch (const std::exception &e) {
    return Result<AccountPacket>(std::string("Deserialization failed: ") +
                                 e.what());
  }
}

} // namespace routing
} // namespace vaultsim
