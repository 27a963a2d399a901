#pragma once

#include "crypto/keys.h"
#include "routing/client_error.h"
#include "common/types.h"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace vaultsim {
namespace routing {

using namespace vaultsim::common;

using crypto::PublicKeys;
using crypto::PublicSignKey;

// Data limits enforced by the data managers
constexpr size_t MAX_IMMUTABLE_DATA_SIZE_IN_BYTES = 1024 * 1024 + 10 * 1024;
constexpr size_t MAX_MUTABLE_DATA_ENTRIES = 100;
constexpr size_t MAX_MUTABLE_DATA_SIZE_IN_BYTES = 1024 * 1024;

/// Type tag of the mutable data record that holds a client's account
constexpr uint64_t TYPE_TAG_SESSION_PACKET = 0;

/// Entry key of the login packet inside an account record
constexpr const char *ACC_LOGIN_ENTRY_KEY = "Login";

Bytes login_entry_key();

using Owners = std::set<PublicSignKey>;

/**
 * ImmutableData - Content-addressed blob; name is SHA256 of the value
 */
class ImmutableData {
public:
  ImmutableData();
  explicit ImmutableData(Bytes value);

  const XorName &name() const { return name_; }
  const Bytes &value() const { return value_; }

  bool operator==(const ImmutableData &other) const {
    return value_ == other.value_;
  }
  bool operator!=(const ImmutableData &other) const { return !(*this == other); }

private:
  Bytes value_;
  XorName name_;
};

/**
 * Value - Content of a mutable data entry with its version
 */
struct Value {
  Bytes content;
  uint64_t entry_version = 0;

  bool operator==(const Value &other) const {
    return content == other.content && entry_version == other.entry_version;
  }
  bool operator!=(const Value &other) const { return !(*this == other); }
};

using Entries = std::map<Bytes, Value>;

/// Mutations a permission set may grant or deny
enum class Action { Insert, Update, Delete, ManagePermissions };

/**
 * PermissionSet - Explicit allow/deny per action; unset means "no opinion"
 */
class PermissionSet {
public:
  PermissionSet &allow(Action action);
  PermissionSet &deny(Action action);
  PermissionSet &clear(Action action);

  /// true/false when set explicitly, std::nullopt otherwise
  std::optional<bool> is_allowed(Action action) const;

  bool operator==(const PermissionSet &other) const {
    return permissions_ == other.permissions_;
  }
  bool operator!=(const PermissionSet &other) const { return !(*this == other); }

private:
  std::map<Action, bool> permissions_;
};

/**
 * User - Subject of a permission set: everyone, or a single key
 */
struct User {
  enum class Kind { Anyone, Key };

  Kind kind = Kind::Anyone;
  PublicSignKey sign_key{};

  static User anyone() { return User(); }
  static User for_key(const PublicSignKey &key) {
    User user;
    user.kind = Kind::Key;
    user.sign_key = key;
    return user;
  }

  bool operator<(const User &other) const {
    if (kind != other.kind) {
      return kind < other.kind;
    }
    return sign_key < other.sign_key;
  }
  bool operator==(const User &other) const {
    return kind == other.kind && sign_key == other.sign_key;
  }
  bool operator!=(const User &other) const { return !(*this == other); }
};

using Permissions = std::map<User, PermissionSet>;

/**
 * EntryAction - One requested change to a single entry
 *
 * Insert carries version 0; Update and Delete carry the successor of the
 * current entry version.
 */
struct EntryAction {
  enum class Kind { Insert, Update, Delete };

  Kind kind = Kind::Insert;
  Bytes content;
  uint64_t version = 0;

  bool operator==(const EntryAction &other) const {
    return kind == other.kind && content == other.content &&
           version == other.version;
  }
  bool operator!=(const EntryAction &other) const { return !(*this == other); }
};

/// A batch of entry actions; the map guarantees one action per key
using EntryActionMap = std::map<Bytes, EntryAction>;

/**
 * EntryActions - Builder for an EntryActionMap
 *
 * A later action for the same key replaces the earlier one.
 */
class EntryActions {
public:
  EntryActions &ins(Bytes key, Bytes content, uint64_t version);
  EntryActions &update(Bytes key, Bytes content, uint64_t version);
  EntryActions &del(Bytes key, uint64_t version);

  const EntryActionMap &actions() const { return actions_; }
  size_t size() const { return actions_.size(); }
  bool contains(const Bytes &key) const { return actions_.count(key) > 0; }

  EntryActionMap take() { return std::move(actions_); }

private:
  EntryActionMap actions_;
};

/**
 * MutableData - Versioned key/value record identified by (name, tag)
 *
 * Entry versions start at 0 and advance by exactly one per update or delete.
 * The shell version (permissions and owners) advances by exactly one per
 * permission or owner change. Owners are always allowed every action; other
 * requesters are checked against their own permission set first and the
 * `Anyone` set second.
 */
class MutableData {
public:
  MutableData();

  /**
   * Build a record and validate its limits
   * @return InvalidOwners, TooManyEntries or DataTooLarge on violation
   */
  static ClientResult<MutableData> create(const XorName &name, uint64_t tag,
                                          Permissions permissions,
                                          Entries entries, Owners owners);

  const XorName &name() const { return name_; }
  uint64_t tag() const { return tag_; }
  uint64_t version() const { return version_; }
  const Entries &entries() const { return entries_; }
  const Permissions &permissions() const { return permissions_; }
  const Owners &owners() const { return owners_; }

  std::set<Bytes> keys() const;
  std::optional<Value> get(const Bytes &key) const;

  /// Permission set for one user, NoSuchKey if none
  ClientResult<PermissionSet> user_permissions(const User &user) const;

  /// Copy of this record without its entries
  MutableData shell() const;

  bool is_action_allowed(const PublicSignKey &requester, Action action) const;

  /// Apply a batch; nothing is applied when any entry fails
  ClientResult<bool> mutate_entries(const EntryActionMap &actions,
                                    const PublicSignKey &requester);

  ClientResult<bool> set_user_permissions(const User &user,
                                          const PermissionSet &permissions,
                                          uint64_t version,
                                          const PublicSignKey &requester);

  ClientResult<bool> del_user_permissions(const User &user, uint64_t version,
                                          const PublicSignKey &requester);

  /// Replace the owner; authorisation is the caller's responsibility
  ClientResult<bool> change_owner(const PublicSignKey &new_owner,
                                  uint64_t version);

  /// Entry count and serialized size limits
  ClientResult<bool> validate() const;

  bool operator==(const MutableData &other) const;
  bool operator!=(const MutableData &other) const { return !(*this == other); }

private:
  XorName name_;
  uint64_t tag_;
  Entries entries_;
  Permissions permissions_;
  uint64_t version_;
  Owners owners_;
};

/**
 * AccountInfo - Mutation allowance of an account
 */
struct AccountInfo {
  uint64_t mutations_done = 0;
  uint64_t mutations_available = 0;

  bool operator==(const AccountInfo &other) const {
    return mutations_done == other.mutations_done &&
           mutations_available == other.mutations_available;
  }
};

/**
 * AccountPacket - Content of the login entry of an account record
 */
struct AccountPacket {
  enum class Kind { WithInvitation, AccPkt };

  Kind kind = Kind::AccPkt;
  std::string invitation_string;
  Bytes acc_pkt;

  static AccountPacket with_invitation(const std::string &invitation,
                                       Bytes acc_pkt = {}) {
    AccountPacket packet;
    packet.kind = Kind::WithInvitation;
    packet.invitation_string = invitation;
    packet.acc_pkt = std::move(acc_pkt);
    return packet;
  }

  bool operator==(const AccountPacket &other) const {
    return kind == other.kind && invitation_string == other.invitation_string &&
           acc_pkt == other.acc_pkt;
  }
};

} // namespace routing
} // namespace vaultsim
